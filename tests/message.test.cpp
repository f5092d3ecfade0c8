#include <catch2/catch_all.hpp>
#include "vaultwire/core/protocol/message.hpp"
#include "vaultwire/core/protocol/methods.hpp"
#include "vaultwire/core/util/byteorder.hpp"
#include "vaultwire/core/util/error_types.hpp"
#include "mock_transport.hpp"

using namespace vaultwire;
using vaultwire::test::bytes;

static std::vector<uint8_t> frameOf(const std::string& tag, int32_t hlen, const std::string& rest) {
    std::vector<uint8_t> out = bytes(tag + ":");
    uint8_t len[4];
    writeInt32LE(hlen, len);
    out.insert(out.end(), len, len + 4);
    out.push_back(':');
    auto tail = bytes(rest);
    out.insert(out.end(), tail.begin(), tail.end());
    return out;
}

// Either decoding fails or the decoded message differs from the original.
static bool violationDetected(const Message& m) {
    try {
        return Message::fromBytes(m.toBytes()) != m;
    }
    catch (const FramingError&) {
        return true;
    }
}

TEST_CASE("Message: request encodes the exact wire layout", "[message]") {
    auto m = Message::request(methods::GetPassword, bytes("github"), "S1", content_types::Ascii);

    auto expected = frameOf("req", 76,
        "Method=get_password:Session=S1:Content-Type=ascii:Content-Length=6:github");
    REQUIRE(m.toBytes() == expected);
    REQUIRE(m.headerLength() == 76);
}

TEST_CASE("Message: request header order is Method, Session, Content-Type, Content-Length", "[message]") {
    auto m = Message::request(methods::SetPassword, bytes("{}"), "tok", content_types::Json);
    const auto& h = m.headers();
    REQUIRE(h.size() == 4);
    REQUIRE(h[0] == std::make_pair(std::string("Method"), std::string("set_password")));
    REQUIRE(h[1].first == "Session");
    REQUIRE(h[2] == std::make_pair(std::string("Content-Type"), std::string("json")));
    REQUIRE(h[3] == std::make_pair(std::string("Content-Length"), std::string("2")));

    auto bare = Message::request(methods::GetSources, {}, "tok");
    REQUIRE(bare.headers().size() == 3);
    REQUIRE_FALSE(bare.header(headers::ContentType));
    REQUIRE(bare.contentLength() == 0u);
}

TEST_CASE("Message: decode(encode(m)) == m", "[message]") {
    std::vector<uint8_t> binary{ 0x00, 0xFF, ':', '=', 0x10 };
    Message m(Direction::Response,
              { { "Session", "abc" }, { "Content-Length", "5" }, { "Method", "login_request" }, { "Content-Type", "bytes" } },
              binary);

    auto decoded = Message::fromBytes(m.toBytes());
    REQUIRE(decoded == m);
    REQUIRE(decoded.direction() == Direction::Response);
    REQUIRE(decoded.body() == binary);
}

TEST_CASE("Message: empty header list and empty body", "[message]") {
    Message m(Direction::Request, {}, {});
    auto wire = m.toBytes();
    REQUIRE(wire.size() == kFramePrefixSize);
    REQUIRE(Message::fromBytes(wire) == m);
}

TEST_CASE("Message: header delimiters inside names or values are detectable", "[message]") {
    REQUIRE(violationDetected(Message(Direction::Request, { { "Session", "a:b" } }, {})));
    REQUIRE(violationDetected(Message(Direction::Request, { { "Session", "a=b" } }, {})));
    REQUIRE(violationDetected(Message(Direction::Request, { { "Se:ssion", "x" } }, {})));
    REQUIRE(violationDetected(Message(Direction::Request, { { "A", "1:B=2" } }, {})));

    REQUIRE(isValidHeaderToken("get_password"));
    REQUIRE_FALSE(isValidHeaderToken("a:b"));
    REQUIRE_FALSE(isValidHeaderToken("a=b"));
}

TEST_CASE("Message: headerLength disagreeing with the header block is rejected", "[message]") {
    const std::string rest = "Method=x:Content-Length=3:abc";
    const int32_t good = static_cast<int32_t>(kFramePrefixSize + rest.size() - 3);
    REQUIRE_NOTHROW(Message::fromBytes(frameOf("res", good, rest)));

    REQUIRE_THROWS_AS(Message::fromBytes(frameOf("res", good - 1, rest)), FramingError);
    REQUIRE_THROWS_AS(Message::fromBytes(frameOf("res", good + 2, rest)), FramingError);
    REQUIRE_THROWS_AS(Message::fromBytes(frameOf("res", good + 100, rest)), FramingError);
    REQUIRE_THROWS_AS(Message::fromBytes(frameOf("res", 4, rest)), FramingError);
    REQUIRE_THROWS_AS(Message::fromBytes(frameOf("res", -1, rest)), FramingError);
}

TEST_CASE("Message: headerLength landing on an entry boundary is caught by Content-Length", "[message]") {
    // real block "Content-Length=4:Method=x:", length stops after the first entry
    const std::string shortBlock = "Content-Length=4:Method=x:abcd";
    const int32_t firstEntryEnd = static_cast<int32_t>(kFramePrefixSize + std::string("Content-Length=4:").size());
    REQUIRE_THROWS_AS(Message::fromBytes(frameOf("res", firstEntryEnd, shortBlock)), FramingError);
    REQUIRE_NOTHROW(Message::fromBytes(frameOf("res", firstEntryEnd + 9, shortBlock)));

    // length runs into a body that happens to look like an entry
    const std::string bodyLikeEntry = "Content-Length=4:k=v:";
    const int32_t wholeFrame = static_cast<int32_t>(kFramePrefixSize + bodyLikeEntry.size());
    REQUIRE_THROWS_AS(Message::fromBytes(frameOf("res", wholeFrame, bodyLikeEntry)), FramingError);
    REQUIRE_NOTHROW(Message::fromBytes(frameOf("res", wholeFrame - 4, bodyLikeEntry)));
}

TEST_CASE("Message: decode without Content-Length keeps the remaining bytes as body", "[message]") {
    auto m = Message::fromBytes(frameOf("res", 18, "Method=x:payload"));
    REQUIRE_FALSE(m.contentLength());
    REQUIRE(m.bodyString() == "payload");

    // non-numeric values are not checked against the body
    auto odd = Message::fromBytes(frameOf("res", 28, "Content-Length=abc:xy"));
    REQUIRE(odd.bodyString() == "xy");
}

TEST_CASE("Message: malformed prefixes are rejected", "[message]") {
    REQUIRE_THROWS_AS(Message::fromBytes(bytes("res:")), FramingError);
    REQUIRE_THROWS_AS(Message::fromBytes(frameOf("rsp", 9, "")), FramingError);

    auto noColon = frameOf("req", 9, "");
    noColon[8] = '!';
    REQUIRE_THROWS_AS(Message::fromBytes(noColon), FramingError);

    REQUIRE_THROWS_AS(Message::fromBytes(frameOf("req", 15, "Method:")), FramingError);
}

TEST_CASE("Message: header lookup returns the last occurrence", "[message]") {
    Message m(Direction::Response, { { "Session", "first" }, { "Method", "m" }, { "Session", "second" } }, {});
    REQUIRE(m.header("Session") == "second");
    REQUIRE(m.header("Method") == "m");
    REQUIRE_FALSE(m.header("session"));

    auto decoded = Message::fromBytes(m.toBytes());
    REQUIRE(decoded.headers().size() == 3);
    REQUIRE(decoded.header("Session") == "second");
}

TEST_CASE("Message: success and content length helpers", "[message]") {
    Message ok(Direction::Response, { { "Content-Length", "7" } }, bytes("Success"));
    REQUIRE(ok.isSuccess());
    REQUIRE(ok.contentLength() == 7u);
    REQUIRE(ok.bodyString() == "Success");

    Message failed(Direction::Response, { { "Content-Length", "x1" } }, bytes("Failed - incorrect number"));
    REQUIRE_FALSE(failed.isSuccess());
    REQUIRE_FALSE(failed.contentLength());

    Message prefix(Direction::Response, {}, bytes("Success!"));
    REQUIRE_FALSE(prefix.isSuccess());
}

TEST_CASE("Message: toString renders headers and hex body", "[message]") {
    Message m(Direction::Response, { { "Method", "login_test" } }, { 0x01, 0xAB });
    REQUIRE(m.toString() == "res:Method=login_test:\n01-ab");
}
