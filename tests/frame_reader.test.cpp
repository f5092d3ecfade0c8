#include <catch2/catch_all.hpp>
#include "vaultwire/core/protocol/frame_reader.hpp"
#include "vaultwire/core/util/byteorder.hpp"
#include "vaultwire/core/util/error_types.hpp"
#include "mock_transport.hpp"

using namespace vaultwire;
using namespace vaultwire::test;

static Message sampleResponse() {
    std::vector<uint8_t> challenge(256);
    for (std::size_t i = 0; i < challenge.size(); ++i) challenge[i] = static_cast<uint8_t>(i * 7);
    return Message(Direction::Response,
                   { { "Session", "S1" }, { "Content-Length", "256" }, { "Method", "login_request" }, { "Content-Type", "bytes" } },
                   challenge);
}

TEST_CASE("FrameReader: reassembles a frame delivered one byte at a time", "[frame]") {
    auto wire = std::make_shared<MockWire>();
    wire->reply = sampleResponse().toBytes();
    wire->chunk = 1;
    MockTransport t(wire);

    FrameReader reader(t);
    REQUIRE(reader.receive() == sampleResponse());
    REQUIRE(wire->readPos == wire->reply.size());
}

TEST_CASE("FrameReader: reassembles a frame delivered in random chunks", "[frame]") {
    auto wire = std::make_shared<MockWire>();
    wire->reply = sampleResponse().toBytes();
    wire->randomChunks = true;
    MockTransport t(wire);

    FrameReader reader(t);
    REQUIRE(reader.receive() == sampleResponse());
}

TEST_CASE("FrameReader: stops at the end of the frame", "[frame]") {
    auto first = Message(Direction::Response, { { "Content-Length", "7" } }, bytes("Success"));
    auto wire = std::make_shared<MockWire>();
    wire->reply = first.toBytes();
    auto trailing = bytes("res:garbage");
    wire->reply.insert(wire->reply.end(), trailing.begin(), trailing.end());
    MockTransport t(wire);

    FrameReader reader(t);
    REQUIRE(reader.receive() == first);
    REQUIRE(wire->readPos == first.toBytes().size());
}

TEST_CASE("FrameReader: empty body", "[frame]") {
    auto empty = Message(Direction::Response,
                         { { "Session", "-" }, { "Content-Length", "0" }, { "Method", "login_request" } }, {});
    auto wire = std::make_shared<MockWire>();
    wire->reply = empty.toBytes();
    MockTransport t(wire);

    FrameReader reader(t);
    auto got = reader.receive();
    REQUIRE(got.body().empty());
    REQUIRE(got.header("Method") == "login_request");
}

TEST_CASE("FrameReader: early close is a framing error", "[frame]") {
    auto full = sampleResponse().toBytes();
    auto wire = std::make_shared<MockWire>();
    wire->reply.assign(full.begin(), full.end() - 10);
    wire->chunk = 3;
    MockTransport t(wire);

    FrameReader reader(t);
    REQUIRE_THROWS_AS(reader.receive(), FramingError);
}

TEST_CASE("FrameReader: missing Content-Length is a framing error", "[frame]") {
    auto wire = std::make_shared<MockWire>();
    wire->reply = Message(Direction::Response, { { "Method", "get_sources" } }, {}).toBytes();
    MockTransport t(wire);

    FrameReader reader(t);
    REQUIRE_THROWS_AS(reader.receive(), FramingError);
}

TEST_CASE("FrameReader: bad tag and oversized frames are rejected", "[frame]") {
    SECTION("tag") {
        auto wire = std::make_shared<MockWire>();
        wire->reply = bytes("HTTP/1.1 400 Bad Request\r\n\r\n");
        MockTransport t(wire);
        FrameReader reader(t);
        REQUIRE_THROWS_AS(reader.receive(), FramingError);
    }
    SECTION("body over limit") {
        auto wire = std::make_shared<MockWire>();
        wire->reply = Message(Direction::Response, { { "Content-Length", "4096" } }, {}).toBytes();
        MockTransport t(wire);
        FrameReader reader(t, 1024);
        REQUIRE_THROWS_AS(reader.receive(), FramingError);
        REQUIRE(wire->readPos == wire->reply.size());
    }
    SECTION("header block over limit") {
        std::vector<uint8_t> prefix = bytes("res:");
        uint8_t len[4];
        writeInt32LE(1 << 30, len);
        prefix.insert(prefix.end(), len, len + 4);
        prefix.push_back(':');
        auto wire = std::make_shared<MockWire>();
        wire->reply = prefix;
        MockTransport t(wire);
        FrameReader reader(t);
        REQUIRE_THROWS_AS(reader.receive(), FramingError);
    }
}

TEST_CASE("FrameReader: Content-Length must match the body that follows", "[frame]") {
    // declares 10 bytes, only 4 arrive before the peer closes
    auto wire = std::make_shared<MockWire>();
    auto m = Message(Direction::Response, { { "Content-Length", "10" } }, bytes("abcd"));
    wire->reply = m.toBytes();
    MockTransport t(wire);

    FrameReader reader(t);
    REQUIRE_THROWS_AS(reader.receive(), FramingError);
}
