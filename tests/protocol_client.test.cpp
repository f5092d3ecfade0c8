#include <catch2/catch_all.hpp>
#include "vaultwire/core/client/protocol_client.hpp"
#include "vaultwire/core/protocol/frame_reader.hpp"
#include "vaultwire/core/protocol/methods.hpp"
#include "vaultwire/core/util/error_types.hpp"
#include "vaultwire/core/util/PinnedCertificateVerifier.hpp"
#include "mock_transport.hpp"
#include "loopback_server.hpp"
#include "self_signed_cert.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace vaultwire;
using namespace vaultwire::test;
using namespace std::chrono_literals;

static ClientConfig plainConfig(uint16_t port = 40000) {
    ClientConfig cfg;
    cfg.serverAddress = "127.0.0.1";
    cfg.serverPort = port;
    cfg.useTls = false;
    cfg.readTimeout = 2000ms;
    cfg.connectTimeout = 2000ms;
    return cfg;
}

static std::vector<uint8_t> successReply(const std::string& method) {
    return Message(Direction::Response,
                   { { "Session", "S1" }, { "Content-Length", "7" }, { "Method", method }, { "Content-Type", "ascii" } },
                   bytes("Success")).toBytes();
}

/*──────────── mock transport ───────────*/

TEST_CASE("ProtocolClient: sends the request frame and returns the response", "[client]") {
    auto wire = std::make_shared<MockWire>();
    wire->reply = successReply("set_password");
    wire->chunk = 5;

    ProtocolClient client(plainConfig());
    client.setTransportFactory([wire] { return std::make_unique<MockTransport>(wire); });

    auto res = client.exchange(methods::SetPassword, bytes("{}"), "S1", std::string(content_types::Json));

    REQUIRE(wire->sent == Message::request("set_password", bytes("{}"), "S1", "json").toBytes());
    REQUIRE(res.direction() == Direction::Response);
    REQUIRE(res.isSuccess());
    REQUIRE(res.header("Session") == "S1");
}

TEST_CASE("ProtocolClient: one connection per exchange, always closed", "[client]") {
    auto wire = std::make_shared<MockWire>();
    wire->respond = [](const std::vector<uint8_t>&) { return successReply("get_sources"); };
    int opened = 0;

    ProtocolClient client(plainConfig());
    client.setTransportFactory([wire, &opened] {
        ++opened;
        return std::make_unique<MockTransport>(wire);
    });

    client.exchange(methods::GetSources, {}, "S1");
    client.exchange(methods::GetSources, {}, "S1");

    REQUIRE(opened == 2);
    REQUIRE(wire->connects == 2);
    REQUIRE(wire->closes == 2);
}

TEST_CASE("ProtocolClient: malformed reply is a framing error and the transport is released", "[client]") {
    auto wire = std::make_shared<MockWire>();
    ProtocolClient client(plainConfig());
    client.setTransportFactory([wire] { return std::make_unique<MockTransport>(wire); });

    SECTION("garbage") {
        wire->reply = bytes("xyz");
        REQUIRE_THROWS_AS(client.exchange(methods::GetSources, {}, "S1"), FramingError);
    }
    SECTION("request frame instead of a response") {
        wire->reply = Message::request("get_sources", {}, "S1").toBytes();
        REQUIRE_THROWS_AS(client.exchange(methods::GetSources, {}, "S1"), FramingError);
    }
    SECTION("connection closed mid-frame") {
        auto full = successReply("get_sources");
        wire->reply.assign(full.begin(), full.begin() + 12);
        REQUIRE_THROWS_AS(client.exchange(methods::GetSources, {}, "S1"), FramingError);
    }
    REQUIRE(wire->closes == 1);
}

TEST_CASE("ProtocolClient: a null certificate verifier is rejected", "[client]") {
    ProtocolClient client(plainConfig());
    REQUIRE_THROWS_AS(client.setCertificateVerifier(nullptr), std::invalid_argument);
}

/*──────────── real loopback sockets ───────────*/

TEST_CASE("ProtocolClient: closed port is classified as connection refused", "[client][net]") {
    uint16_t port;
    {
        boost::asio::io_context io;
        tcp::acceptor probe(io, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
        port = probe.local_endpoint().port();
    }

    ProtocolClient client(plainConfig(port));
    try {
        client.exchange(methods::GetSources, {}, "S1");
        FAIL("exchange against a closed port succeeded");
    }
    catch (const TransportError& e) {
        REQUIRE(e.code() == ClientErr::ConnectionRefused);
    }
}

TEST_CASE("ProtocolClient: silent server is classified as timed out", "[client][net]") {
    LoopbackServer server;

    auto cfg = plainConfig(server.port());
    cfg.readTimeout = 200ms;
    ProtocolClient client(cfg);

    const auto started = std::chrono::steady_clock::now();
    try {
        client.exchange(methods::LoginRequest, bytes("alice"), kRequestSession, std::string(content_types::Ascii));
        FAIL("exchange against a silent server succeeded");
    }
    catch (const TransportError& e) {
        REQUIRE(e.code() == ClientErr::ConnectionTimedOut);
    }
    REQUIRE(std::chrono::steady_clock::now() - started < 1900ms);
}

TEST_CASE("ProtocolClient: plain exchange with a fragmenting server", "[client][net]") {
    LoopbackServer server;
    std::vector<uint8_t> received;

    server.serveOnce([&received](tcp::socket& s) {
        AcceptedSocket conn(s);
        received = FrameReader(conn).receive().toBytes();

        auto reply = successReply("login_test");
        for (std::size_t i = 0; i < reply.size(); i += 4) {
            std::vector<uint8_t> piece(reply.begin() + static_cast<std::ptrdiff_t>(i),
                                       reply.begin() + static_cast<std::ptrdiff_t>(std::min(i + 4, reply.size())));
            conn.send(piece);
            std::this_thread::sleep_for(2ms);
        }
    });

    ProtocolClient client(plainConfig(server.port()));
    std::vector<uint8_t> number{ 9, 8, 7, 6, 5, 4, 3, 2 };
    auto res = client.exchange(methods::LoginTest, number, "S1", std::string(content_types::Bytes));

    REQUIRE(res.isSuccess());
    REQUIRE(res.header("Method") == "login_test");
    server.join();
    REQUIRE(received == Message::request("login_test", number, "S1", "bytes").toBytes());
}

TEST_CASE("ProtocolClient: TLS against a plain-text peer fails with a transport error", "[client][net][tls]") {
    LoopbackServer server;
    server.serveOnce([](tcp::socket& s) {
        uint8_t hello[512];
        boost::system::error_code ec;
        s.read_some(boost::asio::buffer(hello), ec);
        boost::asio::write(s, boost::asio::buffer(std::string("res:this is not TLS\n")), ec);
        s.shutdown(tcp::socket::shutdown_both, ec);
    });

    auto cfg = plainConfig(server.port());
    cfg.useTls = true;
    ProtocolClient client(cfg);

    REQUIRE_THROWS_AS(client.exchange(methods::GetSources, {}, "S1"), TransportError);
}

/*──────────── TLS certificate decisions ───────────*/

// Key generation is slow; one certificate serves every TLS case.
static const SelfSignedCert& serverCert() {
    static SelfSignedCert cert;
    return cert;
}

/// Complete a server handshake and answer one request; returns quietly if the client aborts.
static void serveTls(tcp::socket& s, std::atomic<bool>& answered) {
    namespace ssl = boost::asio::ssl;
    ssl::context ctx(ssl::context::tls_server);
    serverCert().use(ctx);
    ssl::stream<tcp::socket> tls(std::move(s), ctx);

    boost::system::error_code ec;
    tls.handshake(ssl::stream_base::server, ec);
    if (ec) return;

    AcceptedTlsStream conn(tls);
    FrameReader(conn).receive();
    conn.send(successReply("get_sources"));
    answered = true;
    tls.shutdown(ec);
}

static ClientConfig tlsConfig(uint16_t port) {
    auto cfg = plainConfig(port);
    cfg.useTls = true;
    return cfg;
}

TEST_CASE("ProtocolClient: self-signed certificate is rejected by the system trust store", "[client][net][tls]") {
    LoopbackServer server;
    std::atomic<bool> answered{ false };
    server.serveOnce([&answered](tcp::socket& s) { serveTls(s, answered); });

    ProtocolClient client(tlsConfig(server.port()));
    try {
        client.exchange(methods::GetSources, {}, "S1");
        FAIL("untrusted certificate was accepted");
    }
    catch (const TransportError& e) {
        REQUIRE(e.code() == ClientErr::CertificateRejected);
    }
    server.join();
    REQUIRE_FALSE(answered.load());
}

TEST_CASE("ProtocolClient: matching pinned fingerprint completes a TLS exchange", "[client][net][tls]") {
    LoopbackServer server;
    std::atomic<bool> answered{ false };
    server.serveOnce([&answered](tcp::socket& s) { serveTls(s, answered); });

    auto cfg = tlsConfig(server.port());
    cfg.pinnedSha256 = serverCert().sha256();
    ProtocolClient client(cfg);

    auto res = client.exchange(methods::GetSources, {}, "S1");
    REQUIRE(res.isSuccess());
    REQUIRE(res.header("Method") == "get_sources");
    server.join();
    REQUIRE(answered.load());
}

TEST_CASE("ProtocolClient: pinned verifier installed after construction", "[client][net][tls]") {
    LoopbackServer server;
    std::atomic<bool> answered{ false };
    server.serveOnce([&answered](tcp::socket& s) { serveTls(s, answered); });

    ProtocolClient client(tlsConfig(server.port()));
    client.setCertificateVerifier(std::make_shared<PinnedCertificateVerifier>(serverCert().sha256()));

    REQUIRE(client.exchange(methods::GetSources, {}, "S1").isSuccess());
    server.join();
    REQUIRE(answered.load());
}

TEST_CASE("ProtocolClient: wrong pinned fingerprint is rejected", "[client][net][tls]") {
    LoopbackServer server;
    std::atomic<bool> answered{ false };
    server.serveOnce([&answered](tcp::socket& s) { serveTls(s, answered); });

    auto cfg = tlsConfig(server.port());
    cfg.pinnedSha256 = std::string(64, '0');
    ProtocolClient client(cfg);

    try {
        client.exchange(methods::GetSources, {}, "S1");
        FAIL("certificate with a different fingerprint was accepted");
    }
    catch (const TransportError& e) {
        REQUIRE(e.code() == ClientErr::CertificateRejected);
    }
    server.join();
    REQUIRE_FALSE(answered.load());
}
