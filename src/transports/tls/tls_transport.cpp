#include "vaultwire/transports/tls/tls_transport.hpp"
#include "vaultwire/core/util/error_types.hpp"
#include "vaultwire/core/util/logger.hpp"
#include "internal/transports/deadline_io.hpp"
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ssl.hpp>
#include <stdexcept>

namespace vaultwire {

    using boost::asio::ip::tcp;
    namespace ssl = boost::asio::ssl;

    namespace {
        ssl::context makeContext(ICertificateVerifier& verifier) {
            ssl::context ctx(ssl::context::tls_client);
            ctx.set_options(ssl::context::default_workarounds |
                            ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                            ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1);
            verifier.configure(ctx);
            return ctx;
        }

        bool isIpLiteral(const std::string& host) {
            boost::system::error_code ec;
            boost::asio::ip::make_address(host, ec);
            return !ec;
        }

        std::shared_ptr<ICertificateVerifier> requireVerifier(std::shared_ptr<ICertificateVerifier> v) {
            if (!v) throw std::invalid_argument("TlsTransport: certificate verifier must not be null");
            return v;
        }
    }

    class TlsTransport::Impl {
    public:
        Impl(TransportOptions o, std::shared_ptr<ICertificateVerifier> v, std::string name)
            : opts(std::move(o)),
              verifier(std::move(v)),
              serverName(name.empty() ? opts.host : std::move(name)),
              ctx(makeContext(*verifier)),
              stream(io, ctx) {}

        void shutdownSocket() noexcept {
            boost::system::error_code ignored;
            stream.lowest_layer().close(ignored);
        }

        TransportOptions                      opts;
        std::shared_ptr<ICertificateVerifier> verifier;
        std::string                           serverName;
        boost::asio::io_context               io;
        ssl::context                          ctx;
        ssl::stream<tcp::socket>              stream;
        bool                                  rejected = false;
    };

    TlsTransport::TlsTransport(TransportOptions options,
                               std::shared_ptr<ICertificateVerifier> verifier,
                               std::string serverName)
        : pImpl_(std::make_unique<Impl>(std::move(options), requireVerifier(std::move(verifier)),
                                        std::move(serverName))) {}

    TlsTransport::~TlsTransport() {
        close();
    }

    void TlsTransport::connect() {
        Impl& d = *pImpl_;
        detail::connectWithDeadline(d.io, d.stream.next_layer(), d.opts);

        // SNI carries host names only, never address literals
        if (!isIpLiteral(d.serverName) &&
            !SSL_set_tlsext_host_name(d.stream.native_handle(), d.serverName.c_str())) {
            throw TransportError(ClientErr::UnknownTransport, "cannot set TLS server name '" + d.serverName + "'");
        }

        d.stream.set_verify_mode(ssl::verify_peer);
        d.stream.set_verify_callback([&d](bool preverified, ssl::verify_context& vc) {
            const bool ok = d.verifier->verify(preverified, vc, d.serverName);
            if (!ok) d.rejected = true;
            return ok;
        });

        boost::system::error_code ec = boost::asio::error::would_block;
        d.stream.async_handshake(ssl::stream_base::client,
            [&ec](const boost::system::error_code& e) { ec = e; });
        if (!detail::runWithDeadline(d.io, d.opts.connectTimeout, [&d] { d.shutdownSocket(); }))
            throw TransportError(ClientErr::ConnectionTimedOut, "TLS handshake with " + d.serverName + " timed out");
        if (d.rejected)
            throw TransportError(ClientErr::CertificateRejected,
                                 "TLS handshake with " + d.serverName + ": " + d.verifier->rejectReason());
        if (ec)
            throw makeTransportError("TLS handshake with " + d.serverName, ec);

        LOG_DEBUG("[TlsTransport] handshake complete with " + d.serverName + " (" +
                  SSL_get_version(d.stream.native_handle()) + ")");
    }

    void TlsTransport::send(const std::vector<uint8_t>& data) {
        // async_write completes only after every TLS record has been written,
        // which is the flush the protocol requires before reading the reply
        detail::writeWithDeadline(pImpl_->io, pImpl_->stream, data, pImpl_->opts.readTimeout,
                                  [this] { pImpl_->shutdownSocket(); });
    }

    std::size_t TlsTransport::receiveSome(uint8_t* out, std::size_t max) {
        boost::system::error_code ec;
        const std::size_t n = detail::readSomeWithDeadline(pImpl_->io, pImpl_->stream, out, max,
                                                           pImpl_->opts.readTimeout,
                                                           [this] { pImpl_->shutdownSocket(); }, ec);
        // servers commonly drop the socket without close_notify after replying
        if (ec == boost::asio::error::eof || ec == ssl::error::stream_truncated)
            return 0;
        if (ec)
            throw makeTransportError("TLS read", ec);
        return n;
    }

    void TlsTransport::close() noexcept {
        if (!pImpl_) return;
        auto& sock = pImpl_->stream.lowest_layer();
        if (!sock.is_open()) return;
        boost::system::error_code ignored;
        sock.shutdown(tcp::socket::shutdown_both, ignored);
        sock.close(ignored);
    }

}
