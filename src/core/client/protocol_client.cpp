#include "vaultwire/core/client/protocol_client.hpp"
#include "vaultwire/core/interfaces/itransport.hpp"
#include "vaultwire/core/interfaces/ICertificateVerifier.hpp"
#include "vaultwire/core/protocol/frame_reader.hpp"
#include "vaultwire/core/protocol/methods.hpp"
#include "vaultwire/core/util/PinnedCertificateVerifier.hpp"
#include "vaultwire/core/util/SystemTrustVerifier.hpp"
#include "vaultwire/core/util/error_types.hpp"
#include "vaultwire/core/util/logger.hpp"
#include "vaultwire/transports/tcp/tcp_transport.hpp"
#include "vaultwire/transports/tls/tls_transport.hpp"
#include <stdexcept>

namespace vaultwire {

    namespace {
        /// Closes the transport on every exit path of an exchange.
        struct TransportCloser {
            void operator()(ITransport* t) const noexcept {
                t->close();
                delete t;
            }
        };
        using ScopedTransport = std::unique_ptr<ITransport, TransportCloser>;

        std::shared_ptr<ICertificateVerifier> makeVerifier(const ClientConfig& cfg) {
            if (cfg.pinnedSha256)
                return std::make_shared<PinnedCertificateVerifier>(*cfg.pinnedSha256);
            return std::make_shared<SystemTrustVerifier>(cfg.caFile);
        }
    }

    struct ProtocolClient::Impl {
        ClientConfig                          cfg;
        std::shared_ptr<ICertificateVerifier> verifier;
        TransportFactory                      customFactory;

        TransportOptions options() const {
            TransportOptions o;
            o.host = cfg.serverAddress;
            o.port = cfg.serverPort;
            o.connectTimeout = cfg.connectTimeout;
            o.readTimeout = cfg.readTimeout;
            return o;
        }

        std::unique_ptr<ITransport> open() const {
            if (customFactory)
                return customFactory();
            if (cfg.useTls)
                return std::make_unique<TlsTransport>(options(), verifier, cfg.expectedServerName());
            return std::make_unique<TcpTransport>(options());
        }
    };

    ProtocolClient::ProtocolClient(ClientConfig config)
        : pImpl_(std::make_unique<Impl>()) {
        pImpl_->cfg = std::move(config);
        if (pImpl_->cfg.useTls)
            pImpl_->verifier = makeVerifier(pImpl_->cfg);
    }

    ProtocolClient::~ProtocolClient() = default;

    Message ProtocolClient::exchange(const std::string& method,
                                     const std::vector<uint8_t>& body,
                                     const std::string& session,
                                     const std::optional<std::string>& contentType) {
        const Message req = Message::request(method, body, session, contentType);
        const auto wire = req.toBytes();

        ScopedTransport transport(pImpl_->open().release());
        if (!transport)
            throw TransportError(ClientErr::UnknownTransport, "transport factory returned no transport");

        LOG_DEBUG("[ProtocolClient] -> " + method + " session=" + (session.size() > 1 ? "<token>" : session) +
                  " body=" + std::to_string(body.size()) + "B");

        transport->connect();
        transport->send(wire);

        FrameReader reader(*transport, pImpl_->cfg.maxFrameBytes);
        Message res = reader.receive();

        if (res.direction() != Direction::Response)
            throw FramingError("expected a response frame to '" + method + "', got a request");

        LOG_DEBUG("[ProtocolClient] <- " + res.header(headers::Method).value_or("?") +
                  " body=" + std::to_string(res.body().size()) + "B");
        return res;
    }

    void ProtocolClient::setTransportFactory(TransportFactory factory) {
        pImpl_->customFactory = std::move(factory);
    }

    void ProtocolClient::setCertificateVerifier(std::shared_ptr<ICertificateVerifier> verifier) {
        if (!verifier)
            throw std::invalid_argument("ProtocolClient: certificate verifier must not be null");
        pImpl_->verifier = std::move(verifier);
    }

    const ClientConfig& ProtocolClient::config() const noexcept {
        return pImpl_->cfg;
    }

}
