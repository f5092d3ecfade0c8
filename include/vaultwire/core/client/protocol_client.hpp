/**
 * @file protocol_client.hpp
 * @brief One-shot request/response exchange with a vault server.
 *
 * Every exchange opens a fresh connection, sends one request frame, reads one
 * response frame and closes the connection again. There are no retries.
 */
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "vaultwire/core/config/client_config.hpp"
#include "vaultwire/core/protocol/message.hpp"
#include "vaultwire/core/types.hpp"

namespace vaultwire {

    class ICertificateVerifier;

    /**
     * @class ProtocolClient
     * @brief Sends requests over a connection chosen by the configuration.
     *
     * `exchange` is re-entrant: each call owns its own transport. The setters
     * are not synchronized with running exchanges.
     */
    class ProtocolClient {
    public:
        /**
         * @brief Create a client for the configured endpoint.
         *
         * With `useTls` the certificate verifier is a pinned-fingerprint
         * verifier when `pinnedSha256` is set, otherwise the system trust
         * store (plus `caFile`).
         * @throws ConfigError if the pinned fingerprint is invalid
         */
        explicit ProtocolClient(ClientConfig config);
        ~ProtocolClient();

        ProtocolClient(const ProtocolClient&) = delete;
        ProtocolClient& operator=(const ProtocolClient&) = delete;

        /**
         * @brief Send one request and wait for its response.
         *
         * Request headers are emitted in the order Method, Session,
         * [Content-Type], Content-Length.
         * @param method Method name (see methods.hpp)
         * @param body Request body
         * @param session Session token, "-" for none or "*" to open one
         * @param contentType Optional Content-Type header value
         * @return The server's response frame
         * @throws TransportError on connect/read/write failure (classified)
         * @throws FramingError if the reply is malformed or is not a response
         */
        Message exchange(const std::string& method,
                         const std::vector<uint8_t>& body,
                         const std::string& session,
                         const std::optional<std::string>& contentType = std::nullopt);

        /**
         * @brief Replace the transport factory (alternative transports, tests).
         * @param factory Factory producing a fresh, unconnected transport; empty restores the default
         */
        void setTransportFactory(TransportFactory factory);

        /**
         * @brief Replace the TLS certificate policy used by the default factory.
         * @throws std::invalid_argument if @p verifier is null
         */
        void setCertificateVerifier(std::shared_ptr<ICertificateVerifier> verifier);

        const ClientConfig& config() const noexcept;

    private:
        struct Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}
