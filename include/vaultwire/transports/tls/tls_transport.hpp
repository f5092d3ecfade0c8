/**
 * @file tls_transport.hpp
 * @brief TLS transport for VaultWire.
 */
#pragma once

#include "vaultwire/core/interfaces/itransport.hpp"
#include "vaultwire/core/interfaces/ICertificateVerifier.hpp"
#include "vaultwire/core/types.hpp"
#include <memory>
#include <string>

namespace vaultwire {

    /**
     * @class TlsTransport
     * @brief TLS (OpenSSL via Boost.Asio) implementation of ITransport.
     *
     * connect() opens the TCP connection and completes the TLS handshake
     * before any protocol bytes are sent. The peer certificate is judged by
     * the ICertificateVerifier; a rejection raises TransportError with reason
     * CertificateRejected. TLS 1.2 is the minimum protocol version.
     */
    class TlsTransport : public ITransport {
    public:
        /**
         * @param options Endpoint and deadlines
         * @param verifier Certificate policy (must not be null)
         * @param serverName Expected server identity; empty means options.host
         * @throws std::invalid_argument if @p verifier is null
         */
        TlsTransport(TransportOptions options,
                     std::shared_ptr<ICertificateVerifier> verifier,
                     std::string serverName = {});

        ~TlsTransport() override;

        TlsTransport(const TlsTransport&) = delete;
        TlsTransport& operator=(const TlsTransport&) = delete;

        void connect() override;
        void send(const std::vector<uint8_t>& data) override;
        std::size_t receiveSome(uint8_t* out, std::size_t max) override;
        void close() noexcept override;

    private:
        class Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}
