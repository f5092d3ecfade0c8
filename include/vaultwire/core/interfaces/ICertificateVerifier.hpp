/**
 * @file ICertificateVerifier.hpp
 * @brief Interface for TLS server identity verification in VaultWire.
 *
 * Defines the ICertificateVerifier interface consulted by TlsTransport during
 * the handshake. A rejected certificate aborts the handshake and surfaces as a
 * TransportError with reason CertificateRejected; there is no accept-all
 * fallback.
 */
#pragma once

#include <string>

// Forward declarations to avoid including the Boost.Asio SSL headers
namespace boost::asio::ssl {
    class context;
    class verify_context;
}

namespace vaultwire {

    /**
     * @class ICertificateVerifier
     * @brief Pluggable certificate verification strategy for TLS connections.
     *
     * Implement this interface to change which servers a TlsTransport accepts,
     * e.g. a private CA bundle or a pinned self-signed certificate.
     */
    class ICertificateVerifier {
    public:
        virtual ~ICertificateVerifier() = default;

        /**
         * @brief Prepare the SSL context before any connection is made.
         *
         * Implementations load trust anchors here. Peer verification is always
         * enabled by the transport regardless of what this method does.
         * @param ctx SSL context owned by the transport
         */
        virtual void configure(boost::asio::ssl::context& ctx) = 0;

        /**
         * @brief Decide whether one certificate of the presented chain is acceptable.
         *
         * Called once per certificate, from the root towards the leaf (depth 0).
         * @param preverified Result of OpenSSL's own chain validation for this certificate
         * @param ctx Verification context (certificate, depth, error)
         * @param serverName Expected server identity (host name or IP address)
         * @return true to accept, false to abort the handshake
         */
        virtual bool verify(bool preverified, boost::asio::ssl::verify_context& ctx,
                            const std::string& serverName) = 0;

        /**
         * @brief Reason text used when a certificate is rejected.
         * @return String describing the rejection reason
         */
        virtual std::string rejectReason() const {
            return "server certificate rejected";
        }
    };

}
