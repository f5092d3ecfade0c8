/**
 * @file PinnedCertificateVerifier.hpp
 * @brief Certificate verifier that accepts exactly one leaf certificate by SHA-256 fingerprint.
 */
#pragma once

#include "vaultwire/core/interfaces/ICertificateVerifier.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace vaultwire {

    /**
     * @class PinnedCertificateVerifier
     * @brief Accepts a server whose leaf certificate has a known SHA-256 fingerprint.
     *
     * Intended for vault servers running with a self-signed certificate. Chain
     * and name validation are replaced by the fingerprint comparison; any other
     * leaf certificate is rejected.
     */
    class PinnedCertificateVerifier : public ICertificateVerifier {
    public:
        /**
         * @param sha256Fingerprint 64 hex digits, colons/spaces allowed
         * @throws ConfigError if the fingerprint is not 32 bytes of hex
         */
        explicit PinnedCertificateVerifier(std::string_view sha256Fingerprint);

        void configure(boost::asio::ssl::context& ctx) override;

        bool verify(bool preverified, boost::asio::ssl::verify_context& ctx,
                    const std::string& serverName) override;

        std::string rejectReason() const override;

        /// Expected fingerprint as lowercase hex.
        std::string fingerprint() const;

    private:
        std::vector<uint8_t> pin_;
    };

}
