/**
 * @file SystemTrustVerifier.hpp
 * @brief Default certificate verifier: system trust store plus host name check.
 */
#pragma once

#include "vaultwire/core/interfaces/ICertificateVerifier.hpp"
#include <optional>
#include <string>

namespace vaultwire {

    /**
     * @class SystemTrustVerifier
     * @brief Default implementation of ICertificateVerifier.
     *
     * Validates the chain against the platform's default trust anchors
     * (optionally extended with a PEM CA file) and requires the leaf
     * certificate to match the expected server name (RFC 2818/6125 rules as
     * implemented by OpenSSL).
     */
    class SystemTrustVerifier : public ICertificateVerifier {
    public:
        /**
         * @param extraCaFile Optional PEM file with additional trust anchors
         */
        explicit SystemTrustVerifier(std::optional<std::string> extraCaFile = std::nullopt);

        void configure(boost::asio::ssl::context& ctx) override;

        bool verify(bool preverified, boost::asio::ssl::verify_context& ctx,
                    const std::string& serverName) override;

        std::string rejectReason() const override;

    private:
        std::optional<std::string> extraCaFile_;
    };

}
