#include "vaultwire/core/util/PinnedCertificateVerifier.hpp"
#include "vaultwire/core/util/error_types.hpp"
#include "vaultwire/core/util/hex.hpp"
#include "vaultwire/core/util/logger.hpp"
#include <boost/asio/ssl.hpp>
#include <openssl/evp.h>
#include <openssl/x509.h>

namespace vaultwire {

    PinnedCertificateVerifier::PinnedCertificateVerifier(std::string_view sha256Fingerprint) {
        try {
            pin_ = fromHex(sha256Fingerprint);
        }
        catch (const std::invalid_argument& ex) {
            throw ConfigError(std::string("invalid certificate fingerprint: ") + ex.what());
        }
        if (pin_.size() != 32)
            throw ConfigError("certificate fingerprint must be 32 bytes (SHA-256), got " +
                              std::to_string(pin_.size()));
    }

    void PinnedCertificateVerifier::configure(boost::asio::ssl::context&) {
        // no trust anchors: the pin is the only criterion
    }

    bool PinnedCertificateVerifier::verify(bool, boost::asio::ssl::verify_context& ctx,
                                           const std::string& serverName) {
        X509_STORE_CTX* store = ctx.native_handle();
        if (X509_STORE_CTX_get_error_depth(store) > 0)
            return true;   // only the leaf is pinned

        X509* cert = X509_STORE_CTX_get_current_cert(store);
        if (!cert) return false;

        std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
        unsigned int len = 0;
        if (X509_digest(cert, EVP_sha256(), digest.data(), &len) != 1)
            return false;
        digest.resize(len);

        if (digest != pin_) {
            LOG_WARN("[PinnedCertificateVerifier] certificate for '" + serverName +
                     "' has fingerprint " + toHex(digest) + ", expected " + toHex(pin_));
            return false;
        }
        return true;
    }

    std::string PinnedCertificateVerifier::rejectReason() const {
        return "server certificate does not match the pinned fingerprint";
    }

    std::string PinnedCertificateVerifier::fingerprint() const {
        return toHex(pin_);
    }

}
