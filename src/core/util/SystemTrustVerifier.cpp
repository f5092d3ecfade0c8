#include "vaultwire/core/util/SystemTrustVerifier.hpp"
#include "vaultwire/core/util/error_types.hpp"
#include "vaultwire/core/util/logger.hpp"
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>

namespace vaultwire {

    SystemTrustVerifier::SystemTrustVerifier(std::optional<std::string> extraCaFile)
        : extraCaFile_(std::move(extraCaFile)) {}

    void SystemTrustVerifier::configure(boost::asio::ssl::context& ctx) {
        boost::system::error_code ec;
        ctx.set_default_verify_paths(ec);
        if (ec) {
            LOG_WARN("[SystemTrustVerifier] could not load default trust store: " + ec.message());
        }
        if (extraCaFile_) {
            ctx.load_verify_file(*extraCaFile_, ec);
            if (ec)
                throw ConfigError("cannot load CA file '" + *extraCaFile_ + "': " + ec.message());
        }
    }

    bool SystemTrustVerifier::verify(bool preverified, boost::asio::ssl::verify_context& ctx,
                                     const std::string& serverName) {
        const bool ok = boost::asio::ssl::host_name_verification(serverName)(preverified, ctx);
        if (!ok) {
            const int depth = X509_STORE_CTX_get_error_depth(ctx.native_handle());
            const int err = X509_STORE_CTX_get_error(ctx.native_handle());
            LOG_WARN("[SystemTrustVerifier] rejected certificate at depth " + std::to_string(depth) +
                     " for '" + serverName + "': " + X509_verify_cert_error_string(err));
        }
        return ok;
    }

    std::string SystemTrustVerifier::rejectReason() const {
        return "server certificate is not trusted or does not match the server name";
    }

}
