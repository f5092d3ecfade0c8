#include "vaultwire/core/config/client_config.hpp"
#include "vaultwire/core/util/error_types.hpp"
#include "vaultwire/core/util/hex.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

namespace vaultwire {

    namespace {
        template <typename T>
        std::optional<T> optionalField(const nlohmann::json& j, const char* key) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
                return std::nullopt;
            try {
                return it->get<T>();
            }
            catch (const nlohmann::json::exception& e) {
                throw ConfigError(std::string("config field '") + key + "' has the wrong type: " + e.what());
            }
        }

        /// Looks up the first of two alternative key names.
        template <typename T>
        std::optional<T> eitherField(const nlohmann::json& j, const char* key, const char* legacyKey) {
            if (auto v = optionalField<T>(j, key)) return v;
            return optionalField<T>(j, legacyKey);
        }

        std::chrono::milliseconds timeoutField(const nlohmann::json& j, const char* key, std::chrono::milliseconds fallback) {
            auto ms = optionalField<int64_t>(j, key);
            if (!ms) return fallback;
            if (*ms <= 0)
                throw ConfigError(std::string("config field '") + key + "' must be positive");
            return std::chrono::milliseconds(*ms);
        }
    }

    ClientConfig ClientConfig::fromJson(const nlohmann::json& j) {
        if (!j.is_object())
            throw ConfigError("configuration must be a JSON object");

        ClientConfig cfg;

        if (auto addr = eitherField<std::string>(j, "serverAddress", "serverIP")) {
            if (addr->empty())
                throw ConfigError("config field 'serverAddress' must not be empty");
            cfg.serverAddress = *addr;
        }

        auto port = optionalField<int64_t>(j, "serverPort");
        if (!port)
            throw ConfigError("config field 'serverPort' is required");
        if (*port < 1 || *port > 65535)
            throw ConfigError("config field 'serverPort' out of range: " + std::to_string(*port));
        cfg.serverPort = static_cast<uint16_t>(*port);

        if (auto tls = eitherField<bool>(j, "useTls", "withSSL"))
            cfg.useTls = *tls;

        cfg.readTimeout = timeoutField(j, "readTimeoutMs", cfg.readTimeout);
        cfg.connectTimeout = timeoutField(j, "connectTimeoutMs", cfg.readTimeout);

        if (auto dir = optionalField<std::string>(j, "keysDirectory")) {
            if (dir->empty())
                throw ConfigError("config field 'keysDirectory' must not be empty");
            cfg.keysDirectory = *dir;
        }

        if (auto name = optionalField<std::string>(j, "tlsServerName"))
            cfg.tlsServerName = *name;
        cfg.caFile = optionalField<std::string>(j, "caFile");

        if (auto pin = optionalField<std::string>(j, "pinnedSha256")) {
            std::vector<uint8_t> raw;
            try {
                raw = fromHex(*pin);
            }
            catch (const std::invalid_argument& e) {
                throw ConfigError(std::string("config field 'pinnedSha256' is not hex: ") + e.what());
            }
            if (raw.size() != 32)
                throw ConfigError("config field 'pinnedSha256' must be a 32-byte SHA-256 fingerprint");
            cfg.pinnedSha256 = *pin;
        }

        if (auto maxFrame = optionalField<int64_t>(j, "maxFrameBytes")) {
            if (*maxFrame < 64)
                throw ConfigError("config field 'maxFrameBytes' is too small");
            cfg.maxFrameBytes = static_cast<std::size_t>(*maxFrame);
        }

        if (auto lvl = optionalField<std::string>(j, "logLevel")) {
            auto parsed = parseLogLevel(*lvl);
            if (!parsed)
                throw ConfigError("unknown log level '" + *lvl + "'");
            cfg.logLevel = *parsed;
        }

        return cfg;
    }

    ClientConfig loadClientConfig(const std::filesystem::path& path) {
        std::ifstream in(path);
        if (!in)
            throw ConfigError("cannot open config file " + path.string());

        nlohmann::json j;
        try {
            in >> j;
        }
        catch (const nlohmann::json::parse_error& e) {
            throw ConfigError("config file " + path.string() + " is not valid JSON: " + e.what());
        }
        return ClientConfig::fromJson(j);
    }

}
