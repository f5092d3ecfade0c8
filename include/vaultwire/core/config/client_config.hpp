/**
 * @file client_config.hpp
 * @brief Client configuration and its JSON loader.
 *
 * Accepts the legacy keys `serverIP`, `serverPort` and `withSSL` alongside
 * the extended ones (`serverAddress`, `useTls`, `readTimeoutMs`, ...).
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>
#include "vaultwire/core/util/logger.hpp"

namespace vaultwire {

    /**
     * @struct ClientConfig
     * @brief Everything needed to reach a vault server and keep local key files.
     */
    struct ClientConfig {
        std::string                serverAddress = "127.0.0.1";
        uint16_t                   serverPort = 0;
        bool                       useTls = true;
        std::chrono::milliseconds  readTimeout{ 120'000 };
        std::chrono::milliseconds  connectTimeout{ 120'000 };
        std::filesystem::path      keysDirectory = "keys";
        std::string                tlsServerName;              ///< Expected server identity; empty = serverAddress
        std::optional<std::string> caFile;                     ///< Extra trust anchor (PEM)
        std::optional<std::string> pinnedSha256;               ///< Leaf certificate fingerprint (hex)
        std::size_t                maxFrameBytes = 16 * 1024 * 1024;
        LogLevel                   logLevel = LogLevel::Info;

        /// Server identity checked during the TLS handshake.
        const std::string& expectedServerName() const noexcept {
            return tlsServerName.empty() ? serverAddress : tlsServerName;
        }

        /**
         * @brief Build a configuration from a JSON object.
         *
         * `serverPort` is required. When `connectTimeoutMs` is absent the
         * connect deadline follows the read deadline.
         * @throws ConfigError on a missing required field or a field of the wrong type or range
         */
        static ClientConfig fromJson(const nlohmann::json& j);
    };

    /**
     * @brief Read and parse a JSON configuration file.
     * @throws ConfigError if the file cannot be read, is not JSON, or fails validation
     */
    ClientConfig loadClientConfig(const std::filesystem::path& path);

}
