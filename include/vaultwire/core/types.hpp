#pragma once
#include <vector>
#include <string>
#include <utility>
#include <cstdint>
#include <functional>
#include <memory>
#include <chrono>

namespace vaultwire {

    class ITransport; // Forward-declaration

    /// Ordered (name, value) header entries; order defines the wire layout.
    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    /// Opens a fresh, not yet connected transport for one exchange.
    using TransportFactory = std::function<std::unique_ptr<ITransport>()>;

    /**
     * @struct TransportOptions
     * @brief Endpoint and deadlines for one client connection.
     */
    struct TransportOptions {
        std::string               host = "127.0.0.1";                    ///< Server address or host name
        uint16_t                  port = 0;                              ///< Server port
        std::chrono::milliseconds connectTimeout{ 120'000 };             ///< Resolve + connect (+ TLS handshake) deadline
        std::chrono::milliseconds readTimeout{ 120'000 };                ///< Deadline for each read and write
    };

    /// Session token sent when no session exists (create_user).
    inline constexpr const char* kNoSession = "-";
    /// Session token asking the server to open a new session (login_request).
    inline constexpr const char* kRequestSession = "*";

}
