/**
 * @file message.hpp
 * @brief Wire message value type for the vault protocol.
 *
 * Frame layout (all integers little-endian, all text ASCII, no escaping):
 * @code
 *   0..3   "req" | "res"
 *   3      ':'
 *   4..8   int32 headerLength (offset at which the body starts)
 *   8      ':'
 *   9..H   (name '=' value ':')*
 *   H..end body
 * @endcode
 * Header names and values must not contain ':' or '='. There is no escaping
 * mechanism; a violating header produces a frame that decodes differently or
 * fails to decode.
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "vaultwire/core/types.hpp"
#include "vaultwire/core/util/error_types.hpp"

namespace vaultwire {

    /**
     * @enum Direction
     * @brief Message direction, encoded as the 3-byte tag "req" or "res".
     */
    enum class Direction { Request, Response };

    /// Number of fixed bytes preceding the header entries: tag(3) ':' int32 ':'.
    inline constexpr std::size_t kFramePrefixSize = 9;

    /**
     * @brief Check that a header name or value contains no wire delimiter.
     * @return False if the token contains ':' or '='
     */
    bool isValidHeaderToken(std::string_view token) noexcept;

    /**
     * @class Message
     * @brief Immutable request/response message with deterministic binary encoding.
     */
    class Message {
    public:
        /**
         * @brief Construct a message.
         *
         * Header tokens are not validated here; use isValidHeaderToken() to
         * check caller-supplied values before building a message.
         * @param direction Request or Response
         * @param headers Ordered header entries
         * @param body Opaque body bytes
         */
        Message(Direction direction, HeaderList headers, std::vector<uint8_t> body);

        /**
         * @brief Build a request with the standard header set.
         *
         * Headers, in order: Method, Session, [Content-Type], Content-Length.
         * @param method Protocol method name
         * @param body Request body
         * @param session Session token ("-", "*" or a server-issued token)
         * @param contentType Optional Content-Type header value
         */
        static Message request(const std::string& method,
                               std::vector<uint8_t> body,
                               const std::string& session,
                               const std::optional<std::string>& contentType = std::nullopt);

        /**
         * @brief Parse a complete frame.
         * @param bytes Whole frame (prefix, header block and body)
         * @return Decoded message
         * @throws FramingError if the bytes are not a well-formed frame, or a
         *         Content-Length header disagrees with the body length
         */
        static Message fromBytes(const std::vector<uint8_t>& bytes);

        /**
         * @brief Serialize the message into a frame.
         * @throws std::overflow_error if the header block exceeds INT32_MAX bytes
         */
        std::vector<uint8_t> toBytes() const;

        Direction direction() const noexcept { return direction_; }
        const HeaderList& headers() const noexcept { return headers_; }
        const std::vector<uint8_t>& body() const noexcept { return body_; }

        /**
         * @brief Look up a header value by name.
         *
         * Duplicate names are preserved on the wire; the last occurrence wins.
         */
        std::optional<std::string> header(std::string_view name) const;

        /// Body bytes as a string.
        std::string bodyString() const { return std::string(body_.begin(), body_.end()); }

        /// Parsed Content-Length header, if present and numeric.
        std::optional<std::size_t> contentLength() const;

        /// True if the body is exactly the literal "Success".
        bool isSuccess() const noexcept;

        /// Offset at which the body starts in the encoded frame.
        std::size_t headerLength() const noexcept;

        /// Debug rendering: "req:Name=value:...:" followed by the body in hex.
        std::string toString() const;

        bool operator==(const Message& other) const = default;

    private:
        Direction            direction_;
        HeaderList           headers_;
        std::vector<uint8_t> body_;
    };

}
