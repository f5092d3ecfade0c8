#include "vaultwire/core/protocol/message.hpp"
#include "vaultwire/core/protocol/methods.hpp"
#include "vaultwire/core/util/byteorder.hpp"
#include "vaultwire/core/util/hex.hpp"
#include <charconv>
#include <cstring>
#include <limits>
#include <stdexcept>

namespace vaultwire {

    namespace {
        constexpr char kRequestTag[]  = "req";
        constexpr char kResponseTag[] = "res";
        constexpr std::size_t kTagSize = 3;

        const char* tagFor(Direction d) {
            return d == Direction::Request ? kRequestTag : kResponseTag;
        }
    }

    bool isValidHeaderToken(std::string_view token) noexcept {
        return token.find_first_of(":=") == std::string_view::npos;
    }

    Message::Message(Direction direction, HeaderList headers, std::vector<uint8_t> body)
        : direction_(direction), headers_(std::move(headers)), body_(std::move(body)) {}

    Message Message::request(const std::string& method,
                             std::vector<uint8_t> body,
                             const std::string& session,
                             const std::optional<std::string>& contentType) {
        HeaderList h;
        h.emplace_back(headers::Method, method);
        h.emplace_back(headers::Session, session);
        if (contentType) h.emplace_back(headers::ContentType, *contentType);
        h.emplace_back(headers::ContentLength, std::to_string(body.size()));
        return Message(Direction::Request, std::move(h), std::move(body));
    }

    std::size_t Message::headerLength() const noexcept {
        std::size_t len = kFramePrefixSize;
        for (const auto& [name, value] : headers_)
            len += name.size() + value.size() + 2;   // '=' and ':'
        return len;
    }

    std::vector<uint8_t> Message::toBytes() const {
        const std::size_t hlen = headerLength();
        if (hlen > static_cast<std::size_t>(std::numeric_limits<int32_t>::max()))
            throw std::overflow_error("Message::toBytes: header block exceeds INT32_MAX");

        std::vector<uint8_t> out;
        out.reserve(hlen + body_.size());
        out.insert(out.end(), tagFor(direction_), tagFor(direction_) + kTagSize);
        out.push_back(':');
        uint8_t len[4];
        writeInt32LE(static_cast<int32_t>(hlen), len);
        out.insert(out.end(), len, len + 4);
        out.push_back(':');
        for (const auto& [name, value] : headers_) {
            out.insert(out.end(), name.begin(), name.end());
            out.push_back('=');
            out.insert(out.end(), value.begin(), value.end());
            out.push_back(':');
        }
        out.insert(out.end(), body_.begin(), body_.end());
        return out;
    }

    Message Message::fromBytes(const std::vector<uint8_t>& bytes) {
        if (bytes.size() < kFramePrefixSize)
            throw FramingError("frame shorter than the " + std::to_string(kFramePrefixSize) + "-byte prefix");

        Direction dir;
        if (std::memcmp(bytes.data(), kRequestTag, kTagSize) == 0)       dir = Direction::Request;
        else if (std::memcmp(bytes.data(), kResponseTag, kTagSize) == 0) dir = Direction::Response;
        else throw FramingError("message does not start with req or res");

        if (bytes[3] != ':' || bytes[8] != ':')
            throw FramingError("missing ':' around the header length field");

        const int32_t rawLen = readInt32LE(bytes.data() + 4);
        if (rawLen < static_cast<int32_t>(kFramePrefixSize) || static_cast<std::size_t>(rawLen) > bytes.size())
            throw FramingError("header length " + std::to_string(rawLen) +
                               " out of range for a " + std::to_string(bytes.size()) + "-byte frame");
        const auto hlen = static_cast<std::size_t>(rawLen);

        HeaderList headers;
        std::string name, value;
        bool inName = true;
        bool sawEquals = false;
        for (std::size_t i = kFramePrefixSize; i < hlen; ++i) {
            const char c = static_cast<char>(bytes[i]);
            if (c == ':') {
                if (!sawEquals)
                    throw FramingError("header entry '" + name + "' has no '='");
                headers.emplace_back(std::move(name), std::move(value));
                name.clear();
                value.clear();
                inName = true;
                sawEquals = false;
            }
            else if (c == '=') {
                if (sawEquals)
                    throw FramingError("header entry '" + name + "' has more than one '='");
                sawEquals = true;
                inName = false;
            }
            else if (inName) {
                name.push_back(c);
            }
            else {
                value.push_back(c);
            }
        }
        if (!name.empty() || sawEquals)
            throw FramingError("header block does not end on an entry boundary at offset " + std::to_string(hlen));

        Message m(dir, std::move(headers),
                  std::vector<uint8_t>(bytes.begin() + static_cast<std::ptrdiff_t>(hlen), bytes.end()));

        // Content-Length is optional here, but when present it must describe the body
        if (auto declared = m.contentLength(); declared && *declared != m.body_.size())
            throw FramingError("Content-Length " + std::to_string(*declared) + " disagrees with the " +
                               std::to_string(m.body_.size()) + "-byte body after header length " +
                               std::to_string(hlen));
        return m;
    }

    std::optional<std::string> Message::header(std::string_view name) const {
        for (auto it = headers_.rbegin(); it != headers_.rend(); ++it)
            if (it->first == name) return it->second;
        return std::nullopt;
    }

    std::optional<std::size_t> Message::contentLength() const {
        auto v = header(headers::ContentLength);
        if (!v || v->empty()) return std::nullopt;
        std::size_t n = 0;
        auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), n);
        if (ec != std::errc() || ptr != v->data() + v->size()) return std::nullopt;
        return n;
    }

    bool Message::isSuccess() const noexcept {
        static constexpr std::string_view kSuccess = "Success";
        return body_.size() == kSuccess.size() &&
               std::memcmp(body_.data(), kSuccess.data(), kSuccess.size()) == 0;
    }

    std::string Message::toString() const {
        std::string s = tagFor(direction_);
        s += ':';
        for (const auto& [name, value] : headers_) {
            s += name;
            s += '=';
            s += value;
            s += ':';
        }
        s += '\n';
        s += toHex(body_, '-');
        return s;
    }

}
