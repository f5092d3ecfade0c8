/**
 * @file hex.hpp
 * @brief Hexadecimal encoding and decoding utilities for VaultWire.
 *
 * Used for certificate fingerprints and debug rendering of message bodies.
 */
#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <cctype>

namespace vaultwire {

    /**
     * @brief Convert bytes to a lowercase hexadecimal string.
     *
     * @param data Bytes to convert
     * @param separator Optional character inserted between bytes (0 for none)
     * @return Hexadecimal string
     */
    inline std::string toHex(const std::vector<uint8_t>& data, char separator = 0)
    {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (size_t i = 0; i < data.size(); ++i) {
            if (separator && i) oss << separator;
            oss << std::setw(2) << static_cast<int>(data[i]);
        }
        return oss.str();
    }

    /**
     * @brief Convert a hexadecimal string to bytes.
     *
     * Colons and spaces are ignored so fingerprints copied from
     * `openssl x509 -fingerprint` output are accepted as-is.
     * @param hex Hexadecimal string
     * @return Decoded bytes
     * @throws std::invalid_argument if the input has an odd digit count or contains invalid hex
     */
    inline std::vector<uint8_t> fromHex(std::string_view hex)
    {
        std::string digits;
        digits.reserve(hex.size());
        for (char c : hex) {
            if (c == ':' || c == ' ') continue;
            if (!std::isxdigit(static_cast<unsigned char>(c)))
                throw std::invalid_argument("fromHex: invalid character");
            digits.push_back(c);
        }
        if (digits.size() % 2 != 0)
            throw std::invalid_argument("fromHex: odd number of digits");

        std::vector<uint8_t> out(digits.size() / 2);
        for (size_t i = 0; i < out.size(); ++i)
        {
            auto byte = std::stoul(digits.substr(i * 2, 2), nullptr, 16);
            out[i] = static_cast<uint8_t>(byte & 0xFF);
        }
        return out;
    }

}
