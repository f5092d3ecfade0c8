/**
 * @file base64.hpp
 * @brief Base64 helpers (standard alphabet, padded) backed by OpenSSL.
 */
#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>

namespace vaultwire {

    /**
     * @brief Encode bytes as padded standard base64 without line breaks.
     */
    std::string base64Encode(const std::vector<uint8_t>& data);

    /**
     * @brief Decode padded standard base64.
     * @throws std::invalid_argument if the text is not valid base64
     */
    std::vector<uint8_t> base64Decode(std::string_view text);

}
