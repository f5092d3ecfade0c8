#include "vaultwire/core/util/base64.hpp"
#include <openssl/evp.h>
#include <stdexcept>
#include <limits>

namespace vaultwire {

    std::string base64Encode(const std::vector<uint8_t>& data) {
        if (data.empty()) return {};
        if (data.size() > static_cast<size_t>(std::numeric_limits<int>::max() / 4 * 3))
            throw std::overflow_error("base64Encode: input too large");

        std::string out(4 * ((data.size() + 2) / 3), '\0');
        const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                            data.data(), static_cast<int>(data.size()));
        out.resize(static_cast<size_t>(written));
        return out;
    }

    std::vector<uint8_t> base64Decode(std::string_view text) {
        if (text.empty()) return {};
        if (text.size() % 4 != 0)
            throw std::invalid_argument("base64Decode: length is not a multiple of 4");
        if (text.size() > static_cast<size_t>(std::numeric_limits<int>::max()))
            throw std::overflow_error("base64Decode: input too large");

        std::vector<uint8_t> out(text.size() / 4 * 3);
        const int n = EVP_DecodeBlock(out.data(),
                                      reinterpret_cast<const unsigned char*>(text.data()),
                                      static_cast<int>(text.size()));
        if (n < 0)
            throw std::invalid_argument("base64Decode: invalid character");

        // EVP_DecodeBlock counts the padding as zero bytes
        size_t padding = 0;
        if (text.back() == '=') ++padding;
        if (text.size() > 1 && text[text.size() - 2] == '=') ++padding;
        out.resize(static_cast<size_t>(n) - padding);
        return out;
    }

}
