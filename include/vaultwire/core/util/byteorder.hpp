#pragma once
#include <cstdint>
#include <cstddef>

namespace vaultwire {
    /**
     * @brief Writes a signed 32-bit integer as 4 little-endian bytes.
     * @param value The value to write.
     * @param out Destination, at least 4 bytes.
     */
    inline void writeInt32LE(int32_t value, uint8_t* out) {
        const auto u = static_cast<uint32_t>(value);
        out[0] = static_cast<uint8_t>(u & 0xFF);
        out[1] = static_cast<uint8_t>((u >> 8) & 0xFF);
        out[2] = static_cast<uint8_t>((u >> 16) & 0xFF);
        out[3] = static_cast<uint8_t>((u >> 24) & 0xFF);
    }

    /**
     * @brief Reads 4 little-endian bytes as a signed 32-bit integer, independent of host byte order.
     * @param in Source, at least 4 bytes.
     * @return The decoded value.
     */
    inline int32_t readInt32LE(const uint8_t* in) {
        const uint32_t u = static_cast<uint32_t>(in[0])
                         | (static_cast<uint32_t>(in[1]) << 8)
                         | (static_cast<uint32_t>(in[2]) << 16)
                         | (static_cast<uint32_t>(in[3]) << 24);
        return static_cast<int32_t>(u);
    }
}
