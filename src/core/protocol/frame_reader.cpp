#include "vaultwire/core/protocol/frame_reader.hpp"
#include "vaultwire/core/interfaces/itransport.hpp"
#include "vaultwire/core/util/byteorder.hpp"
#include "vaultwire/core/util/logger.hpp"
#include <charconv>
#include <regex>
#include <string>

namespace vaultwire {

    namespace {
        const std::regex& contentLengthPattern() {
            static const std::regex re("(?:^|:)Content-Length=([0-9]+):");
            return re;
        }
    }

    FrameReader::FrameReader(ITransport& transport, std::size_t maxFrameBytes)
        : transport_(transport), maxFrameBytes_(maxFrameBytes) {}

    std::vector<uint8_t> FrameReader::readExact(std::size_t n) {
        std::vector<uint8_t> buf(n);
        std::size_t got = 0;
        while (got < n) {
            const std::size_t r = transport_.receiveSome(buf.data() + got, n - got);
            if (r == 0)
                throw FramingError("connection closed after " + std::to_string(got) +
                                   " of " + std::to_string(n) + " bytes");
            got += r;
        }
        return buf;
    }

    Message FrameReader::receive() {
        // 1) direction tag
        std::vector<uint8_t> frame = readExact(3);
        const std::string tag(frame.begin(), frame.end());
        if (tag != "req" && tag != "res")
            throw FramingError("message does not start with req or res");

        // 2) ':' + int32 headerLength + ':'
        const auto lenField = readExact(6);
        frame.insert(frame.end(), lenField.begin(), lenField.end());
        const int32_t headerLength = readInt32LE(lenField.data() + 1);
        if (headerLength < static_cast<int32_t>(kFramePrefixSize))
            throw FramingError("invalid header length " + std::to_string(headerLength));
        const auto blockSize = static_cast<std::size_t>(headerLength) - kFramePrefixSize;
        if (blockSize > maxFrameBytes_)
            throw FramingError("header block of " + std::to_string(blockSize) + " bytes exceeds limit");

        // 3) header block
        const auto block = readExact(blockSize);
        frame.insert(frame.end(), block.begin(), block.end());

        // 4) Content-Length
        const std::string headerText(block.begin(), block.end());
        std::smatch m;
        if (!std::regex_search(headerText, m, contentLengthPattern()))
            throw FramingError("response has no Content-Length header");
        const std::string digits = m[1].str();
        std::size_t contentLength = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), contentLength);
        if (ec != std::errc() || contentLength > maxFrameBytes_)
            throw FramingError("Content-Length " + digits + " is out of range");

        // 5) body
        const auto body = readExact(contentLength);
        frame.insert(frame.end(), body.begin(), body.end());

        LOG_TRACE("[FrameReader] received frame of " + std::to_string(frame.size()) + " bytes");

        // 6) decode the reassembled frame
        return Message::fromBytes(frame);
    }

}
