/**
 * @file frame_reader.hpp
 * @brief Reassembles one framed Message from a streaming transport.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "vaultwire/core/protocol/message.hpp"

namespace vaultwire {

    class ITransport;

    /**
     * @class FrameReader
     * @brief Reads exactly one frame from an ITransport.
     *
     * The stream carries no whole-message length prefix, so the frame is read
     * in stages: tag, header length field, header block, then a body whose
     * size comes from the Content-Length header. Every stage loops until the
     * requested byte count has arrived, whatever chunking the transport uses.
     */
    class FrameReader {
    public:
        /// Default upper bound for header block and body sizes.
        static constexpr std::size_t kDefaultMaxFrameBytes = 16 * 1024 * 1024;

        /**
         * @param transport Connected transport to read from
         * @param maxFrameBytes Largest header block or body accepted
         */
        explicit FrameReader(ITransport& transport, std::size_t maxFrameBytes = kDefaultMaxFrameBytes);

        /**
         * @brief Receive and decode one frame.
         * @throws FramingError on a bad tag, truncated stream, missing Content-Length or oversized frame
         * @throws TransportError if the transport fails or times out
         */
        Message receive();

        /**
         * @brief Read exactly @p n bytes.
         * @throws FramingError if the peer closes before @p n bytes arrived
         */
        std::vector<uint8_t> readExact(std::size_t n);

    private:
        ITransport& transport_;
        std::size_t maxFrameBytes_;
    };

}
