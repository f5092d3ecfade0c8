/**
 * @file itransport.hpp
 * @brief Interface for transport layers in VaultWire.
 *
 * Defines the ITransport interface for one client-side byte-stream connection
 * (plain TCP, TLS, or an in-memory test double). A transport instance serves
 * exactly one request/response exchange and is released afterwards.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace vaultwire {

    /**
     * @class ITransport
     * @brief Interface for custom transport layers in VaultWire.
     *
     * Implement this interface to provide custom connection mechanisms. Errors
     * are reported as TransportError with a classified reason.
     */
    class ITransport {
    public:
        virtual ~ITransport() = default;
        /**
         * @brief Open the connection to the configured endpoint.
         *
         * Secure transports complete their handshake, including peer identity
         * verification, before returning.
         */
        virtual void connect() = 0;
        /**
         * @brief Write the whole buffer to the connection.
         * @param data Bytes to send
         */
        virtual void send(const std::vector<uint8_t>& data) = 0;
        /**
         * @brief Read at most @p max bytes.
         *
         * May return fewer bytes than requested. Throws TransportError with
         * reason ConnectionTimedOut if nothing arrives within the read timeout.
         * @param out Destination buffer
         * @param max Capacity of @p out
         * @return Number of bytes read, or 0 if the peer closed the connection
         */
        virtual std::size_t receiveSome(uint8_t* out, std::size_t max) = 0;
        /**
         * @brief Release the connection. Safe to call more than once.
         */
        virtual void close() noexcept = 0;
    };
}
