/**
 * @file tcp_transport.hpp
 * @brief Plaintext TCP transport for VaultWire.
 */
#pragma once

#include "vaultwire/core/interfaces/itransport.hpp"
#include "vaultwire/core/types.hpp"
#include <memory>

namespace vaultwire {

    /**
     * @class TcpTransport
     * @brief Plain TCP implementation of ITransport (Boost.Asio).
     *
     * Every blocking step runs against a deadline: connectTimeout for resolve
     * and connect, readTimeout for each send and read.
     */
    class TcpTransport : public ITransport {
    public:
        /**
         * @brief Constructs an unconnected transport.
         * @param options Endpoint and deadlines
         */
        explicit TcpTransport(TransportOptions options);

        /**
         * @brief Closes the connection if still open.
         */
        ~TcpTransport() override;

        TcpTransport(const TcpTransport&) = delete;
        TcpTransport& operator=(const TcpTransport&) = delete;

        void connect() override;
        void send(const std::vector<uint8_t>& data) override;
        std::size_t receiveSome(uint8_t* out, std::size_t max) override;
        void close() noexcept override;

    private:
        class Impl;
        std::unique_ptr<Impl> pImpl_;
    };

}
