#pragma once
#include "vaultwire/core/types.hpp"
#include "vaultwire/core/util/error_types.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

// Blocking socket operations with a deadline, built on one private io_context
// per connection: start the async operation, run the context for at most the
// timeout, and if the operation is still pending cancel it and drain the
// context so no handler outlives the call.

namespace vaultwire::detail {

    using boost::asio::ip::tcp;

    /**
     * @brief Run @p io until the started operation completes or @p timeout expires.
     * @param cancel Called on timeout; must abort the pending operation (typically closes the socket)
     * @return false if the deadline expired
     */
    template <typename CancelFn>
    bool runWithDeadline(boost::asio::io_context& io, std::chrono::milliseconds timeout, CancelFn&& cancel) {
        io.restart();
        io.run_for(timeout);
        if (!io.stopped()) {
            cancel();
            io.run();
            return false;
        }
        return true;
    }

    /**
     * @brief Resolve and connect @p socket to the endpoint in @p opts.
     * @throws TransportError classified from the failing step
     */
    inline void connectWithDeadline(boost::asio::io_context& io, tcp::socket& socket, const TransportOptions& opts) {
        boost::system::error_code ec = boost::asio::error::would_block;
        tcp::resolver resolver(io);
        tcp::resolver::results_type endpoints;
        resolver.async_resolve(opts.host, std::to_string(opts.port),
            [&](const boost::system::error_code& e, tcp::resolver::results_type r) {
                ec = e;
                endpoints = std::move(r);
            });
        if (!runWithDeadline(io, opts.connectTimeout, [&] { resolver.cancel(); }))
            throw TransportError(ClientErr::ConnectionTimedOut, "resolving " + opts.host + " timed out");
        if (ec)
            throw makeTransportError("resolve " + opts.host, ec);

        ec = boost::asio::error::would_block;
        boost::asio::async_connect(socket, endpoints,
            [&](const boost::system::error_code& e, const tcp::endpoint&) { ec = e; });
        if (!runWithDeadline(io, opts.connectTimeout, [&] {
                boost::system::error_code ignored;
                socket.close(ignored);
            }))
            throw TransportError(ClientErr::ConnectionTimedOut,
                                 "connect to " + opts.host + ":" + std::to_string(opts.port) + " timed out");
        if (ec)
            throw makeTransportError("connect to " + opts.host + ":" + std::to_string(opts.port), ec);
    }

    /**
     * @brief Write the whole buffer to @p stream.
     * @throws TransportError on failure or when @p timeout expires
     */
    template <typename Stream, typename CancelFn>
    void writeWithDeadline(boost::asio::io_context& io, Stream& stream, const std::vector<uint8_t>& data,
                           std::chrono::milliseconds timeout, CancelFn&& cancel) {
        boost::system::error_code ec = boost::asio::error::would_block;
        boost::asio::async_write(stream, boost::asio::buffer(data),
            [&](const boost::system::error_code& e, std::size_t) { ec = e; });
        if (!runWithDeadline(io, timeout, std::forward<CancelFn>(cancel)))
            throw TransportError(ClientErr::ConnectionTimedOut, "send timed out");
        if (ec)
            throw makeTransportError("send", ec);
    }

    /**
     * @brief One bounded read from @p stream.
     * @param[out] ec Error of the read (eof and friends are left to the caller to interpret)
     * @return Bytes read
     * @throws TransportError with reason ConnectionTimedOut when @p timeout expires
     */
    template <typename Stream, typename CancelFn>
    std::size_t readSomeWithDeadline(boost::asio::io_context& io, Stream& stream, uint8_t* out, std::size_t max,
                                     std::chrono::milliseconds timeout, CancelFn&& cancel,
                                     boost::system::error_code& ec) {
        ec = boost::asio::error::would_block;
        std::size_t n = 0;
        stream.async_read_some(boost::asio::buffer(out, max),
            [&](const boost::system::error_code& e, std::size_t got) {
                ec = e;
                n = got;
            });
        if (!runWithDeadline(io, timeout, std::forward<CancelFn>(cancel)))
            throw TransportError(ClientErr::ConnectionTimedOut,
                                 "no data received within " + std::to_string(timeout.count()) + " ms");
        return n;
    }

}
