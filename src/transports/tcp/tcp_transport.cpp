#include "vaultwire/transports/tcp/tcp_transport.hpp"
#include "vaultwire/core/util/error_types.hpp"
#include "vaultwire/core/util/logger.hpp"
#include "internal/transports/deadline_io.hpp"

namespace vaultwire {

    using boost::asio::ip::tcp;

    class TcpTransport::Impl {
    public:
        explicit Impl(TransportOptions o) : opts(std::move(o)), socket(io) {}

        void shutdownSocket() noexcept {
            boost::system::error_code ignored;
            socket.close(ignored);
        }

        TransportOptions        opts;
        boost::asio::io_context io;
        tcp::socket             socket;
    };

    TcpTransport::TcpTransport(TransportOptions options)
        : pImpl_(std::make_unique<Impl>(std::move(options))) {}

    TcpTransport::~TcpTransport() {
        close();
    }

    void TcpTransport::connect() {
        detail::connectWithDeadline(pImpl_->io, pImpl_->socket, pImpl_->opts);
        LOG_DEBUG("[TcpTransport] connected to " + pImpl_->opts.host + ":" + std::to_string(pImpl_->opts.port));
    }

    void TcpTransport::send(const std::vector<uint8_t>& data) {
        detail::writeWithDeadline(pImpl_->io, pImpl_->socket, data, pImpl_->opts.readTimeout,
                                  [this] { pImpl_->shutdownSocket(); });
    }

    std::size_t TcpTransport::receiveSome(uint8_t* out, std::size_t max) {
        boost::system::error_code ec;
        const std::size_t n = detail::readSomeWithDeadline(pImpl_->io, pImpl_->socket, out, max,
                                                           pImpl_->opts.readTimeout,
                                                           [this] { pImpl_->shutdownSocket(); }, ec);
        if (ec == boost::asio::error::eof)
            return 0;
        if (ec)
            throw makeTransportError("read", ec);
        return n;
    }

    void TcpTransport::close() noexcept {
        if (!pImpl_ || !pImpl_->socket.is_open()) return;
        boost::system::error_code ignored;
        pImpl_->socket.shutdown(tcp::socket::shutdown_both, ignored);
        pImpl_->socket.close(ignored);
    }

}
