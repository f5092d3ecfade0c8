#pragma once
#include "vaultwire/core/interfaces/itransport.hpp"
#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <vector>

namespace vaultwire::test {

    /**
     * In-memory transport. Serves a scripted reply in chunks and records what
     * the client sent; state is shared so tests can inspect it after the
     * client has released the transport.
     */
    struct MockWire {
        std::vector<uint8_t> reply;             // bytes handed out by receiveSome
        std::size_t          readPos = 0;
        std::size_t          chunk = 0;         // 0 = as much as requested
        bool                 randomChunks = false;
        std::mt19937         rng{ 1234 };

        std::vector<uint8_t> sent;
        int                  connects = 0;
        int                  closes = 0;

        // Optional: compute the reply from the request (mock server).
        std::function<std::vector<uint8_t>(const std::vector<uint8_t>&)> respond;
    };

    class MockTransport : public ITransport {
    public:
        explicit MockTransport(std::shared_ptr<MockWire> wire) : w_(std::move(wire)) {}

        void connect() override { ++w_->connects; }

        void send(const std::vector<uint8_t>& data) override {
            w_->sent.insert(w_->sent.end(), data.begin(), data.end());
            if (w_->respond) {
                w_->reply = w_->respond(data);
                w_->readPos = 0;
            }
        }

        std::size_t receiveSome(uint8_t* out, std::size_t max) override {
            const std::size_t left = w_->reply.size() - w_->readPos;
            if (left == 0) return 0;
            std::size_t n = std::min(left, max);
            if (w_->randomChunks)
                n = std::min(n, std::uniform_int_distribution<std::size_t>(1, 7)(w_->rng));
            else if (w_->chunk)
                n = std::min(n, w_->chunk);
            std::copy_n(w_->reply.begin() + static_cast<std::ptrdiff_t>(w_->readPos), n, out);
            w_->readPos += n;
            return n;
        }

        void close() noexcept override { ++w_->closes; }

    private:
        std::shared_ptr<MockWire> w_;
    };

    inline std::vector<uint8_t> bytes(const std::string& s) {
        return std::vector<uint8_t>(s.begin(), s.end());
    }

}
