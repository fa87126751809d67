#pragma once

#include "apca/core/errors.hpp"
#include "apca/core/ws/websocket_transport.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

namespace apca::core::ws {

/**
 * In-memory transport for tests. Inbound frames are queued with push_frame();
 * read() blocks until one is available or the mock is closed. Outbound frames
 * are recorded in write order.
 */
class MockWebSocketTransport final : public IWebSocketTransport {
  public:
    void push_frame(std::string payload, FrameKind kind = FrameKind::Text) {
        {
            std::lock_guard lock(mutex_);
            inbound_.push_back(Frame{kind, std::move(payload)});
        }
        cv_.notify_all();
    }

    // Simulates the peer closing the connection once queued frames are drained.
    void close_from_peer() {
        {
            std::lock_guard lock(mutex_);
            peer_closed_ = true;
        }
        cv_.notify_all();
    }

    void fail_writes(bool fail) {
        std::lock_guard lock(mutex_);
        fail_writes_ = fail;
    }

    void write(std::string_view payload, FrameKind kind) override {
        std::lock_guard lock(mutex_);
        if (closed_ || fail_writes_) {
            throw TransportError("MockWebSocketTransport: connection reset");
        }
        outbound_.push_back(Frame{kind, std::string(payload)});
    }

    std::optional<Frame> read() override {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return !inbound_.empty() || peer_closed_ || closed_; });
        if (inbound_.empty()) {
            return std::nullopt;
        }
        auto frame = std::move(inbound_.front());
        inbound_.pop_front();
        return frame;
    }

    void close() override {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] std::vector<Frame> written() const {
        std::lock_guard lock(mutex_);
        return outbound_;
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Frame> inbound_;
    std::vector<Frame> outbound_;
    bool peer_closed_{false};
    bool closed_{false};
    bool fail_writes_{false};
};

}  // namespace apca::core::ws
