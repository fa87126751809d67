#pragma once

#include "apca/core/ws/websocket_transport.hpp"

#include <memory>
#include <string>

namespace apca::core::ws {

/**
 * Secure WebSocket over Boost.Beast. The socket is driven by a private I/O
 * thread; read() and write() hand their operation to it and block on the result.
 */
class BeastWebSocketTransport final : public IWebSocketTransport {
  public:
    // Resolves, connects and performs the TLS and WebSocket handshakes.
    explicit BeastWebSocketTransport(const std::string& url);
    ~BeastWebSocketTransport() override;

    BeastWebSocketTransport(const BeastWebSocketTransport&) = delete;
    BeastWebSocketTransport& operator=(const BeastWebSocketTransport&) = delete;

    void write(std::string_view payload, FrameKind kind) override;
    std::optional<Frame> read() override;
    void close() override;

  private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
};

std::shared_ptr<IWebSocketTransport> make_beast_websocket_transport(const std::string& url);

}  // namespace apca::core::ws
