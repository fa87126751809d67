#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace apca::core::ws {

enum class FrameKind { Text, Binary };

struct Frame {
    FrameKind kind{FrameKind::Text};
    std::string payload;
};

/**
 * A message-oriented, bidirectional connection.
 *
 * Implementations allow exactly one write() and one read() to be in progress
 * at the same time from two different threads; that is what lets the send and
 * receive halves of a session be driven independently. Failures raise
 * core::TransportError.
 */
class IWebSocketTransport {
  public:
    virtual ~IWebSocketTransport() = default;

    virtual void write(std::string_view payload, FrameKind kind) = 0;

    // Blocks until a data frame arrives. std::nullopt once the peer has closed.
    virtual std::optional<Frame> read() = 0;

    virtual void close() = 0;
};

}  // namespace apca::core::ws
