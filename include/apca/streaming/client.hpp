#pragma once

#include "apca/core/config.hpp"
#include "apca/core/ws/session.hpp"
#include "apca/streaming/protocol.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace apca::streaming {

using Receiver = core::ws::Receiver<TradeUpdatesProtocol>;
using ResponseStream = core::ws::ResponseStream<TradeUpdatesProtocol>;

/**
 * Sending half of an account session. The server answers authenticate() and
 * listen() with Authorization and Listening messages on the receiving half.
 */
class Listener {
  public:
    Listener(core::ws::Sender<TradeUpdatesProtocol> sender, core::ClientConfig config);

    void authenticate();
    void authenticate(std::string key, std::string secret);
    // Sends the complete set of streams; an empty list stops all updates.
    void listen(std::vector<MessageStream> streams);
    void close();

    [[nodiscard]] core::ws::SessionState state() const noexcept { return sender_.state(); }

  private:
    core::ws::Sender<TradeUpdatesProtocol> sender_;
    core::ClientConfig config_;
};

/**
 * Order update client over wss://{paper-api|api}.alpaca.markets/stream.
 */
class Client {
  public:
    static Client connect(const core::ClientConfig& config,
                          core::ws::DecodeFailurePolicy policy =
                              core::ws::DecodeFailurePolicy::Terminate);

    Client(core::ClientConfig config, std::shared_ptr<core::ws::IWebSocketTransport> transport,
           core::ws::DecodeFailurePolicy policy = core::ws::DecodeFailurePolicy::Terminate);

    [[nodiscard]] static std::string stream_url(const core::ClientConfig& config);

    void authenticate() { listener_.authenticate(); }
    void listen(std::vector<MessageStream> streams) { listener_.listen(std::move(streams)); }

    std::pair<Listener, Receiver> split() &&;
    ResponseStream stream() &&;

  private:
    Client(core::ClientConfig config,
           std::pair<core::ws::Sender<TradeUpdatesProtocol>, Receiver> halves);

    Listener listener_;
    Receiver receiver_;
};

}  // namespace apca::streaming
