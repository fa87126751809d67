#pragma once

#include "apca/core/config.hpp"
#include "apca/core/ws/session.hpp"
#include "apca/data/enums.hpp"
#include "apca/data/realtime/protocol.hpp"

#include <memory>
#include <string>
#include <utility>

namespace apca::data::realtime {

using Receiver = core::ws::Receiver<MarketDataProtocol>;
using ResponseStream = core::ws::ResponseStream<MarketDataProtocol>;

/**
 * Sending half of a market data session. authenticate() returns as soon as the
 * frame is written; the outcome arrives as a Success or Error on the receiving
 * half. Subscription lists replace the current set of each channel they name.
 */
class Subscriber {
  public:
    Subscriber(core::ws::Sender<MarketDataProtocol> sender, core::ClientConfig config);

    // Authenticates with the credentials of the client configuration.
    void authenticate();
    void authenticate(std::string key, std::string secret);
    void subscribe(SubscriptionData data);
    void unsubscribe(SubscriptionData data);
    void close();

    [[nodiscard]] core::ws::SessionState state() const noexcept { return sender_.state(); }

  private:
    core::ws::Sender<MarketDataProtocol> sender_;
    core::ClientConfig config_;
};

/**
 * Real-time stock market data client over
 * wss://stream.data.alpaca.markets/v2/{iex|sip}.
 */
class Client {
  public:
    static Client connect(const core::ClientConfig& config, Source source = Source::Iex,
                          core::ws::DecodeFailurePolicy policy =
                              core::ws::DecodeFailurePolicy::Terminate);

    Client(core::ClientConfig config, std::shared_ptr<core::ws::IWebSocketTransport> transport,
           core::ws::DecodeFailurePolicy policy = core::ws::DecodeFailurePolicy::Terminate);

    [[nodiscard]] static std::string stream_url(const core::ClientConfig& config, Source source);

    void authenticate() { subscriber_.authenticate(); }
    void subscribe(SubscriptionData data) { subscriber_.subscribe(std::move(data)); }
    void unsubscribe(SubscriptionData data) { subscriber_.unsubscribe(std::move(data)); }

    // Hands out both halves; the client is consumed.
    std::pair<Subscriber, Receiver> split() &&;

    // Consumes the client, keeping only the receiving half.
    ResponseStream stream() &&;

  private:
    Client(core::ClientConfig config,
           std::pair<core::ws::Sender<MarketDataProtocol>, Receiver> halves);

    Subscriber subscriber_;
    Receiver receiver_;
};

}  // namespace apca::data::realtime
