#include "apca/data/realtime/client.hpp"

#include "apca/core/ws/beast_websocket_transport.hpp"

namespace apca::data::realtime {

Subscriber::Subscriber(core::ws::Sender<MarketDataProtocol> sender, core::ClientConfig config)
    : sender_(std::move(sender)), config_(std::move(config)) {}

void Subscriber::authenticate() {
    authenticate(std::string(config_.api_key()), std::string(config_.api_secret()));
}

void Subscriber::authenticate(std::string key, std::string secret) {
    sender_.send(Authenticate{std::move(key), std::move(secret)});
}

void Subscriber::subscribe(SubscriptionData data) {
    sender_.send(Subscribe{std::move(data)});
}

void Subscriber::unsubscribe(SubscriptionData data) {
    sender_.send(Unsubscribe{std::move(data)});
}

void Subscriber::close() {
    sender_.close();
}

Client Client::connect(const core::ClientConfig& config, Source source,
                       core::ws::DecodeFailurePolicy policy) {
    return Client(config, core::ws::make_beast_websocket_transport(stream_url(config, source)),
                  policy);
}

Client::Client(core::ClientConfig config,
               std::shared_ptr<core::ws::IWebSocketTransport> transport,
               core::ws::DecodeFailurePolicy policy)
    : Client(std::move(config),
             core::ws::Session<MarketDataProtocol>(std::move(transport), policy).split()) {}

Client::Client(core::ClientConfig config,
               std::pair<core::ws::Sender<MarketDataProtocol>, Receiver> halves)
    : subscriber_(std::move(halves.first), std::move(config)),
      receiver_(std::move(halves.second)) {}

std::string Client::stream_url(const core::ClientConfig& config, Source source) {
    return config.environment().market_data_stream_url + "/" + std::string(to_string(source));
}

std::pair<Subscriber, Receiver> Client::split() && {
    return {std::move(subscriber_), std::move(receiver_)};
}

ResponseStream Client::stream() && {
    return std::move(receiver_).stream();
}

}  // namespace apca::data::realtime
