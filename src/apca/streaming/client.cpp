#include "apca/streaming/client.hpp"

#include "apca/core/ws/beast_websocket_transport.hpp"

namespace apca::streaming {

Listener::Listener(core::ws::Sender<TradeUpdatesProtocol> sender, core::ClientConfig config)
    : sender_(std::move(sender)), config_(std::move(config)) {}

void Listener::authenticate() {
    authenticate(std::string(config_.api_key()), std::string(config_.api_secret()));
}

void Listener::authenticate(std::string key, std::string secret) {
    sender_.send(Authenticate{std::move(key), std::move(secret)});
}

void Listener::listen(std::vector<MessageStream> streams) {
    sender_.send(Listen{std::move(streams)});
}

void Listener::close() {
    sender_.close();
}

Client Client::connect(const core::ClientConfig& config, core::ws::DecodeFailurePolicy policy) {
    return Client(config, core::ws::make_beast_websocket_transport(stream_url(config)), policy);
}

Client::Client(core::ClientConfig config,
               std::shared_ptr<core::ws::IWebSocketTransport> transport,
               core::ws::DecodeFailurePolicy policy)
    : Client(std::move(config),
             core::ws::Session<TradeUpdatesProtocol>(std::move(transport), policy).split()) {}

Client::Client(core::ClientConfig config,
               std::pair<core::ws::Sender<TradeUpdatesProtocol>, Receiver> halves)
    : listener_(std::move(halves.first), std::move(config)),
      receiver_(std::move(halves.second)) {}

std::string Client::stream_url(const core::ClientConfig& config) {
    return config.environment().trading_stream_url;
}

std::pair<Listener, Receiver> Client::split() && {
    return {std::move(listener_), std::move(receiver_)};
}

ResponseStream Client::stream() && {
    return std::move(receiver_).stream();
}

}  // namespace apca::streaming
