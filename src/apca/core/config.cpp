#include "apca/core/config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace apca::core {

namespace {
constexpr std::string_view kLiveTradingUrl = "https://api.alpaca.markets";
constexpr std::string_view kPaperTradingUrl = "https://paper-api.alpaca.markets";
constexpr std::string_view kMarketDataUrl = "https://data.alpaca.markets";
constexpr std::string_view kLiveTradingStreamUrl = "wss://api.alpaca.markets/stream";
constexpr std::string_view kPaperTradingStreamUrl = "wss://paper-api.alpaca.markets/stream";
constexpr std::string_view kMarketDataStreamUrl = "wss://stream.data.alpaca.markets/v2";

bool env_flag_is_false(const char* value) {
    std::string_view flag(value);
    return flag == "false" || flag == "FALSE" || flag == "False" || flag == "0";
}
}  // namespace

ClientEnvironment ClientEnvironment::Live() {
    return ClientEnvironment{
        .kind = EnvironmentKind::LiveTrading,
        .trading_url = std::string{kLiveTradingUrl},
        .market_data_url = std::string{kMarketDataUrl},
        .trading_stream_url = std::string{kLiveTradingStreamUrl},
        .market_data_stream_url = std::string{kMarketDataStreamUrl},
    };
}

ClientEnvironment ClientEnvironment::Paper() {
    return ClientEnvironment{
        .kind = EnvironmentKind::PaperTrading,
        .trading_url = std::string{kPaperTradingUrl},
        .market_data_url = std::string{kMarketDataUrl},
        .trading_stream_url = std::string{kPaperTradingStreamUrl},
        .market_data_stream_url = std::string{kMarketDataStreamUrl},
    };
}

ClientEnvironment ClientEnvironment::Custom(std::string trading, std::string market_data,
                                            std::string trading_stream,
                                            std::string market_data_stream) {
    return ClientEnvironment{
        .kind = EnvironmentKind::Custom,
        .trading_url = std::move(trading),
        .market_data_url = std::move(market_data),
        .trading_stream_url = std::move(trading_stream),
        .market_data_stream_url = std::move(market_data_stream),
    };
}

ClientConfig ClientConfig::WithPaperKeys(std::string api_key, std::string api_secret) {
    ClientConfig cfg;
    cfg.set_environment(ClientEnvironment::Paper());
    cfg.set_credentials(std::move(api_key), std::move(api_secret));
    return cfg;
}

ClientConfig ClientConfig::WithLiveKeys(std::string api_key, std::string api_secret) {
    ClientConfig cfg;
    cfg.set_environment(ClientEnvironment::Live());
    cfg.set_credentials(std::move(api_key), std::move(api_secret));
    return cfg;
}

ClientConfig ClientConfig::FromEnvironment() {
    const char* key = std::getenv("APCA_API_KEY_ID");
    const char* secret = std::getenv("APCA_API_SECRET_KEY");
    if (!key || !secret) {
        throw std::invalid_argument("APCA_API_KEY_ID and APCA_API_SECRET_KEY must be set");
    }

    const char* paper = std::getenv("APCA_PAPER");
    auto cfg = (paper && env_flag_is_false(paper)) ? WithLiveKeys(key, secret)
                                                    : WithPaperKeys(key, secret);
    if (const char* trading_url = std::getenv("APCA_TRADING_URL")) {
        auto env = cfg.environment();
        env.kind = EnvironmentKind::Custom;
        env.trading_url = trading_url;
        cfg.set_environment(std::move(env));
    }
    return cfg;
}

ClientConfig& ClientConfig::set_environment(ClientEnvironment env) {
    environment_ = std::move(env);
    return *this;
}

ClientConfig& ClientConfig::set_credentials(std::string api_key, std::string api_secret) {
    api_key_ = std::move(api_key);
    api_secret_ = std::move(api_secret);
    return *this;
}

const ClientEnvironment& ClientConfig::environment() const noexcept { return environment_; }

std::string_view ClientConfig::api_key() const noexcept { return api_key_; }

std::string_view ClientConfig::api_secret() const noexcept { return api_secret_; }

bool ClientConfig::is_live() const noexcept {
    return environment_.kind == EnvironmentKind::LiveTrading;
}

}  // namespace apca::core
