#include "apca/core/config.hpp"
#include "apca/core/dotenv.hpp"
#include "apca/core/logging.hpp"
#include "apca/data/realtime/client.hpp"

#include <iostream>
#include <thread>
#include <variant>

namespace realtime = apca::data::realtime;

int main() {
    apca::core::load_env_file();
    apca::core::set_log_level(spdlog::level::info);

    try {
        auto config = apca::core::ClientConfig::FromEnvironment();
        auto client = realtime::Client::connect(config, apca::data::Source::Iex,
                                                apca::core::ws::DecodeFailurePolicy::Skip);
        auto [subscriber, receiver] = std::move(client).split();

        subscriber.authenticate();
        realtime::SubscriptionData data;
        data.quotes = std::vector<std::string>{"AAPL", "MSFT"};
        data.trades = std::vector<std::string>{"AAPL"};
        subscriber.subscribe(data);

        auto stream = std::move(receiver).stream();
        int quotes_seen = 0;
        while (auto response = stream.next()) {
            if (const auto* error = std::get_if<realtime::Error>(&*response)) {
                std::cerr << "server error " << error->code << ": " << error->message << '\n';
                break;
            }
            if (const auto* quote = std::get_if<apca::data::Quote>(&*response)) {
                std::cout << "[QUOTE] " << quote->symbol << " bid " << quote->bid_price << " x "
                          << quote->bid_size << " ask " << quote->ask_price << " x "
                          << quote->ask_size << '\n';
                if (++quotes_seen == 20) {
                    break;
                }
            } else if (const auto* trade = std::get_if<apca::data::Trade>(&*response)) {
                std::cout << "[TRADE] " << trade->symbol << " @ $" << trade->price << '\n';
            }
        }
        subscriber.close();
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
