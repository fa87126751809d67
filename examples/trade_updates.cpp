#include "apca/core/config.hpp"
#include "apca/core/dotenv.hpp"
#include "apca/streaming/client.hpp"

#include <iostream>
#include <variant>

namespace streaming = apca::streaming;

namespace {

void summarize(const apca::trading::Order& order) {
    std::cout << order.id << " -- " << order.created_at << " -- " << order.symbol << " -- "
              << order.filled_qty << '/' << order.qty.value_or(0.0) << " -- "
              << apca::trading::to_string(order.status) << '\n';
}

}  // namespace

int main() {
    apca::core::load_env_file();

    try {
        auto config = apca::core::ClientConfig::FromEnvironment();
        auto client = streaming::Client::connect(config);
        client.authenticate();
        client.listen({streaming::MessageStream::TradeUpdates});

        auto stream = std::move(client).stream();
        while (auto response = stream.next()) {
            if (const auto* auth = std::get_if<streaming::Authorization>(&*response)) {
                std::cout << "authorization: " << streaming::to_string(auth->status) << '\n';
                if (auth->status == streaming::AuthorizationStatus::Unauthorized) {
                    return 1;
                }
            } else if (const auto* updates = std::get_if<streaming::TradeUpdates>(&*response)) {
                std::cout << streaming::event_name(updates->update) << ": ";
                summarize(streaming::order_of(updates->update));
            }
        }
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
