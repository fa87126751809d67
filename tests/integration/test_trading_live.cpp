#include "apca/core/config.hpp"
#include "apca/core/dotenv.hpp"
#include "apca/core/http/beast_transport.hpp"
#include "apca/data/client.hpp"
#include "apca/trading/client.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>

int main() {
    apca::core::load_env_file();

    apca::core::ClientConfig config;
    try {
        config = apca::core::ClientConfig::FromEnvironment();
    } catch (const std::invalid_argument& ex) {
        std::cerr << ex.what() << '\n';
        return 1;
    }

    auto transport = std::make_shared<apca::core::BeastHttpTransport>();
    apca::trading::TradingClient trading(config, transport);
    apca::data::HistoricalClient history(config, transport);

    try {
        const auto asset = trading.get_asset("AAPL");
        assert(asset.symbol == "AAPL");
        std::cout << "AAPL tradable? " << std::boolalpha << asset.tradable << '\n';

        apca::trading::ListOrdersRequest orders_request;
        orders_request.status = apca::trading::OrderQueryStatus::All;
        orders_request.limit = 50;
        auto orders = trading.stream_orders(orders_request);
        std::size_t order_count = 0;
        while (auto order = orders.next()) {
            ++order_count;
        }
        std::cout << "Walked " << order_count << " orders\n";

        const auto positions = trading.list_open_positions();
        std::cout << "Open positions: " << positions.size() << '\n';

        apca::data::BarsRequest bars_request{
            .symbol = "AAPL",
            .timeframe = apca::data::TimeFrame::Hour,
            .start = "2024-01-02T00:00:00Z",
            .end = "2024-01-10T00:00:00Z",
            .limit = 20,
        };
        auto bars = history.bars(bars_request).collect();
        assert(!bars.empty());
        std::cout << "Fetched " << bars.size() << " hourly bars\n";
    } catch (const std::exception& ex) {
        std::cerr << "Integration test failed: " << ex.what() << '\n';
        return 1;
    }

    return 0;
}
