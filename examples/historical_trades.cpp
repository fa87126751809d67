#include "apca/core/config.hpp"
#include "apca/core/dotenv.hpp"
#include "apca/core/http/beast_transport.hpp"
#include "apca/data/client.hpp"

#include <iostream>

int main() {
    apca::core::load_env_file();

    try {
        auto config = apca::core::ClientConfig::FromEnvironment();
        apca::data::HistoricalClient client(config, apca::core::make_beast_transport());

        apca::data::TradesRequest request{
            .symbol = "AAPL",
            .start = "2024-01-03T14:30:00Z",
            .end = "2024-01-03T14:31:00Z",
            .limit = 1000,
        };

        // Pages are fetched as the loop drains them.
        auto trades = client.trades(request);
        std::size_t count = 0;
        while (auto trade = trades.next()) {
            if (count++ < 10) {
                std::cout << trade->timestamp << ' ' << trade->symbol << " " << trade->size
                          << " @ $" << trade->price << '\n';
            }
        }
        std::cout << count << " trades in total\n";
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
