#include "apca/core/config.hpp"
#include "apca/core/dotenv.hpp"
#include "apca/core/http/beast_transport.hpp"
#include "apca/trading/client.hpp"

#include <iomanip>
#include <iostream>

int main() {
    apca::core::load_env_file();

    try {
        auto config = apca::core::ClientConfig::FromEnvironment();
        apca::trading::TradingClient client(config, apca::core::make_beast_transport());

        const auto positions = client.list_open_positions();
        if (positions.empty()) {
            std::cout << "No open positions\n";
        }
        for (const auto& position : positions) {
            std::cout << std::left << std::setw(8) << position.symbol << std::right
                      << std::setw(10) << position.qty << " @ " << position.avg_entry_price;
            if (position.unrealized_pl) {
                std::cout << "  P/L " << *position.unrealized_pl;
            }
            std::cout << '\n';
        }
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
