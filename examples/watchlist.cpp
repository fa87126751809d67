#include "apca/core/config.hpp"
#include "apca/core/dotenv.hpp"
#include "apca/core/http/beast_transport.hpp"
#include "apca/trading/client.hpp"

#include <iostream>

int main() {
    apca::core::load_env_file();

    try {
        auto config = apca::core::ClientConfig::FromEnvironment();
        apca::trading::TradingClient client(config, apca::core::make_beast_transport());

        auto watchlist = client.create_watchlist("apca-example", {"AAPL", "MSFT"});
        std::cout << "Created watchlist " << watchlist.id << '\n';

        watchlist = client.add_asset_to_watchlist(watchlist.id, "NVDA");
        client.remove_asset_from_watchlist(watchlist.id, "MSFT");

        watchlist = client.get_watchlist(watchlist.id);
        for (const auto& asset : watchlist.assets) {
            std::cout << "  " << asset.symbol << " (" << asset.exchange << ")\n";
        }

        client.delete_watchlist(watchlist.id);
        std::cout << "Deleted watchlist\n";
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
