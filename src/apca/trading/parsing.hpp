#pragma once

#include "apca/trading/models.hpp"

#include <simdjson.h>

#include <string_view>
#include <vector>

namespace apca::trading::detail {

Order parse_order(simdjson::ondemand::object& object);

Order parse_order(std::string_view payload);
std::vector<Order> parse_orders(std::string_view payload);
std::vector<CancelStatus> parse_cancel_statuses(std::string_view payload);
Position parse_position(std::string_view payload);
std::vector<Position> parse_positions(std::string_view payload);
std::vector<Closure> parse_closures(std::string_view payload);
Asset parse_asset(std::string_view payload);
std::vector<Asset> parse_assets(std::string_view payload);
Watchlist parse_watchlist(std::string_view payload);
std::vector<Watchlist> parse_watchlists(std::string_view payload);

}  // namespace apca::trading::detail
