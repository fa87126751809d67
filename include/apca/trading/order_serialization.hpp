#pragma once

#include "apca/trading/requests.hpp"

#include <string>
#include <vector>

namespace apca::trading {

/**
 * Request body encoders of the trading API. Order requests are validated first;
 * inconsistent requests raise std::invalid_argument before anything is sent.
 */
std::string serialize_order_request(const PlaceOrderRequest& request);
std::string serialize_replace_order_request(const ReplaceOrderRequest& request);
std::string serialize_watchlist_body(const std::string& name,
                                     const std::vector<std::string>& symbols);
std::string serialize_symbol_body(const std::string& symbol);

}  // namespace apca::trading
