#pragma once

#include "apca/data/models.hpp"

#include <simdjson.h>

#include <string>
#include <string_view>

namespace apca::data::detail {

// Decoders for the compact data point objects shared by the REST and
// real-time market data APIs.
Trade parse_trade(simdjson::ondemand::object& object, std::string symbol);
Quote parse_quote(simdjson::ondemand::object& object, std::string symbol);
Bar parse_bar(simdjson::ondemand::object& object, std::string symbol);

TradesPage parse_trades_page(std::string_view payload);
QuotesPage parse_quotes_page(std::string_view payload);
BarsPage parse_bars_page(std::string_view payload);

Trade parse_latest_trade(std::string_view payload);
Quote parse_latest_quote(std::string_view payload);
Snapshot parse_snapshot(std::string_view payload);

}  // namespace apca::data::detail
