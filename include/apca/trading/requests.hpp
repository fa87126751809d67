#pragma once

#include "apca/trading/enums.hpp"

#include <optional>
#include <string>
#include <vector>

namespace apca::trading {

struct TakeProfitRequest {
    double limit_price{0.0};
};

struct StopLossRequest {
    std::optional<double> stop_price;
    std::optional<double> limit_price;
};

struct PlaceOrderRequest {
    std::string symbol;
    std::optional<double> qty;
    std::optional<double> notional;
    OrderSide side{OrderSide::Buy};
    OrderType type{OrderType::Market};
    TimeInForce time_in_force{TimeInForce::Day};
    std::optional<OrderClass> order_class;
    std::optional<bool> extended_hours;
    std::optional<std::string> client_order_id;
    std::optional<TakeProfitRequest> take_profit;
    std::optional<StopLossRequest> stop_loss;
    std::optional<double> limit_price;
    std::optional<double> stop_price;
    std::optional<double> trail_price;
    std::optional<double> trail_percent;
};

struct ReplaceOrderRequest {
    std::optional<double> qty;
    std::optional<TimeInForce> time_in_force;
    std::optional<double> limit_price;
    std::optional<double> stop_price;
    std::optional<double> trail;
    std::optional<std::string> client_order_id;
};

struct ListOrdersRequest {
    std::optional<OrderQueryStatus> status;
    // Page size; the vendor caps it at 500.
    std::optional<int> limit;
    std::optional<std::string> after;
    std::optional<std::string> until;
    std::optional<SortDirection> direction;
    bool nested{false};
    std::vector<std::string> symbols;
};

}  // namespace apca::trading
