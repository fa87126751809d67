#pragma once

#include "apca/trading/enums.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace apca::trading {

/**
 * An order as returned by the REST API and carried by order update events.
 * Quantities and prices are normalized to double whether the vendor sent them
 * as JSON numbers or strings. Timestamps are kept as RFC 3339 strings.
 */
struct Order {
    std::string id;
    std::string client_order_id;
    std::string created_at;
    std::optional<std::string> updated_at;
    std::optional<std::string> submitted_at;
    std::optional<std::string> filled_at;
    std::optional<std::string> expired_at;
    std::optional<std::string> canceled_at;
    std::optional<std::string> failed_at;
    std::optional<std::string> replaced_at;
    std::optional<std::string> replaced_by;
    std::optional<std::string> replaces;
    std::string asset_id;
    std::string symbol;
    std::string asset_class;
    std::optional<double> notional;
    std::optional<double> qty;
    double filled_qty{0.0};
    std::optional<double> filled_avg_price;
    OrderClass order_class{OrderClass::Simple};
    OrderType type{OrderType::Market};
    OrderSide side{OrderSide::Buy};
    TimeInForce time_in_force{TimeInForce::Day};
    std::optional<double> limit_price;
    std::optional<double> stop_price;
    OrderStatus status{OrderStatus::New};
    bool extended_hours{false};
    // Child orders of bracket, OCO and OTO orders. Empty for simple orders.
    std::vector<Order> legs;
    std::optional<double> trail_percent;
    std::optional<double> trail_price;
    std::optional<double> hwm;
};

/**
 * One page of the order listing. The endpoint has no vendor token; the token
 * of a full page records the submission time of its last order and the ids of
 * the orders returned at that time. The next request bounds `until`
 * (descending) or `after` (ascending) so that this time is included, and the
 * orders already returned are dropped from it.
 */
struct OrdersPage {
    using item_type = Order;

    std::vector<Order> orders;
    std::optional<std::string> next_page_token;

    std::pair<std::vector<Order>, std::optional<std::string>> split() && {
        return {std::move(orders), std::move(next_page_token)};
    }
};

// Per-order outcome of cancel_all_orders().
struct CancelStatus {
    std::string id;
    int status{0};
};

struct Position {
    std::string asset_id;
    std::string symbol;
    std::string exchange;
    std::string asset_class;
    std::string side;
    double qty{0.0};
    std::optional<double> qty_available;
    double avg_entry_price{0.0};
    double cost_basis{0.0};
    std::optional<double> market_value;
    std::optional<double> unrealized_pl;
    std::optional<double> unrealized_plpc;
    std::optional<double> unrealized_intraday_pl;
    std::optional<double> unrealized_intraday_plpc;
    std::optional<double> current_price;
    std::optional<double> lastday_price;
    std::optional<double> change_today;
    bool asset_marginable{false};
};

// Outcome of liquidating one position through close_all_positions().
struct Closure {
    std::string symbol;
    int status{0};
    std::optional<Order> order;
    std::optional<std::string> error_message;
};

struct Asset {
    std::string id;
    std::string asset_class;
    std::string exchange;
    std::string symbol;
    std::string name;
    AssetStatus status{AssetStatus::Active};
    bool tradable{false};
    bool marginable{false};
    bool shortable{false};
    bool easy_to_borrow{false};
    bool fractionable{false};
};

struct Watchlist {
    std::string id;
    std::string account_id;
    std::string name;
    std::string created_at;
    std::string updated_at;
    std::vector<Asset> assets;
};

}  // namespace apca::trading
