#include "apca/trading/parsing.hpp"

#include "apca/core/errors.hpp"
#include "apca/core/json.hpp"

#include <string>
#include <utility>

namespace apca::trading::detail {

namespace json = core::json;

namespace {

template <typename Decode>
auto parse_array(simdjson::ondemand::array array, std::string_view context, Decode decode) {
    std::vector<decltype(decode(std::declval<simdjson::ondemand::object&>()))> items;
    for (auto element : array) {
        simdjson::ondemand::value value;
        if (element.get(value)) {
            throw core::SerializationError("Invalid element in " + std::string(context));
        }
        auto object = json::as_object(value, context);
        items.push_back(decode(object));
    }
    return items;
}

template <typename Decode>
auto parse_root_array(std::string_view payload, std::string_view context, Decode decode) {
    json::ParsedDocument document(payload, context);
    return parse_array(document.root_array(), context, decode);
}

Position parse_position(simdjson::ondemand::object& object) {
    Position position;
    position.asset_id = json::get_string_or_empty(object, "asset_id");
    position.symbol = json::get_string(object, "symbol");
    position.exchange = json::get_string_or_empty(object, "exchange");
    position.asset_class = json::get_string_or_empty(object, "asset_class");
    position.side = json::get_string_or_empty(object, "side");
    position.qty = json::get_number(object, "qty");
    position.qty_available = json::get_optional_number(object, "qty_available");
    position.avg_entry_price = json::get_number(object, "avg_entry_price");
    position.cost_basis = json::get_number(object, "cost_basis");
    position.market_value = json::get_optional_number(object, "market_value");
    position.unrealized_pl = json::get_optional_number(object, "unrealized_pl");
    position.unrealized_plpc = json::get_optional_number(object, "unrealized_plpc");
    position.unrealized_intraday_pl = json::get_optional_number(object, "unrealized_intraday_pl");
    position.unrealized_intraday_plpc =
        json::get_optional_number(object, "unrealized_intraday_plpc");
    position.current_price = json::get_optional_number(object, "current_price");
    position.lastday_price = json::get_optional_number(object, "lastday_price");
    position.change_today = json::get_optional_number(object, "change_today");
    position.asset_marginable = json::get_bool_or_default(object, "asset_marginable");
    return position;
}

Asset parse_asset(simdjson::ondemand::object& object) {
    Asset asset;
    asset.id = json::get_string(object, "id");
    asset.asset_class = json::get_string_or_empty(object, "class");
    asset.exchange = json::get_string_or_empty(object, "exchange");
    asset.symbol = json::get_string(object, "symbol");
    asset.name = json::get_string_or_empty(object, "name");
    if (auto status = json::get_optional_string(object, "status")) {
        asset.status = parse_asset_status(*status);
    }
    asset.tradable = json::get_bool_or_default(object, "tradable");
    asset.marginable = json::get_bool_or_default(object, "marginable");
    asset.shortable = json::get_bool_or_default(object, "shortable");
    asset.easy_to_borrow = json::get_bool_or_default(object, "easy_to_borrow");
    asset.fractionable = json::get_bool_or_default(object, "fractionable");
    return asset;
}

Watchlist parse_watchlist(simdjson::ondemand::object& object) {
    Watchlist watchlist;
    watchlist.id = json::get_string(object, "id");
    watchlist.account_id = json::get_string_or_empty(object, "account_id");
    watchlist.name = json::get_string(object, "name");
    watchlist.created_at = json::get_string_or_empty(object, "created_at");
    watchlist.updated_at = json::get_string_or_empty(object, "updated_at");
    if (auto assets = json::find_array(object, "assets")) {
        watchlist.assets = parse_array(*assets, "watchlist assets",
                                       [](simdjson::ondemand::object& asset) {
                                           return parse_asset(asset);
                                       });
    }
    return watchlist;
}

Closure parse_closure(simdjson::ondemand::object& object) {
    Closure closure;
    closure.symbol = json::get_string(object, "symbol");
    closure.status = static_cast<int>(json::get_int64(object, "status"));
    auto body = json::find_object(object, "body");
    if (!body) {
        return closure;
    }
    if (closure.status >= 200 && closure.status < 300) {
        closure.order = parse_order(*body);
    } else {
        closure.error_message = json::get_optional_string(*body, "message");
    }
    return closure;
}

}  // namespace

Order parse_order(simdjson::ondemand::object& object) {
    Order order;
    order.id = json::get_string(object, "id");
    order.client_order_id = json::get_string_or_empty(object, "client_order_id");
    order.created_at = json::get_string(object, "created_at");
    order.updated_at = json::get_optional_string(object, "updated_at");
    order.submitted_at = json::get_optional_string(object, "submitted_at");
    order.filled_at = json::get_optional_string(object, "filled_at");
    order.expired_at = json::get_optional_string(object, "expired_at");
    order.canceled_at = json::get_optional_string(object, "canceled_at");
    order.failed_at = json::get_optional_string(object, "failed_at");
    order.replaced_at = json::get_optional_string(object, "replaced_at");
    order.replaced_by = json::get_optional_string(object, "replaced_by");
    order.replaces = json::get_optional_string(object, "replaces");
    order.asset_id = json::get_string_or_empty(object, "asset_id");
    order.symbol = json::get_string(object, "symbol");
    order.asset_class = json::get_string_or_empty(object, "asset_class");
    order.notional = json::get_optional_number(object, "notional");
    order.qty = json::get_optional_number(object, "qty");
    order.filled_qty = json::get_optional_number(object, "filled_qty").value_or(0.0);
    order.filled_avg_price = json::get_optional_number(object, "filled_avg_price");
    order.order_class = parse_order_class(json::get_string_or_empty(object, "order_class"));
    order.type = parse_order_type(json::get_string(object, "type"));
    order.side = parse_order_side(json::get_string(object, "side"));
    order.time_in_force = parse_time_in_force(json::get_string(object, "time_in_force"));
    order.limit_price = json::get_optional_number(object, "limit_price");
    order.stop_price = json::get_optional_number(object, "stop_price");
    order.status = parse_order_status(json::get_string(object, "status"));
    order.extended_hours = json::get_bool_or_default(object, "extended_hours");
    if (auto legs = json::find_array(object, "legs")) {
        order.legs = parse_array(*legs, "order legs", [](simdjson::ondemand::object& leg) {
            return parse_order(leg);
        });
    }
    order.trail_percent = json::get_optional_number(object, "trail_percent");
    order.trail_price = json::get_optional_number(object, "trail_price");
    order.hwm = json::get_optional_number(object, "hwm");
    return order;
}

Order parse_order(std::string_view payload) {
    json::ParsedDocument document(payload, "order");
    auto root = document.root_object();
    return parse_order(root);
}

std::vector<Order> parse_orders(std::string_view payload) {
    return parse_root_array(payload, "orders", [](simdjson::ondemand::object& object) {
        return parse_order(object);
    });
}

std::vector<CancelStatus> parse_cancel_statuses(std::string_view payload) {
    return parse_root_array(payload, "cancel statuses", [](simdjson::ondemand::object& object) {
        CancelStatus status;
        status.id = json::get_string(object, "id");
        status.status = static_cast<int>(json::get_int64(object, "status"));
        return status;
    });
}

Position parse_position(std::string_view payload) {
    json::ParsedDocument document(payload, "position");
    auto root = document.root_object();
    return parse_position(root);
}

std::vector<Position> parse_positions(std::string_view payload) {
    return parse_root_array(payload, "positions", [](simdjson::ondemand::object& object) {
        return parse_position(object);
    });
}

std::vector<Closure> parse_closures(std::string_view payload) {
    return parse_root_array(payload, "position closures", [](simdjson::ondemand::object& object) {
        return parse_closure(object);
    });
}

Asset parse_asset(std::string_view payload) {
    json::ParsedDocument document(payload, "asset");
    auto root = document.root_object();
    return parse_asset(root);
}

std::vector<Asset> parse_assets(std::string_view payload) {
    return parse_root_array(payload, "assets", [](simdjson::ondemand::object& object) {
        return parse_asset(object);
    });
}

Watchlist parse_watchlist(std::string_view payload) {
    json::ParsedDocument document(payload, "watchlist");
    auto root = document.root_object();
    return parse_watchlist(root);
}

std::vector<Watchlist> parse_watchlists(std::string_view payload) {
    return parse_root_array(payload, "watchlists", [](simdjson::ondemand::object& object) {
        return parse_watchlist(object);
    });
}

}  // namespace apca::trading::detail
