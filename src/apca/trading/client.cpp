#include "apca/trading/client.hpp"

#include "apca/core/errors.hpp"
#include "apca/core/query.hpp"
#include "apca/trading/order_serialization.hpp"
#include "apca/trading/parsing.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace apca::trading {

namespace {

constexpr int kDefaultOrderPageSize = 50;
constexpr int kMaxOrderPageSize = 500;

std::string resource_path(std::string_view collection, const std::string& id) {
    if (id.empty()) {
        throw std::invalid_argument(std::string(collection) + " requires a non-empty identifier");
    }
    return std::string(collection) + "/" + core::encode_path_segment(id);
}

std::string build_order_query(const ListOrdersRequest& request) {
    core::QueryBuilder query;
    if (request.status) {
        query.add("status", to_string(*request.status));
    }
    query.add("limit", request.limit).add("after", request.after).add("until", request.until);
    if (request.direction) {
        query.add("direction", to_string(*request.direction));
    }
    if (request.nested) {
        query.add_flag("nested", true);
    }
    query.add("symbols", request.symbols);
    return query.str();
}

const std::string& order_time(const Order& order) {
    return order.submitted_at ? *order.submitted_at : order.created_at;
}

/**
 * Moves an RFC 3339 timestamp by `step` units of its own precision: seconds
 * when it has no fraction, otherwise the last fractional digit.
 */
std::string shift_timestamp(const std::string& timestamp, int step) {
    std::tm parts{};
    std::istringstream in(timestamp.substr(0, 19));
    in >> std::get_time(&parts, "%Y-%m-%dT%H:%M:%S");
    if (in.fail() || timestamp.size() < 20) {
        throw std::invalid_argument("Invalid timestamp in order page token: " + timestamp);
    }

    std::size_t pos = 19;
    std::string fraction;
    if (timestamp[pos] == '.') {
        ++pos;
        while (pos < timestamp.size() && std::isdigit(static_cast<unsigned char>(timestamp[pos]))) {
            fraction.push_back(timestamp[pos++]);
        }
        if (fraction.empty() || fraction.size() > 9) {
            throw std::invalid_argument("Invalid timestamp in order page token: " + timestamp);
        }
    }
    const auto suffix = timestamp.substr(pos);

    std::time_t seconds = timegm(&parts);
    if (fraction.empty()) {
        seconds += step;
    } else {
        std::int64_t scale = 1;
        for (std::size_t i = 0; i < fraction.size(); ++i) {
            scale *= 10;
        }
        std::int64_t units = std::stoll(fraction) + step;
        if (units >= scale) {
            units -= scale;
            ++seconds;
        } else if (units < 0) {
            units += scale;
            --seconds;
        }
        std::ostringstream digits;
        digits << std::setw(static_cast<int>(fraction.size())) << std::setfill('0') << units;
        fraction = digits.str();
    }

    std::tm shifted{};
    gmtime_r(&seconds, &shifted);
    std::ostringstream out;
    out << std::put_time(&shifted, "%Y-%m-%dT%H:%M:%S");
    if (!fraction.empty()) {
        out << '.' << fraction;
    }
    out << suffix;
    return out.str();
}

// Position reached by an order stream: the submission time of the last order
// returned and the ids of every order already yielded at that time.
struct OrderCursor {
    std::string boundary;
    std::vector<std::string> seen_ids;
};

std::string encode_cursor(const OrderCursor& cursor) {
    std::string token = cursor.boundary + "|";
    for (std::size_t i = 0; i < cursor.seen_ids.size(); ++i) {
        if (i > 0) {
            token.push_back(',');
        }
        token += cursor.seen_ids[i];
    }
    return token;
}

OrderCursor decode_cursor(const std::string& token) {
    OrderCursor cursor;
    const auto bar = token.find('|');
    cursor.boundary = token.substr(0, bar);
    if (bar == std::string::npos) {
        return cursor;
    }
    std::istringstream ids(token.substr(bar + 1));
    std::string id;
    while (std::getline(ids, id, ',')) {
        if (!id.empty()) {
            cursor.seen_ids.push_back(id);
        }
    }
    return cursor;
}

}  // namespace

TradingClient::TradingClient(core::ClientConfig config,
                             std::shared_ptr<core::IHttpTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("TradingClient requires a valid IHttpTransport");
    }
}

Order TradingClient::place_order(const PlaceOrderRequest& request) const {
    auto response = send_request(core::HttpMethod::Post, "/v2/orders",
                                 std::make_optional(serialize_order_request(request)));
    core::ensure_success(core::ResourceFamily::Orders, response.status_code, response.body);
    return detail::parse_order(std::string_view(response.body));
}

std::vector<Order> TradingClient::list_orders(const ListOrdersRequest& request) const {
    if (request.limit && (*request.limit <= 0 || *request.limit > kMaxOrderPageSize)) {
        throw std::invalid_argument("ListOrdersRequest limit must be between 1 and 500");
    }
    auto response = send_request(core::HttpMethod::Get, "/v2/orders" + build_order_query(request));
    core::ensure_success(core::ResourceFamily::Orders, response.status_code, response.body);
    return detail::parse_orders(response.body);
}

OrdersPage TradingClient::get_orders_page(const ListOrdersRequest& request,
                                          const std::optional<std::string>& page_token) const {
    auto page_request = request;
    const bool ascending = request.direction == SortDirection::Asc;
    int page_size = request.limit.value_or(kDefaultOrderPageSize);

    // The vendor's after/until bounds are exclusive. Widening the bound by one
    // unit brings back the orders sharing the boundary time; those already
    // yielded are filtered out below and the page is enlarged to make room.
    std::optional<OrderCursor> cursor;
    if (page_token) {
        cursor = decode_cursor(*page_token);
        const auto bound = shift_timestamp(cursor->boundary, ascending ? -1 : 1);
        if (ascending) {
            page_request.after = bound;
        } else {
            page_request.until = bound;
        }
        if (static_cast<int>(cursor->seen_ids.size()) >= kMaxOrderPageSize) {
            throw core::Error("More than " + std::to_string(kMaxOrderPageSize) +
                              " orders share submission time " + cursor->boundary);
        }
        page_size = std::min(page_size + static_cast<int>(cursor->seen_ids.size()),
                             kMaxOrderPageSize);
    }
    page_request.limit = page_size;

    auto orders = list_orders(page_request);

    OrdersPage page;
    if (static_cast<int>(orders.size()) == page_size) {
        OrderCursor next;
        next.boundary = order_time(orders.back());
        if (cursor && cursor->boundary == next.boundary) {
            next.seen_ids = cursor->seen_ids;
        }
        for (const auto& order : orders) {
            if (order_time(order) == next.boundary &&
                std::find(next.seen_ids.begin(), next.seen_ids.end(), order.id) ==
                    next.seen_ids.end()) {
                next.seen_ids.push_back(order.id);
            }
        }
        page.next_page_token = encode_cursor(next);
    }

    if (cursor) {
        std::erase_if(orders, [&](const Order& order) {
            return order_time(order) == cursor->boundary &&
                   std::find(cursor->seen_ids.begin(), cursor->seen_ids.end(), order.id) !=
                       cursor->seen_ids.end();
        });
    }
    page.orders = std::move(orders);
    return page;
}

core::PagedStream<OrdersPage> TradingClient::stream_orders(ListOrdersRequest request) const {
    return core::PagedStream<OrdersPage>(
        [client = *this, request = std::move(request)](const std::optional<std::string>& token) {
            return client.get_orders_page(request, token);
        });
}

Order TradingClient::get_order(const std::string& order_id) const {
    auto response = send_request(core::HttpMethod::Get, resource_path("/v2/orders", order_id));
    core::ensure_success(core::ResourceFamily::Orders, response.status_code, response.body);
    return detail::parse_order(std::string_view(response.body));
}

Order TradingClient::get_order_by_client_id(const std::string& client_order_id) const {
    if (client_order_id.empty()) {
        throw std::invalid_argument("get_order_by_client_id requires a client order id");
    }
    core::QueryBuilder query;
    query.add("client_order_id", client_order_id);
    auto response =
        send_request(core::HttpMethod::Get, "/v2/orders:by_client_order_id" + query.str());
    core::ensure_success(core::ResourceFamily::Orders, response.status_code, response.body);
    return detail::parse_order(std::string_view(response.body));
}

Order TradingClient::replace_order(const std::string& order_id,
                                   const ReplaceOrderRequest& request) const {
    auto response = send_request(core::HttpMethod::Patch, resource_path("/v2/orders", order_id),
                                 serialize_replace_order_request(request));
    core::ensure_success(core::ResourceFamily::Orders, response.status_code, response.body);
    return detail::parse_order(std::string_view(response.body));
}

void TradingClient::cancel_order(const std::string& order_id) const {
    auto response = send_request(core::HttpMethod::Delete, resource_path("/v2/orders", order_id));
    core::ensure_success(core::ResourceFamily::Orders, response.status_code, response.body);
}

std::vector<CancelStatus> TradingClient::cancel_all_orders() const {
    auto response = send_request(core::HttpMethod::Delete, "/v2/orders");
    core::ensure_success(core::ResourceFamily::Orders, response.status_code, response.body);
    if (response.body.empty()) {
        return {};
    }
    return detail::parse_cancel_statuses(response.body);
}

std::vector<Position> TradingClient::list_open_positions() const {
    auto response = send_request(core::HttpMethod::Get, "/v2/positions");
    core::ensure_success(core::ResourceFamily::Positions, response.status_code, response.body);
    return detail::parse_positions(response.body);
}

Position TradingClient::get_open_position(const std::string& symbol) const {
    auto response = send_request(core::HttpMethod::Get, resource_path("/v2/positions", symbol));
    core::ensure_success(core::ResourceFamily::Positions, response.status_code, response.body);
    return detail::parse_position(std::string_view(response.body));
}

std::vector<Closure> TradingClient::close_all_positions(bool cancel_orders) const {
    core::QueryBuilder query;
    query.add_flag("cancel_orders", cancel_orders);
    auto response = send_request(core::HttpMethod::Delete, "/v2/positions" + query.str());
    core::ensure_success(core::ResourceFamily::Positions, response.status_code, response.body);
    if (response.body.empty()) {
        return {};
    }
    return detail::parse_closures(response.body);
}

Order TradingClient::close_position(const std::string& symbol, std::optional<double> qty,
                                    std::optional<double> percentage) const {
    if (qty && percentage) {
        throw std::invalid_argument("close_position accepts qty or percentage, not both");
    }
    if (percentage && (*percentage <= 0.0 || *percentage > 100.0)) {
        throw std::invalid_argument("close_position percentage must be in (0, 100]");
    }
    core::QueryBuilder query;
    query.add("qty", qty).add("percentage", percentage);
    auto response = send_request(core::HttpMethod::Delete,
                                 resource_path("/v2/positions", symbol) + query.str());
    core::ensure_success(core::ResourceFamily::Positions, response.status_code, response.body);
    return detail::parse_order(std::string_view(response.body));
}

std::vector<Asset> TradingClient::list_assets(std::optional<AssetStatus> status,
                                              std::optional<std::string> asset_class) const {
    core::QueryBuilder query;
    if (status) {
        query.add("status", to_string(*status));
    }
    query.add("asset_class", asset_class);
    auto response = send_request(core::HttpMethod::Get, "/v2/assets" + query.str());
    core::ensure_success(core::ResourceFamily::Assets, response.status_code, response.body);
    return detail::parse_assets(response.body);
}

Asset TradingClient::get_asset(const std::string& symbol) const {
    auto response = send_request(core::HttpMethod::Get, resource_path("/v2/assets", symbol));
    core::ensure_success(core::ResourceFamily::Assets, response.status_code, response.body);
    return detail::parse_asset(std::string_view(response.body));
}

std::vector<Watchlist> TradingClient::list_watchlists() const {
    auto response = send_request(core::HttpMethod::Get, "/v2/watchlists");
    core::ensure_success(core::ResourceFamily::Watchlists, response.status_code, response.body);
    return detail::parse_watchlists(response.body);
}

Watchlist TradingClient::create_watchlist(const std::string& name,
                                          const std::vector<std::string>& symbols) const {
    auto response = send_request(core::HttpMethod::Post, "/v2/watchlists",
                                 serialize_watchlist_body(name, symbols));
    core::ensure_success(core::ResourceFamily::Watchlists, response.status_code, response.body);
    return detail::parse_watchlist(std::string_view(response.body));
}

Watchlist TradingClient::get_watchlist(const std::string& watchlist_id) const {
    auto response =
        send_request(core::HttpMethod::Get, resource_path("/v2/watchlists", watchlist_id));
    core::ensure_success(core::ResourceFamily::Watchlists, response.status_code, response.body);
    return detail::parse_watchlist(std::string_view(response.body));
}

Watchlist TradingClient::update_watchlist(const std::string& watchlist_id, const std::string& name,
                                          const std::vector<std::string>& symbols) const {
    auto response = send_request(core::HttpMethod::Put,
                                 resource_path("/v2/watchlists", watchlist_id),
                                 serialize_watchlist_body(name, symbols));
    core::ensure_success(core::ResourceFamily::Watchlists, response.status_code, response.body);
    return detail::parse_watchlist(std::string_view(response.body));
}

Watchlist TradingClient::add_asset_to_watchlist(const std::string& watchlist_id,
                                                const std::string& symbol) const {
    auto response = send_request(core::HttpMethod::Post,
                                 resource_path("/v2/watchlists", watchlist_id),
                                 serialize_symbol_body(symbol));
    core::ensure_success(core::ResourceFamily::Watchlists, response.status_code, response.body);
    return detail::parse_watchlist(std::string_view(response.body));
}

void TradingClient::delete_watchlist(const std::string& watchlist_id) const {
    auto response =
        send_request(core::HttpMethod::Delete, resource_path("/v2/watchlists", watchlist_id));
    core::ensure_success(core::ResourceFamily::Watchlists, response.status_code, response.body);
}

void TradingClient::remove_asset_from_watchlist(const std::string& watchlist_id,
                                                const std::string& symbol) const {
    auto path = resource_path("/v2/watchlists", watchlist_id) + "/" +
                core::encode_path_segment(symbol);
    auto response = send_request(core::HttpMethod::Delete, path);
    core::ensure_success(core::ResourceFamily::Watchlists, response.status_code, response.body);
}

core::HttpResponse TradingClient::send_request(core::HttpMethod method, std::string_view path,
                                               const std::optional<std::string>& body) const {
    core::HttpRequest request;
    request.method = method;
    request.url = config_.environment().trading_url + std::string(path);
    request.headers["Accept"] = "application/json";

    if (body && !body->empty()) {
        request.body = *body;
        request.headers["Content-Type"] = "application/json";
    }
    if (!config_.api_key().empty()) {
        request.headers["APCA-API-KEY-ID"] = std::string(config_.api_key());
    }
    if (!config_.api_secret().empty()) {
        request.headers["APCA-API-SECRET-KEY"] = std::string(config_.api_secret());
    }

    return transport_->send(request);
}

}  // namespace apca::trading
