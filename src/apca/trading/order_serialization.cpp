#include "apca/trading/order_serialization.hpp"

#include "apca/core/json.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace apca::trading {

namespace {

std::string format_decimal(double value) {
    std::ostringstream oss;
    oss << std::setprecision(15) << value;
    return oss.str();
}

void require_positive(const std::optional<double>& value, const char* name) {
    if (value && *value <= 0.0) {
        throw std::invalid_argument(std::string(name) + " must be greater than zero");
    }
}

void validate_order_request(const PlaceOrderRequest& request) {
    if (request.symbol.empty()) {
        throw std::invalid_argument("PlaceOrderRequest requires a symbol");
    }
    if (request.qty.has_value() == request.notional.has_value()) {
        throw std::invalid_argument("PlaceOrderRequest requires exactly one of qty or notional");
    }
    require_positive(request.qty, "qty");
    require_positive(request.notional, "notional");

    switch (request.type) {
        case OrderType::Limit:
            if (!request.limit_price) {
                throw std::invalid_argument("Limit orders require limit_price");
            }
            break;
        case OrderType::Stop:
            if (!request.stop_price) {
                throw std::invalid_argument("Stop orders require stop_price");
            }
            break;
        case OrderType::StopLimit:
            if (!request.stop_price || !request.limit_price) {
                throw std::invalid_argument("StopLimit orders require stop_price and limit_price");
            }
            break;
        case OrderType::TrailingStop:
            if (request.trail_price.has_value() == request.trail_percent.has_value()) {
                throw std::invalid_argument(
                    "Trailing stop orders require exactly one of trail_price or trail_percent");
            }
            break;
        case OrderType::Market:
            break;
    }

    require_positive(request.limit_price, "limit_price");
    require_positive(request.stop_price, "stop_price");
    require_positive(request.trail_price, "trail_price");
    require_positive(request.trail_percent, "trail_percent");

    if (request.order_class == OrderClass::Bracket && (!request.take_profit || !request.stop_loss)) {
        throw std::invalid_argument("Bracket orders require take_profit and stop_loss");
    }
    if (request.take_profit && request.take_profit->limit_price <= 0.0) {
        throw std::invalid_argument("take_profit.limit_price must be greater than zero");
    }
    if (request.stop_loss) {
        if (!request.stop_loss->stop_price) {
            throw std::invalid_argument("stop_loss requires stop_price");
        }
        require_positive(request.stop_loss->stop_price, "stop_loss.stop_price");
        require_positive(request.stop_loss->limit_price, "stop_loss.limit_price");
    }
}

// Writes comma separated "key":value members of one JSON object.
class ObjectWriter {
  public:
    explicit ObjectWriter(std::ostream& os) : os_(os) { os_ << '{'; }

    void raw(std::string_view key, const std::string& value) {
        separate(key);
        os_ << value;
    }
    void string(std::string_view key, std::string_view value) {
        separate(key);
        os_ << std::quoted(value);
    }
    void number(std::string_view key, double value) { raw(key, format_decimal(value)); }
    void boolean(std::string_view key, bool value) { raw(key, value ? "true" : "false"); }
    void close() { os_ << '}'; }

  private:
    void separate(std::string_view key) {
        if (!first_) {
            os_ << ',';
        }
        first_ = false;
        os_ << std::quoted(key) << ':';
    }

    std::ostream& os_;
    bool first_{true};
};

}  // namespace

std::string serialize_order_request(const PlaceOrderRequest& request) {
    validate_order_request(request);

    std::ostringstream oss;
    ObjectWriter writer(oss);
    writer.string("symbol", request.symbol);
    if (request.qty) {
        writer.number("qty", *request.qty);
    }
    if (request.notional) {
        writer.number("notional", *request.notional);
    }
    writer.string("side", to_string(request.side));
    writer.string("type", to_string(request.type));
    writer.string("time_in_force", to_string(request.time_in_force));
    if (request.order_class) {
        writer.string("order_class", to_string(*request.order_class));
    }
    if (request.extended_hours) {
        writer.boolean("extended_hours", *request.extended_hours);
    }
    if (request.client_order_id) {
        writer.string("client_order_id", *request.client_order_id);
    }
    if (request.limit_price) {
        writer.number("limit_price", *request.limit_price);
    }
    if (request.stop_price) {
        writer.number("stop_price", *request.stop_price);
    }
    if (request.trail_price) {
        writer.number("trail_price", *request.trail_price);
    }
    if (request.trail_percent) {
        writer.number("trail_percent", *request.trail_percent);
    }
    if (request.take_profit) {
        writer.raw("take_profit",
                   R"({"limit_price":)" + format_decimal(request.take_profit->limit_price) + "}");
    }
    if (request.stop_loss) {
        std::ostringstream nested;
        ObjectWriter stop_loss(nested);
        stop_loss.number("stop_price", *request.stop_loss->stop_price);
        if (request.stop_loss->limit_price) {
            stop_loss.number("limit_price", *request.stop_loss->limit_price);
        }
        stop_loss.close();
        writer.raw("stop_loss", nested.str());
    }
    writer.close();
    return oss.str();
}

std::string serialize_replace_order_request(const ReplaceOrderRequest& request) {
    require_positive(request.qty, "qty");
    require_positive(request.limit_price, "limit_price");
    require_positive(request.stop_price, "stop_price");
    require_positive(request.trail, "trail");

    std::ostringstream oss;
    ObjectWriter writer(oss);
    if (request.qty) {
        writer.number("qty", *request.qty);
    }
    if (request.time_in_force) {
        writer.string("time_in_force", to_string(*request.time_in_force));
    }
    if (request.limit_price) {
        writer.number("limit_price", *request.limit_price);
    }
    if (request.stop_price) {
        writer.number("stop_price", *request.stop_price);
    }
    if (request.trail) {
        writer.number("trail", *request.trail);
    }
    if (request.client_order_id) {
        writer.string("client_order_id", *request.client_order_id);
    }
    writer.close();
    return oss.str();
}

std::string serialize_watchlist_body(const std::string& name,
                                     const std::vector<std::string>& symbols) {
    if (name.empty()) {
        throw std::invalid_argument("watchlist name must not be empty");
    }
    std::ostringstream symbols_json;
    core::json::write_string_array(symbols_json, symbols);

    std::ostringstream oss;
    ObjectWriter writer(oss);
    writer.string("name", name);
    writer.raw("symbols", symbols_json.str());
    writer.close();
    return oss.str();
}

std::string serialize_symbol_body(const std::string& symbol) {
    if (symbol.empty()) {
        throw std::invalid_argument("symbol must not be empty");
    }
    std::ostringstream oss;
    ObjectWriter writer(oss);
    writer.string("symbol", symbol);
    writer.close();
    return oss.str();
}

}  // namespace apca::trading
