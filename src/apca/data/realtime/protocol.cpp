#include "apca/data/realtime/protocol.hpp"

#include "apca/core/json.hpp"
#include "apca/data/parsing.hpp"

#include <iomanip>
#include <sstream>
#include <type_traits>

namespace apca::data::realtime {

namespace json = core::json;

namespace {

void write_subscription(std::ostream& os, std::string_view action, const SubscriptionData& data) {
    os << "{\"action\":" << std::quoted(action);
    auto write_channel = [&](std::string_view channel,
                             const std::optional<std::vector<std::string>>& symbols) {
        if (!symbols) {
            return;
        }
        os << ',' << std::quoted(channel) << ':';
        json::write_string_array(os, *symbols);
    };
    write_channel("trades", data.trades);
    write_channel("quotes", data.quotes);
    write_channel("bars", data.bars);
    os << '}';
}

SubscriptionData parse_subscription(simdjson::ondemand::object& object) {
    SubscriptionData data;
    data.trades = json::get_optional_string_array(object, "trades");
    data.quotes = json::get_optional_string_array(object, "quotes");
    data.bars = json::get_optional_string_array(object, "bars");
    return data;
}

Response decode_message(simdjson::ondemand::object& object) {
    const auto tag = json::get_string(object, "T");
    if (tag == "t") {
        auto symbol = json::get_string(object, "S");
        return detail::parse_trade(object, std::move(symbol));
    }
    if (tag == "q") {
        auto symbol = json::get_string(object, "S");
        return detail::parse_quote(object, std::move(symbol));
    }
    if (tag == "b") {
        auto symbol = json::get_string(object, "S");
        return detail::parse_bar(object, std::move(symbol));
    }
    if (tag == "success") {
        return Success{json::get_string_or_empty(object, "msg")};
    }
    if (tag == "subscription") {
        return Subscription{parse_subscription(object)};
    }
    if (tag == "error") {
        Error error;
        error.code = static_cast<int>(json::get_int64(object, "code"));
        error.kind = core::realtime_error_code(error.code);
        error.message = json::get_string_or_empty(object, "msg");
        return error;
    }
    throw core::ProtocolError(core::ProtocolErrorKind::UnknownVariant,
                              "market-data: unknown message type '" + tag + "'");
}

}  // namespace

std::string MarketDataProtocol::encode(const Action& action) {
    std::ostringstream oss;
    std::visit(
        [&oss](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, Authenticate>) {
                oss << "{\"action\":\"auth\",\"key\":" << std::quoted(value.key)
                    << ",\"secret\":" << std::quoted(value.secret) << '}';
            } else if constexpr (std::is_same_v<T, Subscribe>) {
                write_subscription(oss, "subscribe", value.data);
            } else {
                write_subscription(oss, "unsubscribe", value.data);
            }
        },
        action);
    return oss.str();
}

core::ws::SessionState MarketDataProtocol::state_after(const Action& action) noexcept {
    if (std::holds_alternative<Authenticate>(action)) {
        return core::ws::SessionState::Authenticating;
    }
    return core::ws::SessionState::Subscribed;
}

std::vector<Response> MarketDataProtocol::decode(std::string_view frame) {
    std::vector<Response> responses;
    try {
        json::ParsedDocument document(frame, "market-data frame");
        if (document.root_type() == simdjson::ondemand::json_type::object) {
            auto object = document.root_object();
            responses.push_back(decode_message(object));
            return responses;
        }
        auto array = document.root_array();
        for (auto element : array) {
            simdjson::ondemand::value value;
            if (element.get(value)) {
                throw core::SerializationError("Invalid element in market-data frame");
            }
            auto object = json::as_object(value, "market-data message");
            responses.push_back(decode_message(object));
        }
    } catch (const core::SerializationError& error) {
        throw core::ProtocolError(core::ProtocolErrorKind::Malformed,
                                  std::string("market-data: ") + error.what());
    }
    return responses;
}

}  // namespace apca::data::realtime
