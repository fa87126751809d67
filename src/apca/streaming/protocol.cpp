#include "apca/streaming/protocol.hpp"

#include "apca/core/errors.hpp"
#include "apca/core/json.hpp"
#include "apca/trading/parsing.hpp"

#include <iomanip>
#include <sstream>
#include <type_traits>
#include <variant>

namespace apca::streaming {

namespace json = core::json;

namespace {

[[noreturn]] void unknown_variant(std::string_view field, std::string_view value) {
    throw core::ProtocolError(core::ProtocolErrorKind::UnknownVariant,
                              "trade-updates: unknown " + std::string(field) + " '" +
                                  std::string(value) + "'");
}

MessageStream parse_stream_name(std::string_view value) {
    if (value == "trade_updates") {
        return MessageStream::TradeUpdates;
    }
    unknown_variant("stream", value);
}

std::vector<MessageStream> parse_stream_list(simdjson::ondemand::object& data) {
    std::vector<MessageStream> streams;
    for (const auto& name : json::get_string_array(data, "streams")) {
        streams.push_back(parse_stream_name(name));
    }
    return streams;
}

Authorization parse_authorization(simdjson::ondemand::object& data) {
    Authorization authorization;
    const auto status = json::get_string(data, "status");
    if (status == "authorized") {
        authorization.status = AuthorizationStatus::Authorized;
    } else if (status == "unauthorized") {
        authorization.status = AuthorizationStatus::Unauthorized;
    } else {
        unknown_variant("authorization status", status);
    }
    const auto action = json::get_string(data, "action");
    if (action == "authenticate") {
        authorization.action = AuthorizationAction::Authenticate;
    } else if (action == "listen") {
        authorization.action = AuthorizationAction::Listen;
    } else {
        unknown_variant("authorization action", action);
    }
    return authorization;
}

trading::Order parse_event_order(simdjson::ondemand::object& data) {
    auto order = json::find_object(data, "order");
    if (!order) {
        throw core::SerializationError("trade update is missing its order");
    }
    return trading::detail::parse_order(*order);
}

template <typename Event>
Event parse_event(simdjson::ondemand::object& data) {
    Event event;
    if constexpr (requires { event.timestamp; }) {
        event.timestamp = json::get_string(data, "timestamp");
    }
    if constexpr (requires { event.position_qty; }) {
        event.price = json::get_number(data, "price");
        event.position_qty = json::get_number(data, "position_qty");
    }
    event.order = parse_event_order(data);
    return event;
}

// Walks the alternatives of OrderUpdate until one carries the wire name.
template <std::size_t I = 0>
OrderUpdate parse_order_update(std::string_view name, simdjson::ondemand::object& data) {
    if constexpr (I == std::variant_size_v<OrderUpdate>) {
        unknown_variant("event", name);
    } else {
        using Event = std::variant_alternative_t<I, OrderUpdate>;
        if (name == Event::name) {
            return parse_event<Event>(data);
        }
        return parse_order_update<I + 1>(name, data);
    }
}

void write_stream_list(std::ostream& os, const std::vector<MessageStream>& streams) {
    os << '[';
    for (std::size_t i = 0; i < streams.size(); ++i) {
        if (i > 0) {
            os << ',';
        }
        os << std::quoted(to_string(streams[i]));
    }
    os << ']';
}

}  // namespace

std::string_view event_name(const OrderUpdate& update) noexcept {
    return std::visit([](const auto& event) { return std::decay_t<decltype(event)>::name; },
                      update);
}

const trading::Order& order_of(const OrderUpdate& update) noexcept {
    return std::visit([](const auto& event) -> const trading::Order& { return event.order; },
                      update);
}

std::string TradeUpdatesProtocol::encode(const Action& action) {
    std::ostringstream oss;
    std::visit(
        [&oss](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, Authenticate>) {
                oss << "{\"action\":\"authenticate\",\"data\":{\"key_id\":"
                    << std::quoted(value.key) << ",\"secret_key\":" << std::quoted(value.secret)
                    << "}}";
            } else {
                oss << "{\"action\":\"listen\",\"data\":{\"streams\":";
                write_stream_list(oss, value.streams);
                oss << "}}";
            }
        },
        action);
    return oss.str();
}

core::ws::SessionState TradeUpdatesProtocol::state_after(const Action& action) noexcept {
    if (std::holds_alternative<Authenticate>(action)) {
        return core::ws::SessionState::Authenticating;
    }
    return core::ws::SessionState::Listening;
}

std::vector<Response> TradeUpdatesProtocol::decode(std::string_view frame) {
    std::vector<Response> responses;
    try {
        json::ParsedDocument document(frame, "trade-updates frame");
        auto root = document.root_object();
        const auto stream = json::get_string(root, "stream");
        auto data = json::find_object(root, "data");
        if (!data) {
            throw core::SerializationError("'" + stream + "' message has no data");
        }
        if (stream == "authorization") {
            responses.emplace_back(parse_authorization(*data));
        } else if (stream == "listening") {
            responses.emplace_back(Listening{parse_stream_list(*data)});
        } else if (stream == "trade_updates") {
            const auto event = json::get_string(*data, "event");
            responses.emplace_back(TradeUpdates{parse_order_update(event, *data)});
        } else {
            unknown_variant("stream", stream);
        }
    } catch (const core::SerializationError& error) {
        throw core::ProtocolError(core::ProtocolErrorKind::Malformed,
                                  std::string("trade-updates: ") + error.what());
    }
    return responses;
}

}  // namespace apca::streaming
