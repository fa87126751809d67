#pragma once

#include "apca/trading/models.hpp"

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace apca::streaming {

// Streams a client can listen to on the account socket.
enum class MessageStream { TradeUpdates };

enum class AuthorizationStatus { Authorized, Unauthorized };

// The client action an authorization message answers.
enum class AuthorizationAction { Authenticate, Listen };

[[nodiscard]] constexpr std::string_view to_string(MessageStream stream) noexcept {
    switch (stream) {
        case MessageStream::TradeUpdates:
            return "trade_updates";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(AuthorizationStatus status) noexcept {
    return status == AuthorizationStatus::Authorized ? "authorized" : "unauthorized";
}

[[nodiscard]] constexpr std::string_view to_string(AuthorizationAction action) noexcept {
    return action == AuthorizationAction::Authenticate ? "authenticate" : "listen";
}

// {"action":"authenticate","data":{"key_id":...,"secret_key":...}}
struct Authenticate {
    std::string key;
    std::string secret;
};

// {"action":"listen","data":{"streams":[...]}}. The list replaces the current set.
struct Listen {
    std::vector<MessageStream> streams;
};

using Action = std::variant<Authenticate, Listen>;

/**
 * Events of the trade_updates stream. Every event carries the order as the
 * REST API returns it; fills add the execution price and the resulting
 * position, terminal events add the time they happened.
 */
namespace events {

struct New {
    static constexpr std::string_view name = "new";

    trading::Order order;
};

struct Fill {
    static constexpr std::string_view name = "fill";

    trading::Order order;
    std::string timestamp;
    double price{0.0};
    double position_qty{0.0};
};

struct PartialFill {
    static constexpr std::string_view name = "partial_fill";

    trading::Order order;
    std::string timestamp;
    double price{0.0};
    double position_qty{0.0};
};

struct Canceled {
    static constexpr std::string_view name = "canceled";

    trading::Order order;
    std::string timestamp;
};

struct Expired {
    static constexpr std::string_view name = "expired";

    trading::Order order;
    std::string timestamp;
};

struct DoneForDay {
    static constexpr std::string_view name = "done_for_day";

    trading::Order order;
};

struct Replaced {
    static constexpr std::string_view name = "replaced";

    trading::Order order;
    std::string timestamp;
};

struct Rejected {
    static constexpr std::string_view name = "rejected";

    trading::Order order;
    std::string timestamp;
};

struct PendingNew {
    static constexpr std::string_view name = "pending_new";

    trading::Order order;
};

struct Stopped {
    static constexpr std::string_view name = "stopped";

    trading::Order order;
};

struct PendingCancel {
    static constexpr std::string_view name = "pending_cancel";

    trading::Order order;
};

struct PendingReplace {
    static constexpr std::string_view name = "pending_replace";

    trading::Order order;
};

struct Calculated {
    static constexpr std::string_view name = "calculated";

    trading::Order order;
};

struct Suspended {
    static constexpr std::string_view name = "suspended";

    trading::Order order;
};

struct OrderReplaceRejected {
    static constexpr std::string_view name = "order_replace_rejected";

    trading::Order order;
};

struct OrderCancelRejected {
    static constexpr std::string_view name = "order_cancel_rejected";

    trading::Order order;
};

}  // namespace events

using OrderUpdate =
    std::variant<events::New, events::Fill, events::PartialFill, events::Canceled,
                 events::Expired, events::DoneForDay, events::Replaced, events::Rejected,
                 events::PendingNew, events::Stopped, events::PendingCancel,
                 events::PendingReplace, events::Calculated, events::Suspended,
                 events::OrderReplaceRejected, events::OrderCancelRejected>;

// Wire name of the event ("fill", "pending_new", ...).
[[nodiscard]] std::string_view event_name(const OrderUpdate& update) noexcept;

// The order snapshot every event carries.
[[nodiscard]] const trading::Order& order_of(const OrderUpdate& update) noexcept;

// Server to client, tagged by "stream".
struct Authorization {
    AuthorizationStatus status{AuthorizationStatus::Unauthorized};
    AuthorizationAction action{AuthorizationAction::Authenticate};
};

struct Listening {
    std::vector<MessageStream> streams;
};

struct TradeUpdates {
    OrderUpdate update;
};

using Response = std::variant<Authorization, Listening, TradeUpdates>;

}  // namespace apca::streaming
