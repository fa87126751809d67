#pragma once

#include <string_view>

namespace apca::trading {

enum class OrderSide { Buy, Sell };
enum class OrderType { Market, Limit, Stop, StopLimit, TrailingStop };
enum class OrderClass { Simple, Bracket, Oco, Oto };
enum class TimeInForce { Day, Gtc, Opg, Cls, Ioc, Fok };
enum class OrderStatus {
    New,
    PartiallyFilled,
    Filled,
    DoneForDay,
    Canceled,
    Expired,
    Replaced,
    PendingCancel,
    PendingReplace,
    Accepted,
    PendingNew,
    AcceptedForBidding,
    Stopped,
    Rejected,
    Suspended,
    Calculated
};
// Status filter of the order listing endpoint.
enum class OrderQueryStatus { Open, Closed, All };
enum class SortDirection { Asc, Desc };
enum class AssetStatus { Active, Inactive };

[[nodiscard]] constexpr std::string_view to_string(OrderSide side) noexcept {
    switch (side) {
        case OrderSide::Buy:
            return "buy";
        case OrderSide::Sell:
            return "sell";
    }
    return "buy";
}

[[nodiscard]] constexpr std::string_view to_string(OrderType type) noexcept {
    switch (type) {
        case OrderType::Market:
            return "market";
        case OrderType::Limit:
            return "limit";
        case OrderType::Stop:
            return "stop";
        case OrderType::StopLimit:
            return "stop_limit";
        case OrderType::TrailingStop:
            return "trailing_stop";
    }
    return "market";
}

[[nodiscard]] constexpr std::string_view to_string(OrderClass order_class) noexcept {
    switch (order_class) {
        case OrderClass::Simple:
            return "simple";
        case OrderClass::Bracket:
            return "bracket";
        case OrderClass::Oco:
            return "oco";
        case OrderClass::Oto:
            return "oto";
    }
    return "simple";
}

[[nodiscard]] constexpr std::string_view to_string(TimeInForce tif) noexcept {
    switch (tif) {
        case TimeInForce::Day:
            return "day";
        case TimeInForce::Gtc:
            return "gtc";
        case TimeInForce::Opg:
            return "opg";
        case TimeInForce::Cls:
            return "cls";
        case TimeInForce::Ioc:
            return "ioc";
        case TimeInForce::Fok:
            return "fok";
    }
    return "day";
}

[[nodiscard]] constexpr std::string_view to_string(OrderQueryStatus status) noexcept {
    switch (status) {
        case OrderQueryStatus::Open:
            return "open";
        case OrderQueryStatus::Closed:
            return "closed";
        case OrderQueryStatus::All:
            return "all";
    }
    return "open";
}

[[nodiscard]] constexpr std::string_view to_string(SortDirection direction) noexcept {
    switch (direction) {
        case SortDirection::Asc:
            return "asc";
        case SortDirection::Desc:
            return "desc";
    }
    return "desc";
}

[[nodiscard]] constexpr std::string_view to_string(AssetStatus status) noexcept {
    switch (status) {
        case AssetStatus::Active:
            return "active";
        case AssetStatus::Inactive:
            return "inactive";
    }
    return "active";
}

[[nodiscard]] std::string_view to_string(OrderStatus status) noexcept;

// Wire value parsers. Unknown values raise core::SerializationError.
OrderSide parse_order_side(std::string_view value);
OrderType parse_order_type(std::string_view value);
// An empty value is the vendor's spelling of a simple order.
OrderClass parse_order_class(std::string_view value);
TimeInForce parse_time_in_force(std::string_view value);
OrderStatus parse_order_status(std::string_view value);
AssetStatus parse_asset_status(std::string_view value);

}  // namespace apca::trading
