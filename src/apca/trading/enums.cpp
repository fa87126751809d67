#include "apca/trading/enums.hpp"

#include "apca/core/errors.hpp"

#include <array>
#include <string>
#include <utility>

namespace apca::trading {

namespace {

constexpr std::array<std::pair<std::string_view, OrderStatus>, 16> kOrderStatuses{{
    {"new", OrderStatus::New},
    {"partially_filled", OrderStatus::PartiallyFilled},
    {"filled", OrderStatus::Filled},
    {"done_for_day", OrderStatus::DoneForDay},
    {"canceled", OrderStatus::Canceled},
    {"expired", OrderStatus::Expired},
    {"replaced", OrderStatus::Replaced},
    {"pending_cancel", OrderStatus::PendingCancel},
    {"pending_replace", OrderStatus::PendingReplace},
    {"accepted", OrderStatus::Accepted},
    {"pending_new", OrderStatus::PendingNew},
    {"accepted_for_bidding", OrderStatus::AcceptedForBidding},
    {"stopped", OrderStatus::Stopped},
    {"rejected", OrderStatus::Rejected},
    {"suspended", OrderStatus::Suspended},
    {"calculated", OrderStatus::Calculated},
}};

[[noreturn]] void unknown(std::string_view kind, std::string_view value) {
    throw core::SerializationError("Unknown " + std::string(kind) + " '" + std::string(value) +
                                   "'");
}

}  // namespace

std::string_view to_string(OrderStatus status) noexcept {
    for (const auto& [name, value] : kOrderStatuses) {
        if (value == status) {
            return name;
        }
    }
    return "new";
}

OrderSide parse_order_side(std::string_view value) {
    if (value == "buy") {
        return OrderSide::Buy;
    }
    if (value == "sell") {
        return OrderSide::Sell;
    }
    unknown("order side", value);
}

OrderType parse_order_type(std::string_view value) {
    for (auto type : {OrderType::Market, OrderType::Limit, OrderType::Stop, OrderType::StopLimit,
                      OrderType::TrailingStop}) {
        if (to_string(type) == value) {
            return type;
        }
    }
    unknown("order type", value);
}

OrderClass parse_order_class(std::string_view value) {
    if (value.empty()) {
        return OrderClass::Simple;
    }
    for (auto order_class :
         {OrderClass::Simple, OrderClass::Bracket, OrderClass::Oco, OrderClass::Oto}) {
        if (to_string(order_class) == value) {
            return order_class;
        }
    }
    unknown("order class", value);
}

TimeInForce parse_time_in_force(std::string_view value) {
    for (auto tif : {TimeInForce::Day, TimeInForce::Gtc, TimeInForce::Opg, TimeInForce::Cls,
                     TimeInForce::Ioc, TimeInForce::Fok}) {
        if (to_string(tif) == value) {
            return tif;
        }
    }
    unknown("time in force", value);
}

OrderStatus parse_order_status(std::string_view value) {
    for (const auto& [name, status] : kOrderStatuses) {
        if (name == value) {
            return status;
        }
    }
    unknown("order status", value);
}

AssetStatus parse_asset_status(std::string_view value) {
    if (value == "active") {
        return AssetStatus::Active;
    }
    if (value == "inactive") {
        return AssetStatus::Inactive;
    }
    unknown("asset status", value);
}

}  // namespace apca::trading
