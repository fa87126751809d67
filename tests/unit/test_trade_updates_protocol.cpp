#include "apca/core/errors.hpp"
#include "apca/streaming/protocol.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <variant>

using namespace apca;
using streaming::TradeUpdatesProtocol;

namespace {

const std::string kOrder =
    R"({"id":"810f77c9-fd3f-4a10-a78c-046c611f26db","client_order_id":"ad1a656c-c524-421b-a1ff-c84bb1b4ae38","created_at":"2021-11-11T17:11:17.353294Z","updated_at":"2021-11-11T17:11:17.594109Z","submitted_at":"2021-11-11T17:11:17.347956Z","filled_at":"2021-11-11T17:11:17.557793Z","expired_at":null,"canceled_at":null,"failed_at":null,"replaced_at":null,"replaced_by":null,"replaces":null,"asset_id":"b6d1aa75-5c9c-4353-a305-9e2caa1925ab","symbol":"MSFT","asset_class":"us_equity","notional":null,"qty":"1","filled_qty":"1","filled_avg_price":"333.16","order_class":"simple","order_type":"market","type":"market","side":"buy","time_in_force":"day","limit_price":null,"stop_price":null,"status":"filled","extended_hours":false,"legs":null,"trail_percent":null,"trail_price":null,"hwm":null})";

std::string update_frame(const std::string& event, const std::string& extra = {}) {
    return R"({"stream":"trade_updates","data":{"event":")" + event + "\"" + extra +
           R"(,"order":)" + kOrder + "}}";
}

streaming::OrderUpdate decode_update(const std::string& frame) {
    auto responses = TradeUpdatesProtocol::decode(frame);
    assert(responses.size() == 1);
    return std::get<streaming::TradeUpdates>(responses.front()).update;
}

core::ProtocolErrorKind decode_failure(const std::string& frame) {
    try {
        (void)TradeUpdatesProtocol::decode(frame);
    } catch (const core::ProtocolError& error) {
        return error.kind();
    }
    assert(false && "expected a ProtocolError");
    return core::ProtocolErrorKind::Malformed;
}

}  // namespace

int main() {
    assert(TradeUpdatesProtocol::encode(streaming::Authenticate{"key", "secret"}) ==
           R"({"action":"authenticate","data":{"key_id":"key","secret_key":"secret"}})");
    assert(TradeUpdatesProtocol::encode(
               streaming::Listen{{streaming::MessageStream::TradeUpdates}}) ==
           R"({"action":"listen","data":{"streams":["trade_updates"]}})");
    assert(TradeUpdatesProtocol::encode(streaming::Listen{}) ==
           R"({"action":"listen","data":{"streams":[]}})");
    assert(TradeUpdatesProtocol::frame_kind == core::ws::FrameKind::Binary);
    assert(TradeUpdatesProtocol::state_after(streaming::Listen{}) ==
           core::ws::SessionState::Listening);

    const auto authorized = TradeUpdatesProtocol::decode(
        R"({"stream":"authorization","data":{"action":"authenticate","status":"authorized"}})");
    const auto& authorization = std::get<streaming::Authorization>(authorized.front());
    assert(authorization.status == streaming::AuthorizationStatus::Authorized);
    assert(authorization.action == streaming::AuthorizationAction::Authenticate);

    const auto rejected = TradeUpdatesProtocol::decode(
        R"({"stream":"authorization","data":{"status":"unauthorized","action":"listen"}})");
    assert(std::get<streaming::Authorization>(rejected.front()).status ==
           streaming::AuthorizationStatus::Unauthorized);
    assert(std::get<streaming::Authorization>(rejected.front()).action ==
           streaming::AuthorizationAction::Listen);

    const auto listening = TradeUpdatesProtocol::decode(
        R"({"stream":"listening","data":{"streams":["trade_updates"]}})");
    assert(std::get<streaming::Listening>(listening.front()).streams.size() == 1);

    const auto fill = decode_update(update_frame(
        "fill", R"(,"execution_id":"b0c17642","price":"333.16","timestamp":"2021-11-11T17:11:17.557793708Z","position_qty":"1","qty":"1")"));
    const auto& filled = std::get<streaming::events::Fill>(fill);
    assert(filled.price == 333.16);
    assert(filled.position_qty == 1.0);
    assert(filled.timestamp == "2021-11-11T17:11:17.557793708Z");
    assert(filled.order.symbol == "MSFT");
    assert(filled.order.filled_avg_price == 333.16);
    assert(filled.order.status == trading::OrderStatus::Filled);
    assert(streaming::event_name(fill) == "fill");

    const auto partial = decode_update(update_frame(
        "partial_fill", R"(,"price":120,"timestamp":"2021-11-11T17:11:17Z","position_qty":-50)"));
    assert(std::get<streaming::events::PartialFill>(partial).position_qty == -50.0);

    const auto canceled =
        decode_update(update_frame("canceled", R"(,"timestamp":"2021-11-11T18:00:00Z")"));
    assert(std::get<streaming::events::Canceled>(canceled).timestamp == "2021-11-11T18:00:00Z");

    const char* plain_events[] = {"new",           "done_for_day",    "pending_new",
                                  "stopped",       "pending_cancel",  "pending_replace",
                                  "calculated",    "suspended",       "order_replace_rejected",
                                  "order_cancel_rejected"};
    for (const char* event : plain_events) {
        const auto update = decode_update(update_frame(event));
        assert(streaming::event_name(update) == event);
        assert(streaming::order_of(update).id == "810f77c9-fd3f-4a10-a78c-046c611f26db");
    }
    const char* timestamped_events[] = {"canceled", "expired", "replaced", "rejected"};
    for (const char* event : timestamped_events) {
        const auto update =
            decode_update(update_frame(event, R"(,"timestamp":"2021-11-11T18:00:00Z")"));
        assert(streaming::event_name(update) == event);
    }

    // Unknown tags are reported, never ignored.
    assert(decode_failure(update_frame("teleported")) == core::ProtocolErrorKind::UnknownVariant);
    assert(decode_failure(R"({"stream":"account_updates","data":{}})") ==
           core::ProtocolErrorKind::UnknownVariant);
    assert(decode_failure(R"({"stream":"listening","data":{"streams":["news"]}})") ==
           core::ProtocolErrorKind::UnknownVariant);

    // Missing fields and bad shapes are malformed.
    assert(decode_failure(update_frame("fill", R"(,"timestamp":"2021-11-11T17:11:17Z")")) ==
           core::ProtocolErrorKind::Malformed);
    assert(decode_failure(R"({"stream":"trade_updates","data":{"event":"new"}})") ==
           core::ProtocolErrorKind::Malformed);
    assert(decode_failure(R"({"data":{}})") == core::ProtocolErrorKind::Malformed);
    assert(decode_failure("not json") == core::ProtocolErrorKind::Malformed);

    std::cout << "Trade update protocol tests passed\n";
    return 0;
}
