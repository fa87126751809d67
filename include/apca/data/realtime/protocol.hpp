#pragma once

#include "apca/core/ws/session.hpp"
#include "apca/data/realtime/messages.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace apca::data::realtime {

// Wire format of the market data socket: text frames holding JSON arrays.
struct MarketDataProtocol {
    using action_type = Action;
    using response_type = Response;

    static constexpr core::ws::FrameKind frame_kind = core::ws::FrameKind::Text;
    static constexpr std::string_view name = "market-data";

    static std::string encode(const Action& action);
    static core::ws::SessionState state_after(const Action& action) noexcept;
    static std::vector<Response> decode(std::string_view frame);
};

}  // namespace apca::data::realtime
