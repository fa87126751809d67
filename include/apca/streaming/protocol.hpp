#pragma once

#include "apca/core/ws/session.hpp"
#include "apca/streaming/messages.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace apca::streaming {

// Wire format of the account socket: binary frames holding one JSON object each.
struct TradeUpdatesProtocol {
    using action_type = Action;
    using response_type = Response;

    static constexpr core::ws::FrameKind frame_kind = core::ws::FrameKind::Binary;
    static constexpr std::string_view name = "trade-updates";

    static std::string encode(const Action& action);
    static core::ws::SessionState state_after(const Action& action) noexcept;
    static std::vector<Response> decode(std::string_view frame);
};

}  // namespace apca::streaming
