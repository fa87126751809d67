#pragma once

#include "apca/core/errors.hpp"
#include "apca/data/models.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace apca::data::realtime {

/**
 * Channel lists of a subscribe or unsubscribe action, and of the subscription
 * acknowledgement. An absent list leaves that channel untouched; the server
 * always acknowledges with the complete resulting set.
 */
struct SubscriptionData {
    std::optional<std::vector<std::string>> trades;
    std::optional<std::vector<std::string>> quotes;
    std::optional<std::vector<std::string>> bars;
};

// Client to server, {"action":"auth","key":...,"secret":...}
struct Authenticate {
    std::string key;
    std::string secret;
};

struct Subscribe {
    SubscriptionData data;
};

struct Unsubscribe {
    SubscriptionData data;
};

using Action = std::variant<Authenticate, Subscribe, Unsubscribe>;

// Server to client, one object per element of a frame array, tagged by "T".
struct Error {
    int code{0};
    core::VendorErrorCode kind{core::VendorErrorCode::Unexpected};
    std::string message;
};

struct Success {
    std::string message;
};

struct Subscription {
    SubscriptionData data;
};

using Response = std::variant<Error, Success, Subscription, Trade, Quote, Bar>;

}  // namespace apca::data::realtime
