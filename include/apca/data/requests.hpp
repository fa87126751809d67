#pragma once

#include "apca/data/enums.hpp"

#include <optional>
#include <string>

namespace apca::data {

struct TradesRequest {
    std::string symbol;
    std::string start;
    std::string end;
    std::optional<int> limit;
};

struct QuotesRequest {
    std::string symbol;
    std::string start;
    std::string end;
    std::optional<int> limit;
};

struct BarsRequest {
    std::string symbol;
    TimeFrame timeframe{TimeFrame::Minute};
    std::string start;
    std::string end;
    std::optional<int> limit;
};

}  // namespace apca::data
