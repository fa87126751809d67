#pragma once

#include <string_view>

namespace apca::data {

// Feed of the real-time market data socket.
enum class Source { Iex, Sip };

// Bar aggregation period.
enum class TimeFrame { Minute, Hour, Day };

[[nodiscard]] constexpr std::string_view to_string(Source source) noexcept {
    switch (source) {
    case Source::Iex:
        return "iex";
    case Source::Sip:
        return "sip";
    }
    return "iex";
}

[[nodiscard]] constexpr std::string_view to_string(TimeFrame timeframe) noexcept {
    switch (timeframe) {
    case TimeFrame::Minute:
        return "1Min";
    case TimeFrame::Hour:
        return "1Hour";
    case TimeFrame::Day:
        return "1Day";
    }
    return "1Min";
}

}  // namespace apca::data
