#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace apca::data {

struct Trade {
    std::string symbol;
    std::int64_t id{0};
    std::string exchange;
    double price{0.0};
    double size{0.0};
    std::string timestamp;
    std::vector<std::string> conditions;
    std::string tape;
};

struct Quote {
    std::string symbol;
    std::string ask_exchange;
    double ask_price{0.0};
    double ask_size{0.0};
    std::string bid_exchange;
    double bid_price{0.0};
    double bid_size{0.0};
    std::string timestamp;
    std::vector<std::string> conditions;
    std::string tape;
};

struct Bar {
    std::string symbol;
    double open{0.0};
    double high{0.0};
    double low{0.0};
    double close{0.0};
    double volume{0.0};
    std::string timestamp;
};

struct Snapshot {
    std::string symbol;
    std::optional<Trade> latest_trade;
    std::optional<Quote> latest_quote;
    std::optional<Bar> minute_bar;
    std::optional<Bar> daily_bar;
    std::optional<Bar> prev_daily_bar;
};

/**
 * One page of a historical query. A null list on the wire decodes as an empty
 * page; only the absence of next_page_token ends the sequence.
 */
struct TradesPage {
    using item_type = Trade;

    std::string symbol;
    std::vector<Trade> trades;
    std::optional<std::string> next_page_token;

    std::pair<std::vector<Trade>, std::optional<std::string>> split() && {
        return {std::move(trades), std::move(next_page_token)};
    }
};

struct QuotesPage {
    using item_type = Quote;

    std::string symbol;
    std::vector<Quote> quotes;
    std::optional<std::string> next_page_token;

    std::pair<std::vector<Quote>, std::optional<std::string>> split() && {
        return {std::move(quotes), std::move(next_page_token)};
    }
};

struct BarsPage {
    using item_type = Bar;

    std::string symbol;
    std::vector<Bar> bars;
    std::optional<std::string> next_page_token;

    std::pair<std::vector<Bar>, std::optional<std::string>> split() && {
        return {std::move(bars), std::move(next_page_token)};
    }
};

}  // namespace apca::data
