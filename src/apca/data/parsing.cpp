#include "apca/data/parsing.hpp"

#include "apca/core/errors.hpp"
#include "apca/core/json.hpp"

#include <utility>

namespace apca::data::detail {

namespace json = core::json;

namespace {

template <typename Item, typename Decode>
std::vector<Item> parse_items(simdjson::ondemand::object& root, std::string_view key,
                              const std::string& symbol, Decode decode) {
    std::vector<Item> items;
    auto array = json::find_array(root, key);
    if (!array) {
        return items;
    }
    for (auto element : *array) {
        simdjson::ondemand::value value;
        if (element.get(value)) {
            throw core::SerializationError("Invalid element in '" + std::string(key) + "'");
        }
        auto object = json::as_object(value, key);
        items.push_back(decode(object, symbol));
    }
    return items;
}

template <typename Item, typename Decode>
std::optional<Item> parse_nested(simdjson::ondemand::object& root, std::string_view key,
                                 const std::string& symbol, Decode decode) {
    auto nested = json::find_object(root, key);
    if (!nested) {
        return std::nullopt;
    }
    return decode(*nested, symbol);
}

}  // namespace

Trade parse_trade(simdjson::ondemand::object& object, std::string symbol) {
    Trade trade;
    trade.symbol = std::move(symbol);
    trade.id = json::get_int64(object, "i");
    trade.exchange = json::get_string_or_empty(object, "x");
    trade.price = json::get_number(object, "p");
    trade.size = json::get_number(object, "s");
    trade.timestamp = json::get_string(object, "t");
    trade.conditions = json::get_string_array(object, "c");
    trade.tape = json::get_string_or_empty(object, "z");
    return trade;
}

Quote parse_quote(simdjson::ondemand::object& object, std::string symbol) {
    Quote quote;
    quote.symbol = std::move(symbol);
    quote.ask_exchange = json::get_string_or_empty(object, "ax");
    quote.ask_price = json::get_number(object, "ap");
    quote.ask_size = json::get_number(object, "as");
    quote.bid_exchange = json::get_string_or_empty(object, "bx");
    quote.bid_price = json::get_number(object, "bp");
    quote.bid_size = json::get_number(object, "bs");
    quote.timestamp = json::get_string(object, "t");
    quote.conditions = json::get_string_array(object, "c");
    quote.tape = json::get_string_or_empty(object, "z");
    return quote;
}

Bar parse_bar(simdjson::ondemand::object& object, std::string symbol) {
    Bar bar;
    bar.symbol = std::move(symbol);
    bar.open = json::get_number(object, "o");
    bar.high = json::get_number(object, "h");
    bar.low = json::get_number(object, "l");
    bar.close = json::get_number(object, "c");
    bar.volume = json::get_number(object, "v");
    bar.timestamp = json::get_string(object, "t");
    return bar;
}

TradesPage parse_trades_page(std::string_view payload) {
    json::ParsedDocument document(payload, "trades page");
    auto root = document.root_object();
    TradesPage page;
    page.symbol = json::get_string_or_empty(root, "symbol");
    page.trades = parse_items<Trade>(root, "trades", page.symbol, parse_trade);
    page.next_page_token = json::get_optional_string(root, "next_page_token");
    return page;
}

QuotesPage parse_quotes_page(std::string_view payload) {
    json::ParsedDocument document(payload, "quotes page");
    auto root = document.root_object();
    QuotesPage page;
    page.symbol = json::get_string_or_empty(root, "symbol");
    page.quotes = parse_items<Quote>(root, "quotes", page.symbol, parse_quote);
    page.next_page_token = json::get_optional_string(root, "next_page_token");
    return page;
}

BarsPage parse_bars_page(std::string_view payload) {
    json::ParsedDocument document(payload, "bars page");
    auto root = document.root_object();
    BarsPage page;
    page.symbol = json::get_string_or_empty(root, "symbol");
    page.bars = parse_items<Bar>(root, "bars", page.symbol, parse_bar);
    page.next_page_token = json::get_optional_string(root, "next_page_token");
    return page;
}

Trade parse_latest_trade(std::string_view payload) {
    json::ParsedDocument document(payload, "latest trade");
    auto root = document.root_object();
    auto symbol = json::get_string_or_empty(root, "symbol");
    auto trade = parse_nested<Trade>(root, "trade", symbol, parse_trade);
    if (!trade) {
        throw core::SerializationError("Invalid latest trade payload: missing 'trade'");
    }
    return std::move(*trade);
}

Quote parse_latest_quote(std::string_view payload) {
    json::ParsedDocument document(payload, "latest quote");
    auto root = document.root_object();
    auto symbol = json::get_string_or_empty(root, "symbol");
    auto quote = parse_nested<Quote>(root, "quote", symbol, parse_quote);
    if (!quote) {
        throw core::SerializationError("Invalid latest quote payload: missing 'quote'");
    }
    return std::move(*quote);
}

Snapshot parse_snapshot(std::string_view payload) {
    json::ParsedDocument document(payload, "snapshot");
    auto root = document.root_object();
    Snapshot snapshot;
    snapshot.symbol = json::get_string_or_empty(root, "symbol");
    snapshot.latest_trade = parse_nested<Trade>(root, "latestTrade", snapshot.symbol, parse_trade);
    snapshot.latest_quote = parse_nested<Quote>(root, "latestQuote", snapshot.symbol, parse_quote);
    snapshot.minute_bar = parse_nested<Bar>(root, "minuteBar", snapshot.symbol, parse_bar);
    snapshot.daily_bar = parse_nested<Bar>(root, "dailyBar", snapshot.symbol, parse_bar);
    snapshot.prev_daily_bar = parse_nested<Bar>(root, "prevDailyBar", snapshot.symbol, parse_bar);
    return snapshot;
}

}  // namespace apca::data::detail
