#include "apca/data/client.hpp"

#include "apca/core/errors.hpp"
#include "apca/core/query.hpp"
#include "apca/data/parsing.hpp"

#include <stdexcept>
#include <utility>

namespace apca::data {

namespace {

constexpr core::ResourceFamily kFamily = core::ResourceFamily::History;

std::string symbol_path(const std::string &symbol, std::string_view resource) {
    if (symbol.empty()) {
        throw std::invalid_argument("market data requests require a symbol");
    }
    std::string path = "/v2/stocks/";
    path.append(core::encode_path_segment(symbol));
    path.push_back('/');
    path.append(resource);
    return path;
}

std::string build_trades_path(const TradesRequest &request,
                              const std::optional<std::string> &page_token) {
    core::QueryBuilder query;
    query.add("start", request.start)
        .add("end", request.end)
        .add("limit", request.limit)
        .add("page_token", page_token);
    return symbol_path(request.symbol, "trades") + query.str();
}

std::string build_quotes_path(const QuotesRequest &request,
                              const std::optional<std::string> &page_token) {
    core::QueryBuilder query;
    query.add("start", request.start)
        .add("end", request.end)
        .add("limit", request.limit)
        .add("page_token", page_token);
    return symbol_path(request.symbol, "quotes") + query.str();
}

std::string build_bars_path(const BarsRequest &request,
                            const std::optional<std::string> &page_token) {
    core::QueryBuilder query;
    query.add("timeframe", to_string(request.timeframe))
        .add("start", request.start)
        .add("end", request.end)
        .add("limit", request.limit)
        .add("page_token", page_token);
    return symbol_path(request.symbol, "bars") + query.str();
}

}  // namespace

HistoricalClient::HistoricalClient(core::ClientConfig config,
                                   std::shared_ptr<core::IHttpTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("HistoricalClient requires a valid IHttpTransport");
    }
}

TradesPage HistoricalClient::get_trades_page(const TradesRequest &request,
                                             const std::optional<std::string> &page_token) const {
    auto response = send_request(core::HttpMethod::Get, build_trades_path(request, page_token));
    core::ensure_success(kFamily, response.status_code, response.body);
    auto page = detail::parse_trades_page(response.body);
    if (page.symbol.empty()) {
        page.symbol = request.symbol;
        for (auto &trade : page.trades) {
            trade.symbol = request.symbol;
        }
    }
    return page;
}

QuotesPage HistoricalClient::get_quotes_page(const QuotesRequest &request,
                                             const std::optional<std::string> &page_token) const {
    auto response = send_request(core::HttpMethod::Get, build_quotes_path(request, page_token));
    core::ensure_success(kFamily, response.status_code, response.body);
    auto page = detail::parse_quotes_page(response.body);
    if (page.symbol.empty()) {
        page.symbol = request.symbol;
        for (auto &quote : page.quotes) {
            quote.symbol = request.symbol;
        }
    }
    return page;
}

BarsPage HistoricalClient::get_bars_page(const BarsRequest &request,
                                         const std::optional<std::string> &page_token) const {
    auto response = send_request(core::HttpMethod::Get, build_bars_path(request, page_token));
    core::ensure_success(kFamily, response.status_code, response.body);
    auto page = detail::parse_bars_page(response.body);
    if (page.symbol.empty()) {
        page.symbol = request.symbol;
        for (auto &bar : page.bars) {
            bar.symbol = request.symbol;
        }
    }
    return page;
}

// The fetchers run on the stream's own tasks, so they capture copies of the
// configuration and transport rather than this client.
core::PagedStream<TradesPage> HistoricalClient::trades(TradesRequest request) const {
    return core::PagedStream<TradesPage>(
        [client = *this, request = std::move(request)](const std::optional<std::string> &token) {
            return client.get_trades_page(request, token);
        });
}

core::PagedStream<QuotesPage> HistoricalClient::quotes(QuotesRequest request) const {
    return core::PagedStream<QuotesPage>(
        [client = *this, request = std::move(request)](const std::optional<std::string> &token) {
            return client.get_quotes_page(request, token);
        });
}

core::PagedStream<BarsPage> HistoricalClient::bars(BarsRequest request) const {
    return core::PagedStream<BarsPage>(
        [client = *this, request = std::move(request)](const std::optional<std::string> &token) {
            return client.get_bars_page(request, token);
        });
}

Trade HistoricalClient::latest_trade(const std::string &symbol) const {
    auto response = send_request(core::HttpMethod::Get, symbol_path(symbol, "trades/latest"));
    core::ensure_success(kFamily, response.status_code, response.body);
    auto trade = detail::parse_latest_trade(response.body);
    if (trade.symbol.empty()) {
        trade.symbol = symbol;
    }
    return trade;
}

Quote HistoricalClient::latest_quote(const std::string &symbol) const {
    auto response = send_request(core::HttpMethod::Get, symbol_path(symbol, "quotes/latest"));
    core::ensure_success(kFamily, response.status_code, response.body);
    auto quote = detail::parse_latest_quote(response.body);
    if (quote.symbol.empty()) {
        quote.symbol = symbol;
    }
    return quote;
}

Snapshot HistoricalClient::snapshot(const std::string &symbol) const {
    auto response = send_request(core::HttpMethod::Get, symbol_path(symbol, "snapshot"));
    core::ensure_success(kFamily, response.status_code, response.body);
    auto snapshot = detail::parse_snapshot(response.body);
    if (snapshot.symbol.empty()) {
        snapshot.symbol = symbol;
    }
    return snapshot;
}

core::HttpResponse HistoricalClient::send_request(core::HttpMethod method,
                                                  std::string_view path) const {
    core::HttpRequest request;
    request.method = method;
    request.url = config_.environment().market_data_url + std::string(path);
    request.headers["Accept"] = "application/json";
    if (!config_.api_key().empty()) {
        request.headers["APCA-API-KEY-ID"] = std::string(config_.api_key());
    }
    if (!config_.api_secret().empty()) {
        request.headers["APCA-API-SECRET-KEY"] = std::string(config_.api_secret());
    }
    return transport_->send(request);
}

}  // namespace apca::data
