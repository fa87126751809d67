#pragma once

#include "apca/core/config.hpp"
#include "apca/core/http_transport.hpp"
#include "apca/core/paged_stream.hpp"
#include "apca/data/models.hpp"
#include "apca/data/requests.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace apca::data {

/**
 * Historical market data REST client. The *_page calls fetch a single page;
 * trades(), quotes() and bars() walk every page of a query lazily.
 */
class HistoricalClient {
  public:
    HistoricalClient(core::ClientConfig config, std::shared_ptr<core::IHttpTransport> transport);

    [[nodiscard]] TradesPage get_trades_page(const TradesRequest &request,
                                             const std::optional<std::string> &page_token) const;
    [[nodiscard]] QuotesPage get_quotes_page(const QuotesRequest &request,
                                             const std::optional<std::string> &page_token) const;
    [[nodiscard]] BarsPage get_bars_page(const BarsRequest &request,
                                         const std::optional<std::string> &page_token) const;

    [[nodiscard]] core::PagedStream<TradesPage> trades(TradesRequest request) const;
    [[nodiscard]] core::PagedStream<QuotesPage> quotes(QuotesRequest request) const;
    [[nodiscard]] core::PagedStream<BarsPage> bars(BarsRequest request) const;

    [[nodiscard]] Trade latest_trade(const std::string &symbol) const;
    [[nodiscard]] Quote latest_quote(const std::string &symbol) const;
    [[nodiscard]] Snapshot snapshot(const std::string &symbol) const;

  private:
    core::HttpResponse send_request(core::HttpMethod method, std::string_view path) const;

    core::ClientConfig config_;
    std::shared_ptr<core::IHttpTransport> transport_;
};

}  // namespace apca::data
