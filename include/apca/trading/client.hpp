#pragma once

#include "apca/core/config.hpp"
#include "apca/core/http_transport.hpp"
#include "apca/core/paged_stream.hpp"
#include "apca/trading/models.hpp"
#include "apca/trading/requests.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apca::trading {

/**
 * Trading REST client: orders, positions, assets and watchlists. Non-2xx
 * responses raise core::VendorError with the code of the resource family.
 */
class TradingClient {
  public:
    TradingClient(core::ClientConfig config, std::shared_ptr<core::IHttpTransport> transport);

    Order place_order(const PlaceOrderRequest& request) const;
    std::vector<Order> list_orders(const ListOrdersRequest& request) const;
    // Walks every order matching the request, one page of request.limit orders at a time.
    core::PagedStream<OrdersPage> stream_orders(ListOrdersRequest request) const;
    OrdersPage get_orders_page(const ListOrdersRequest& request,
                               const std::optional<std::string>& page_token) const;
    Order get_order(const std::string& order_id) const;
    Order get_order_by_client_id(const std::string& client_order_id) const;
    Order replace_order(const std::string& order_id, const ReplaceOrderRequest& request) const;
    void cancel_order(const std::string& order_id) const;
    std::vector<CancelStatus> cancel_all_orders() const;

    std::vector<Position> list_open_positions() const;
    Position get_open_position(const std::string& symbol) const;
    std::vector<Closure> close_all_positions(bool cancel_orders) const;
    Order close_position(const std::string& symbol, std::optional<double> qty = std::nullopt,
                         std::optional<double> percentage = std::nullopt) const;

    std::vector<Asset> list_assets(std::optional<AssetStatus> status = std::nullopt,
                                   std::optional<std::string> asset_class = std::nullopt) const;
    Asset get_asset(const std::string& symbol) const;

    std::vector<Watchlist> list_watchlists() const;
    Watchlist create_watchlist(const std::string& name,
                               const std::vector<std::string>& symbols) const;
    Watchlist get_watchlist(const std::string& watchlist_id) const;
    Watchlist update_watchlist(const std::string& watchlist_id, const std::string& name,
                               const std::vector<std::string>& symbols) const;
    Watchlist add_asset_to_watchlist(const std::string& watchlist_id,
                                     const std::string& symbol) const;
    void delete_watchlist(const std::string& watchlist_id) const;
    void remove_asset_from_watchlist(const std::string& watchlist_id,
                                     const std::string& symbol) const;

    [[nodiscard]] const core::ClientConfig& config() const noexcept { return config_; }

  private:
    core::HttpResponse send_request(core::HttpMethod method, std::string_view path,
                                    const std::optional<std::string>& body = std::nullopt) const;

    core::ClientConfig config_;
    std::shared_ptr<core::IHttpTransport> transport_;
};

}  // namespace apca::trading
