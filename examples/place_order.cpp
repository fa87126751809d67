#include "apca/core/config.hpp"
#include "apca/core/mock_http_transport.hpp"
#include "apca/trading/client.hpp"
#include "apca/trading/requests.hpp"

#include <iostream>

int main() {
    auto config = apca::core::ClientConfig::WithPaperKeys("YOUR_KEY", "YOUR_SECRET");

    auto transport = std::make_shared<apca::core::MockHttpTransport>();
    transport->enqueue_response(
        {200,
         {},
         R"({"id":"order-1","client_order_id":"example","created_at":"2024-05-01T14:00:00Z","symbol":"AAPL","qty":"1","filled_qty":"0","type":"limit","side":"buy","time_in_force":"day","limit_price":"150","status":"accepted"})"});

    apca::trading::TradingClient client(config, transport);

    apca::trading::PlaceOrderRequest request;
    request.symbol = "AAPL";
    request.qty = 1;
    request.side = apca::trading::OrderSide::Buy;
    request.type = apca::trading::OrderType::Limit;
    request.limit_price = 150;
    request.time_in_force = apca::trading::TimeInForce::Day;
    request.client_order_id = std::string("example");

    const auto order = client.place_order(request);
    std::cout << "Order " << order.id << " is " << apca::trading::to_string(order.status)
              << "\nRequest body: " << transport->requests().back().body << '\n';
}
