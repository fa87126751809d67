#include "apca/core/errors.hpp"
#include "apca/core/mock_http_transport.hpp"
#include "apca/trading/client.hpp"
#include "apca/trading/order_serialization.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace apca;

namespace {

std::string order_json(const std::string& id, const std::string& submitted_at) {
    return R"({"id":")" + id + R"(","client_order_id":"c-)" + id +
           R"(","created_at":"2024-05-01T14:00:00Z","updated_at":"2024-05-01T14:00:01Z","submitted_at":")" +
           submitted_at +
           R"(","filled_at":null,"asset_id":"aid","symbol":"AAPL","asset_class":"us_equity","notional":null,"qty":"10","filled_qty":"0","filled_avg_price":null,"order_class":"","type":"limit","side":"buy","time_in_force":"gtc","limit_price":"150.5","stop_price":null,"status":"new","extended_hours":false,"legs":null,"trail_percent":null,"trail_price":null,"hwm":null})";
}

void serialization() {
    trading::PlaceOrderRequest request;
    request.symbol = "AAPL";
    request.qty = 10;
    request.side = trading::OrderSide::Buy;
    request.type = trading::OrderType::Limit;
    request.time_in_force = trading::TimeInForce::Gtc;
    request.limit_price = 150.5;
    request.client_order_id = "my-order";
    assert(trading::serialize_order_request(request) ==
           R"({"symbol":"AAPL","qty":10,"side":"buy","type":"limit","time_in_force":"gtc","client_order_id":"my-order","limit_price":150.5})");

    trading::PlaceOrderRequest bracket;
    bracket.symbol = "MSFT";
    bracket.notional = 500;
    bracket.order_class = trading::OrderClass::Bracket;
    bracket.take_profit = trading::TakeProfitRequest{.limit_price = 420};
    bracket.stop_loss = trading::StopLossRequest{.stop_price = 380, .limit_price = 379.5};
    const auto bracket_json = trading::serialize_order_request(bracket);
    assert(bracket_json.find(R"("order_class":"bracket")") != std::string::npos);
    assert(bracket_json.find(R"("take_profit":{"limit_price":420})") != std::string::npos);
    assert(bracket_json.find(R"("stop_loss":{"stop_price":380,"limit_price":379.5})") !=
           std::string::npos);

    auto expect_invalid = [](trading::PlaceOrderRequest invalid) {
        bool threw = false;
        try {
            (void)trading::serialize_order_request(invalid);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    };
    auto both = request;
    both.notional = 100;
    expect_invalid(both);
    auto no_limit = request;
    no_limit.limit_price.reset();
    expect_invalid(no_limit);
    auto no_symbol = request;
    no_symbol.symbol.clear();
    expect_invalid(no_symbol);
    auto half_bracket = bracket;
    half_bracket.stop_loss.reset();
    expect_invalid(half_bracket);

    trading::ReplaceOrderRequest replace;
    replace.qty = 5;
    replace.limit_price = 151;
    assert(trading::serialize_replace_order_request(replace) ==
           R"({"qty":5,"limit_price":151})");
}

std::vector<std::string> ids_of(const std::vector<trading::Order>& orders) {
    std::vector<std::string> ids;
    for (const auto& order : orders) {
        ids.push_back(order.id);
    }
    return ids;
}

// o2 and o3 share the submission time that ends the first page.
void orders_sharing_a_page_boundary(const trading::TradingClient& client,
                                    core::MockHttpTransport& transport) {
    const std::string t1 = "2024-05-01T14:00:00.500000Z";
    const std::string t2 = "2024-05-01T13:00:00.123456Z";
    const std::string t4 = "2024-05-01T12:00:00.999999Z";
    transport.enqueue_response(
        {200, {}, "[" + order_json("o1", t1) + "," + order_json("o2", t2) + "]"});
    transport.enqueue_response({200, {}, "[" + order_json("o2", t2) + "," + order_json("o3", t2) +
                                             "," + order_json("o4", t4) + "]"});
    transport.enqueue_response({200, {}, "[" + order_json("o4", t4) + "]"});

    trading::ListOrdersRequest request;
    request.limit = 2;
    auto stream = client.stream_orders(request);
    const auto ids = ids_of(stream.collect());
    assert((ids == std::vector<std::string>{"o1", "o2", "o3", "o4"}));

    const auto requests = transport.requests();
    const auto second = requests[requests.size() - 2].url;
    const auto third = requests[requests.size() - 1].url;
    assert(second.find("limit=3") != std::string::npos);
    assert(second.find("until=2024-05-01T13%3A00%3A00.123457Z") != std::string::npos);
    // The last fractional digit carries into the seconds.
    assert(third.find("until=2024-05-01T12%3A00%3A01.000000Z") != std::string::npos);
}

// A page made only of orders at the boundary time keeps every id it has seen.
void page_full_of_one_timestamp(const trading::TradingClient& client,
                                core::MockHttpTransport& transport) {
    const std::string t = "2024-05-01T10:00:00Z";
    const std::string earlier = "2024-05-01T09:00:00Z";
    transport.enqueue_response({200, {}, "[" + order_json("a", t) + "]"});
    transport.enqueue_response(
        {200, {}, "[" + order_json("a", t) + "," + order_json("b", t) + "]"});
    transport.enqueue_response({200, {}, "[" + order_json("a", t) + "," + order_json("b", t) +
                                             "," + order_json("c", earlier) + "]"});
    transport.enqueue_response({200, {}, "[" + order_json("c", earlier) + "]"});

    trading::ListOrdersRequest request;
    request.limit = 1;
    auto page = client.get_orders_page(request, std::nullopt);
    assert(page.next_page_token == t + "|a");
    page = client.get_orders_page(request, page.next_page_token);
    assert(ids_of(page.orders) == std::vector<std::string>{"b"});
    assert(page.next_page_token == t + "|a,b");
    page = client.get_orders_page(request, page.next_page_token);
    assert(ids_of(page.orders) == std::vector<std::string>{"c"});
    assert(page.next_page_token == earlier + "|c");
    assert(transport.requests().back().url.find("limit=3") != std::string::npos);
    page = client.get_orders_page(request, page.next_page_token);
    assert(page.orders.empty());
    assert(!page.next_page_token.has_value());
    assert(transport.requests().back().url.find("until=2024-05-01T09%3A00%3A01Z") !=
           std::string::npos);
}

}  // namespace

int main() {
    serialization();

    auto config = core::ClientConfig::WithPaperKeys("key", "secret");
    auto transport = std::make_shared<core::MockHttpTransport>();
    trading::TradingClient client(config, transport);

    transport->enqueue_response({200, {}, order_json("o1", "2024-05-01T14:00:00Z")});
    trading::PlaceOrderRequest request;
    request.symbol = "AAPL";
    request.qty = 10;
    request.type = trading::OrderType::Limit;
    request.time_in_force = trading::TimeInForce::Gtc;
    request.limit_price = 150.5;
    const auto placed = client.place_order(request);
    assert(placed.id == "o1");
    assert(placed.qty == 10.0);
    assert(placed.limit_price == 150.5);
    assert(placed.order_class == trading::OrderClass::Simple);
    assert(placed.time_in_force == trading::TimeInForce::Gtc);
    assert(placed.status == trading::OrderStatus::New);
    {
        const auto sent = transport->requests().back();
        assert(sent.method == core::HttpMethod::Post);
        assert(sent.url == "https://paper-api.alpaca.markets/v2/orders");
        assert(sent.headers.at("Content-Type") == "application/json");
        assert(sent.body.find(R"("symbol":"AAPL")") != std::string::npos);
    }

    transport->enqueue_response(
        {200, {}, "[" + order_json("o1", "2024-05-01T14:00:00Z") + "," +
                      order_json("o2", "2024-05-01T13:00:00Z") + "]"});
    trading::ListOrdersRequest list_request;
    list_request.status = trading::OrderQueryStatus::All;
    list_request.limit = 2;
    list_request.nested = true;
    list_request.symbols = {"AAPL", "MSFT"};
    const auto orders = client.list_orders(list_request);
    assert(orders.size() == 2);
    {
        const auto url = transport->requests().back().url;
        assert(url.find("/v2/orders?status=all&limit=2") != std::string::npos);
        assert(url.find("nested=true") != std::string::npos);
        assert(url.find("symbols=AAPL%2CMSFT") != std::string::npos);
    }

    // Streaming orders: the next request bounds just past the last submission time.
    transport->enqueue_response(
        {200, {}, "[" + order_json("o1", "2024-05-01T14:00:00Z") + "," +
                      order_json("o2", "2024-05-01T13:00:00Z") + "]"});
    transport->enqueue_response(
        {200, {}, "[" + order_json("o2", "2024-05-01T13:00:00Z") + "," +
                      order_json("o3", "2024-05-01T12:00:00Z") + "]"});
    trading::ListOrdersRequest stream_request;
    stream_request.status = trading::OrderQueryStatus::Closed;
    stream_request.limit = 2;
    auto stream = client.stream_orders(stream_request);
    const auto streamed = stream.collect();
    assert(streamed.size() == 3);
    assert(streamed[1].id == "o2");
    assert(streamed[2].id == "o3");
    {
        const auto requests = transport->requests();
        const auto second = requests[requests.size() - 1].url;
        const auto first = requests[requests.size() - 2].url;
        assert(first.find("until=") == std::string::npos);
        assert(second.find("limit=3") != std::string::npos);
        assert(second.find("until=2024-05-01T13%3A00%3A01Z") != std::string::npos);
    }

    // Ascending order walks forward with `after`.
    transport->enqueue_response({200, {}, "[" + order_json("o9", "2024-05-02T09:00:00Z") + "]"});
    transport->enqueue_response({200, {}, "[" + order_json("o9", "2024-05-02T09:00:00Z") + "]"});
    trading::ListOrdersRequest ascending;
    ascending.limit = 1;
    ascending.direction = trading::SortDirection::Asc;
    auto forward = client.stream_orders(ascending);
    assert(forward.collect().size() == 1);
    assert(transport->requests().back().url.find("after=2024-05-02T08%3A59%3A59Z") !=
           std::string::npos);
    assert(transport->requests().back().url.find("direction=asc") != std::string::npos);

    orders_sharing_a_page_boundary(client, *transport);
    page_full_of_one_timestamp(client, *transport);

    transport->enqueue_response({200, {}, order_json("o1", "2024-05-01T14:00:00Z")});
    (void)client.get_order("o1");
    assert(transport->requests().back().url == "https://paper-api.alpaca.markets/v2/orders/o1");

    transport->enqueue_response({200, {}, order_json("o1", "2024-05-01T14:00:00Z")});
    const auto by_client = client.get_order_by_client_id("c-o1");
    assert(by_client.client_order_id == "c-o1");
    assert(transport->requests().back().url.find("/v2/orders:by_client_order_id?client_order_id=c-o1") !=
           std::string::npos);

    transport->enqueue_response({200, {}, order_json("o4", "2024-05-01T14:05:00Z")});
    trading::ReplaceOrderRequest replace;
    replace.limit_price = 151;
    const auto replaced = client.replace_order("o1", replace);
    assert(replaced.id == "o4");
    assert(transport->requests().back().method == core::HttpMethod::Patch);

    transport->enqueue_response({204, {}, ""});
    client.cancel_order("o4");
    assert(transport->requests().back().method == core::HttpMethod::Delete);

    transport->enqueue_response(
        {207, {}, R"([{"id":"o5","status":200,"body":{}},{"id":"o6","status":500,"body":{}}])"});
    const auto cancelled = client.cancel_all_orders();
    assert(cancelled.size() == 2);
    assert(cancelled[1].id == "o6");
    assert(cancelled[1].status == 500);

    // Orders family mapping.
    transport->enqueue_response({403, {}, R"({"code":40310000,"message":"insufficient buying power"})"});
    bool insufficient = false;
    try {
        (void)client.place_order(request);
    } catch (const core::VendorError& error) {
        insufficient = error.code() == core::VendorErrorCode::InsufficientFunds &&
                       error.status() == 403;
    }
    assert(insufficient);

    transport->enqueue_response({404, {}, R"({"message":"order not found"})"});
    bool missing = false;
    try {
        (void)client.get_order("nope");
    } catch (const core::VendorError& error) {
        missing = error.code() == core::VendorErrorCode::NotFound;
    }
    assert(missing);

    bool invalid_limit = false;
    try {
        trading::ListOrdersRequest too_many;
        too_many.limit = 501;
        (void)client.list_orders(too_many);
    } catch (const std::invalid_argument&) {
        invalid_limit = true;
    }
    assert(invalid_limit);

    std::cout << "Trading order tests passed\n";
    return 0;
}
