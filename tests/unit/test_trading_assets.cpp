#include "apca/core/errors.hpp"
#include "apca/core/mock_http_transport.hpp"
#include "apca/trading/client.hpp"

#include <cassert>
#include <iostream>

using namespace apca;

int main() {
    auto config = core::ClientConfig::WithPaperKeys("key", "secret");
    auto transport = std::make_shared<core::MockHttpTransport>();

    transport->enqueue_response({200,
                                 {},
                                 R"([
        {"id":"asset1","class":"us_equity","exchange":"NASDAQ","symbol":"AAPL","name":"Apple Inc. Common Stock","status":"active","tradable":true,"marginable":true,"shortable":true,"easy_to_borrow":true,"fractionable":true},
        {"id":"asset2","class":"us_equity","exchange":"NYSE","symbol":"XYZ","name":"","status":"inactive","tradable":false,"marginable":false,"shortable":false,"easy_to_borrow":false,"fractionable":false}
    ])"});
    transport->enqueue_response({200,
                                 {},
                                 R"({"id":"asset1","class":"us_equity","exchange":"NASDAQ","symbol":"AAPL","status":"active","tradable":true,"marginable":true,"shortable":true,"easy_to_borrow":true,"fractionable":true})"});
    transport->enqueue_response({404, {}, R"({"message":"asset not found"})"});

    trading::TradingClient client(config, transport);

    const auto assets = client.list_assets(trading::AssetStatus::Active, std::string("us_equity"));
    assert(assets.size() == 2);
    assert(assets.front().symbol == "AAPL");
    assert(assets.front().asset_class == "us_equity");
    assert(assets.front().tradable);
    assert(assets.back().status == trading::AssetStatus::Inactive);
    assert(!assets.back().tradable);

    const auto asset = client.get_asset("AAPL");
    assert(asset.symbol == "AAPL");
    assert(asset.fractionable);

    bool not_found = false;
    try {
        (void)client.get_asset("NOPE");
    } catch (const core::VendorError& error) {
        not_found = error.family() == core::ResourceFamily::Assets &&
                    error.code() == core::VendorErrorCode::NotFound;
    }
    assert(not_found);

    const auto requests = transport->requests();
    if (requests.size() != 3) {
        std::cerr << "Expected exactly three HTTP calls\n";
        return 1;
    }
    const auto& first_request = requests.front();
    if (first_request.url.find("/v2/assets") == std::string::npos ||
        first_request.url.find("status=active") == std::string::npos ||
        first_request.url.find("asset_class=us_equity") == std::string::npos) {
        std::cerr << "List assets query missing filters\n";
        return 1;
    }
    assert(requests[1].url == "https://paper-api.alpaca.markets/v2/assets/AAPL");

    transport->enqueue_response({200, {}, "[]"});
    assert(client.list_assets().empty());
    assert(transport->requests().back().url == "https://paper-api.alpaca.markets/v2/assets");

    std::cout << "Trading asset tests passed\n";
    return 0;
}
