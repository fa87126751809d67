#include "apca/core/query.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace apca::core;

int main() {
    QueryBuilder empty;
    empty.add("start", std::string()).add("limit", std::optional<int>{});
    assert(empty.str().empty());

    QueryBuilder query;
    query.add("start", std::string("2024-01-03T09:30:00Z"))
        .add("limit", std::optional<int>(100))
        .add("page_token", std::optional<std::string>("abc=="))
        .add("qty", std::optional<double>(2.5))
        .add_flag("nested", true)
        .add("symbols", std::vector<std::string>{"AAPL", "", "MSFT"});
    assert(query.str() ==
           "?start=2024-01-03T09%3A30%3A00Z&limit=100&page_token=abc%3D%3D&qty=2.5"
           "&nested=true&symbols=AAPL%2CMSFT");

    QueryBuilder flag;
    flag.add_flag("cancel_orders", false);
    assert(flag.str() == "?cancel_orders=false");

    assert(encode_path_segment("BRK.B") == "BRK.B");
    assert(encode_path_segment("BTC/USD") == "BTC%2FUSD");
    assert(encode_path_segment("a b") == "a%20b");

    std::cout << "Query builder tests passed\n";
    return 0;
}
