#include "apca/core/errors.hpp"
#include "apca/core/json.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <string>

using namespace apca::core;

namespace {

double number_field(const std::string& payload) {
    json::ParsedDocument document(payload, "test");
    auto root = document.root_object();
    return json::get_number(root, "qty");
}

}  // namespace

int main() {
    // A number and its string rendition decode to the same double.
    assert(number_field(R"({"qty":30})") == 30.0);
    assert(number_field(R"({"qty":"30"})") == 30.0);
    assert(number_field(R"({"qty":"179.08"})") == number_field(R"({"qty":179.08})"));
    assert(number_field(R"({"qty":"-5.5"})") == -5.5);

    {
        json::ParsedDocument document(
            R"({"limit_price":null,"stop_price":"12.5","legs":null,"symbols":["A","B"]})",
            "test");
        auto root = document.root_object();
        assert(!json::get_optional_number(root, "limit_price").has_value());
        assert(json::get_optional_number(root, "stop_price") == 12.5);
        assert(!json::get_optional_number(root, "trail_price").has_value());
        assert(json::get_string_array(root, "legs").empty());
        auto listed = json::get_optional_string_array(root, "legs");
        assert(listed.has_value() && listed->empty());
        assert(!json::get_optional_string_array(root, "missing").has_value());
        assert(json::get_string_array(root, "symbols").size() == 2);
    }

    bool threw = false;
    try {
        (void)number_field(R"({"qty":"thirty"})");
    } catch (const SerializationError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        (void)number_field(R"({"qty":null})");
    } catch (const SerializationError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        (void)number_field(R"({"qty":true})");
    } catch (const SerializationError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        json::ParsedDocument document(R"("not an object")", "test");
        (void)document.root_object();
    } catch (const SerializationError&) {
        threw = true;
    }
    assert(threw);

    {
        json::ParsedDocument document(R"({"tradable":true,"shortable":null})", "test");
        auto root = document.root_object();
        assert(json::get_bool_or_default(root, "tradable"));
        assert(json::get_bool_or_default(root, "shortable", true));
        assert(!json::get_bool_or_default(root, "marginable"));
    }

    threw = false;
    try {
        json::ParsedDocument document(R"({"tradable":"yes"})", "test");
        auto root = document.root_object();
        (void)json::get_bool_or_default(root, "tradable");
    } catch (const SerializationError& error) {
        threw = std::string(error.what()).find("tradable") != std::string::npos;
    }
    assert(threw);

    std::ostringstream oss;
    json::write_string_array(oss, {"AAPL", "MS\"FT"});
    assert(oss.str() == R"(["AAPL","MS\"FT"])");

    std::cout << "JSON number normalization tests passed\n";
    return 0;
}
