#include "apca/core/json.hpp"

#include "apca/core/errors.hpp"

#include <charconv>
#include <iomanip>

namespace apca::core::json {

namespace {

[[noreturn]] void fail(std::string_view what, std::string_view key) {
    std::string message(what);
    message.append(" for field '").append(key).append("'");
    throw SerializationError(message);
}

std::optional<simdjson::ondemand::value> find_value(simdjson::ondemand::object& object,
                                                    std::string_view key) {
    simdjson::ondemand::value value;
    auto error = object.find_field_unordered(key).get(value);
    if (error == simdjson::NO_SUCH_FIELD) {
        return std::nullopt;
    }
    if (error) {
        fail(simdjson::error_message(error), key);
    }
    return value;
}

simdjson::ondemand::json_type type_of(simdjson::ondemand::value& value, std::string_view key) {
    simdjson::ondemand::json_type type;
    if (auto error = value.type().get(type)) {
        fail(simdjson::error_message(error), key);
    }
    return type;
}

double parse_decimal(std::string_view text, std::string_view key) {
    double number = 0.0;
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, number);
    if (ec != std::errc{} || ptr != end || text.empty()) {
        fail("expected a number", key);
    }
    return number;
}

std::vector<std::string> read_string_array(simdjson::ondemand::value& value,
                                           std::string_view key) {
    simdjson::ondemand::array array;
    if (value.get_array().get(array)) {
        fail("expected an array", key);
    }
    std::vector<std::string> values;
    for (auto element : array) {
        std::string_view text;
        if (element.get_string().get(text)) {
            fail("expected an array of strings", key);
        }
        values.emplace_back(text);
    }
    return values;
}

}  // namespace

ParsedDocument::ParsedDocument(std::string_view payload, std::string_view context)
    : storage_(payload), context_(context) {
    storage_.append(simdjson::SIMDJSON_PADDING, '\0');
    auto error = parser_.iterate(storage_.data(), payload.size(), storage_.size()).get(document_);
    if (error) {
        throw SerializationError("Failed to parse " + context_ + " payload: " +
                                 simdjson::error_message(error));
    }
}

simdjson::ondemand::json_type ParsedDocument::root_type() {
    simdjson::ondemand::json_type type;
    if (auto error = document_.type().get(type)) {
        throw SerializationError("Invalid " + context_ + " payload: " +
                                 simdjson::error_message(error));
    }
    return type;
}

simdjson::ondemand::object ParsedDocument::root_object() {
    simdjson::ondemand::object object;
    if (document_.get_object().get(object)) {
        throw SerializationError("Invalid " + context_ + " payload: expected an object");
    }
    return object;
}

simdjson::ondemand::array ParsedDocument::root_array() {
    simdjson::ondemand::array array;
    if (document_.get_array().get(array)) {
        throw SerializationError("Invalid " + context_ + " payload: expected an array");
    }
    return array;
}

simdjson::ondemand::object as_object(simdjson::ondemand::value value, std::string_view context) {
    simdjson::ondemand::object object;
    if (value.get_object().get(object)) {
        throw SerializationError("Invalid " + std::string(context) + ": expected an object");
    }
    return object;
}

std::optional<double> to_number(simdjson::ondemand::value value, std::string_view key) {
    switch (type_of(value, key)) {
        case simdjson::ondemand::json_type::null:
            return std::nullopt;
        case simdjson::ondemand::json_type::number: {
            double number = 0.0;
            if (value.get_double().get(number)) {
                fail("invalid number", key);
            }
            return number;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view text;
            if (value.get_string().get(text)) {
                fail("invalid string", key);
            }
            return parse_decimal(text, key);
        }
        default:
            fail("expected a number", key);
    }
}

std::string get_string(simdjson::ondemand::object& object, std::string_view key) {
    auto value = find_value(object, key);
    if (!value) {
        fail("missing string", key);
    }
    std::string_view text;
    if (value->get_string().get(text)) {
        fail("expected a string", key);
    }
    return std::string(text);
}

std::string get_string_or_empty(simdjson::ondemand::object& object, std::string_view key) {
    return get_optional_string(object, key).value_or(std::string{});
}

std::optional<std::string> get_optional_string(simdjson::ondemand::object& object,
                                               std::string_view key) {
    auto value = find_value(object, key);
    if (!value || type_of(*value, key) == simdjson::ondemand::json_type::null) {
        return std::nullopt;
    }
    std::string_view text;
    if (value->get_string().get(text)) {
        fail("expected a string", key);
    }
    return std::string(text);
}

bool get_bool_or_default(simdjson::ondemand::object& object, std::string_view key, bool def) {
    auto value = find_value(object, key);
    if (!value) {
        return def;
    }
    if (type_of(*value, key) == simdjson::ondemand::json_type::null) {
        return def;
    }
    bool flag = def;
    if (value->get_bool().get(flag)) {
        fail("expected a bool", key);
    }
    return flag;
}

std::int64_t get_int64(simdjson::ondemand::object& object, std::string_view key) {
    auto value = find_value(object, key);
    if (!value) {
        fail("missing integer", key);
    }
    std::int64_t number = 0;
    if (value->get_int64().get(number)) {
        fail("expected an integer", key);
    }
    return number;
}

double get_number(simdjson::ondemand::object& object, std::string_view key) {
    auto value = find_value(object, key);
    if (!value) {
        fail("missing number", key);
    }
    auto number = to_number(*value, key);
    if (!number) {
        fail("unexpected null", key);
    }
    return *number;
}

std::optional<double> get_optional_number(simdjson::ondemand::object& object,
                                          std::string_view key) {
    auto value = find_value(object, key);
    if (!value) {
        return std::nullopt;
    }
    return to_number(*value, key);
}

std::vector<std::string> get_string_array(simdjson::ondemand::object& object,
                                          std::string_view key) {
    return get_optional_string_array(object, key).value_or(std::vector<std::string>{});
}

std::optional<std::vector<std::string>>
get_optional_string_array(simdjson::ondemand::object& object, std::string_view key) {
    auto value = find_value(object, key);
    if (!value) {
        return std::nullopt;
    }
    if (type_of(*value, key) == simdjson::ondemand::json_type::null) {
        return std::vector<std::string>{};
    }
    return read_string_array(*value, key);
}

std::optional<simdjson::ondemand::object> find_object(simdjson::ondemand::object& object,
                                                      std::string_view key) {
    auto value = find_value(object, key);
    if (!value || type_of(*value, key) == simdjson::ondemand::json_type::null) {
        return std::nullopt;
    }
    simdjson::ondemand::object nested;
    if (value->get_object().get(nested)) {
        fail("expected an object", key);
    }
    return nested;
}

std::optional<simdjson::ondemand::array> find_array(simdjson::ondemand::object& object,
                                                    std::string_view key) {
    auto value = find_value(object, key);
    if (!value || type_of(*value, key) == simdjson::ondemand::json_type::null) {
        return std::nullopt;
    }
    simdjson::ondemand::array array;
    if (value->get_array().get(array)) {
        fail("expected an array", key);
    }
    return array;
}

void write_string_array(std::ostream& os, const std::vector<std::string>& values) {
    os << '[';
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            os << ',';
        }
        os << std::quoted(values[i]);
    }
    os << ']';
}

}  // namespace apca::core::json
