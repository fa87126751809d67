#pragma once

#include <simdjson.h>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace apca::core::json {

/**
 * Owns the padded copy of a payload together with the on-demand parser and the
 * document iterating it. Not movable: simdjson documents point into both.
 *
 * Every helper in this header reports shape problems with core::SerializationError.
 */
class ParsedDocument {
  public:
    ParsedDocument(std::string_view payload, std::string_view context);

    ParsedDocument(const ParsedDocument&) = delete;
    ParsedDocument& operator=(const ParsedDocument&) = delete;

    [[nodiscard]] simdjson::ondemand::json_type root_type();
    simdjson::ondemand::object root_object();
    simdjson::ondemand::array root_array();

  private:
    std::string storage_;
    std::string context_;
    simdjson::ondemand::parser parser_;
    simdjson::ondemand::document document_;
};

simdjson::ondemand::object as_object(simdjson::ondemand::value value, std::string_view context);

/**
 * Normalizes a numeric value the vendor sends either as a JSON number or as a
 * JSON string ("30" and 30 decode identically). Returns std::nullopt for null.
 */
std::optional<double> to_number(simdjson::ondemand::value value, std::string_view key);

// Required string field.
std::string get_string(simdjson::ondemand::object& object, std::string_view key);
std::string get_string_or_empty(simdjson::ondemand::object& object, std::string_view key);
// Missing and null both yield std::nullopt.
std::optional<std::string> get_optional_string(simdjson::ondemand::object& object,
                                               std::string_view key);
bool get_bool_or_default(simdjson::ondemand::object& object, std::string_view key,
                         bool def = false);
std::int64_t get_int64(simdjson::ondemand::object& object, std::string_view key);

// Required numeric field, string or number on the wire.
double get_number(simdjson::ondemand::object& object, std::string_view key);
// Optional numeric field, string or number on the wire; missing and null are absent.
std::optional<double> get_optional_number(simdjson::ondemand::object& object,
                                          std::string_view key);

// Missing and null both yield an empty list.
std::vector<std::string> get_string_array(simdjson::ondemand::object& object,
                                          std::string_view key);
// Missing yields std::nullopt, null yields an empty list.
std::optional<std::vector<std::string>>
get_optional_string_array(simdjson::ondemand::object& object, std::string_view key);

// Looks up a nested object; std::nullopt when the field is missing or null.
std::optional<simdjson::ondemand::object> find_object(simdjson::ondemand::object& object,
                                                      std::string_view key);

// Looks up a nested array; std::nullopt when the field is missing or null.
std::optional<simdjson::ondemand::array> find_array(simdjson::ondemand::object& object,
                                                    std::string_view key);

void write_string_array(std::ostream& os, const std::vector<std::string>& values);

}  // namespace apca::core::json
