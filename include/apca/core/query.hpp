#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace apca::core {

/**
 * Accumulates `key=value` query parameters. Values are percent-encoded, empty
 * and absent values are skipped.
 */
class QueryBuilder {
  public:
    QueryBuilder& add(std::string_view key, std::string_view value);
    QueryBuilder& add(std::string_view key, const std::string& value);
    QueryBuilder& add(std::string_view key, const std::optional<std::string>& value);
    QueryBuilder& add(std::string_view key, std::optional<int> value);
    QueryBuilder& add(std::string_view key, std::optional<double> value);
    QueryBuilder& add_flag(std::string_view key, bool value);
    // Joins the values with commas, as the vendor expects for symbol lists.
    QueryBuilder& add(std::string_view key, const std::vector<std::string>& values);

    // "?a=1&b=2", or an empty string when nothing was added.
    [[nodiscard]] std::string str() const;

  private:
    std::string query_;
};

// Percent-encodes a single path segment.
std::string encode_path_segment(std::string_view segment);

}  // namespace apca::core
