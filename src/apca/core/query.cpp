#include "apca/core/query.hpp"

#include <boost/url/encode.hpp>
#include <boost/url/rfc/unreserved_chars.hpp>

#include <sstream>

namespace apca::core {

QueryBuilder& QueryBuilder::add(std::string_view key, std::string_view value) {
    if (value.empty()) {
        return *this;
    }
    query_.push_back(query_.empty() ? '?' : '&');
    query_.append(key);
    query_.push_back('=');
    query_.append(boost::urls::encode(value, boost::urls::unreserved_chars));
    return *this;
}

QueryBuilder& QueryBuilder::add(std::string_view key, const std::string& value) {
    return add(key, std::string_view(value));
}

QueryBuilder& QueryBuilder::add(std::string_view key, const std::optional<std::string>& value) {
    if (value) {
        add(key, *value);
    }
    return *this;
}

QueryBuilder& QueryBuilder::add(std::string_view key, std::optional<int> value) {
    if (value) {
        add(key, std::to_string(*value));
    }
    return *this;
}

QueryBuilder& QueryBuilder::add(std::string_view key, std::optional<double> value) {
    if (value) {
        std::ostringstream oss;
        oss << *value;
        add(key, oss.str());
    }
    return *this;
}

QueryBuilder& QueryBuilder::add_flag(std::string_view key, bool value) {
    return add(key, std::string_view(value ? "true" : "false"));
}

QueryBuilder& QueryBuilder::add(std::string_view key, const std::vector<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (value.empty()) {
            continue;
        }
        if (!joined.empty()) {
            joined.push_back(',');
        }
        joined.append(value);
    }
    return add(key, joined);
}

std::string QueryBuilder::str() const {
    return query_;
}

std::string encode_path_segment(std::string_view segment) {
    return boost::urls::encode(segment, boost::urls::unreserved_chars);
}

}  // namespace apca::core
