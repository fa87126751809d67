#include "apca/core/dotenv.hpp"

#include "apca/core/logging.hpp"

#include <cstdlib>
#include <fstream>
#include <string_view>

namespace apca::core {

namespace {

std::string_view trim(std::string_view text) {
    constexpr std::string_view kWhitespace = " \t\r\n";
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

std::string_view unquote(std::string_view value) {
    if (value.size() >= 2) {
        const char front = value.front();
        if ((front == '"' || front == '\'') && value.back() == front) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

}  // namespace

std::size_t load_env_file(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        logger()->debug("no dotenv file at {}", path);
        return 0;
    }

    std::size_t loaded = 0;
    std::string line;
    while (std::getline(input, line)) {
        auto entry = trim(line);
        if (entry.empty() || entry.front() == '#') {
            continue;
        }
        constexpr std::string_view kExport = "export ";
        if (entry.substr(0, kExport.size()) == kExport) {
            entry = trim(entry.substr(kExport.size()));
        }
        const auto eq = entry.find('=');
        if (eq == std::string_view::npos) {
            logger()->warn("ignoring malformed dotenv line in {}", path);
            continue;
        }
        const std::string key(trim(entry.substr(0, eq)));
        const std::string value(unquote(trim(entry.substr(eq + 1))));
        if (key.empty() || std::getenv(key.c_str()) != nullptr) {
            continue;
        }
        if (::setenv(key.c_str(), value.c_str(), 0) == 0) {
            ++loaded;
        }
    }
    return loaded;
}

}  // namespace apca::core
