#pragma once

#include <cstddef>
#include <string>

namespace apca::core {

/**
 * Loads KEY=VALUE pairs from a dotenv file into the process environment.
 * Blank lines and `#` comments are ignored, an `export ` prefix and matching
 * surrounding quotes are stripped. Variables that are already set are left
 * untouched. A missing file is not an error.
 *
 * Returns the number of variables that were set.
 */
std::size_t load_env_file(const std::string& path = ".env");

}  // namespace apca::core
