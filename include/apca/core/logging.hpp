#pragma once

#include <spdlog/logger.h>

#include <memory>

namespace apca::core {

// Shared "apca" logger. Created on first use with a stderr sink at level warn.
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

}  // namespace apca::core
