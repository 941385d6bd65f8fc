// === Logging ================================================================
//
// Process-wide spdlog logger with a colored console sink and a rotating
// JSON-lines file sink. Every component fetches it through `get_logger()`.

#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace transit_presence {

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

}  // namespace transit_presence
