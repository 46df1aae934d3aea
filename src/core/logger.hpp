#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace warden::core {

// Initialize logging with console output
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Parse a level name ("trace", "debug", "info", "warn", "error", "off").
// Unknown names map to info.
spdlog::level::level_enum log_level_from_string(const std::string& name);

} // namespace warden::core
