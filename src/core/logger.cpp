#include "core/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace warden::core {

void init_logger() {
    auto console = spdlog::get("warden");
    if (!console) {
        console = spdlog::stderr_color_mt("warden");
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum log_level_from_string(const std::string& name) {
    // from_str maps unknown names to off
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace warden::core
