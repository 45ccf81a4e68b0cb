#include "core/logger.hpp"
#include "core/config.hpp"
#include <stdexcept>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace conduit::core {

void init_logger() {
    auto logger = spdlog::get("conduit");
    if (!logger) {
        logger = spdlog::stdout_color_mt("conduit");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    auto level_name = config::get_env_or("CONDUIT_LOG_LEVEL", "info");
    try {
        set_log_level(parse_log_level(level_name));
    } catch (const std::invalid_argument& e) {
        set_log_level(spdlog::level::info);
        spdlog::warn("Ignoring CONDUIT_LOG_LEVEL: {}", e.what());
    }
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    throw std::invalid_argument("unknown log level '" + name + "'");
}

} // namespace conduit::core
