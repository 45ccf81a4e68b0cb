#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace conduit::core {

// Initialize logging with console output. Level comes from CONDUIT_LOG_LEVEL
// (default "info").
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Parse "trace", "debug", "info", "warn", "error", "critical" or "off".
// Throws std::invalid_argument for anything else.
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace conduit::core
