#pragma once

#include "appwatch/export.hpp"

#include <spdlog/common.h>

#include <optional>
#include <string>

namespace appwatch {

// Environment variable consulted for the log level.
constexpr const char* LOG_LEVEL_ENV = "APPWATCH_LOG_LEVEL";

// Parse a level name (trace, debug, info, warn, error, critical, off).
// Case-insensitive; "warning" and "err" are accepted aliases.
APPWATCH_API std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

struct LogSettings {
    std::string flag_level;        // --log-level
    bool verbose = false;          // -v
    bool quiet = false;            // -q
};

/**
 * @brief Effective log level
 *
 * Priority: --log-level > APPWATCH_LOG_LEVEL > -v (debug) / -q (error) > info.
 * Unparseable names are skipped.
 */
APPWATCH_API spdlog::level::level_enum resolve_log_level(const LogSettings& settings,
                                                         const std::optional<std::string>& env_level);

} // namespace appwatch
