#include "appwatch/config.hpp"

#include <algorithm>
#include <cctype>

namespace appwatch {

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error" || lower == "err") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return std::nullopt;
}

spdlog::level::level_enum resolve_log_level(const LogSettings& settings,
                                            const std::optional<std::string>& env_level) {
    // 1. Explicit flag
    if (!settings.flag_level.empty()) {
        if (auto level = parse_log_level(settings.flag_level)) {
            return *level;
        }
    }

    // 2. Environment variable
    if (env_level && !env_level->empty()) {
        if (auto level = parse_log_level(*env_level)) {
            return *level;
        }
    }

    // 3. Verbosity flags
    if (settings.verbose) return spdlog::level::debug;
    if (settings.quiet) return spdlog::level::err;

    return spdlog::level::info;
}

} // namespace appwatch
