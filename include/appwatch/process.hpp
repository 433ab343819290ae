#pragma once

#include "appwatch/export.hpp"
#include "appwatch/platform.hpp"
#include "appwatch/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace appwatch {

// ============================================================================
// Path Helpers
// ============================================================================

// Final segment of `path` after the last '\' or '/'; the whole path if none.
APPWATCH_API std::string get_filename(const std::string& path);

// Everything before the last '\' or '/'; the whole path if none.
APPWATCH_API std::string get_parent_directory(const std::string& path);

// ASCII case-insensitive prefix test, as Windows compares paths.
APPWATCH_API bool starts_with_ignore_case(const std::string& value, const std::string& prefix);

// ============================================================================
// Process Metadata Resolver
// ============================================================================

/**
 * @brief Resolve a pid to its executable path and name
 *
 * Returns nullopt when the process cannot be opened (exited or access
 * denied). When the process opens but its path cannot be read, the path is
 * UNKNOWN_PROCESS_PATH. Never throws.
 */
APPWATCH_API std::optional<ProcessInfo> resolve_process(ProcessApi& api, ProcessId pid);

// ============================================================================
// Directory-Scoped Process Locator
// ============================================================================

// Size of the process table snapshot. Processes beyond it are not considered.
constexpr std::size_t PROCESS_ENUMERATION_CAPACITY = 1024;

/**
 * @brief Find the first live process whose path lies under a directory
 *
 * Enumerates at most PROCESS_ENUMERATION_CAPACITY pids, skips pid 0 and pids
 * that no longer resolve, and returns the first whose resolved path starts
 * with `target_directory` (case-insensitive). Enumeration order is defined by
 * the OS, so with several candidates the pick is not stable.
 */
APPWATCH_API std::optional<ProcessId> find_in_directory(ProcessApi& api,
                                                        const std::string& target_directory);

} // namespace appwatch
