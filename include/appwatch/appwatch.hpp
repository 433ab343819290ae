#pragma once

/**
 * @file appwatch.hpp
 * @brief Entry points over the host's own process table and launcher
 *
 * Include this header to launch and supervise an application with the
 * system backends. The seam-injected classes live in supervisor.hpp.
 */

#include "appwatch/events.hpp"
#include "appwatch/export.hpp"
#include "appwatch/launcher.hpp"
#include "appwatch/platform.hpp"
#include "appwatch/process.hpp"
#include "appwatch/supervisor.hpp"
#include "appwatch/types.hpp"

#include <optional>
#include <string>

namespace appwatch {

constexpr const char* APPWATCH_VERSION = "0.3.0";

/// Launch `app_id` and supervise it with the system backends.
APPWATCH_API SessionReport supervise(const std::string& app_id, EventSink& sink);

/// Run the locator once against the live process table.
APPWATCH_API std::optional<ProcessId> find_successor(const std::string& directory);

} // namespace appwatch
