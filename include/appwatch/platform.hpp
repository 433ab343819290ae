#pragma once

#include "appwatch/export.hpp"
#include "appwatch/result.hpp"
#include "appwatch/types.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace appwatch {

// ============================================================================
// Platform Detection
// ============================================================================

enum class Platform {
    Linux,
    macOS,
    Windows,
    Unknown
};

APPWATCH_API Platform get_current_platform();

// ============================================================================
// Process Access
// ============================================================================

enum class QueryStatus {
    Ok,               // opened and path read
    OpenFailed,       // process gone or not openable
    AccessDenied,     // process exists but query access was refused
    PathUnavailable   // opened, but the image path could not be read
};

struct ImageQuery {
    QueryStatus status = QueryStatus::OpenFailed;
    std::string path;  // set only when status is Ok
};

enum class WaitStatus {
    OpenFailed,   // could not acquire a termination handle
    Terminated,   // the process has exited
    Failed,       // the wait itself failed; os_error is set
    Unexpected    // the wait returned without a termination signal
};

struct WaitOutcome {
    WaitStatus status = WaitStatus::Failed;
    std::uint32_t os_error = 0;
    std::uint32_t raw_status = 0;  // platform wait return value
};

/**
 * @brief Query-only view of the host process table
 *
 * Every handle an implementation acquires is released before the call
 * returns. Implementations never throw.
 */
class APPWATCH_API ProcessApi {
public:
    virtual ~ProcessApi() = default;

    /**
     * @brief Fill `buffer` with live process ids
     * @param buffer Destination with room for `capacity` ids
     * @param capacity Maximum number of ids written
     * @return Number of ids written (never more than capacity), or nullopt if
     *         the process table could not be read. Ids past capacity are
     *         dropped without notice.
     */
    virtual std::optional<std::size_t> enumerate_processes(ProcessId* buffer,
                                                           std::size_t capacity) = 0;

    /// Open `pid` with query-only rights and read its executable path.
    virtual ImageQuery query_image_path(ProcessId pid) = 0;

    /// Open `pid` for termination notification and block until it exits.
    virtual WaitOutcome wait_for_exit(ProcessId pid) = 0;
};

// ============================================================================
// Application Activation
// ============================================================================

/**
 * @brief The two launch mechanisms of the host platform
 *
 * Windows: IApplicationActivationManager, then PowerShell shell:appsFolder.
 * Linux: desktop entry Exec spawn, then gtk-launch.
 */
class APPWATCH_API ActivationService {
public:
    virtual ~ActivationService() = default;

    /// Activate `app_id` with no arguments and no options; yields its pid.
    virtual Result<ProcessId> activate(const std::string& app_id) = 0;

    /// Ask the host shell to open `app_id`. No pid is available afterwards.
    virtual Result<void> open_via_shell(const std::string& app_id) = 0;
};

APPWATCH_API std::unique_ptr<ProcessApi> make_system_process_api();
APPWATCH_API std::unique_ptr<ActivationService> make_system_activation_service();

// ============================================================================
// Host Shell
// ============================================================================

struct ShellResult {
    bool ok = false;        // command ran and exited with status 0
    int exit_code = -1;
    std::string output;     // combined stdout/stderr
    std::string error;      // set when the command could not be started
};

// Run `command` through the host shell, capturing its output.
APPWATCH_API ShellResult run_shell_command(const std::string& command);

// Quote a single argument for the host shell (POSIX sh or PowerShell).
APPWATCH_API std::string quote_shell_argument(const std::string& arg);

// ============================================================================
// Environment
// ============================================================================

APPWATCH_API std::optional<std::string> get_env(const std::string& name);

} // namespace appwatch
