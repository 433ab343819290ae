#pragma once

/**
 * @file supervisor.hpp
 * @brief Launch-then-supervise state machine
 *
 * @example
 * ```cpp
 * auto api = appwatch::make_system_process_api();
 * auto activation = appwatch::make_system_activation_service();
 * appwatch::NullEventSink sink;
 * appwatch::Launcher launcher(*activation, &sink);
 * appwatch::Supervisor supervisor(*api, sink);
 * auto report = supervisor.supervise("Microsoft.WindowsCalculator_8wekyb3d8bbwe!App", launcher);
 * ```
 */

#include "appwatch/events.hpp"
#include "appwatch/export.hpp"
#include "appwatch/launcher.hpp"
#include "appwatch/platform.hpp"
#include "appwatch/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace appwatch {

enum class SessionOutcome {
    Stopped,                    // supervised until no successor was left
    PartialCapability,          // launched by fallback, nothing to supervise
    LaunchFailed,               // both launch mechanisms failed
    InitialProcessUnavailable   // launched pid vanished before it was resolved
};

inline const char* session_outcome_to_string(SessionOutcome o) {
    switch (o) {
        case SessionOutcome::Stopped: return "stopped";
        case SessionOutcome::PartialCapability: return "partial_capability";
        case SessionOutcome::LaunchFailed: return "launch_failed";
        case SessionOutcome::InitialProcessUnavailable: return "initial_process_unavailable";
        default: return "unknown";
    }
}

struct SessionReport {
    SessionOutcome outcome = SessionOutcome::LaunchFailed;
    LaunchOutcome launch = LaunchOutcome::failed({});
    std::string target_directory;
    std::vector<SupervisionState> history;
};

/**
 * @brief Watches one process at a time and hops to successors
 *
 * The target directory is taken once from the first monitored process and
 * scopes every successor search of the session. Single threaded; the wait in
 * step() blocks with no timeout.
 */
class APPWATCH_API Supervisor {
public:
    Supervisor(ProcessApi& api, EventSink& sink) : api_(api), sink_(sink) {}

    /**
     * @brief Launch `app_id` and supervise it until no successor is found
     * @return Session report; supervision runs only for a launch with a pid
     */
    SessionReport supervise(const std::string& app_id, Launcher& launcher);

    /**
     * @brief Enter Monitoring(initial) and fix the target directory
     * @return false if `initial` cannot be resolved; state stays Stopped
     */
    bool begin(ProcessId initial);

    /// Perform exactly one transition from the current state.
    const SupervisionState& step();

    /// Step until Stopped.
    void run();

    const SupervisionState& state() const { return state_; }
    const std::string& target_directory() const { return target_directory_; }
    const std::vector<SupervisionState>& history() const { return history_; }

private:
    void monitor_once(ProcessId pid);
    void search_successor();
    void enter(SupervisionState next);
    void emit(SupervisionEvent event);

    ProcessApi& api_;
    EventSink& sink_;
    SupervisionState state_;
    std::string target_directory_;
    std::vector<SupervisionState> history_;
};

} // namespace appwatch
