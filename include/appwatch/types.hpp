#pragma once

#include "appwatch/export.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace appwatch {

// ============================================================================
// Process Identity
// ============================================================================

// OS-assigned process identifier. Observed, never owned; reused after exit.
using ProcessId = std::uint32_t;

// Placeholder for the idle/kernel process, never a supervision candidate.
constexpr ProcessId IDLE_PROCESS_ID = 0;

// Path reported when a process could be opened but its image path could not
// be queried.
constexpr const char* UNKNOWN_PROCESS_PATH = "<Unknown>";

/**
 * @brief Snapshot of a process's executable location
 *
 * `name` is always the final segment of `path`.
 */
struct ProcessInfo {
    std::string name;
    std::string path;
};

// ============================================================================
// Supervision State
// ============================================================================

enum class SupervisionPhase {
    Monitoring,
    SearchingSuccessor,
    Stopped
};

inline const char* phase_to_string(SupervisionPhase p) {
    switch (p) {
        case SupervisionPhase::Monitoring: return "monitoring";
        case SupervisionPhase::SearchingSuccessor: return "searching_successor";
        case SupervisionPhase::Stopped: return "stopped";
        default: return "unknown";
    }
}

/**
 * @brief Current state of a supervision session
 *
 * `pid` is meaningful only while `phase` is Monitoring.
 */
struct SupervisionState {
    SupervisionPhase phase = SupervisionPhase::Stopped;
    ProcessId pid = IDLE_PROCESS_ID;

    static SupervisionState monitoring(ProcessId pid) {
        return {SupervisionPhase::Monitoring, pid};
    }
    static SupervisionState searching() {
        return {SupervisionPhase::SearchingSuccessor, IDLE_PROCESS_ID};
    }
    static SupervisionState stopped() {
        return {SupervisionPhase::Stopped, IDLE_PROCESS_ID};
    }

    bool operator==(const SupervisionState& other) const {
        if (phase != other.phase) return false;
        return phase != SupervisionPhase::Monitoring || pid == other.pid;
    }
    bool operator!=(const SupervisionState& other) const { return !(*this == other); }
};

APPWATCH_API std::string to_string(const SupervisionState& state);

// ============================================================================
// Launch Outcome
// ============================================================================

enum class LaunchKind {
    FullySupervisable,       // primary activation returned a pid
    LaunchedUnsupervisable,  // shell fallback started the app, no pid known
    Failed                   // both mechanisms failed
};

inline const char* launch_kind_to_string(LaunchKind k) {
    switch (k) {
        case LaunchKind::FullySupervisable: return "fully_supervisable";
        case LaunchKind::LaunchedUnsupervisable: return "launched_unsupervisable";
        case LaunchKind::Failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Result of a launch attempt
 *
 * Only the FullySupervisable variant carries a pid; only Failed carries
 * reasons (one per mechanism tried, primary first).
 */
class LaunchOutcome {
public:
    static LaunchOutcome supervisable(ProcessId pid) {
        return LaunchOutcome(LaunchKind::FullySupervisable, pid, {});
    }
    static LaunchOutcome unsupervisable() {
        return LaunchOutcome(LaunchKind::LaunchedUnsupervisable, IDLE_PROCESS_ID, {});
    }
    static LaunchOutcome failed(std::vector<std::string> reasons) {
        return LaunchOutcome(LaunchKind::Failed, IDLE_PROCESS_ID, std::move(reasons));
    }

    LaunchKind kind() const { return kind_; }
    bool has_pid() const { return kind_ == LaunchKind::FullySupervisable; }
    ProcessId pid() const { return pid_; }
    const std::vector<std::string>& reasons() const { return reasons_; }

private:
    LaunchOutcome(LaunchKind kind, ProcessId pid, std::vector<std::string> reasons)
        : kind_(kind), pid_(pid), reasons_(std::move(reasons)) {}

    LaunchKind kind_;
    ProcessId pid_;
    std::vector<std::string> reasons_;
};

} // namespace appwatch
