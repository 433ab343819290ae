#pragma once

#include "appwatch/export.hpp"
#include "appwatch/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace appwatch {

// ============================================================================
// Supervision Events
// ============================================================================

enum class EventKind {
    launch_started,          // app_id in reason
    activation_failed,       // primary mechanism failed; reason
    launched,                // pid
    launched_without_pid,    // fallback mechanism succeeded
    launch_failed,           // reason joins both failures
    process_resolved,        // pid, name, path
    process_unresolved,      // pid
    monitoring_started,      // pid, directory
    waiting,                 // pid
    open_failed,             // pid
    terminated,              // pid
    wait_failed,             // pid, os_error
    unexpected_wait_status,  // pid, os_error carries the raw status
    searching,               // directory
    successor_found,         // pid
    no_successor,            // directory
};

inline const char* event_kind_to_string(EventKind k) {
    switch (k) {
        case EventKind::launch_started: return "launch_started";
        case EventKind::activation_failed: return "activation_failed";
        case EventKind::launched: return "launched";
        case EventKind::launched_without_pid: return "launched_without_pid";
        case EventKind::launch_failed: return "launch_failed";
        case EventKind::process_resolved: return "process_resolved";
        case EventKind::process_unresolved: return "process_unresolved";
        case EventKind::monitoring_started: return "monitoring_started";
        case EventKind::waiting: return "waiting";
        case EventKind::open_failed: return "open_failed";
        case EventKind::terminated: return "terminated";
        case EventKind::wait_failed: return "wait_failed";
        case EventKind::unexpected_wait_status: return "unexpected_wait_status";
        case EventKind::searching: return "searching";
        case EventKind::successor_found: return "successor_found";
        case EventKind::no_successor: return "no_successor";
        default: return "unknown";
    }
}

struct SupervisionEvent {
    EventKind kind;
    std::optional<ProcessId> pid;
    std::string name;
    std::string path;
    std::string directory;
    std::string reason;
    std::uint32_t os_error = 0;
};

/**
 * @brief Receives the progress of a launch and supervision session
 *
 * Wording is up to the sink; the core only guarantees event order and fields.
 */
class APPWATCH_API EventSink {
public:
    virtual ~EventSink() = default;
    virtual void on_event(const SupervisionEvent& event) = 0;
};

// Sink that drops everything.
class APPWATCH_API NullEventSink : public EventSink {
public:
    void on_event(const SupervisionEvent&) override {}
};

// Sink that keeps every event, in order.
class APPWATCH_API RecordingEventSink : public EventSink {
public:
    void on_event(const SupervisionEvent& event) override { events_.push_back(event); }

    const std::vector<SupervisionEvent>& events() const { return events_; }
    std::vector<EventKind> kinds() const;
    void clear() { events_.clear(); }

private:
    std::vector<SupervisionEvent> events_;
};

} // namespace appwatch
