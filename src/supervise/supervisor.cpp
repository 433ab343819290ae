#include "appwatch/supervisor.hpp"
#include "appwatch/process.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace appwatch {

void Supervisor::emit(SupervisionEvent event) {
    sink_.on_event(event);
}

void Supervisor::enter(SupervisionState next) {
    spdlog::debug("supervision: {} -> {}", to_string(state_), to_string(next));
    state_ = next;
    history_.push_back(next);
}

SessionReport Supervisor::supervise(const std::string& app_id, Launcher& launcher) {
    SessionReport report;
    report.launch = launcher.launch(app_id);

    switch (report.launch.kind()) {
        case LaunchKind::Failed:
            report.outcome = SessionOutcome::LaunchFailed;
            return report;
        case LaunchKind::LaunchedUnsupervisable:
            report.outcome = SessionOutcome::PartialCapability;
            return report;
        case LaunchKind::FullySupervisable:
            break;
    }

    if (!begin(report.launch.pid())) {
        report.outcome = SessionOutcome::InitialProcessUnavailable;
        return report;
    }

    run();

    report.outcome = SessionOutcome::Stopped;
    report.target_directory = target_directory_;
    report.history = history_;
    return report;
}

bool Supervisor::begin(ProcessId initial) {
    auto info = resolve_process(api_, initial);
    if (!info) {
        SupervisionEvent unresolved{EventKind::process_unresolved};
        unresolved.pid = initial;
        emit(std::move(unresolved));
        return false;
    }

    SupervisionEvent resolved{EventKind::process_resolved};
    resolved.pid = initial;
    resolved.name = info->name;
    resolved.path = info->path;
    emit(std::move(resolved));

    // Fixed for the whole session, successors never move it.
    target_directory_ = get_parent_directory(info->path);
    history_.clear();

    SupervisionEvent started{EventKind::monitoring_started};
    started.pid = initial;
    started.directory = target_directory_;
    emit(std::move(started));

    enter(SupervisionState::monitoring(initial));
    return true;
}

const SupervisionState& Supervisor::step() {
    switch (state_.phase) {
        case SupervisionPhase::Monitoring:
            monitor_once(state_.pid);
            break;
        case SupervisionPhase::SearchingSuccessor:
            search_successor();
            break;
        case SupervisionPhase::Stopped:
            break;
    }
    return state_;
}

void Supervisor::run() {
    while (state_.phase != SupervisionPhase::Stopped) {
        step();
    }
}

void Supervisor::monitor_once(ProcessId pid) {
    SupervisionEvent waiting{EventKind::waiting};
    waiting.pid = pid;
    emit(std::move(waiting));

    WaitOutcome outcome = api_.wait_for_exit(pid);

    SupervisionEvent event{EventKind::terminated};
    event.pid = pid;
    switch (outcome.status) {
        case WaitStatus::OpenFailed:
            event.kind = EventKind::open_failed;
            event.os_error = outcome.os_error;
            break;
        case WaitStatus::Terminated:
            break;
        case WaitStatus::Failed:
            event.kind = EventKind::wait_failed;
            event.os_error = outcome.os_error;
            break;
        case WaitStatus::Unexpected:
            spdlog::warn("unexpected wait result {} for process {}, waiting again",
                         outcome.raw_status, pid);
            event.kind = EventKind::unexpected_wait_status;
            event.os_error = outcome.raw_status;
            emit(std::move(event));
            return;
    }

    emit(std::move(event));
    enter(SupervisionState::searching());
}

void Supervisor::search_successor() {
    SupervisionEvent searching{EventKind::searching};
    searching.directory = target_directory_;
    emit(std::move(searching));

    auto successor = find_in_directory(api_, target_directory_);
    if (!successor) {
        SupervisionEvent none{EventKind::no_successor};
        none.directory = target_directory_;
        emit(std::move(none));
        enter(SupervisionState::stopped());
        return;
    }

    SupervisionEvent found{EventKind::successor_found};
    found.pid = *successor;
    emit(std::move(found));

    // The successor may already be gone again; the wait reports that.
    if (auto info = resolve_process(api_, *successor)) {
        SupervisionEvent resolved{EventKind::process_resolved};
        resolved.pid = *successor;
        resolved.name = info->name;
        resolved.path = info->path;
        emit(std::move(resolved));
    }

    enter(SupervisionState::monitoring(*successor));
}

} // namespace appwatch
