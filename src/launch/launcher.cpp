#include "appwatch/launcher.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace appwatch {

void Launcher::emit(SupervisionEvent event) {
    if (sink_) {
        sink_->on_event(event);
    }
}

LaunchOutcome Launcher::launch(const std::string& app_id) {
    SupervisionEvent started{EventKind::launch_started};
    started.reason = app_id;
    emit(std::move(started));

    auto primary = activation_.activate(app_id);
    if (primary.isOk()) {
        SupervisionEvent launched{EventKind::launched};
        launched.pid = primary.value();
        emit(std::move(launched));
        return LaunchOutcome::supervisable(primary.value());
    }

    spdlog::debug("activation of {} failed: {}", app_id, primary.error().message());
    SupervisionEvent activation_failed{EventKind::activation_failed};
    activation_failed.reason = primary.error().message();
    emit(std::move(activation_failed));

    auto fallback = activation_.open_via_shell(app_id);
    if (fallback.isOk()) {
        spdlog::info("{} was started by the shell; its process id is not known", app_id);
        emit(SupervisionEvent{EventKind::launched_without_pid});
        return LaunchOutcome::unsupervisable();
    }

    std::vector<std::string> reasons{primary.error().message(), fallback.error().message()};
    SupervisionEvent failed{EventKind::launch_failed};
    failed.reason = reasons[0] + "; " + reasons[1];
    emit(std::move(failed));
    return LaunchOutcome::failed(std::move(reasons));
}

} // namespace appwatch
