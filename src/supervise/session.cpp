#include "appwatch/appwatch.hpp"

namespace appwatch {

SessionReport supervise(const std::string& app_id, EventSink& sink) {
    auto api = make_system_process_api();
    auto activation = make_system_activation_service();

    Launcher launcher(*activation, &sink);
    Supervisor supervisor(*api, sink);
    return supervisor.supervise(app_id, launcher);
}

std::optional<ProcessId> find_successor(const std::string& directory) {
    auto api = make_system_process_api();
    return find_in_directory(*api, directory);
}

} // namespace appwatch
