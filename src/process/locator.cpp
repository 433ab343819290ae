#include "appwatch/process.hpp"

#include <spdlog/spdlog.h>

#include <array>

namespace appwatch {

std::optional<ProcessId> find_in_directory(ProcessApi& api, const std::string& target_directory) {
    std::array<ProcessId, PROCESS_ENUMERATION_CAPACITY> pids{};

    auto count = api.enumerate_processes(pids.data(), pids.size());
    if (!count) {
        spdlog::warn("could not enumerate processes while searching {}", target_directory);
        return std::nullopt;
    }
    if (*count >= pids.size()) {
        spdlog::warn("process table snapshot is full ({} entries); later processes are not considered",
                      pids.size());
    }

    for (size_t i = 0; i < *count && i < pids.size(); ++i) {
        ProcessId pid = pids[i];
        if (pid == IDLE_PROCESS_ID) {
            continue;
        }

        auto info = resolve_process(api, pid);
        if (!info) {
            continue;
        }
        if (starts_with_ignore_case(info->path, target_directory)) {
            spdlog::debug("process {} ({}) is under {}", pid, info->path, target_directory);
            return pid;
        }
    }

    return std::nullopt;
}

} // namespace appwatch
