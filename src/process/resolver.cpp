#include "appwatch/process.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <string>

namespace appwatch {

namespace {

std::string::size_type last_separator(const std::string& path) {
    return path.find_last_of("\\/");
}

} // namespace

std::string get_filename(const std::string& path) {
    auto pos = last_separator(path);
    if (pos == std::string::npos) {
        return path;
    }
    return path.substr(pos + 1);
}

std::string get_parent_directory(const std::string& path) {
    auto pos = last_separator(path);
    if (pos == std::string::npos) {
        return path;
    }
    return path.substr(0, pos);
}

bool starts_with_ignore_case(const std::string& value, const std::string& prefix) {
    if (prefix.size() > value.size()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        auto a = static_cast<unsigned char>(value[i]);
        auto b = static_cast<unsigned char>(prefix[i]);
        if (std::tolower(a) != std::tolower(b)) {
            return false;
        }
    }
    return true;
}

std::optional<ProcessInfo> resolve_process(ProcessApi& api, ProcessId pid) {
    ImageQuery query = api.query_image_path(pid);

    switch (query.status) {
        case QueryStatus::OpenFailed:
            return std::nullopt;
        case QueryStatus::AccessDenied:
            spdlog::debug("query access denied for process {}", pid);
            return std::nullopt;
        case QueryStatus::PathUnavailable:
            query.path.clear();
            break;
        case QueryStatus::Ok:
            break;
    }

    ProcessInfo info;
    info.path = query.path.empty() ? UNKNOWN_PROCESS_PATH : query.path;
    info.name = get_filename(info.path);
    return info;
}

} // namespace appwatch
