/**
 * appwatch CLI - Common utilities and types
 */

#pragma once

#include <appwatch/config.hpp>
#include <appwatch/events.hpp>
#include <appwatch/platform.hpp>
#include <appwatch/result.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <string>

namespace appwatch::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
    std::string log_level;         // --log-level
};

/**
 * Route diagnostics to stderr so stdout carries only command output.
 */
inline void init_logging(const GlobalOptions& opts) {
    auto logger = spdlog::get("appwatch");
    if (!logger) {
        logger = spdlog::stderr_color_mt("appwatch");
    }
    spdlog::set_default_logger(logger);

    LogSettings settings;
    settings.flag_level = opts.log_level;
    settings.verbose = opts.verbose;
    settings.quiet = opts.quiet;
    spdlog::set_level(resolve_log_level(settings, get_env(LOG_LEVEL_ENV)));
}

/**
 * Output utilities.
 */
inline void print_error(const Error& error, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["code"] = error_code_to_string(error.code());
        j["error"] = error.message();
        std::cout << j.dump() << std::endl;
    } else {
        std::cerr << "Error: " << error.message() << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

inline nlohmann::json event_to_json(const SupervisionEvent& e) {
    nlohmann::json j;
    j["event"] = event_kind_to_string(e.kind);
    if (e.pid) j["pid"] = *e.pid;
    if (!e.name.empty()) j["name"] = e.name;
    if (!e.path.empty()) j["path"] = e.path;
    if (!e.directory.empty()) j["directory"] = e.directory;
    if (!e.reason.empty()) j["reason"] = e.reason;
    if (e.os_error != 0) j["os_error"] = e.os_error;
    return j;
}

/**
 * One JSON object per line, flushed per event so a reader can follow along.
 */
class JsonLinesEventSink : public EventSink {
public:
    void on_event(const SupervisionEvent& event) override {
        std::cout << event_to_json(event).dump() << std::endl;
    }
};

/**
 * Human-readable progress lines.
 */
class TextEventSink : public EventSink {
public:
    explicit TextEventSink(bool quiet) : quiet_(quiet) {}
    void on_event(const SupervisionEvent& event) override;

private:
    bool quiet_;
};

} // namespace appwatch::cli
