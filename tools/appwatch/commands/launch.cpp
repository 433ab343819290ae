/**
 * appwatch CLI - launch command
 *
 * Look up an application, launch it and supervise it until no successor
 * process remains.
 */

#include "../common.hpp"
#include <appwatch/app_catalog.hpp>
#include <appwatch/appwatch.hpp>
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <memory>

namespace appwatch::cli::commands {

namespace {

struct LaunchOptions {
    std::string app_id;
};

void print_app_details(const AppDetails& details) {
    auto line = [](const char* label, const std::string& value) {
        if (!value.empty()) std::cout << "  " << label << ": " << value << std::endl;
    };
    std::cout << "Found application information" << std::endl;
    line("Display Name", details.display_name);
    line("Package Name", details.package_name);
    line("Installed Path", details.install_path);
    line("Package Full Name", details.full_name);
    line("Package Family Name", details.family_name);
    line("Desktop Entry", details.entry_file);
}

nlohmann::json app_details_to_json(const AppDetails& details) {
    nlohmann::json j;
    j["event"] = "app_found";
    j["display_name"] = details.display_name;
    j["package_name"] = details.package_name;
    j["install_path"] = details.install_path;
    j["full_name"] = details.full_name;
    j["family_name"] = details.family_name;
    j["entry_file"] = details.entry_file;
    return j;
}

void print_lookup_failure(const std::string& app_id, const Error& error, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["event"] = "app_not_found";
        j["app_id"] = app_id;
        j["code"] = error_code_to_string(error.code());
        j["reason"] = error.message();
        std::cout << j.dump() << std::endl;
        return;
    }
    std::cout << "Failed to find app '" << app_id << "': " << error.message() << std::endl;
    std::cout << "Possible reasons:" << std::endl;
    std::cout << "  - The application id is incorrect" << std::endl;
    std::cout << "  - The app is not installed for the current user" << std::endl;
    std::cout << "  - Access permissions issue" << std::endl;
}

int cmd_launch(const GlobalOptions& opts, const LaunchOptions& launch_opts) {
    init_logging(opts);

    // Launch only what the host can describe.
    auto details = describe_app(launch_opts.app_id);
    if (details.isErr()) {
        print_lookup_failure(launch_opts.app_id, details.error(), opts.json);
        return 0;
    }
    if (opts.json) {
        std::cout << app_details_to_json(details.value()).dump() << std::endl;
    } else if (!opts.quiet) {
        print_app_details(details.value());
    }

    std::unique_ptr<EventSink> sink;
    if (opts.json) {
        sink = std::make_unique<JsonLinesEventSink>();
    } else {
        sink = std::make_unique<TextEventSink>(opts.quiet);
    }

    SessionReport report = supervise(launch_opts.app_id, *sink);
    spdlog::debug("session ended: {} (launch {}) after {} state(s)",
                  session_outcome_to_string(report.outcome),
                  launch_kind_to_string(report.launch.kind()), report.history.size());

    // Supervision ending is not an application error.
    return 0;
}

} // anonymous namespace

void setup_launch(CLI::App* app, GlobalOptions& opts) {
    static LaunchOptions launch_opts;

    app->add_option("app-id", launch_opts.app_id,
                    "Application id (AUMID on Windows, desktop entry id on Linux)")
        ->required();

    app->callback([&opts]() {
        std::exit(cmd_launch(opts, launch_opts));
    });
}

} // namespace appwatch::cli::commands
