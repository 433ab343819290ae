/**
 * appwatch CLI - Entry Point
 *
 * Launch an application and keep watching it across bootstrap hand-offs.
 */

#include <CLI/CLI.hpp>
#include <appwatch/appwatch.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace appwatch::cli::commands {
    void setup_launch(CLI::App* app, GlobalOptions& opts);
    void setup_list(CLI::App* app, GlobalOptions& opts);
    void setup_find(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace appwatch::cli;

    CLI::App app{"appwatch - launch an application and supervise its process"};
    app.set_version_flag("-V,--version", appwatch::APPWATCH_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug diagnostics on stderr");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");
    app.add_option("--log-level", opts.log_level,
                   "trace, debug, info, warn, error, critical or off");

    // Commands
    auto* launch_cmd = app.add_subcommand("launch", "Launch an application and supervise it");
    commands::setup_launch(launch_cmd, opts);

    auto* list_cmd = app.add_subcommand("list-apps", "List installed applications and their ids");
    commands::setup_list(list_cmd, opts);

    auto* find_cmd = app.add_subcommand("find", "Find a running process under a directory");
    commands::setup_find(find_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
