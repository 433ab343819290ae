/**
 * appwatch CLI - find command
 *
 * Run the successor search once against the live process table.
 */

#include "../common.hpp"
#include <appwatch/appwatch.hpp>
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace appwatch::cli::commands {

namespace {

struct FindOptions {
    std::string directory;
};

int cmd_find(const GlobalOptions& opts, const FindOptions& find_opts) {
    init_logging(opts);

    auto pid = find_successor(find_opts.directory);
    if (!pid) {
        if (opts.json) {
            output_json({{"found", false}, {"directory", find_opts.directory}});
        } else if (!opts.quiet) {
            std::cout << "No process found under " << find_opts.directory << std::endl;
        }
        return 1;
    }

    // The process may exit between the search and this lookup.
    auto api = make_system_process_api();
    auto info = resolve_process(*api, *pid);
    if (opts.json) {
        nlohmann::json j;
        j["found"] = true;
        j["directory"] = find_opts.directory;
        j["pid"] = *pid;
        if (info) {
            j["name"] = info->name;
            j["path"] = info->path;
        }
        output_json(j);
    } else {
        std::cout << *pid;
        if (info) {
            std::cout << " " << info->path;
        }
        std::cout << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_find(CLI::App* app, GlobalOptions& opts) {
    static FindOptions find_opts;

    app->add_option("directory", find_opts.directory, "Install directory to search under")
        ->required();

    app->callback([&opts]() {
        std::exit(cmd_find(opts, find_opts));
    });
}

} // namespace appwatch::cli::commands
