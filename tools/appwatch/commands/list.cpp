/**
 * appwatch CLI - list-apps command
 */

#include "../common.hpp"
#include <appwatch/app_catalog.hpp>
#include <CLI/CLI.hpp>
#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <optional>

namespace appwatch::cli::commands {

namespace {

struct ListOptions {
    std::string search;
};

void print_apps_table(const std::vector<AppEntry>& apps) {
    if (apps.empty()) {
        std::cout << "No applications found." << std::endl;
        return;
    }

    std::cout << "Found " << apps.size() << " applications:\n" << std::endl;

    size_t width = 12;
    for (const auto& app : apps) {
        width = std::max(width, app.name.size());
    }

    std::cout << std::left << std::setw(static_cast<int>(width)) << "Application Name"
              << " App ID" << std::endl;
    std::cout << std::string(width, '-') << " " << std::string(50, '-') << std::endl;
    for (const auto& app : apps) {
        std::cout << std::left << std::setw(static_cast<int>(width)) << app.name
                  << " " << app.app_id << std::endl;
    }
}

int cmd_list(const GlobalOptions& opts, const ListOptions& list_opts) {
    init_logging(opts);

    auto result = list_installed_apps();
    if (result.isErr()) {
        print_error(result.error().withContext("could not list applications"), opts.json);
        return 1;
    }

    std::optional<std::string> search;
    if (!list_opts.search.empty()) {
        search = list_opts.search;
    }
    auto apps = filter_apps(std::move(result.value()), search);

    if (opts.json) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& app : apps) {
            j.push_back({{"name", app.name}, {"app_id", app.app_id}});
        }
        output_json(j);
    } else {
        print_apps_table(apps);
    }
    return 0;
}

} // anonymous namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    static ListOptions list_opts;

    app->add_option("--search", list_opts.search, "Only apps whose name contains the term");

    app->callback([&opts]() {
        std::exit(cmd_list(opts, list_opts));
    });
}

} // namespace appwatch::cli::commands
