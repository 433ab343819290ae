#pragma once

#include "appwatch/export.hpp"
#include "appwatch/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace appwatch {

/**
 * @brief A launchable application and the id to pass to `launch`
 */
struct AppEntry {
    std::string name;
    std::string app_id;
};

// Parse "Name<TAB>AppID" lines as printed by the Get-StartApps query.
APPWATCH_API std::vector<AppEntry> parse_start_apps_output(const std::string& output);

// Drop entries without an id, keep names containing `search`
// (case-insensitive), and sort by lower-cased name.
APPWATCH_API std::vector<AppEntry> filter_apps(std::vector<AppEntry> apps,
                                               const std::optional<std::string>& search);

// Installed applications on this host, unfiltered.
APPWATCH_API Result<std::vector<AppEntry>> list_installed_apps();

/**
 * @brief What the host knows about an application before it is launched
 *
 * Windows fills the package fields from the Appx package owning the AUMID.
 * Linux fills display_name, package_name (the desktop id), entry_file, and
 * install_path when the Exec program is an absolute path. Unknown fields are
 * empty.
 */
struct AppDetails {
    std::string display_name;
    std::string package_name;
    std::string install_path;
    std::string full_name;
    std::string family_name;
    std::string entry_file;
};

// Parse the "Display<TAB>Package<TAB>InstallPath<TAB>FullName<TAB>Family" line
// printed by the package query. The last non-blank line is used.
APPWATCH_API std::optional<AppDetails> parse_app_details_output(const std::string& output);

// Look up `app_id`; NOT_FOUND when the host has no such application.
APPWATCH_API Result<AppDetails> describe_app(const std::string& app_id);

} // namespace appwatch
