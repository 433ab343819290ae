#pragma once

#include "appwatch/export.hpp"

#include <optional>
#include <string>
#include <vector>

namespace appwatch {

// ============================================================================
// XDG Desktop Entries
// ============================================================================

struct DesktopEntry {
    std::string id;         // file name without ".desktop"
    std::string name;
    std::string exec;
    std::string file_path;
    bool no_display = false;
    bool hidden = false;
};

// Parse the [Desktop Entry] group. Returns nullopt unless Type=Application
// and Exec is non-empty.
APPWATCH_API std::optional<DesktopEntry> parse_desktop_entry(const std::string& content,
                                                             const std::string& id);

// Split an Exec value into argv, dropping field codes and unquoting.
APPWATCH_API std::vector<std::string> split_exec_line(const std::string& exec);

// Strip a trailing ".desktop" from an application id.
APPWATCH_API std::string normalize_desktop_id(const std::string& app_id);

// $XDG_DATA_HOME/applications followed by each $XDG_DATA_DIRS/applications.
APPWATCH_API std::vector<std::string> desktop_entry_search_dirs();

// First entry named `app_id` across the search dirs.
APPWATCH_API std::optional<DesktopEntry> find_desktop_entry(const std::string& app_id);

// Every parseable entry; the first directory providing an id wins.
APPWATCH_API std::vector<DesktopEntry> list_desktop_entries();

} // namespace appwatch
