#include "appwatch/app_catalog.hpp"
#include "appwatch/desktop_entry.hpp"
#include "appwatch/platform.hpp"
#include "appwatch/process.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace appwatch {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> fields;
    std::string::size_type start = 0;
    while (true) {
        auto tab = line.find('\t', start);
        fields.push_back(trim(line.substr(start, tab == std::string::npos ? std::string::npos
                                                                          : tab - start)));
        if (tab == std::string::npos) break;
        start = tab + 1;
    }
    return fields;
}

#ifdef _WIN32
// Name and AUMID of every Start menu entry, one tab-separated pair per line.
constexpr const char* START_APPS_QUERY =
    "powershell -NoProfile -NonInteractive -Command "
    "\"Get-StartApps | ForEach-Object { \\\"$($_.Name)`t$($_.AppID)\\\" }\"";

// Exit code of the details query when no package owns the family name.
constexpr int PACKAGE_NOT_FOUND_EXIT = 2;

// Start menu name plus the Appx package of the AUMID's family, one line.
std::string app_details_query(const std::string& app_id) {
    std::string family = app_id.substr(0, app_id.find('!'));
    std::string script =
        "$a = Get-StartApps | Where-Object { $_.AppID -eq " + quote_shell_argument(app_id) +
        " } | Select-Object -First 1; "
        "$p = Get-AppxPackage | Where-Object { $_.PackageFamilyName -eq " +
        quote_shell_argument(family) + " } | Select-Object -First 1; "
        "if (-not $p) { exit " + std::to_string(PACKAGE_NOT_FOUND_EXIT) + " }; "
        "\\\"$($a.Name)`t$($p.Name)`t$($p.InstallLocation)`t$($p.PackageFullName)`t"
        "$($p.PackageFamilyName)\\\"";
    return "powershell -NoProfile -NonInteractive -Command \"" + script + "\"";
}
#endif

} // namespace

std::vector<AppEntry> parse_start_apps_output(const std::string& output) {
    std::vector<AppEntry> apps;
    std::istringstream stream(output);
    std::string raw;
    while (std::getline(stream, raw)) {
        // Keep trailing tabs: an empty id still marks a row.
        std::string line = raw;
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();
        if (trim(line).empty()) continue;

        auto tab = line.find('\t');
        if (tab == std::string::npos) continue;

        AppEntry app;
        app.name = trim(line.substr(0, tab));
        app.app_id = trim(line.substr(tab + 1));
        apps.push_back(std::move(app));
    }
    return apps;
}

std::vector<AppEntry> filter_apps(std::vector<AppEntry> apps,
                                  const std::optional<std::string>& search) {
    std::string term = search ? to_lower(*search) : std::string();

    std::vector<AppEntry> out;
    for (auto& app : apps) {
        // Entries without an id cannot be launched (plain Win32 shortcuts).
        if (app.app_id.empty()) continue;
        if (!term.empty() && to_lower(app.name).find(term) == std::string::npos) continue;
        out.push_back(std::move(app));
    }

    std::stable_sort(out.begin(), out.end(), [](const AppEntry& a, const AppEntry& b) {
        return to_lower(a.name) < to_lower(b.name);
    });
    return out;
}

Result<std::vector<AppEntry>> list_installed_apps() {
#ifdef _WIN32
    ShellResult r = run_shell_command(START_APPS_QUERY);
    if (!r.error.empty()) {
        return Result<std::vector<AppEntry>>::err(Error(ErrorCode::IO_ERROR, r.error));
    }
    if (!r.ok) {
        return Result<std::vector<AppEntry>>::err(Error(ErrorCode::IO_ERROR, trim(r.output))
                                                      .withContext("Get-StartApps failed"));
    }
    return Result<std::vector<AppEntry>>::ok(parse_start_apps_output(r.output));
#else
    std::vector<AppEntry> apps;
    for (const auto& entry : list_desktop_entries()) {
        if (entry.no_display || entry.hidden) continue;
        AppEntry app;
        app.name = entry.name.empty() ? entry.id : entry.name;
        app.app_id = entry.id;
        apps.push_back(std::move(app));
    }
    spdlog::debug("found {} visible desktop entries", apps.size());
    return Result<std::vector<AppEntry>>::ok(std::move(apps));
#endif
}

std::optional<AppDetails> parse_app_details_output(const std::string& output) {
    std::string last;
    std::istringstream stream(output);
    std::string raw;
    while (std::getline(stream, raw)) {
        if (!trim(raw).empty()) last = raw;
    }

    auto fields = split_tabs(last);
    if (fields.size() != 5) {
        return std::nullopt;
    }

    AppDetails details;
    details.display_name = fields[0];
    details.package_name = fields[1];
    details.install_path = fields[2];
    details.full_name = fields[3];
    details.family_name = fields[4];
    if (details.full_name.empty() && details.family_name.empty()) {
        return std::nullopt;
    }
    return details;
}

Result<AppDetails> describe_app(const std::string& app_id) {
#ifdef _WIN32
    if (app_id.find('"') != std::string::npos) {
        return Result<AppDetails>::err(Error(ErrorCode::NOT_FOUND,
            "application id contains a double quote").withContext(app_id));
    }

    ShellResult r = run_shell_command(app_details_query(app_id));
    if (!r.error.empty()) {
        return Result<AppDetails>::err(Error(ErrorCode::IO_ERROR, r.error));
    }
    if (r.exit_code == PACKAGE_NOT_FOUND_EXIT) {
        return Result<AppDetails>::err(Error(ErrorCode::NOT_FOUND,
            "no installed package owns this AUMID").withContext(app_id));
    }
    if (!r.ok) {
        return Result<AppDetails>::err(Error(ErrorCode::IO_ERROR, trim(r.output))
                                           .withContext("package query failed"));
    }

    auto details = parse_app_details_output(r.output);
    if (!details) {
        return Result<AppDetails>::err(Error(ErrorCode::NOT_FOUND,
            "package query returned no package information").withContext(app_id));
    }
    return Result<AppDetails>::ok(std::move(*details));
#else
    auto entry = find_desktop_entry(app_id);
    if (!entry) {
        return Result<AppDetails>::err(Error(ErrorCode::NOT_FOUND,
            "no desktop entry named " + normalize_desktop_id(app_id)));
    }

    AppDetails details;
    details.display_name = entry->name.empty() ? entry->id : entry->name;
    details.package_name = entry->id;
    details.entry_file = entry->file_path;

    auto args = split_exec_line(entry->exec);
    if (!args.empty() && !args[0].empty() && args[0][0] == '/') {
        details.install_path = get_parent_directory(args[0]);
    }
    return Result<AppDetails>::ok(std::move(details));
#endif
}

} // namespace appwatch
