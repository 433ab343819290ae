#include "appwatch/desktop_entry.hpp"
#include "appwatch/platform.hpp"

#include <spdlog/spdlog.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace appwatch {

namespace fs = std::filesystem;

namespace {

constexpr const char* DESKTOP_SUFFIX = ".desktop";

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) return "";
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

// String-value escapes: \s \n \t \r \\ . Unknown escapes are kept verbatim.
std::string unescape_value(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c != '\\' || i + 1 >= value.size()) {
            out += c;
            continue;
        }
        char next = value[++i];
        switch (next) {
            case 's': out += ' '; break;
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            case '\\': out += '\\'; break;
            default:
                out += '\\';
                out += next;
                break;
        }
    }
    return out;
}

bool parse_bool(const std::string& value) {
    return value == "true";
}

bool has_desktop_suffix(const std::string& s) {
    size_t n = std::strlen(DESKTOP_SUFFIX);
    return s.size() > n && s.compare(s.size() - n, n, DESKTOP_SUFFIX) == 0;
}

std::vector<std::string> split_search_path(const std::string& value) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(value);
    while (std::getline(ss, current, ':')) {
        if (!current.empty()) parts.push_back(current);
    }
    return parts;
}

std::optional<DesktopEntry> load_desktop_file(const std::string& path, const std::string& id) {
    std::string content = read_file(path);
    if (content.empty()) {
        spdlog::debug("could not read desktop entry {}", path);
        return std::nullopt;
    }
    auto entry = parse_desktop_entry(content, id);
    if (entry) {
        entry->file_path = path;
    }
    return entry;
}

} // namespace

std::optional<DesktopEntry> parse_desktop_entry(const std::string& content, const std::string& id) {
    DesktopEntry entry;
    entry.id = normalize_desktop_id(id);

    std::string type;
    bool in_group = false;
    bool saw_group = false;

    std::istringstream stream(content);
    std::string raw;
    while (std::getline(stream, raw)) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '[') {
            if (in_group) break;
            in_group = line == "[Desktop Entry]";
            saw_group = saw_group || in_group;
            continue;
        }
        if (!in_group) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));

        // Localized variants such as Name[de] are not used.
        if (key.find('[') != std::string::npos) continue;

        if (key == "Type") {
            type = value;
        } else if (key == "Name") {
            entry.name = unescape_value(value);
        } else if (key == "Exec") {
            entry.exec = unescape_value(value);
        } else if (key == "NoDisplay") {
            entry.no_display = parse_bool(value);
        } else if (key == "Hidden") {
            entry.hidden = parse_bool(value);
        }
    }

    if (!saw_group || type != "Application" || entry.exec.empty()) {
        return std::nullopt;
    }
    return entry;
}

std::vector<std::string> split_exec_line(const std::string& exec) {
    std::vector<std::string> args;
    std::string current;
    bool has_arg = false;
    bool in_quotes = false;

    for (size_t i = 0; i < exec.size(); ++i) {
        char c = exec[i];

        if (in_quotes) {
            if (c == '\\' && i + 1 < exec.size() && std::strchr("\"`$\\", exec[i + 1]) != nullptr) {
                current += exec[++i];
            } else if (c == '"') {
                in_quotes = false;
            } else {
                current += c;
            }
            continue;
        }

        if (c == ' ' || c == '\t') {
            if (has_arg) {
                args.push_back(current);
                current.clear();
                has_arg = false;
            }
        } else if (c == '"') {
            in_quotes = true;
            has_arg = true;
        } else if (c == '%' && i + 1 < exec.size()) {
            // Field codes expand to files/URLs we never pass; drop them.
            if (exec[++i] == '%') {
                current += '%';
                has_arg = true;
            }
        } else {
            current += c;
            has_arg = true;
        }
    }

    if (has_arg) {
        args.push_back(current);
    }
    return args;
}

std::string normalize_desktop_id(const std::string& app_id) {
    if (has_desktop_suffix(app_id)) {
        return app_id.substr(0, app_id.size() - std::strlen(DESKTOP_SUFFIX));
    }
    return app_id;
}

std::vector<std::string> desktop_entry_search_dirs() {
    std::vector<std::string> dirs;

    auto data_home = get_env("XDG_DATA_HOME");
    if (data_home && !data_home->empty()) {
        dirs.push_back(*data_home + "/applications");
    } else if (auto home = get_env("HOME"); home && !home->empty()) {
        dirs.push_back(*home + "/.local/share/applications");
    }

    auto data_dirs = get_env("XDG_DATA_DIRS");
    std::string search = (data_dirs && !data_dirs->empty()) ? *data_dirs
                                                           : "/usr/local/share:/usr/share";
    for (const auto& dir : split_search_path(search)) {
        dirs.push_back(dir + "/applications");
    }
    return dirs;
}

std::optional<DesktopEntry> find_desktop_entry(const std::string& app_id) {
    std::string id = normalize_desktop_id(app_id);
    for (const auto& dir : desktop_entry_search_dirs()) {
        fs::path candidate = fs::path(dir) / (id + DESKTOP_SUFFIX);
        std::error_code ec;
        if (!fs::is_regular_file(candidate, ec)) continue;

        if (auto entry = load_desktop_file(candidate.string(), id)) {
            return entry;
        }
    }
    return std::nullopt;
}

std::vector<DesktopEntry> list_desktop_entries() {
    std::vector<DesktopEntry> entries;
    std::set<std::string> seen;

    for (const auto& dir : desktop_entry_search_dirs()) {
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) continue;

        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            if (!it->is_regular_file(ec)) continue;

            std::string filename = it->path().filename().string();
            if (!has_desktop_suffix(filename)) continue;

            std::string id = normalize_desktop_id(filename);
            if (!seen.insert(id).second) continue;

            if (auto entry = load_desktop_file(it->path().string(), id)) {
                entries.push_back(std::move(*entry));
            }
        }
        if (ec) {
            spdlog::debug("stopped reading {}: {}", dir, ec.message());
        }
    }
    return entries;
}

} // namespace appwatch
