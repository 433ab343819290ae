#include <doctest/doctest.h>
#include <appwatch/desktop_entry.hpp>

#include "xdg_fixture.hpp"

#include <string>

using namespace appwatch;
using appwatch::testing::TestXdgEnvironment;

namespace {

const char* CALCULATOR_ENTRY =
    "[Desktop Entry]\n"
    "Type=Application\n"
    "Name=Calculator\n"
    "Name[de]=Rechner\n"
    "Exec=gnome-calculator %U\n";

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("parse a basic application entry") {
    auto entry = parse_desktop_entry(CALCULATOR_ENTRY, "org.gnome.Calculator.desktop");
    REQUIRE(entry.has_value());
    CHECK(entry->id == "org.gnome.Calculator");
    CHECK(entry->name == "Calculator");
    CHECK(entry->exec == "gnome-calculator %U");
    CHECK_FALSE(entry->no_display);
    CHECK_FALSE(entry->hidden);
}

TEST_CASE("keys outside the Desktop Entry group are ignored") {
    const char* content =
        "# comment\n"
        "[Desktop Entry]\n"
        "Type=Application\n"
        "Name=Editor\n"
        "Exec=editor\n"
        "\n"
        "[Desktop Action new-window]\n"
        "Name=New Window\n"
        "Exec=editor --new-window\n";

    auto entry = parse_desktop_entry(content, "editor");
    REQUIRE(entry.has_value());
    CHECK(entry->name == "Editor");
    CHECK(entry->exec == "editor");
}

TEST_CASE("links and entries without Exec are rejected") {
    CHECK_FALSE(parse_desktop_entry("[Desktop Entry]\nType=Link\nURL=https://example.com\n", "l").has_value());
    CHECK_FALSE(parse_desktop_entry("[Desktop Entry]\nType=Application\nName=x\n", "x").has_value());
    CHECK_FALSE(parse_desktop_entry("Type=Application\nExec=x\n", "x").has_value());
}

TEST_CASE("NoDisplay and Hidden flags are read") {
    auto entry = parse_desktop_entry(
        "[Desktop Entry]\nType=Application\nExec=x\nNoDisplay=true\nHidden=true\n", "x");
    REQUIRE(entry.has_value());
    CHECK(entry->no_display);
    CHECK(entry->hidden);
}

TEST_CASE("string escapes in values are decoded") {
    auto entry = parse_desktop_entry(
        "[Desktop Entry]\nType=Application\nName=Two\\sWords\nExec=x\n", "x");
    REQUIRE(entry.has_value());
    CHECK(entry->name == "Two Words");
}

// ============================================================================
// Exec line
// ============================================================================

TEST_CASE("field codes are dropped from the exec line") {
    auto argv = split_exec_line("firefox --new-window %u");
    REQUIRE(argv.size() == 2);
    CHECK(argv[0] == "firefox");
    CHECK(argv[1] == "--new-window");
}

TEST_CASE("quoted arguments keep spaces and escapes") {
    auto argv = split_exec_line("\"/opt/My App/app\" --title \"say \\\"hi\\\"\" %F");
    REQUIRE(argv.size() == 3);
    CHECK(argv[0] == "/opt/My App/app");
    CHECK(argv[1] == "--title");
    CHECK(argv[2] == "say \"hi\"");
}

TEST_CASE("double percent is a literal percent") {
    auto argv = split_exec_line("printf 100%%");
    REQUIRE(argv.size() == 2);
    CHECK(argv[1] == "100%");
}

TEST_CASE("empty quoted argument is preserved") {
    auto argv = split_exec_line("app \"\" end");
    REQUIRE(argv.size() == 3);
    CHECK(argv[1].empty());
}

TEST_CASE("desktop suffix is optional in ids") {
    CHECK(normalize_desktop_id("firefox.desktop") == "firefox");
    CHECK(normalize_desktop_id("firefox") == "firefox");
    CHECK(normalize_desktop_id(".desktop") == ".desktop");
}

// ============================================================================
// Lookup
// ============================================================================

TEST_CASE("search dirs follow XDG variables") {
    TestXdgEnvironment env;
    auto dirs = desktop_entry_search_dirs();
    REQUIRE(dirs.size() == 2);
    CHECK(dirs[0] == env.home + "/applications");
    CHECK(dirs[1] == env.system + "/applications");
}

TEST_CASE("find prefers the user data dir") {
    TestXdgEnvironment env;
    env.write(env.system, "calc.desktop", CALCULATOR_ENTRY);
    env.write(env.home, "calc.desktop",
              "[Desktop Entry]\nType=Application\nName=My Calculator\nExec=my-calc\n");

    auto entry = find_desktop_entry("calc.desktop");
    REQUIRE(entry.has_value());
    CHECK(entry->name == "My Calculator");
    CHECK(entry->file_path.find(env.home) == 0);
}

TEST_CASE("find returns nothing for an unknown id") {
    TestXdgEnvironment env;
    CHECK_FALSE(find_desktop_entry("does-not-exist").has_value());
}

TEST_CASE("list keeps the first occurrence of each id") {
    TestXdgEnvironment env;
    env.write(env.home, "calc.desktop",
              "[Desktop Entry]\nType=Application\nName=Mine\nExec=my-calc\n");
    env.write(env.system, "calc.desktop", CALCULATOR_ENTRY);
    env.write(env.system, "editor.desktop",
              "[Desktop Entry]\nType=Application\nName=Editor\nExec=editor\n");
    env.write(env.system, "readme.txt", "not an entry");

    auto entries = list_desktop_entries();
    REQUIRE(entries.size() == 2);
    int calc_count = 0;
    for (const auto& e : entries) {
        if (e.id == "calc") {
            ++calc_count;
            CHECK(e.name == "Mine");
        }
    }
    CHECK(calc_count == 1);
}
