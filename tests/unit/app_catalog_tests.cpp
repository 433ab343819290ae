#include <doctest/doctest.h>
#include <appwatch/app_catalog.hpp>

#include "xdg_fixture.hpp"

using namespace appwatch;

TEST_CASE("parse tab separated start apps output") {
    std::string output =
        "Calculator\tMicrosoft.WindowsCalculator_8wekyb3d8bbwe!App\r\n"
        "\r\n"
        "Notepad\tC:\\Windows\\notepad.exe\r\n"
        "no tab here\r\n"
        "Legacy Tool\t\r\n";

    auto apps = parse_start_apps_output(output);
    REQUIRE(apps.size() == 3);
    CHECK(apps[0].name == "Calculator");
    CHECK(apps[0].app_id == "Microsoft.WindowsCalculator_8wekyb3d8bbwe!App");
    CHECK(apps[2].name == "Legacy Tool");
    CHECK(apps[2].app_id.empty());
}

TEST_CASE("filter drops entries without an id") {
    std::vector<AppEntry> apps{{"Legacy Tool", ""}, {"Calculator", "Calc!App"}};
    auto out = filter_apps(apps, std::nullopt);
    REQUIRE(out.size() == 1);
    CHECK(out[0].name == "Calculator");
}

TEST_CASE("filter search is a case-insensitive name match") {
    std::vector<AppEntry> apps{
        {"Forza Horizon 5", "Microsoft.624F8B84B80_8wekyb3d8bbwe!forzahorizon5"},
        {"Calculator", "Calc!App"},
        {"FORZA Motorsport", "Microsoft.ForzaMotorsport!App"},
    };
    auto out = filter_apps(apps, std::string("forza"));
    REQUIRE(out.size() == 2);
    CHECK(out[0].name == "Forza Horizon 5");
    CHECK(out[1].name == "FORZA Motorsport");
}

TEST_CASE("filter sorts by lower-cased name") {
    std::vector<AppEntry> apps{{"zune", "z"}, {"Alarms", "a"}, {"camera", "c"}, {"Bing", "b"}};
    auto out = filter_apps(apps, std::nullopt);
    REQUIRE(out.size() == 4);
    CHECK(out[0].name == "Alarms");
    CHECK(out[1].name == "Bing");
    CHECK(out[2].name == "camera");
    CHECK(out[3].name == "zune");
}

TEST_CASE("empty search keeps everything") {
    std::vector<AppEntry> apps{{"One", "1"}, {"Two", "2"}};
    CHECK(filter_apps(apps, std::string("")).size() == 2);
}

// ============================================================================
// Application details
// ============================================================================

TEST_CASE("package details are read from the last line") {
    std::string output =
        "WARNING: loading module\r\n"
        "Forza Horizon 5\tMicrosoft.624F8B84B80\tC:\\Program Files\\WindowsApps\\Forza\t"
        "Microsoft.624F8B84B80_3.2.0.0_x64__8wekyb3d8bbwe\tMicrosoft.624F8B84B80_8wekyb3d8bbwe\r\n"
        "\r\n";

    auto details = parse_app_details_output(output);
    REQUIRE(details.has_value());
    CHECK(details->display_name == "Forza Horizon 5");
    CHECK(details->package_name == "Microsoft.624F8B84B80");
    CHECK(details->install_path == "C:\\Program Files\\WindowsApps\\Forza");
    CHECK(details->full_name == "Microsoft.624F8B84B80_3.2.0.0_x64__8wekyb3d8bbwe");
    CHECK(details->family_name == "Microsoft.624F8B84B80_8wekyb3d8bbwe");
    CHECK(details->entry_file.empty());
}

TEST_CASE("package details keep empty fields") {
    auto details = parse_app_details_output("\tPkg\t\tPkg_1.0_x64__abc\tPkg_abc\n");
    REQUIRE(details.has_value());
    CHECK(details->display_name.empty());
    CHECK(details->install_path.empty());
    CHECK(details->family_name == "Pkg_abc");
}

TEST_CASE("malformed package details are rejected") {
    CHECK_FALSE(parse_app_details_output("").has_value());
    CHECK_FALSE(parse_app_details_output("only\ttwo").has_value());
    CHECK_FALSE(parse_app_details_output("Name\tPkg\tC:\\x\t\t\n").has_value());
}

#ifndef _WIN32

TEST_CASE("desktop entry provides the details on this host") {
    appwatch::testing::TestXdgEnvironment env;
    env.write(env.home, "editor.desktop",
              "[Desktop Entry]\nType=Application\nName=Editor\nExec=/opt/editor/bin/editor %F\n");

    auto details = describe_app("editor.desktop");
    REQUIRE(details.isOk());
    CHECK(details.value().display_name == "Editor");
    CHECK(details.value().package_name == "editor");
    CHECK(details.value().install_path == "/opt/editor/bin");
    CHECK(details.value().entry_file == env.home + "/applications/editor.desktop");
    CHECK(details.value().family_name.empty());
}

TEST_CASE("relative Exec program leaves the install path empty") {
    appwatch::testing::TestXdgEnvironment env;
    env.write(env.system, "calc.desktop",
              "[Desktop Entry]\nType=Application\nExec=gnome-calculator\n");

    auto details = describe_app("calc");
    REQUIRE(details.isOk());
    CHECK(details.value().display_name == "calc");
    CHECK(details.value().install_path.empty());
}

TEST_CASE("describing an unknown application is not found") {
    appwatch::testing::TestXdgEnvironment env;

    auto details = describe_app("missing");
    REQUIRE(details.isErr());
    CHECK(details.error().code() == ErrorCode::NOT_FOUND);
}

#endif
