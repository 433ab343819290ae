#include <doctest/doctest.h>
#include <appwatch/process.hpp>

#include "fakes.hpp"

using namespace appwatch;
using appwatch::testing::FakeProcessApi;

TEST_CASE("locator finds a process under the directory") {
    FakeProcessApi api;
    api.add(4, "C:\\Windows\\System32\\ntoskrnl.exe");
    api.add(4399, "C:\\Apps\\Foo\\foo-worker.exe");

    auto pid = find_in_directory(api, "C:\\Apps\\Foo");
    REQUIRE(pid.has_value());
    CHECK(*pid == 4399);
}

TEST_CASE("locator prefix comparison ignores case") {
    FakeProcessApi api;
    api.add(77, "c:\\apps\\foo\\FOO-WORKER.EXE");

    auto pid = find_in_directory(api, "C:\\Apps\\Foo");
    REQUIRE(pid.has_value());
    CHECK(*pid == 77);
}

TEST_CASE("locator returns the first match in enumeration order") {
    FakeProcessApi api;
    api.add(500, "C:\\Apps\\Foo\\helper.exe");
    api.add(300, "C:\\Apps\\Foo\\foo.exe");

    auto pid = find_in_directory(api, "C:\\Apps\\Foo");
    REQUIRE(pid.has_value());
    CHECK(*pid == 500);
}

TEST_CASE("locator reports not found for a nonexistent directory") {
    FakeProcessApi api;
    api.add(4, "C:\\Windows\\System32\\ntoskrnl.exe");
    api.add(1200, "C:\\Apps\\Foo\\foo.exe");

    CHECK_FALSE(find_in_directory(api, "Z:\\nonexistent\\path").has_value());
}

TEST_CASE("locator skips pid zero, denied and vanished processes") {
    FakeProcessApi api;
    api.add(0, "C:\\Apps\\Foo\\idle.exe");
    api.add_denied(10);
    api.add(20, "C:\\Apps\\Foo\\foo.exe");

    auto pid = find_in_directory(api, "C:\\Apps\\Foo");
    REQUIRE(pid.has_value());
    CHECK(*pid == 20);
}

TEST_CASE("unknown path matches an unknown directory") {
    FakeProcessApi api;
    api.add(12, "C:\\Windows\\explorer.exe");
    api.add_without_path(31);

    auto pid = find_in_directory(api, UNKNOWN_PROCESS_PATH);
    REQUIRE(pid.has_value());
    CHECK(*pid == 31);
}

TEST_CASE("locator result always lies under the directory") {
    FakeProcessApi api;
    api.add(1, "C:\\Windows\\explorer.exe");
    api.add(2, "C:\\Apps\\Bar\\bar.exe");
    api.add(3, "C:\\Apps\\Foo\\sub\\deep.exe");

    auto pid = find_in_directory(api, "C:\\Apps\\Foo");
    REQUIRE(pid.has_value());
    auto info = resolve_process(api, *pid);
    REQUIRE(info.has_value());
    CHECK(starts_with_ignore_case(info->path, "C:\\Apps\\Foo"));
}

TEST_CASE("locator treats an enumeration failure as not found") {
    FakeProcessApi api;
    api.add(20, "C:\\Apps\\Foo\\foo.exe");
    api.fail_enumeration();

    CHECK_FALSE(find_in_directory(api, "C:\\Apps\\Foo").has_value());
}

// ============================================================================
// Enumeration capacity
// ============================================================================

TEST_CASE("with exactly capacity processes the last one is considered") {
    FakeProcessApi api;
    for (ProcessId pid = 1; pid < PROCESS_ENUMERATION_CAPACITY; ++pid) {
        api.add(pid, "C:\\Windows\\System32\\svc" + std::to_string(pid) + ".exe");
    }
    api.add(5000, "C:\\Apps\\Foo\\foo-worker.exe");

    auto pid = find_in_directory(api, "C:\\Apps\\Foo");
    REQUIRE(pid.has_value());
    CHECK(*pid == 5000);
}

TEST_CASE("processes past capacity are not considered") {
    FakeProcessApi api;
    for (ProcessId pid = 1; pid <= PROCESS_ENUMERATION_CAPACITY; ++pid) {
        api.add(pid, "C:\\Windows\\System32\\svc" + std::to_string(pid) + ".exe");
    }
    api.add(5000, "C:\\Apps\\Foo\\foo-worker.exe");

    CHECK_FALSE(find_in_directory(api, "C:\\Apps\\Foo").has_value());
}
