/**
 * Temporary XDG data directories for desktop entry tests
 */

#pragma once

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <string>

namespace appwatch::testing {

inline void safe_setenv(const char* name, const char* value) {
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

inline void safe_unsetenv(const char* name) {
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

// Two fake XDG data dirs, installed through XDG_DATA_HOME / XDG_DATA_DIRS.
class TestXdgEnvironment {
public:
    TestXdgEnvironment() {
        std::srand(static_cast<unsigned>(std::time(nullptr)));
        root = (std::filesystem::temp_directory_path() /
                ("appwatch_xdg_test_" + std::to_string(std::rand()))).string();
        home = root + "/home";
        system = root + "/system";
        std::filesystem::create_directories(home + "/applications");
        std::filesystem::create_directories(system + "/applications");
        safe_setenv("XDG_DATA_HOME", home.c_str());
        safe_setenv("XDG_DATA_DIRS", system.c_str());
    }

    ~TestXdgEnvironment() {
        safe_unsetenv("XDG_DATA_HOME");
        safe_unsetenv("XDG_DATA_DIRS");
        std::filesystem::remove_all(root);
    }

    void write(const std::string& dir, const std::string& file, const std::string& content) {
        std::ofstream out(dir + "/applications/" + file);
        out << content;
    }

    std::string root;
    std::string home;
    std::string system;
};

} // namespace appwatch::testing
