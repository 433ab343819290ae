#include "appwatch/platform.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>

#ifdef _WIN32
#include <stdlib.h>
#define popen _popen
#define pclose _pclose
#else
#include <sys/wait.h>
#endif

namespace appwatch {

std::string quote_shell_argument(const std::string& arg) {
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
#ifdef _WIN32
            // PowerShell single-quoted literal: '' is a literal quote
            out += "''";
#else
            out += "'\\''";
#endif
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

ShellResult run_shell_command(const std::string& command) {
    ShellResult result;

    std::string full = command + " 2>&1";
    FILE* pipe = popen(full.c_str(), "r");
    if (pipe == nullptr) {
        result.error = "failed to start shell: " + std::string(std::strerror(errno));
        return result;
    }

    std::array<char, 512> buffer{};
    size_t n = 0;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.output.append(buffer.data(), n);
    }

    int status = pclose(pipe);
    if (status == -1) {
        result.error = "failed to wait for shell: " + std::string(std::strerror(errno));
        return result;
    }

#ifdef _WIN32
    result.exit_code = status;
#else
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
#endif

    spdlog::debug("shell command exited with {}: {}", result.exit_code, command);
    result.ok = result.exit_code == 0;
    return result;
}

} // namespace appwatch
