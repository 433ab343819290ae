#include "appwatch/platform.hpp"

#include <cstdlib>

namespace appwatch {

Platform get_current_platform() {
#if defined(__APPLE__)
    return Platform::macOS;
#elif defined(_WIN32)
    return Platform::Windows;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

std::optional<std::string> get_env(const std::string& name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t sz = 0;
    if (_dupenv_s(&buf, &sz, name.c_str()) == 0 && buf != nullptr) {
        std::string result(buf);
        free(buf);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val == nullptr) return std::nullopt;
    return std::string(val);
#endif
}

} // namespace appwatch
