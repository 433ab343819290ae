#pragma once

#ifdef _WIN32

#include <windows.h>

#include <string>

namespace appwatch {
namespace win32 {

inline std::wstring widen(const std::string& utf8) {
    if (utf8.empty()) return std::wstring();
    int len = MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()), nullptr, 0);
    if (len <= 0) return std::wstring();
    std::wstring out(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()), &out[0], len);
    return out;
}

inline std::string narrow(const wchar_t* data, size_t size) {
    if (size == 0) return std::string();
    int len = WideCharToMultiByte(CP_UTF8, 0, data, static_cast<int>(size), nullptr, 0, nullptr, nullptr);
    if (len <= 0) return std::string();
    std::string out(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, data, static_cast<int>(size), &out[0], len, nullptr, nullptr);
    return out;
}

// Owns a kernel HANDLE for the lifetime of one query.
class ScopedHandle {
public:
    explicit ScopedHandle(HANDLE h) : handle_(h) {}
    ~ScopedHandle() {
        if (handle_ != nullptr) CloseHandle(handle_);
    }
    ScopedHandle(const ScopedHandle&) = delete;
    ScopedHandle& operator=(const ScopedHandle&) = delete;

    HANDLE get() const { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    HANDLE handle_;
};

} // namespace win32
} // namespace appwatch

#endif // _WIN32
