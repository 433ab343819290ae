#include "appwatch/platform.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <psapi.h>
#include "win32_strings.hpp"
#elif defined(__linux__)
#include <dirent.h>
#include <fcntl.h>
#include <limits.h>
#include <poll.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace appwatch {

namespace {

// ============================================================================
// Windows: Win32 process handles
// ============================================================================

#ifdef _WIN32

static_assert(sizeof(ProcessId) == sizeof(DWORD), "ProcessId must match DWORD");

// Longest path QueryFullProcessImageNameW can return.
constexpr DWORD MAX_IMAGE_PATH = 32768;

class Win32ProcessApi : public ProcessApi {
public:
    std::optional<std::size_t> enumerate_processes(ProcessId* buffer, std::size_t capacity) override {
        DWORD bytes_returned = 0;
        if (!EnumProcesses(reinterpret_cast<DWORD*>(buffer),
                           static_cast<DWORD>(capacity * sizeof(DWORD)),
                           &bytes_returned)) {
            spdlog::debug("EnumProcesses failed: {}", GetLastError());
            return std::nullopt;
        }
        return static_cast<std::size_t>(bytes_returned / sizeof(DWORD));
    }

    ImageQuery query_image_path(ProcessId pid) override {
        ImageQuery query;

        win32::ScopedHandle process(OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid));
        if (!process) {
            query.status = GetLastError() == ERROR_ACCESS_DENIED ? QueryStatus::AccessDenied
                                                                 : QueryStatus::OpenFailed;
            return query;
        }

        std::wstring image(MAX_IMAGE_PATH, L'\0');
        DWORD size = MAX_IMAGE_PATH;
        if (!QueryFullProcessImageNameW(process.get(), 0, &image[0], &size) || size == 0) {
            query.status = QueryStatus::PathUnavailable;
            return query;
        }

        query.status = QueryStatus::Ok;
        query.path = win32::narrow(image.data(), size);
        return query;
    }

    WaitOutcome wait_for_exit(ProcessId pid) override {
        WaitOutcome outcome;

        // SYNCHRONIZE is the only right needed to wait on termination.
        win32::ScopedHandle process(OpenProcess(SYNCHRONIZE, FALSE, pid));
        if (!process) {
            outcome.status = WaitStatus::OpenFailed;
            outcome.os_error = GetLastError();
            return outcome;
        }

        DWORD wait_result = WaitForSingleObject(process.get(), INFINITE);
        outcome.raw_status = wait_result;
        if (wait_result == WAIT_OBJECT_0) {
            outcome.status = WaitStatus::Terminated;
        } else if (wait_result == WAIT_FAILED) {
            outcome.status = WaitStatus::Failed;
            outcome.os_error = GetLastError();
        } else {
            outcome.status = WaitStatus::Unexpected;
        }
        return outcome;
    }
};

#endif // _WIN32

// ============================================================================
// Linux: /proc and pidfd
// ============================================================================

#if defined(__linux__)

class ScopedFd {
public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() {
        if (fd_ >= 0) close(fd_);
    }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};

struct DirCloser {
    void operator()(DIR* dir) const { closedir(dir); }
};

bool is_digit_string(const char* s) {
    if (*s == '\0') return false;
    for (; *s; ++s) {
        if (*s < '0' || *s > '9') return false;
    }
    return true;
}

class LinuxProcessApi : public ProcessApi {
public:
    std::optional<std::size_t> enumerate_processes(ProcessId* buffer, std::size_t capacity) override {
        std::unique_ptr<DIR, DirCloser> proc(opendir("/proc"));
        if (!proc) {
            spdlog::debug("opendir /proc failed: {}", std::strerror(errno));
            return std::nullopt;
        }

        std::size_t count = 0;
        struct dirent* entry = nullptr;
        while (count < capacity && (entry = readdir(proc.get())) != nullptr) {
            if (!is_digit_string(entry->d_name)) continue;
            buffer[count++] = static_cast<ProcessId>(std::strtoul(entry->d_name, nullptr, 10));
        }
        return count;
    }

    ImageQuery query_image_path(ProcessId pid) override {
        ImageQuery query;

        std::string proc_dir = "/proc/" + std::to_string(pid);
        ScopedFd dir(open(proc_dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
        if (!dir.valid()) {
            query.status = (errno == EACCES || errno == EPERM) ? QueryStatus::AccessDenied
                                                                : QueryStatus::OpenFailed;
            return query;
        }

        char target[PATH_MAX];
        ssize_t n = readlinkat(dir.get(), "exe", target, sizeof(target));
        if (n < 0) {
            // Other users' processes refuse the link; kernel threads have none.
            query.status = (errno == EACCES || errno == EPERM) ? QueryStatus::AccessDenied
                                                                : QueryStatus::PathUnavailable;
            return query;
        }
        if (n == 0 || static_cast<size_t>(n) >= sizeof(target)) {
            query.status = QueryStatus::PathUnavailable;
            return query;
        }

        query.status = QueryStatus::Ok;
        query.path.assign(target, static_cast<size_t>(n));
        return query;
    }

    WaitOutcome wait_for_exit(ProcessId pid) override {
        WaitOutcome outcome;

#ifdef SYS_pidfd_open
        ScopedFd pidfd(static_cast<int>(syscall(SYS_pidfd_open, static_cast<pid_t>(pid), 0)));
        if (!pidfd.valid()) {
            outcome.status = WaitStatus::OpenFailed;
            outcome.os_error = static_cast<std::uint32_t>(errno);
            return outcome;
        }

        // A pidfd becomes readable once the process has exited.
        struct pollfd poll_fd{};
        poll_fd.fd = pidfd.get();
        poll_fd.events = POLLIN;
        int r = poll(&poll_fd, 1, -1);
        if (r < 0) {
            if (errno == EINTR) {
                outcome.status = WaitStatus::Unexpected;
                outcome.raw_status = static_cast<std::uint32_t>(EINTR);
                return outcome;
            }
            outcome.status = WaitStatus::Failed;
            outcome.os_error = static_cast<std::uint32_t>(errno);
            return outcome;
        }

        outcome.raw_status = static_cast<std::uint32_t>(poll_fd.revents);
        if (r == 1 && (poll_fd.revents & POLLIN)) {
            outcome.status = WaitStatus::Terminated;
            // Reap it if we spawned it; otherwise there is nothing to collect.
            if (waitpid(static_cast<pid_t>(pid), nullptr, WNOHANG) < 0 && errno != ECHILD) {
                spdlog::debug("waitpid {} failed: {}", pid, std::strerror(errno));
            }
        } else {
            outcome.status = WaitStatus::Unexpected;
        }
#else
        (void)pid;
        outcome.status = WaitStatus::OpenFailed;
        outcome.os_error = static_cast<std::uint32_t>(ENOSYS);
#endif
        return outcome;
    }
};

#endif // __linux__

// ============================================================================
// Other platforms
// ============================================================================

#if !defined(_WIN32) && !defined(__linux__)

class UnsupportedProcessApi : public ProcessApi {
public:
    std::optional<std::size_t> enumerate_processes(ProcessId*, std::size_t) override {
        return std::nullopt;
    }
    ImageQuery query_image_path(ProcessId) override { return ImageQuery{}; }
    WaitOutcome wait_for_exit(ProcessId) override {
        WaitOutcome outcome;
        outcome.status = WaitStatus::OpenFailed;
        return outcome;
    }
};

#endif

} // namespace

std::unique_ptr<ProcessApi> make_system_process_api() {
#if defined(_WIN32)
    return std::make_unique<Win32ProcessApi>();
#elif defined(__linux__)
    return std::make_unique<LinuxProcessApi>();
#else
    spdlog::warn("process supervision is not supported on this platform");
    return std::make_unique<UnsupportedProcessApi>();
#endif
}

} // namespace appwatch
