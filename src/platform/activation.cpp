#include "appwatch/platform.hpp"
#include "appwatch/desktop_entry.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <objbase.h>
#include <shobjidl.h>
#include <wrl/client.h>
#include "win32_strings.hpp"
#else
#include <spawn.h>
#include <unistd.h>
#if defined(__APPLE__)
#include <crt_externs.h>
#define environ (*_NSGetEnviron())
#else
extern "C" char** environ;
#endif
#endif

namespace appwatch {

namespace {

std::string trim_output(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

Result<void> shell_failure(const std::string& what, const ShellResult& r) {
    if (!r.error.empty()) {
        return Result<void>::err(Error(ErrorCode::SHELL_LAUNCH_FAILED, r.error).withContext(what));
    }
    std::string detail = "exit code " + std::to_string(r.exit_code);
    std::string output = trim_output(r.output);
    if (!output.empty()) {
        detail += ", " + output;
    }
    return Result<void>::err(Error(ErrorCode::SHELL_LAUNCH_FAILED, detail)
                                 .withContext(what + " failed"));
}

// ============================================================================
// Windows: IApplicationActivationManager
// ============================================================================

#ifdef _WIN32

std::string hresult_message(HRESULT hr) {
    char code[16];
    std::snprintf(code, sizeof(code), "0x%08lX", static_cast<unsigned long>(hr));

    char* text = nullptr;
    DWORD len = FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM |
                                   FORMAT_MESSAGE_IGNORE_INSERTS,
                               nullptr, static_cast<DWORD>(hr), 0,
                               reinterpret_cast<LPSTR>(&text), 0, nullptr);
    std::string message = code;
    if (len > 0 && text != nullptr) {
        message += " " + trim_output(std::string(text, len));
    }
    if (text != nullptr) {
        LocalFree(text);
    }
    return message;
}

// COM apartment for the duration of one activation call.
class ComApartment {
public:
    ComApartment() : hr_(CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED)) {
        if (FAILED(hr_)) {
            spdlog::debug("CoInitializeEx failed: {}", hresult_message(hr_));
        }
    }
    ~ComApartment() {
        if (SUCCEEDED(hr_)) CoUninitialize();
    }
    ComApartment(const ComApartment&) = delete;
    ComApartment& operator=(const ComApartment&) = delete;

    bool ok() const { return SUCCEEDED(hr_); }
    HRESULT result() const { return hr_; }

private:
    HRESULT hr_;
};

class Win32ActivationService : public ActivationService {
public:
    Result<ProcessId> activate(const std::string& app_id) override {
        ComApartment com;
        if (!com.ok()) {
            return Result<ProcessId>::err(Error(ErrorCode::ACTIVATION_FAILED,
                hresult_message(com.result())).withContext("failed to initialize COM"));
        }

        // Declared after the apartment so it is released before CoUninitialize.
        Microsoft::WRL::ComPtr<IApplicationActivationManager> manager;
        HRESULT hr = CoCreateInstance(CLSID_ApplicationActivationManager, nullptr,
                                      CLSCTX_INPROC_SERVER, IID_PPV_ARGS(&manager));
        if (FAILED(hr)) {
            return Result<ProcessId>::err(Error(ErrorCode::ACTIVATION_FAILED,
                hresult_message(hr)).withContext("failed to create ApplicationActivationManager"));
        }

        std::wstring aumid = win32::widen(app_id);
        DWORD pid = 0;
        hr = manager->ActivateApplication(aumid.c_str(), nullptr, AO_NONE, &pid);
        if (FAILED(hr)) {
            return Result<ProcessId>::err(Error(ErrorCode::ACTIVATION_FAILED,
                hresult_message(hr)).withContext("failed to activate application"));
        }

        spdlog::debug("activated {} as process {}", app_id, pid);
        return Result<ProcessId>::ok(static_cast<ProcessId>(pid));
    }

    Result<void> open_via_shell(const std::string& app_id) override {
        // The command passes through cmd.exe inside double quotes.
        if (app_id.find('"') != std::string::npos) {
            return Result<void>::err(Error(ErrorCode::SHELL_LAUNCH_FAILED,
                "application id contains a double quote").withContext(app_id));
        }

        std::string script = "Start-Process " + quote_shell_argument("shell:appsFolder\\" + app_id);
        std::string command = "powershell -NoProfile -NonInteractive -Command \"" + script + "\"";

        ShellResult r = run_shell_command(command);
        if (!r.ok) {
            return shell_failure("PowerShell command", r);
        }
        return Result<void>::ok();
    }
};

#else

// ============================================================================
// POSIX: desktop entry Exec line, then gtk-launch
// ============================================================================

class DesktopActivationService : public ActivationService {
public:
    Result<ProcessId> activate(const std::string& app_id) override {
        auto entry = find_desktop_entry(app_id);
        if (!entry) {
            return Result<ProcessId>::err(Error(ErrorCode::NOT_FOUND,
                "no desktop entry named " + normalize_desktop_id(app_id)));
        }

        std::vector<std::string> args = split_exec_line(entry->exec);
        if (args.empty()) {
            return Result<ProcessId>::err(Error(ErrorCode::ACTIVATION_FAILED,
                "desktop entry has no command").withContext(entry->file_path));
        }

        std::vector<char*> argv;
        for (auto& a : args) {
            argv.push_back(const_cast<char*>(a.c_str()));
        }
        argv.push_back(nullptr);

        pid_t pid = 0;
        int r = posix_spawnp(&pid, argv[0], nullptr, nullptr, argv.data(), environ);
        if (r != 0) {
            return Result<ProcessId>::err(Error(ErrorCode::ACTIVATION_FAILED, std::strerror(r))
                                              .withContext("failed to spawn " + args[0]));
        }

        spdlog::debug("spawned {} from {} as process {}", args[0], entry->file_path, pid);
        return Result<ProcessId>::ok(static_cast<ProcessId>(pid));
    }

    Result<void> open_via_shell(const std::string& app_id) override {
        std::string command = "gtk-launch " + quote_shell_argument(normalize_desktop_id(app_id));

        ShellResult r = run_shell_command(command);
        if (!r.ok) {
            return shell_failure("gtk-launch", r);
        }
        return Result<void>::ok();
    }
};

#endif // _WIN32

} // namespace

std::unique_ptr<ActivationService> make_system_activation_service() {
#ifdef _WIN32
    return std::make_unique<Win32ActivationService>();
#else
    return std::make_unique<DesktopActivationService>();
#endif
}

} // namespace appwatch
