/**
 * In-memory process table and activation service for core tests
 */

#pragma once

#include <appwatch/platform.hpp>

#include <algorithm>
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace appwatch::testing {

/**
 * Process table with scripted wait results.
 *
 * A pid without scripted waits terminates on its first wait. A terminated
 * process is removed from the table.
 */
class FakeProcessApi : public ProcessApi {
public:
    void add(ProcessId pid, const std::string& path) {
        order_.push_back(pid);
        paths_[pid] = path;
    }

    void add_denied(ProcessId pid) {
        order_.push_back(pid);
        denied_.push_back(pid);
    }

    void add_without_path(ProcessId pid) {
        order_.push_back(pid);
        paths_[pid] = "";
    }

    void remove(ProcessId pid) {
        order_.erase(std::remove(order_.begin(), order_.end(), pid), order_.end());
        paths_.erase(pid);
    }

    void script_wait(ProcessId pid, WaitOutcome outcome) {
        waits_[pid].push_back(outcome);
    }

    void fail_enumeration() { enumeration_fails_ = true; }

    std::optional<std::size_t> enumerate_processes(ProcessId* buffer, std::size_t capacity) override {
        ++enumerations;
        if (enumeration_fails_) return std::nullopt;
        std::size_t n = std::min(capacity, order_.size());
        std::copy(order_.begin(), order_.begin() + static_cast<std::ptrdiff_t>(n), buffer);
        return n;
    }

    ImageQuery query_image_path(ProcessId pid) override {
        ++queries;
        ImageQuery q;
        if (std::find(denied_.begin(), denied_.end(), pid) != denied_.end()) {
            q.status = QueryStatus::AccessDenied;
            return q;
        }
        auto it = paths_.find(pid);
        if (it == paths_.end()) {
            q.status = QueryStatus::OpenFailed;
            return q;
        }
        if (it->second.empty()) {
            q.status = QueryStatus::PathUnavailable;
            return q;
        }
        q.status = QueryStatus::Ok;
        q.path = it->second;
        return q;
    }

    WaitOutcome wait_for_exit(ProcessId pid) override {
        waited.push_back(pid);
        WaitOutcome outcome;

        auto scripted = waits_.find(pid);
        if (scripted != waits_.end() && !scripted->second.empty()) {
            outcome = scripted->second.front();
            scripted->second.pop_front();
        } else if (paths_.count(pid) == 0) {
            outcome.status = WaitStatus::OpenFailed;
            outcome.os_error = 87;
        } else {
            outcome.status = WaitStatus::Terminated;
        }

        if (outcome.status == WaitStatus::Terminated) {
            remove(pid);
        }
        return outcome;
    }

    int enumerations = 0;
    int queries = 0;
    std::vector<ProcessId> waited;

private:
    std::vector<ProcessId> order_;
    std::map<ProcessId, std::string> paths_;
    std::vector<ProcessId> denied_;
    std::map<ProcessId, std::deque<WaitOutcome>> waits_;
    bool enumeration_fails_ = false;
};

inline WaitOutcome wait_result(WaitStatus status, std::uint32_t os_error = 0,
                               std::uint32_t raw_status = 0) {
    WaitOutcome outcome;
    outcome.status = status;
    outcome.os_error = os_error;
    outcome.raw_status = raw_status;
    return outcome;
}

/**
 * Activation service whose two mechanisms succeed or fail on demand.
 */
class FakeActivationService : public ActivationService {
public:
    Result<ProcessId> activate(const std::string& app_id) override {
        activated.push_back(app_id);
        if (activation_pid) {
            return Result<ProcessId>::ok(*activation_pid);
        }
        return Result<ProcessId>::err(Error(ErrorCode::ACTIVATION_FAILED, activation_error));
    }

    Result<void> open_via_shell(const std::string& app_id) override {
        shell_opened.push_back(app_id);
        if (shell_succeeds) {
            return Result<void>::ok();
        }
        return Result<void>::err(Error(ErrorCode::SHELL_LAUNCH_FAILED, shell_error));
    }

    std::optional<ProcessId> activation_pid;
    std::string activation_error = "failed to activate application: 0x80270254";
    bool shell_succeeds = false;
    std::string shell_error = "PowerShell command failed with exit code 1";

    std::vector<std::string> activated;
    std::vector<std::string> shell_opened;
};

} // namespace appwatch::testing
