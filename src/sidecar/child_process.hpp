#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

/// Single-owner handle for one spawned process. Not thread-safe on its own;
/// SupervisorState serializes access to the handle it owns.
class ChildProcess {
public:
    struct SpawnResult {
        std::unique_ptr<ChildProcess> child;
        std::string error;  // set when child is null
    };

    /// fork + execvp with stdio on /dev/null and cwd = working_dir.
    /// Succeeds only once exec itself succeeded.
    static SpawnResult spawn(const std::string& program,
                             const std::vector<std::string>& args = {},
                             const std::string& working_dir = "");

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }

    /// Reap if exited; true while the process is still running
    bool is_alive();

    /// SIGTERM to the process group, wait up to grace, then SIGKILL. Returns
    /// true once the leader is reaped; group members still running after that
    /// are killed. Safe to call repeatedly; never waits longer than grace +
    /// kill timeout.
    bool terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(5000));

    bool reaped() const { return reaped_; }

    /// Exit status once reaped (-1 when killed by a signal)
    std::optional<int> exit_code() const { return exit_code_; }

private:
    explicit ChildProcess(pid_t pid) : pid_(pid) {}

    bool wait_for_exit(std::chrono::milliseconds timeout);
    void record_status(int status);
    bool signal_group(int sig);
    void reap_stragglers();

    pid_t pid_ = -1;
    bool reaped_ = false;
    bool abandoned_ = false;
    bool group_cleared_ = false;
    std::optional<int> exit_code_;
};
