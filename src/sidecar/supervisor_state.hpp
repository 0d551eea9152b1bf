#pragma once

#include "sidecar/child_process.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <sys/types.h>

enum class WatchdogState {
    Starting,          // health not yet classified
    Healthy,
    Degraded,          // consecutive_failures > 0
    Restarting,
    RestartExhausted,  // cap reached: monitoring only
    Stopped,
};

const char* watchdog_state_name(WatchdogState state);

struct SupervisorSnapshot {
    WatchdogState state = WatchdogState::Starting;
    int consecutive_failures = 0;
    int restart_count = 0;
    bool stop_requested = false;
    bool owns_child = false;
    pid_t child_pid = -1;
    bool external = false;
};

/// The one record shared by the setup thread, the watchdog thread and
/// query callers.
///
/// Locking discipline:
///   - child_mutex_ guards the owned ChildProcess. Verify-then-kill and
///     replace happen in one critical section under it, so a handle is never
///     killed twice or dropped while alive.
///   - status_mutex_ guards the published record (state, failures, owned
///     pid, external flag) and is only held for copies. Queries take only
///     this lock and never wait behind a process termination.
///   - Lock order is child_mutex_ then status_mutex_; never the reverse.
///   - stop_requested_ is an independent atomic (release store, acquire
///     load). Shutdown sets it before taking child_mutex_, so a restart
///     installed after that point sees it under the lock and is torn down.
///   - restart_count_ is atomic; it is bumped under both locks together with
///     the new pid so a snapshot never mixes old pid and new count.
class SupervisorState {
public:
    SupervisorState() = default;
    ~SupervisorState();

    SupervisorState(const SupervisorState&) = delete;
    SupervisorState& operator=(const SupervisorState&) = delete;

    // ── Stop signal ─────────────────────────────────────────
    /// Returns true only for the call that flipped the flag
    bool request_stop();
    bool stop_requested() const;

    // ── Health record ───────────────────────────────────────
    void set_health(WatchdogState state, int consecutive_failures);
    WatchdogState health() const;
    bool is_healthy() const;
    int restart_count() const;

    void set_external(bool external);

    SupervisorSnapshot snapshot() const;

    // ── Child ownership ─────────────────────────────────────
    /// Take ownership of the initially launched child
    void adopt_child(std::unique_ptr<ChildProcess> child,
                     std::chrono::milliseconds grace = std::chrono::milliseconds(5000));

    /// Install a child launched by an auto-restart and count it. If stop was
    /// requested the new child is terminated instead and false is returned.
    bool install_restarted_child(std::unique_ptr<ChildProcess> child,
                                 std::chrono::milliseconds grace = std::chrono::milliseconds(5000));

    /// Verify-then-kill the owned child. True if a child was owned.
    bool terminate_child(std::chrono::milliseconds grace = std::chrono::milliseconds(5000));

    bool owns_child() const;
    pid_t child_pid() const;

    /// Owned child is still running (reaps it if it has exited)
    bool child_alive();

private:
    // Caller holds child_mutex_
    bool terminate_locked(std::chrono::milliseconds grace);
    void publish_child_locked();

    mutable std::mutex child_mutex_;
    std::unique_ptr<ChildProcess> child_;

    mutable std::mutex status_mutex_;
    WatchdogState state_ = WatchdogState::Starting;
    int failures_ = 0;
    pid_t child_pid_ = -1;
    bool external_ = false;

    std::atomic<bool> stop_requested_{false};
    std::atomic<int> restart_count_{0};
};
