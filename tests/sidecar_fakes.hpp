#pragma once

#include "sidecar/child_process.hpp"
#include "sidecar/launcher.hpp"
#include "sidecar/reachability.hpp"
#include "sidecar/sleeper.hpp"

#include <atomic>
#include <cerrno>
#include <signal.h>
#include <deque>
#include <functional>
#include <mutex>

// Prober whose health answers come from a script; falls back to
// `default_health` once the script runs out.
class ScriptedProber : public Prober {
public:
    void push(bool ok, int times = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (int i = 0; i < times; ++i) script_.push_back(ok);
    }

    bool transport_reachable() override {
        ++transport_calls;
        return transport.load();
    }

    bool healthy() override {
        ++health_calls;
        if (on_probe) on_probe();
        std::lock_guard<std::mutex> lock(mutex_);
        if (!script_.empty()) {
            bool ok = script_.front();
            script_.pop_front();
            return ok;
        }
        return default_health.load();
    }

    std::atomic<bool> transport{false};
    std::atomic<bool> default_health{false};
    std::atomic<int> transport_calls{0};
    std::atomic<int> health_calls{0};
    std::function<void()> on_probe;

private:
    std::mutex mutex_;
    std::deque<bool> script_;
};

// Launcher that spawns a harmless long-running process and counts calls.
class CountingLauncher : public Launcher {
public:
    LaunchResult launch() override {
        ++launches;
        if (on_launch) on_launch();

        LaunchResult result;
        result.status = status;
        if (status == LaunchStatus::Launched) {
            auto spawned = ChildProcess::spawn("sleep", {"60"});
            if (!spawned.child) {
                result.status = LaunchStatus::SpawnFailed;
                result.error = spawned.error;
                return result;
            }
            last_pid = spawned.child->pid();
            result.child = std::move(spawned.child);
            result.command = "sleep 60";
        }
        return result;
    }

    LaunchStatus status = LaunchStatus::Launched;
    std::atomic<int> launches{0};
    std::atomic<pid_t> last_pid{-1};
    std::function<void()> on_launch;
};

inline Sleeper immediate_sleeper() {
    return [](std::chrono::milliseconds) {};
}

// True once `pid` has been reaped and no longer exists
inline bool process_gone(pid_t pid) {
    return pid > 0 && ::kill(pid, 0) != 0 && errno == ESRCH;
}
