#pragma once

#include "sidecar/sleeper.hpp"
#include "sidecar/startup_gate.hpp"
#include "sidecar/supervisor_state.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

class Prober;
class Launcher;

/// Outbound status notifications
enum class SidecarEvent {
    Healthy,           // "healthy": became or recovered to healthy
    Unhealthy,         // "unhealthy": failure threshold reached
    Restarted,         // "restarted": auto-restart launched a new process
    RestartExhausted,  // "restart_exhausted": cap reached, auto-recovery off
};

const char* sidecar_event_name(SidecarEvent event);

struct WatchdogOptions {
    std::chrono::milliseconds initial_grace{15000};
    std::chrono::milliseconds interval{10000};
    std::chrono::milliseconds poll_tick{1000};
    int failure_threshold = 3;
    int restart_cap = 5;
    std::chrono::milliseconds terminate_grace{5000};
    StartupGateOptions startup_gate;
};

class Watchdog {
public:
    Watchdog(SupervisorState& state, Prober& prober, Launcher& launcher,
             WatchdogOptions options = {}, Sleeper sleep = default_sleeper());
    ~Watchdog();

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    /// Run the monitoring loop on a background thread
    void start();

    /// Wait for the loop to exit (after stop was requested on the state)
    void join();

    bool running() const { return running_.load(); }

    /// Monitoring loop: grace period, then tick/sleep until stop
    void run();

    /// One probe and the resulting transitions
    void tick();

    int consecutive_failures() const { return failures_; }
    const WatchdogOptions& options() const { return options_; }

    /// Invoked on the watchdog thread for every status notification
    std::function<void(SidecarEvent)> on_event;

private:
    /// Sleep in poll_tick slices; false as soon as stop is observed
    bool sleep_interruptible(std::chrono::milliseconds total);
    void attempt_restart();
    void emit(SidecarEvent event);

    SupervisorState& state_;
    Prober& prober_;
    Launcher& launcher_;
    WatchdogOptions options_;
    Sleeper sleep_;

    // Owned by the watchdog thread; published through state_
    int failures_ = 0;
    bool exhausted_reported_ = false;

    std::atomic<bool> running_{false};
    std::thread thread_;
};
