#pragma once

#include "sidecar/launcher.hpp"
#include "sidecar/reachability.hpp"
#include "sidecar/shutdown_coordinator.hpp"
#include "sidecar/sleeper.hpp"
#include "sidecar/startup_gate.hpp"
#include "sidecar/supervisor_state.hpp"
#include "sidecar/watchdog.hpp"

#include <chrono>
#include <functional>
#include <memory>

struct AppConfig;

enum class StartOutcome {
    Ready,             // launched and passed the startup gate
    ExternalInstance,  // backend already listening; nothing launched
    NotReady,          // launched but not healthy within the gate
    NotFound,          // no backend on disk; assume externally managed
    LaunchFailed,      // every spawn attempt failed
    Skipped,           // autostart disabled; monitoring only
};

const char* start_outcome_name(StartOutcome outcome);

struct SupervisorOptions {
    bool autostart = true;
    bool watchdog_enabled = true;
    StartupGateOptions startup_gate;
    WatchdogOptions watchdog;
    std::chrono::milliseconds shutdown_grace{5000};
};

SupervisorOptions supervisor_options_from_config(const AppConfig& config);

class Supervisor {
public:
    Supervisor(std::unique_ptr<Prober> prober, std::unique_ptr<Launcher> launcher,
               SupervisorOptions options = {}, Sleeper sleep = default_sleeper());
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    /// Launch (unless already reachable), wait for health, start monitoring.
    /// Blocks the calling thread for up to the startup gate bound.
    StartOutcome start();

    /// Cached health from the last probe; never does I/O
    bool is_healthy() const;

    /// Live probe bounded by the probe timeouts; does not touch watchdog
    /// counters
    bool check_health_now();

    int restart_count() const;
    int restart_cap() const { return options_.watchdog.restart_cap; }
    SupervisorSnapshot snapshot() const;

    /// Stop monitoring and reap the owned backend. Idempotent.
    void shutdown();

    /// Async-signal-safe: cancels a pending start() and stops the watchdog
    /// loop. The owned backend is reaped by the following shutdown().
    void request_stop();

    /// Status notifications; set before start()
    std::function<void(SidecarEvent)> on_event;

    SupervisorState& state() { return state_; }
    Watchdog& watchdog() { return *watchdog_; }

private:
    void emit(SidecarEvent event);

    SupervisorOptions options_;
    Sleeper sleep_;
    SupervisorState state_;
    std::unique_ptr<Prober> prober_;
    std::unique_ptr<Launcher> launcher_;
    std::unique_ptr<Watchdog> watchdog_;
    std::unique_ptr<ShutdownCoordinator> coordinator_;
    bool started_ = false;
};

/// Locator search roots: process cwd plus the configured (or executable) dir
LocatorPaths locator_paths_from_config(const AppConfig& config);

/// Wire the HTTP prober, locator and launcher from configuration
std::unique_ptr<Supervisor> make_supervisor(const AppConfig& config);
