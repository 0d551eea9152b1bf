#include "sidecar/watchdog.hpp"
#include "sidecar/launcher.hpp"
#include "sidecar/reachability.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>

const char* sidecar_event_name(SidecarEvent event) {
    switch (event) {
    case SidecarEvent::Healthy: return "healthy";
    case SidecarEvent::Unhealthy: return "unhealthy";
    case SidecarEvent::Restarted: return "restarted";
    case SidecarEvent::RestartExhausted: return "restart_exhausted";
    }
    return "unknown";
}

Watchdog::Watchdog(SupervisorState& state, Prober& prober, Launcher& launcher,
                   WatchdogOptions options, Sleeper sleep)
    : state_(state),
      prober_(prober),
      launcher_(launcher),
      options_(options),
      sleep_(sleep ? std::move(sleep) : default_sleeper()) {}

Watchdog::~Watchdog() {
    if (thread_.joinable()) {
        state_.request_stop();
        thread_.join();
    }
}

void Watchdog::start() {
    if (thread_.joinable()) return;
    running_.store(true);
    thread_ = std::thread([this]() {
        run();
        running_.store(false);
    });
}

void Watchdog::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void Watchdog::emit(SidecarEvent event) {
    if (!on_event) return;
    try {
        on_event(event);
    } catch (const std::exception& e) {
        spdlog::error("[Watchdog] Event handler for '{}' threw: {}", sidecar_event_name(event),
                      e.what());
    }
}

bool Watchdog::sleep_interruptible(std::chrono::milliseconds total) {
    auto step = options_.poll_tick.count() > 0 ? options_.poll_tick : total;
    auto remaining = total;
    while (remaining.count() > 0) {
        if (state_.stop_requested()) return false;
        auto slice = std::min(remaining, step);
        sleep_(slice);
        remaining -= slice;
    }
    return !state_.stop_requested();
}

void Watchdog::run() {
    spdlog::info("[Watchdog] Monitoring started (grace {} ms, interval {} ms, threshold {}, cap {})",
                 options_.initial_grace.count(), options_.interval.count(),
                 options_.failure_threshold, options_.restart_cap);

    if (sleep_interruptible(options_.initial_grace)) {
        while (!state_.stop_requested()) {
            tick();
            if (!sleep_interruptible(options_.interval)) break;
        }
    }

    state_.set_health(WatchdogState::Stopped, failures_);
    spdlog::info("[Watchdog] Monitoring stopped");
}

void Watchdog::tick() {
    if (state_.stop_requested()) {
        state_.set_health(WatchdogState::Stopped, failures_);
        return;
    }

    WatchdogState previous = state_.health();
    bool ok = prober_.healthy();

    // The probe can take seconds; shutdown may have started meanwhile
    if (state_.stop_requested()) {
        state_.set_health(WatchdogState::Stopped, failures_);
        return;
    }

    if (ok) {
        int had_failures = failures_;
        failures_ = 0;
        state_.set_health(WatchdogState::Healthy, 0);
        if (previous != WatchdogState::Healthy) {
            spdlog::info("[Watchdog] Backend healthy (was {}, {} failed probe(s))",
                         watchdog_state_name(previous), had_failures);
            emit(SidecarEvent::Healthy);
        }
        return;
    }

    ++failures_;
    spdlog::warn("[Watchdog] Health check failed ({}/{})", failures_, options_.failure_threshold);

    if (failures_ < options_.failure_threshold) {
        state_.set_health(WatchdogState::Degraded, failures_);
        return;
    }

    bool exhausted = state_.restart_count() >= options_.restart_cap;
    state_.set_health(exhausted ? WatchdogState::RestartExhausted : WatchdogState::Degraded,
                      failures_);

    if (failures_ == options_.failure_threshold) {
        spdlog::warn("[Watchdog] Backend unhealthy after {} consecutive failures", failures_);
        emit(SidecarEvent::Unhealthy);
    }

    if (exhausted) {
        if (!exhausted_reported_) {
            exhausted_reported_ = true;
            spdlog::error("[Watchdog] Restart limit reached ({}); automatic recovery disabled "
                          "for this session", options_.restart_cap);
            emit(SidecarEvent::RestartExhausted);
        }
        return;
    }

    attempt_restart();
}

void Watchdog::attempt_restart() {
    state_.set_health(WatchdogState::Restarting, failures_);
    spdlog::warn("[Watchdog] Restarting backend (attempt {}/{})", state_.restart_count() + 1,
                 options_.restart_cap);

    state_.terminate_child(options_.terminate_grace);
    if (state_.stop_requested()) {
        state_.set_health(WatchdogState::Stopped, failures_);
        return;
    }

    LaunchResult result = launcher_.launch();
    if (result.status != LaunchStatus::Launched || !result.child) {
        spdlog::error("[Watchdog] Restart did not launch a backend ({}){}{}",
                      launch_status_name(result.status),
                      result.error.empty() ? "" : ": ", result.error);
        state_.set_health(WatchdogState::Degraded, failures_);
        return;
    }

    if (!state_.install_restarted_child(std::move(result.child), options_.terminate_grace)) {
        state_.set_health(WatchdogState::Stopped, failures_);
        return;
    }

    spdlog::info("[Watchdog] Backend restarted via {} (restart {}/{})", result.command,
                 state_.restart_count(), options_.restart_cap);
    emit(SidecarEvent::Restarted);

    bool ok = wait_until_healthy(prober_, options_.startup_gate, sleep_,
                                 [this]() { return state_.stop_requested(); });
    if (state_.stop_requested()) {
        state_.set_health(WatchdogState::Stopped, failures_);
        return;
    }

    if (ok) {
        failures_ = 0;
        state_.set_health(WatchdogState::Healthy, 0);
        emit(SidecarEvent::Healthy);
    } else {
        // Throttle: next attempt waits for the next failing tick
        spdlog::warn("[Watchdog] Restarted backend did not become healthy; retrying on next tick");
        state_.set_health(WatchdogState::Degraded, failures_);
    }
}
