#include "sidecar/shutdown_coordinator.hpp"
#include "sidecar/supervisor_state.hpp"
#include "sidecar/watchdog.hpp"

#include <spdlog/spdlog.h>

ShutdownCoordinator::ShutdownCoordinator(SupervisorState& state, Watchdog* watchdog,
                                         std::chrono::milliseconds grace)
    : state_(state), watchdog_(watchdog), grace_(grace) {}

void ShutdownCoordinator::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (completed_) return;

    // Must be visible to the watchdog before the child is touched
    state_.request_stop();

    if (state_.terminate_child(grace_)) {
        spdlog::info("[Shutdown] Backend sidecar terminated");
    } else {
        spdlog::debug("[Shutdown] No owned backend process");
    }

    if (watchdog_) {
        watchdog_->join();
    }

    state_.set_health(WatchdogState::Stopped, 0);
    completed_ = true;
}

void ShutdownCoordinator::request_stop() {
    state_.request_stop();
}

bool ShutdownCoordinator::completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return completed_;
}
