#include "sidecar/supervisor_state.hpp"

#include <spdlog/spdlog.h>

const char* watchdog_state_name(WatchdogState state) {
    switch (state) {
    case WatchdogState::Starting: return "starting";
    case WatchdogState::Healthy: return "healthy";
    case WatchdogState::Degraded: return "degraded";
    case WatchdogState::Restarting: return "restarting";
    case WatchdogState::RestartExhausted: return "restart_exhausted";
    case WatchdogState::Stopped: return "stopped";
    }
    return "unknown";
}

SupervisorState::~SupervisorState() {
    std::lock_guard<std::mutex> lock(child_mutex_);
    terminate_locked(std::chrono::milliseconds(5000));
}

bool SupervisorState::request_stop() {
    bool expected = false;
    return stop_requested_.compare_exchange_strong(expected, true,
                                                   std::memory_order_acq_rel,
                                                   std::memory_order_acquire);
}

bool SupervisorState::stop_requested() const {
    return stop_requested_.load(std::memory_order_acquire);
}

void SupervisorState::set_health(WatchdogState state, int consecutive_failures) {
    std::lock_guard<std::mutex> lock(status_mutex_);
    state_ = state;
    failures_ = consecutive_failures;
}

WatchdogState SupervisorState::health() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return state_;
}

bool SupervisorState::is_healthy() const {
    return health() == WatchdogState::Healthy;
}

int SupervisorState::restart_count() const {
    return restart_count_.load(std::memory_order_acquire);
}

void SupervisorState::set_external(bool external) {
    std::lock_guard<std::mutex> lock(status_mutex_);
    external_ = external;
}

SupervisorSnapshot SupervisorState::snapshot() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    SupervisorSnapshot snap;
    snap.state = state_;
    snap.consecutive_failures = failures_;
    snap.restart_count = restart_count_.load(std::memory_order_acquire);
    snap.stop_requested = stop_requested_.load(std::memory_order_acquire);
    snap.owns_child = child_pid_ > 0;
    snap.child_pid = child_pid_;
    snap.external = external_;
    return snap;
}

void SupervisorState::publish_child_locked() {
    std::lock_guard<std::mutex> lock(status_mutex_);
    child_pid_ = child_ ? child_->pid() : -1;
}

bool SupervisorState::terminate_locked(std::chrono::milliseconds grace) {
    if (!child_) return false;

    pid_t pid = child_->pid();
    if (child_->is_alive()) {
        if (child_->terminate(grace)) {
            spdlog::info("[Supervisor] Stopped backend process (pid {})", pid);
        } else {
            spdlog::error("[Supervisor] Backend process {} could not be reaped", pid);
        }
    } else {
        spdlog::debug("[Supervisor] Backend process {} had already exited", pid);
    }
    child_.reset();
    publish_child_locked();
    return true;
}

void SupervisorState::adopt_child(std::unique_ptr<ChildProcess> child,
                                  std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lock(child_mutex_);
    terminate_locked(grace);
    child_ = std::move(child);
    publish_child_locked();
}

bool SupervisorState::install_restarted_child(std::unique_ptr<ChildProcess> child,
                                              std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lock(child_mutex_);
    if (stop_requested_.load(std::memory_order_acquire)) {
        if (child) {
            spdlog::info("[Supervisor] Shutdown in progress; discarding restarted pid {}",
                         child->pid());
            child->terminate(grace);
        }
        return false;
    }
    terminate_locked(grace);
    child_ = std::move(child);

    std::lock_guard<std::mutex> status_lock(status_mutex_);
    child_pid_ = child_ ? child_->pid() : -1;
    restart_count_.fetch_add(1, std::memory_order_acq_rel);
    return true;
}

bool SupervisorState::terminate_child(std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lock(child_mutex_);
    return terminate_locked(grace);
}

bool SupervisorState::owns_child() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return child_pid_ > 0;
}

pid_t SupervisorState::child_pid() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return child_pid_;
}

bool SupervisorState::child_alive() {
    std::lock_guard<std::mutex> lock(child_mutex_);
    return child_ && child_->is_alive();
}
