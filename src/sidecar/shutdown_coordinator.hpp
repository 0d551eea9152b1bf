#pragma once

#include <chrono>
#include <mutex>

class SupervisorState;
class Watchdog;

/// Ordered teardown: stop flag, then child termination, then watchdog join.
class ShutdownCoordinator {
public:
    ShutdownCoordinator(SupervisorState& state, Watchdog* watchdog,
                        std::chrono::milliseconds grace = std::chrono::milliseconds(5000));

    /// Idempotent; a second call or a call with nothing owned is a no-op
    void shutdown();

    /// First step only: raise the stop flag. Lock-free, so it may be called
    /// from a signal handler; shutdown() must still follow.
    void request_stop();

    bool completed() const;

private:
    SupervisorState& state_;
    Watchdog* watchdog_;
    std::chrono::milliseconds grace_;

    mutable std::mutex mutex_;
    bool completed_ = false;
};
