#pragma once

#include "sidecar/sleeper.hpp"

#include <chrono>
#include <functional>

class Prober;

struct StartupGateOptions {
    int max_attempts = 60;
    std::chrono::milliseconds interval{500};
};

/// Block until the health probe succeeds or max_attempts run out, then make
/// one final check. `cancelled` (optional) aborts early and returns false.
bool wait_until_healthy(Prober& prober,
                        const StartupGateOptions& options,
                        const Sleeper& sleep,
                        const std::function<bool()>& cancelled = {});
