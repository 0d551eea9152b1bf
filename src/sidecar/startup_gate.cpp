#include "sidecar/startup_gate.hpp"
#include "sidecar/reachability.hpp"

#include <spdlog/spdlog.h>

bool wait_until_healthy(Prober& prober,
                        const StartupGateOptions& options,
                        const Sleeper& sleep,
                        const std::function<bool()>& cancelled) {
    auto is_cancelled = [&cancelled]() { return cancelled && cancelled(); };

    for (int attempt = 1; attempt <= options.max_attempts; ++attempt) {
        if (is_cancelled()) {
            spdlog::info("[StartupGate] Cancelled after {} attempts", attempt - 1);
            return false;
        }
        if (prober.healthy()) {
            spdlog::info("[StartupGate] Backend healthy after {} attempt(s)", attempt);
            return true;
        }
        sleep(options.interval);
    }

    if (is_cancelled()) return false;

    bool ok = prober.healthy();
    if (!ok) {
        spdlog::warn("[StartupGate] Backend not healthy after {} attempts",
                     options.max_attempts + 1);
    }
    return ok;
}
