#include "sidecar/supervisor.hpp"
#include "core/config.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

const char* start_outcome_name(StartOutcome outcome) {
    switch (outcome) {
    case StartOutcome::Ready: return "ready";
    case StartOutcome::ExternalInstance: return "external_instance";
    case StartOutcome::NotReady: return "not_ready";
    case StartOutcome::NotFound: return "not_found";
    case StartOutcome::LaunchFailed: return "launch_failed";
    case StartOutcome::Skipped: return "skipped";
    }
    return "unknown";
}

SupervisorOptions supervisor_options_from_config(const AppConfig& config) {
    using std::chrono::milliseconds;

    SupervisorOptions opts;
    opts.autostart = config.autostart;
    opts.watchdog_enabled = config.watchdog_enabled;
    opts.startup_gate.max_attempts = std::max(0, config.startup_max_attempts);
    opts.startup_gate.interval = milliseconds(std::max(1, config.startup_interval_ms));
    opts.shutdown_grace = milliseconds(std::max(0, config.shutdown_grace_ms));

    // A zero interval would probe in a tight loop
    opts.watchdog.poll_tick = milliseconds(std::max(1, config.watchdog_poll_tick_ms));
    opts.watchdog.initial_grace = milliseconds(std::max(0, config.watchdog_initial_grace_ms));
    opts.watchdog.interval = std::max(milliseconds(config.watchdog_interval_ms),
                                      opts.watchdog.poll_tick);
    opts.watchdog.failure_threshold = std::max(1, config.failure_threshold);
    opts.watchdog.restart_cap = std::max(0, config.restart_cap);
    opts.watchdog.terminate_grace = opts.shutdown_grace;
    opts.watchdog.startup_gate = opts.startup_gate;
    return opts;
}

Supervisor::Supervisor(std::unique_ptr<Prober> prober, std::unique_ptr<Launcher> launcher,
                       SupervisorOptions options, Sleeper sleep)
    : options_(options),
      sleep_(sleep ? std::move(sleep) : default_sleeper()),
      prober_(std::move(prober)),
      launcher_(std::move(launcher)) {
    watchdog_ = std::make_unique<Watchdog>(state_, *prober_, *launcher_, options_.watchdog, sleep_);
    watchdog_->on_event = [this](SidecarEvent event) { emit(event); };
    coordinator_ = std::make_unique<ShutdownCoordinator>(state_, watchdog_.get(),
                                                         options_.shutdown_grace);
}

Supervisor::~Supervisor() {
    shutdown();
}

void Supervisor::emit(SidecarEvent event) {
    if (!on_event) return;
    try {
        on_event(event);
    } catch (const std::exception& e) {
        spdlog::error("[Supervisor] Event handler for '{}' threw: {}",
                      sidecar_event_name(event), e.what());
    }
}

StartOutcome Supervisor::start() {
    if (started_) {
        spdlog::warn("[Supervisor] start() called twice; ignoring");
        return StartOutcome::Skipped;
    }
    started_ = true;

    if (state_.stop_requested()) {
        spdlog::info("[Supervisor] Stop requested before start; not launching");
        return StartOutcome::Skipped;
    }

    StartOutcome outcome = StartOutcome::Skipped;

    if (options_.autostart) {
        LaunchResult result = launcher_->launch();
        switch (result.status) {
        case LaunchStatus::ExternalInstance:
            state_.set_external(true);
            outcome = StartOutcome::ExternalInstance;
            break;
        case LaunchStatus::NotFound:
            spdlog::warn("[Supervisor] Backend not found; if it is not running, start it "
                         "manually: cd backend && python app.py");
            outcome = StartOutcome::NotFound;
            break;
        case LaunchStatus::SpawnFailed:
            outcome = StartOutcome::LaunchFailed;
            break;
        case LaunchStatus::Launched:
            state_.adopt_child(std::move(result.child), options_.shutdown_grace);
            spdlog::info("[Supervisor] Waiting for backend health (up to {} attempts)",
                         options_.startup_gate.max_attempts);
            outcome = wait_until_healthy(*prober_, options_.startup_gate, sleep_,
                                         [this]() { return state_.stop_requested(); })
                          ? StartOutcome::Ready
                          : StartOutcome::NotReady;
            break;
        }
    } else {
        spdlog::info("[Supervisor] Autostart disabled; monitoring only");
    }

    bool healthy = outcome == StartOutcome::Ready;
    if (outcome == StartOutcome::ExternalInstance || outcome == StartOutcome::Skipped) {
        healthy = prober_->healthy();
    }

    if (healthy) {
        state_.set_health(WatchdogState::Healthy, 0);
        emit(SidecarEvent::Healthy);
    } else {
        state_.set_health(WatchdogState::Starting, 0);
    }

    spdlog::info("[Supervisor] Startup finished: {} (healthy={})", start_outcome_name(outcome),
                 healthy);

    if (options_.watchdog_enabled && !state_.stop_requested()) {
        watchdog_->start();
    }
    return outcome;
}

bool Supervisor::is_healthy() const {
    return state_.is_healthy();
}

bool Supervisor::check_health_now() {
    return prober_->healthy();
}

int Supervisor::restart_count() const {
    return state_.restart_count();
}

SupervisorSnapshot Supervisor::snapshot() const {
    return state_.snapshot();
}

void Supervisor::shutdown() {
    coordinator_->shutdown();
}

void Supervisor::request_stop() {
    coordinator_->request_stop();
}

LocatorPaths locator_paths_from_config(const AppConfig& config) {
    LocatorPaths paths;
    std::error_code ec;
    paths.cwd = fs::current_path(ec).string();
    paths.resource_dir = config.resource_dir.empty()
        ? Config::executable_dir()
        : Config::expand_home(config.resource_dir);
    paths.binary_name = config.binary_name;
    paths.script_name = config.script_name;
    return paths;
}

std::unique_ptr<Supervisor> make_supervisor(const AppConfig& config) {
    auto prober = std::make_unique<HttpProber>(config.backend_host, config.backend_port,
                                               config.health_path);
    auto launcher = std::make_unique<SidecarLauncher>(
        ProcessLocator(locator_paths_from_config(config)), *prober, config.interpreters);

    return std::make_unique<Supervisor>(std::move(prober), std::move(launcher),
                                        supervisor_options_from_config(config));
}
