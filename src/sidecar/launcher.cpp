#include "sidecar/launcher.hpp"
#include "sidecar/reachability.hpp"

#include <spdlog/spdlog.h>
#include <filesystem>

namespace fs = std::filesystem;

const char* launch_status_name(LaunchStatus status) {
    switch (status) {
    case LaunchStatus::Launched: return "launched";
    case LaunchStatus::ExternalInstance: return "external_instance";
    case LaunchStatus::NotFound: return "not_found";
    case LaunchStatus::SpawnFailed: return "spawn_failed";
    }
    return "unknown";
}

SidecarLauncher::SidecarLauncher(ProcessLocator locator, Prober& prober,
                                 std::vector<std::string> interpreters)
    : locator_(std::move(locator)), prober_(prober), interpreters_(std::move(interpreters)) {}

LaunchResult SidecarLauncher::launch() {
    LaunchResult result;

    if (prober_.transport_reachable()) {
        spdlog::info("[Launcher] Backend already reachable; skipping sidecar launch");
        result.status = LaunchStatus::ExternalInstance;
        return result;
    }

    auto found = locator_.find_all();
    if (found.empty()) {
        spdlog::warn("[Launcher] Backend sidecar not found (cwd={}, resources={})",
                     locator_.paths().cwd, locator_.paths().resource_dir);
        result.status = LaunchStatus::NotFound;
        return result;
    }

    for (const auto& candidate : found) {
        std::string working_dir = fs::path(candidate.path).parent_path().string();

        if (candidate.kind == CandidateKind::Binary) {
            auto spawned = ChildProcess::spawn(candidate.path, {}, working_dir);
            if (spawned.child) {
                spdlog::info("[Launcher] Launched backend binary {} (pid {})",
                             candidate.path, spawned.child->pid());
                result.status = LaunchStatus::Launched;
                result.child = std::move(spawned.child);
                result.command = candidate.path;
                return result;
            }
            spdlog::warn("[Launcher] Failed to launch {}: {}", candidate.path, spawned.error);
            result.error = spawned.error;
            continue;
        }

        for (const auto& interpreter : interpreters_) {
            auto spawned = ChildProcess::spawn(interpreter, {candidate.path}, working_dir);
            if (spawned.child) {
                spdlog::info("[Launcher] Launched backend using {} {} (pid {})",
                             interpreter, candidate.path, spawned.child->pid());
                result.status = LaunchStatus::Launched;
                result.child = std::move(spawned.child);
                result.command = interpreter + " " + candidate.path;
                return result;
            }
            spdlog::debug("[Launcher] {} {}: {}", interpreter, candidate.path, spawned.error);
            result.error = spawned.error;
        }
    }

    spdlog::error("[Launcher] Failed to launch backend sidecar: {}", result.error);
    result.status = LaunchStatus::SpawnFailed;
    return result;
}
