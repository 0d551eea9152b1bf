#pragma once

#include "sidecar/child_process.hpp"
#include "sidecar/process_locator.hpp"

#include <memory>
#include <string>
#include <vector>

class Prober;

enum class LaunchStatus {
    Launched,          // child is owned by the caller
    ExternalInstance,  // something already listens on the backend address
    NotFound,          // no candidate on disk
    SpawnFailed,       // every candidate failed to spawn
};

const char* launch_status_name(LaunchStatus status);

struct LaunchResult {
    LaunchStatus status = LaunchStatus::NotFound;
    std::unique_ptr<ChildProcess> child;
    std::string command;  // what was launched, for logs
    std::string error;    // last spawn error
};

class Launcher {
public:
    virtual ~Launcher() = default;
    virtual LaunchResult launch() = 0;
};

class SidecarLauncher : public Launcher {
public:
    SidecarLauncher(ProcessLocator locator, Prober& prober,
                    std::vector<std::string> interpreters = {"python3", "python"});

    LaunchResult launch() override;

    const ProcessLocator& locator() const { return locator_; }

private:
    ProcessLocator locator_;
    Prober& prober_;
    std::vector<std::string> interpreters_;
};
