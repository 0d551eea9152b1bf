#pragma once

#include <string>
#include <vector>

struct AppConfig {
    // Backend address
    std::string backend_host = "127.0.0.1";
    int backend_port = 8000;
    std::string health_path = "/status";

    // Sidecar discovery/launch
    bool autostart = true;
    std::string binary_name = "stocksbot-backend";
    std::string script_name = "app.py";
    std::vector<std::string> interpreters = {"python3", "python"};
    std::string resource_dir;  // empty = directory containing the executable

    // Startup gate
    int startup_max_attempts = 60;
    int startup_interval_ms = 500;

    // Watchdog
    bool watchdog_enabled = true;
    int watchdog_initial_grace_ms = 15000;
    int watchdog_interval_ms = 10000;
    int watchdog_poll_tick_ms = 1000;
    int failure_threshold = 3;
    int restart_cap = 5;

    // Shutdown
    int shutdown_grace_ms = 5000;

    // Logging
    std::string log_level = "info";
    std::string log_file;
};

class Config {
public:
    Config();
    ~Config();

    bool load();
    bool save();

    AppConfig& data();
    const AppConfig& data() const;

    static std::string config_dir();
    static std::string config_path();
    static std::string executable_dir();
    static std::string expand_home(const std::string& path);

private:
    AppConfig config_;
};
