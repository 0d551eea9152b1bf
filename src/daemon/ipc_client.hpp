#pragma once

#include <nlohmann/json_fwd.hpp>
#include <string>

class DaemonClient {
public:
    /// Check if the daemon is running (socket exists and responds)
    bool is_daemon_running();

    struct DaemonStatus {
        bool reachable = false;  // daemon answered
        bool healthy = false;
        std::string state = "unknown";
        int consecutive_failures = 0;
        int restart_count = 0;
        int restart_cap = 0;
        bool owns_child = false;
        int child_pid = -1;
        bool external = false;
    };

    /// Supervisor snapshot as seen by the daemon
    DaemonStatus get_status();

    /// Ask the daemon for a live probe; false on error with `err` set
    bool check_health(bool& healthy, std::string& err);

private:
    /// Send a JSON command and receive response
    /// Returns empty json on connection failure
    nlohmann::json send_command(const nlohmann::json& cmd);
};
