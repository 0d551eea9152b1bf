#pragma once

#include "sidecar/supervisor_state.hpp"

#include <ftxui/component/component.hpp>
#include <string>
#include <mutex>

class StatusBar {
public:
    StatusBar();
    ~StatusBar();

    ftxui::Component component();

    // Thread-safe setters for background updates
    void set_snapshot(const SupervisorSnapshot& snapshot, int restart_cap);
    void set_endpoint(const std::string& endpoint);
    void set_last_check(const std::string& result);

    /// Center text: failures, restarts/cap and owned pid
    std::string summary() const;

    static std::string format_restarts(int count, int cap);
    static std::string format_owner(const SupervisorSnapshot& snapshot);

private:
    mutable std::mutex mutex_;
    SupervisorSnapshot snapshot_;
    int restart_cap_ = 0;
    std::string endpoint_;
    std::string last_check_;
};
