#include "ui/status_bar.hpp"

#include <ftxui/dom/elements.hpp>

using namespace ftxui;

namespace {

Color state_color(WatchdogState state) {
    switch (state) {
    case WatchdogState::Healthy: return Color::Green;
    case WatchdogState::Degraded:
    case WatchdogState::Restarting: return Color::Yellow;
    case WatchdogState::RestartExhausted: return Color::Red;
    default: return Color::GrayLight;
    }
}

} // namespace

StatusBar::StatusBar() = default;
StatusBar::~StatusBar() = default;

void StatusBar::set_snapshot(const SupervisorSnapshot& snapshot, int restart_cap) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_ = snapshot;
    restart_cap_ = restart_cap;
}

void StatusBar::set_endpoint(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    endpoint_ = endpoint;
}

void StatusBar::set_last_check(const std::string& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_check_ = result;
}

std::string StatusBar::format_restarts(int count, int cap) {
    return "restarts " + std::to_string(count) + "/" + std::to_string(cap);
}

std::string StatusBar::format_owner(const SupervisorSnapshot& snapshot) {
    if (snapshot.owns_child && snapshot.child_pid > 0) {
        return "pid " + std::to_string(snapshot.child_pid);
    }
    if (snapshot.external) return "external";
    return "no process";
}

std::string StatusBar::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return "failures " + std::to_string(snapshot_.consecutive_failures) + "  "
         + format_restarts(snapshot_.restart_count, restart_cap_) + "  "
         + format_owner(snapshot_);
}

Component StatusBar::component() {
    return Renderer([this] {
        SupervisorSnapshot snap;
        std::string endpoint;
        std::string last_check;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snap = snapshot_;
            endpoint = endpoint_;
            last_check = last_check_;
        }

        // Left: watchdog state
        auto state_text = text(" " + std::string(watchdog_state_name(snap.state)) + " ")
                        | bold | color(state_color(snap.state));

        Elements right;
        if (!last_check.empty()) {
            right.push_back(text(" check: " + last_check + " ") | dim);
        }
        right.push_back(text(" " + endpoint + " "));

        return hbox({
            state_text,
            filler(),
            text(summary()),
            filler(),
            hbox(right),
        }) | inverted;
    });
}
