#include "app.hpp"
#include "core/config.hpp"
#include "sidecar/supervisor.hpp"
#include "ui/main_screen.hpp"
#include "ui/event_panel.hpp"
#include "ui/status_bar.hpp"

#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/component/component.hpp>
#include <ftxui/dom/elements.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <iostream>
#include <thread>

using namespace ftxui;

struct App::Impl {
    Config config;
    std::unique_ptr<Supervisor> supervisor;

    MainScreen main_screen;
    StatusBar status_bar;
    EventPanel event_panel;

    ScreenInteractive screen = ScreenInteractive::FullscreenAlternateScreen();

    // Background threads
    std::atomic<bool> stop_flag{false};
    std::atomic<bool> quit_requested{false};
    std::thread status_thread;
    std::thread health_thread;
    std::atomic<bool> health_running{false};

    std::string event_message(SidecarEvent event) const {
        SupervisorSnapshot snap = supervisor->snapshot();
        switch (event) {
        case SidecarEvent::Healthy:
            return "Backend is healthy";
        case SidecarEvent::Unhealthy:
            return "Backend failed " + std::to_string(snap.consecutive_failures)
                 + " consecutive health checks";
        case SidecarEvent::Restarted:
            return "Backend restarted (" + std::to_string(snap.restart_count) + "/"
                 + std::to_string(supervisor->restart_cap()) + ", pid "
                 + std::to_string(snap.child_pid) + ")";
        case SidecarEvent::RestartExhausted:
            return "Restart limit of " + std::to_string(supervisor->restart_cap())
                 + " reached; restart the backend manually";
        }
        return sidecar_event_name(event);
    }

    void refresh_status() {
        SupervisorSnapshot snap = supervisor->snapshot();
        status_bar.set_snapshot(snap, supervisor->restart_cap());
        main_screen.set_state(snap.state);
    }

    void setup_callbacks() {
        supervisor->on_event = [this](SidecarEvent event) {
            event_panel.push_event(event, event_message(event));
            refresh_status();
            screen.Post(Event::Custom);
        };

        MainScreen::Callbacks cb;
        cb.on_quit = [this]() { screen.Exit(); };
        cb.on_health_check = [this]() { run_health_check(); };
        main_screen.set_callbacks(std::move(cb));
    }

    void run_health_check() {
        if (health_running.exchange(true)) return;  // one at a time
        if (health_thread.joinable()) health_thread.join();

        main_screen.set_checking(true);
        health_thread = std::thread([this]() {
            bool healthy = supervisor->check_health_now();

            EventEntry entry;
            entry.tag = "check";
            entry.severity = healthy ? EventSeverity::Success : EventSeverity::Warning;
            entry.message = healthy ? "Manual health check: healthy"
                                    : "Manual health check: not responding";
            event_panel.push(std::move(entry));
            status_bar.set_last_check(healthy ? "healthy" : "failed");

            main_screen.set_checking(false);
            health_running.store(false);
            screen.Post(Event::Custom);
        });
    }

    void start_status_thread() {
        status_thread = std::thread([this]() {
            bool exit_posted = false;
            while (!stop_flag.load()) {
                if (quit_requested.load() && !exit_posted) {
                    screen.Exit();
                    exit_posted = true;
                }
                refresh_status();
                screen.Post(Event::Custom);

                // Sleep 1 second, checking both flags every 100ms
                for (int i = 0; i < 10 && !stop_flag.load() && !quit_requested.load(); ++i) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                }
            }
        });
    }

    void stop_threads() {
        stop_flag.store(true);
        if (status_thread.joinable()) {
            status_thread.join();
        }
        if (health_thread.joinable()) {
            health_thread.join();
        }
    }
};

App::App() : impl_(std::make_unique<Impl>()) {
    // Load config (use defaults if file doesn't exist)
    impl_->config.load();

    impl_->supervisor = make_supervisor(impl_->config.data());
    impl_->setup_callbacks();

    const auto& d = impl_->config.data();
    impl_->status_bar.set_endpoint(d.backend_host + ":" + std::to_string(d.backend_port));

    impl_->main_screen.set_content(impl_->event_panel.component());
    impl_->main_screen.set_status_bar(impl_->status_bar.component());
}

App::~App() {
    impl_->stop_threads();
    impl_->supervisor->shutdown();
}

void App::request_stop() {
    impl_->quit_requested.store(true);
    impl_->supervisor->request_stop();
}

int App::run() {
    const auto& d = impl_->config.data();
    std::cout << "Starting stocksbot backend on " << d.backend_host << ":" << d.backend_port
              << "..." << std::endl;

    StartOutcome outcome = impl_->supervisor->start();
    switch (outcome) {
    case StartOutcome::Ready:
        std::cout << "Backend ready." << std::endl;
        break;
    case StartOutcome::ExternalInstance:
        std::cout << "Using the backend that is already running." << std::endl;
        break;
    case StartOutcome::NotReady:
        std::cout << "Backend started but is not healthy yet; continuing." << std::endl;
        break;
    case StartOutcome::NotFound:
        std::cout << "Backend not found. Start it manually: cd backend && python app.py"
                  << std::endl;
        break;
    case StartOutcome::LaunchFailed:
        std::cout << "Backend failed to launch; see the log file." << std::endl;
        break;
    case StartOutcome::Skipped:
        std::cout << "Autostart disabled; monitoring only." << std::endl;
        break;
    }

    EventEntry entry;
    entry.tag = "startup";
    entry.severity = (outcome == StartOutcome::Ready || outcome == StartOutcome::ExternalInstance)
        ? EventSeverity::Success
        : EventSeverity::Warning;
    entry.message = std::string("Startup finished: ") + start_outcome_name(outcome);
    impl_->event_panel.push(std::move(entry));

    impl_->refresh_status();
    impl_->start_status_thread();

    // Run the TUI unless a signal already asked us to quit
    if (!impl_->quit_requested.load()) {
        impl_->screen.Loop(impl_->main_screen.component());
    }

    // Cleanup
    impl_->stop_threads();
    std::cout << "Stopping backend..." << std::endl;
    impl_->supervisor->shutdown();
    spdlog::info("[App] Exited cleanly");
    return 0;
}
