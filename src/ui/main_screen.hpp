#pragma once

#include "sidecar/supervisor_state.hpp"

#include <ftxui/component/component.hpp>
#include <string>
#include <functional>
#include <memory>

class MainScreen {
public:
    struct Callbacks {
        std::function<void()> on_health_check;
        std::function<void()> on_quit;
    };

    MainScreen();
    ~MainScreen();

    void set_callbacks(Callbacks cb);
    void set_state(WatchdogState state);
    void set_checking(bool checking);

    // Set the main content component (the event panel)
    void set_content(ftxui::Component content);

    // Set the status bar component
    void set_status_bar(ftxui::Component status_bar);

    ftxui::Component component();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
