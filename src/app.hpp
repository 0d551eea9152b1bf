#pragma once

#include <memory>

class App {
public:
    App();
    ~App();

    /// Start the supervisor, run the TUI, then shut the backend down
    int run();

    /// Async-signal-safe quit: cancels a pending start and makes the TUI
    /// loop exit, after which run() shuts the backend down
    void request_stop();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
