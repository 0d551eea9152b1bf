#pragma once

#include "core/config.hpp"
#include "sidecar/supervisor.hpp"

#include <memory>
#include <atomic>
#include <string>

class Daemon {
public:
    /// A null supervisor is built from the configuration
    explicit Daemon(Config& config, std::unique_ptr<Supervisor> supervisor = nullptr);
    ~Daemon();

    /// Main loop; blocks until stop is requested
    int run();

    /// Request graceful stop (called from signal handler). Lock-free; run()
    /// finishes the shutdown.
    void request_stop();

    static std::string socket_path();

    /// Handle one JSON request line and return the JSON response
    std::string handle_command(const std::string& json_line);

private:
    Config& config_;
    std::unique_ptr<Supervisor> supervisor_;
    std::atomic<bool> stop_flag_{false};
    int socket_fd_ = -1;

    // IPC
    bool start_ipc_server();
    void ipc_loop();
    void cleanup_socket();
};
