#include "core/cli.hpp"
#include "core/config.hpp"
#include "api/backend_client.hpp"
#include "daemon/ipc_client.hpp"
#include "sidecar/process_locator.hpp"
#include "sidecar/reachability.hpp"
#include "sidecar/supervisor.hpp"

#include <cstring>
#include <iostream>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) return -1;  // no subcommand → launch TUI

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "status") == 0) {
        return cmd_status();
    }
    if (std::strcmp(cmd, "locate") == 0) {
        return cmd_locate();
    }
    if (std::strcmp(cmd, "probe") == 0) {
        return cmd_probe();
    }
    if (std::strcmp(cmd, "daemon") == 0 || std::strcmp(cmd, "--daemon") == 0) {
        return -2;  // special: caller handles daemon mode
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'stocksbot-shell help' for usage.\n";
    return 1;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "stocksbot-shell: desktop shell supervising the stocksbot backend\n"
        "\n"
        "Usage:\n"
        "  stocksbot-shell             Launch TUI (default)\n"
        "  stocksbot-shell daemon      Supervise the backend headless\n"
        "  stocksbot-shell status      Show daemon and backend status\n"
        "  stocksbot-shell locate      Show which backend would be launched\n"
        "  stocksbot-shell probe       Probe the backend once (exit 0 if healthy)\n"
        "  stocksbot-shell version     Show version\n"
        "  stocksbot-shell help        Show this help\n"
        "\n"
        "Configuration: " << Config::config_path() << "\n"
        "\n"
        "Keyboard shortcuts (TUI mode):\n"
        "  H           Run a health check now\n"
        "  1-4         Filter events (all/success/warning/error)\n"
        "  F           Freeze/unfreeze the event list\n"
        "  X           Export events to a file\n"
        "  Q           Quit (stops the backend this shell started)\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "stocksbot-shell " << APP_VERSION << "\n";
    return 0;
}

// ── status ──────────────────────────────────────────────────

int CLI::cmd_status() {
    Config config;
    config.load();

    DaemonClient dc;
    auto st = dc.get_status();
    std::cout << "Daemon:   " << (st.reachable ? "running" : "stopped") << "\n";

    if (st.reachable) {
        std::cout << "State:    " << st.state << "\n";
        std::cout << "Failures: " << st.consecutive_failures << "\n";
        std::cout << "Restarts: " << st.restart_count << "/" << st.restart_cap << "\n";
        if (st.owns_child) {
            std::cout << "Backend:  owned (pid " << st.child_pid << ")\n";
        } else if (st.external) {
            std::cout << "Backend:  external instance\n";
        }
    }

    // Direct probe, independent of the daemon
    auto& d = config.data();
    BackendClient client(d.backend_host, d.backend_port);
    auto status = client.get_status(d.health_path);
    if (status.reachable && status.http_status == 200) {
        std::cout << "API:      healthy (" << d.backend_host << ":" << d.backend_port << ")\n";
        if (!status.service.empty()) {
            std::cout << "Service:  " << status.service;
            if (!status.version.empty()) std::cout << " " << status.version;
            std::cout << "\n";
        }
    } else if (status.reachable) {
        std::cout << "API:      unhealthy (HTTP " << status.http_status << ")\n";
    } else {
        std::cout << "API:      not reachable\n";
    }

    return 0;
}

// ── locate ──────────────────────────────────────────────────

int CLI::cmd_locate() {
    Config config;
    config.load();

    ProcessLocator locator(locator_paths_from_config(config.data()));
    auto found = locator.find_first();
    if (!found) {
        std::cerr << "No backend found. Searched:\n";
        for (const auto& c : locator.candidates()) {
            std::cerr << "  " << c.path << "\n";
        }
        return 1;
    }

    std::cout << (found->kind == CandidateKind::Binary ? "binary " : "script ")
              << found->path << "\n";
    return 0;
}

// ── probe ───────────────────────────────────────────────────

int CLI::cmd_probe() {
    Config config;
    config.load();
    auto& d = config.data();

    HttpProber prober(d.backend_host, d.backend_port, d.health_path);
    bool transport = prober.transport_reachable();
    std::cout << "Transport: " << (transport ? "reachable" : "unreachable") << "\n";
    if (!transport) return 1;

    bool healthy = prober.healthy();
    std::cout << "Health:    " << (healthy ? "healthy" : "unhealthy") << "\n";
    return healthy ? 0 : 1;
}
