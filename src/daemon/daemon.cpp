#include "daemon/daemon.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/stat.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;
using json = nlohmann::json;

Daemon::Daemon(Config& config, std::unique_ptr<Supervisor> supervisor)
    : config_(config), supervisor_(std::move(supervisor)) {
    if (!supervisor_) {
        supervisor_ = make_supervisor(config_.data());
    }
}

Daemon::~Daemon() {
    request_stop();
    supervisor_->shutdown();
    cleanup_socket();
}

std::string Daemon::socket_path() {
    std::string dir = Config::config_dir();
    if (dir.empty()) return "";
    return dir + "/stocksbot-shell.sock";
}

void Daemon::cleanup_socket() {
    if (socket_fd_ >= 0) {
        close(socket_fd_);
        socket_fd_ = -1;
        std::string path = socket_path();
        if (!path.empty()) {
            unlink(path.c_str());
        }
    }
}

bool Daemon::start_ipc_server() {
    std::string path = socket_path();
    if (path.empty()) {
        spdlog::error("[Daemon] Cannot resolve socket path (HOME unset)");
        return false;
    }

    // Clean up any stale socket
    unlink(path.c_str());

    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        spdlog::error("[Daemon] Cannot create {}: {}", fs::path(path).parent_path().string(),
                      ec.message());
        return false;
    }

    socket_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (socket_fd_ < 0) {
        spdlog::error("[Daemon] socket() failed: {}", std::strerror(errno));
        return false;
    }

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(socket_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        spdlog::error("[Daemon] bind({}) failed: {}", path, std::strerror(errno));
        close(socket_fd_);
        socket_fd_ = -1;
        return false;
    }

    // Restrict permissions to owner only
    chmod(path.c_str(), 0600);

    if (listen(socket_fd_, 5) < 0) {
        spdlog::error("[Daemon] listen() failed: {}", std::strerror(errno));
        close(socket_fd_);
        socket_fd_ = -1;
        unlink(path.c_str());
        return false;
    }

    spdlog::info("[Daemon] IPC listening on {}", path);
    return true;
}

void Daemon::ipc_loop() {
    struct pollfd pfd;
    pfd.fd = socket_fd_;
    pfd.events = POLLIN;

    while (!stop_flag_.load()) {
        int ret = poll(&pfd, 1, 500);
        if (ret <= 0) continue;

        if (pfd.revents & POLLIN) {
            int client_fd = accept(socket_fd_, nullptr, nullptr);
            if (client_fd < 0) continue;

            struct timeval tv;
            tv.tv_sec = 5;
            tv.tv_usec = 0;
            setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

            // Read a single JSON line
            std::string buffer;
            char c;
            while (read(client_fd, &c, 1) == 1) {
                if (c == '\n') break;
                buffer += c;
                if (buffer.size() > 65536) break;
            }

            if (!buffer.empty()) {
                std::string response = handle_command(buffer);
                response += "\n";
                size_t total = 0;
                while (total < response.size()) {
                    // A client that hung up must not raise SIGPIPE here
                    ssize_t n = send(client_fd, response.data() + total,
                                     response.size() - total, MSG_NOSIGNAL);
                    if (n <= 0) {
                        spdlog::debug("[Daemon] Client went away mid-response");
                        break;
                    }
                    total += static_cast<size_t>(n);
                }
            }

            close(client_fd);
        }
    }
}

std::string Daemon::handle_command(const std::string& json_line) {
    json req = json::parse(json_line, nullptr, false);
    if (req.is_discarded() || !req.is_object()) {
        return json({{"ok", false}, {"error", "Parse error: expected a JSON object"}}).dump();
    }

    std::string cmd = req.value("cmd", "");

    if (cmd == "status") {
        SupervisorSnapshot snap = supervisor_->snapshot();
        json data;
        data["healthy"] = snap.state == WatchdogState::Healthy;
        data["state"] = watchdog_state_name(snap.state);
        data["consecutive_failures"] = snap.consecutive_failures;
        data["restart_count"] = snap.restart_count;
        data["restart_cap"] = supervisor_->restart_cap();
        data["owns_child"] = snap.owns_child;
        data["child_pid"] = snap.child_pid;
        data["external"] = snap.external;
        return json({{"ok", true}, {"data", data}}).dump();
    }

    if (cmd == "health") {
        bool healthy = supervisor_->check_health_now();
        return json({{"ok", true}, {"data", {{"healthy", healthy}}}}).dump();
    }

    if (cmd == "restart_count") {
        return json({{"ok", true}, {"data", {{"restart_count", supervisor_->restart_count()}}}})
            .dump();
    }

    return json({{"ok", false}, {"error", "Unknown command: " + cmd}}).dump();
}

void Daemon::request_stop() {
    stop_flag_.store(true);
    // Also cancels a start() still waiting in the startup gate
    supervisor_->request_stop();
}

int Daemon::run() {
    if (!start_ipc_server()) {
        return 1;
    }

    supervisor_->on_event = [](SidecarEvent event) {
        if (event == SidecarEvent::RestartExhausted) {
            spdlog::error("[Daemon] Backend event: {}", sidecar_event_name(event));
        } else {
            spdlog::info("[Daemon] Backend event: {}", sidecar_event_name(event));
        }
    };

    StartOutcome outcome = supervisor_->start();
    spdlog::info("[Daemon] Supervisor started ({})", start_outcome_name(outcome));

    ipc_loop();

    spdlog::info("[Daemon] Stopping");
    stop_flag_.store(true);
    supervisor_->shutdown();
    cleanup_socket();

    return 0;
}
