#include "daemon/ipc_client.hpp"
#include "daemon/daemon.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cstring>

using json = nlohmann::json;

json DaemonClient::send_command(const json& cmd) {
    std::string path = Daemon::socket_path();
    if (path.empty() || access(path.c_str(), F_OK) != 0) return json();

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) return json();

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(fd);
        return json();
    }

    // A live health probe is bounded well under this
    struct timeval tv;
    tv.tv_sec = 10;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    std::string msg = cmd.dump() + "\n";
    size_t total = 0;
    while (total < msg.size()) {
        ssize_t n = send(fd, msg.data() + total, msg.size() - total, MSG_NOSIGNAL);
        if (n <= 0) {
            close(fd);
            return json();
        }
        total += static_cast<size_t>(n);
    }

    std::string buffer;
    char c;
    while (read(fd, &c, 1) == 1) {
        if (c == '\n') break;
        buffer += c;
        if (buffer.size() > 65536) break;
    }

    close(fd);

    if (buffer.empty()) return json();

    json resp = json::parse(buffer, nullptr, false);
    if (resp.is_discarded()) {
        spdlog::warn("[IPC] Malformed daemon response");
        return json();
    }
    return resp;
}

bool DaemonClient::is_daemon_running() {
    auto resp = send_command({{"cmd", "status"}});
    return !resp.empty() && resp.value("ok", false);
}

DaemonClient::DaemonStatus DaemonClient::get_status() {
    DaemonStatus status;
    auto resp = send_command({{"cmd", "status"}});
    if (resp.empty() || !resp.value("ok", false)) return status;

    auto it = resp.find("data");
    if (it == resp.end() || !it->is_object()) return status;

    const json& data = *it;
    status.reachable = true;
    status.healthy = data.value("healthy", false);
    status.state = data.value("state", "unknown");
    status.consecutive_failures = data.value("consecutive_failures", 0);
    status.restart_count = data.value("restart_count", 0);
    status.restart_cap = data.value("restart_cap", 0);
    status.owns_child = data.value("owns_child", false);
    status.child_pid = data.value("child_pid", -1);
    status.external = data.value("external", false);
    return status;
}

bool DaemonClient::check_health(bool& healthy, std::string& err) {
    auto resp = send_command({{"cmd", "health"}});
    if (resp.empty()) {
        err = "Cannot connect to daemon";
        return false;
    }
    if (!resp.value("ok", false)) {
        err = resp.value("error", "Unknown error");
        return false;
    }
    auto it = resp.find("data");
    healthy = it != resp.end() && it->is_object() && it->value("healthy", false);
    return true;
}
