#include "sidecar/reachability.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

HttpProber::HttpProber(std::string host, int port, std::string health_path,
                       ProbeTimeouts timeouts)
    : host_(std::move(host)),
      port_(port),
      health_path_(std::move(health_path)),
      timeouts_(timeouts) {}

bool HttpProber::transport_reachable() {
    return tcp_connect_probe(host_, port_, timeouts_.transport_ms);
}

bool HttpProber::healthy() {
    BackendClient client(host_, port_, timeouts_);
    return client.check_status(health_path_);
}

bool tcp_connect_probe(const std::string& host, int port, int timeout_ms) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    if (getaddrinfo(host.c_str(), service.c_str(), &hints, &res) != 0 || !res) {
        return false;
    }

    bool connected = false;
    for (auto* ai = res; ai && !connected; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                        ai->ai_protocol);
        if (fd < 0) continue;

        int rc = connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc == 0) {
            connected = true;
        } else if (errno == EINPROGRESS) {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLOUT;
            pfd.revents = 0;

            int ready;
            do {
                ready = poll(&pfd, 1, timeout_ms);
            } while (ready < 0 && errno == EINTR);

            if (ready > 0) {
                int so_error = 0;
                socklen_t len = sizeof(so_error);
                if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 && so_error == 0) {
                    connected = true;
                }
            }
        }
        close(fd);
    }

    freeaddrinfo(res);
    return connected;
}
