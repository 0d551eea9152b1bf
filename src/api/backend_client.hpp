#pragma once

#include <string>
#include <memory>

struct ProbeTimeouts {
    int connect_ms = 2000;
    int read_ms = 3000;   // connect + read bound a health call to ~5s
    int transport_ms = 350;
};

struct BackendStatus {
    bool reachable = false;
    int http_status = 0;
    std::string status;   // "healthy", "degraded", "unhealthy"
    std::string service;
    std::string version;
    double uptime_seconds = 0.0;
};

class BackendClient {
public:
    BackendClient(const std::string& host, int port, ProbeTimeouts timeouts = {});
    ~BackendClient();

    /// GET <path>; true only for HTTP 200
    bool check_status(const std::string& path = "/status");

    /// GET <path> and parse the health payload (missing fields stay default)
    BackendStatus get_status(const std::string& path = "/status");

    const std::string& host() const;
    int port() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
