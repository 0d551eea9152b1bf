#pragma once

#include "api/backend_client.hpp"

#include <string>

/// Liveness checks against the backend. Implementations must be safe to call
/// from several threads at once.
class Prober {
public:
    virtual ~Prober() = default;

    /// Something accepts TCP connections on the backend address
    virtual bool transport_reachable() = 0;

    /// The health endpoint answered 200 OK
    virtual bool healthy() = 0;
};

class HttpProber : public Prober {
public:
    HttpProber(std::string host, int port, std::string health_path,
               ProbeTimeouts timeouts = {});

    bool transport_reachable() override;
    bool healthy() override;

    const std::string& host() const { return host_; }
    int port() const { return port_; }

private:
    std::string host_;
    int port_;
    std::string health_path_;
    ProbeTimeouts timeouts_;
};

/// Bounded TCP connect to host:port (IPv4 literal or resolvable name)
bool tcp_connect_probe(const std::string& host, int port, int timeout_ms);
