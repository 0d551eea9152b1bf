#include "api/backend_client.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

struct BackendClient::Impl {
    std::string host;
    int port;
    ProbeTimeouts timeouts;

    std::unique_ptr<httplib::Client> make_client() {
        auto cli = std::make_unique<httplib::Client>(host, port);
        cli->set_connection_timeout(std::chrono::milliseconds(timeouts.connect_ms));
        cli->set_read_timeout(std::chrono::milliseconds(timeouts.read_ms));
        cli->set_write_timeout(std::chrono::milliseconds(timeouts.read_ms));
        cli->set_keep_alive(false);
        return cli;
    }
};

BackendClient::BackendClient(const std::string& host, int port, ProbeTimeouts timeouts)
    : impl_(std::make_unique<Impl>()) {
    impl_->host = host;
    impl_->port = port;
    impl_->timeouts = timeouts;
}

BackendClient::~BackendClient() = default;

const std::string& BackendClient::host() const { return impl_->host; }
int BackendClient::port() const { return impl_->port; }

// ── Health ──────────────────────────────────────────────────

bool BackendClient::check_status(const std::string& path) {
    try {
        auto cli = impl_->make_client();
        auto res = cli->Get(path);
        return res && res->status == 200;
    } catch (const std::exception& e) {
        spdlog::debug("[Backend] Health request failed: {}", e.what());
        return false;
    }
}

BackendStatus BackendClient::get_status(const std::string& path) {
    BackendStatus st;
    try {
        auto cli = impl_->make_client();
        auto res = cli->Get(path);
        if (!res) return st;

        st.reachable = true;
        st.http_status = res->status;
        if (res->status != 200) return st;

        auto j = json::parse(res->body, nullptr, false);
        if (!j.is_object()) return st;
        st.status = j.value("status", "");
        st.service = j.value("service", "");
        st.version = j.value("version", "");
        if (j.contains("uptime_seconds") && j["uptime_seconds"].is_number()) {
            st.uptime_seconds = j["uptime_seconds"].get<double>();
        }
    } catch (const std::exception& e) {
        spdlog::debug("[Backend] Status request failed: {}", e.what());
    }
    return st;
}
