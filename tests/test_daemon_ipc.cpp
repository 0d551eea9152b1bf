#include <gtest/gtest.h>
#include "daemon/daemon.hpp"
#include "daemon/ipc_client.hpp"
#include "core/config.hpp"
#include "sidecar_fakes.hpp"

#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>
#include <thread>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <cstdlib>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace std::chrono_literals;

class DaemonIPCTest : public ::testing::Test {
protected:
    std::string original_home_;
    std::string original_xdg_;
    std::string temp_dir_;
    ScriptedProber* prober_ = nullptr;

    void SetUp() override {
        const char* home = std::getenv("HOME");
        if (home) original_home_ = home;
        const char* xdg = std::getenv("XDG_CONFIG_HOME");
        if (xdg) original_xdg_ = xdg;

        temp_dir_ = "/tmp/sb_d_" + std::to_string(::getpid());
        fs::create_directories(temp_dir_);
        setenv("HOME", temp_dir_.c_str(), 1);
        unsetenv("XDG_CONFIG_HOME");
    }

    void TearDown() override {
        if (!original_home_.empty()) {
            setenv("HOME", original_home_.c_str(), 1);
        } else {
            unsetenv("HOME");
        }
        if (!original_xdg_.empty()) {
            setenv("XDG_CONFIG_HOME", original_xdg_.c_str(), 1);
        }
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    // Supervisor with no backend on disk and no watchdog thread
    std::unique_ptr<Supervisor> make_supervisor_fake() {
        auto prober = std::make_unique<ScriptedProber>();
        auto launcher = std::make_unique<CountingLauncher>();
        launcher->status = LaunchStatus::NotFound;
        prober_ = prober.get();

        SupervisorOptions opts;
        opts.watchdog_enabled = false;
        opts.watchdog.restart_cap = 5;
        return std::make_unique<Supervisor>(std::move(prober), std::move(launcher), opts,
                                            immediate_sleeper());
    }

    std::string socket_path() {
        return temp_dir_ + "/.config/stocksbot-shell/stocksbot-shell.sock";
    }

    // Ready once a connection is accepted (bind, chmod and listen all done)
    bool wait_for_socket(int timeout_ms = 5000) {
        int waited = 0;
        while (waited < timeout_ms) {
            if (fs::exists(socket_path()) && can_connect()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            waited += 50;
        }
        return false;
    }

    bool can_connect() {
        int fd = socket(AF_UNIX, SOCK_STREAM, 0);
        if (fd < 0) return false;
        struct sockaddr_un addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        std::string path = socket_path();
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
        bool ok = connect(fd, (struct sockaddr*)&addr, sizeof(addr)) == 0;
        close(fd);
        return ok;
    }

    json send_raw(const std::string& line) {
        int fd = socket(AF_UNIX, SOCK_STREAM, 0);
        if (fd < 0) return json();

        struct sockaddr_un addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sun_family = AF_UNIX;
        std::string path = socket_path();
        std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

        if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
            close(fd);
            return json();
        }

        struct timeval tv;
        tv.tv_sec = 5;
        tv.tv_usec = 0;
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        std::string msg = line + "\n";
        if (write(fd, msg.data(), msg.size()) != (ssize_t)msg.size()) {
            close(fd);
            return json();
        }

        std::string buf;
        char c;
        while (read(fd, &c, 1) == 1) {
            if (c == '\n') break;
            buf += c;
        }
        close(fd);

        if (buf.empty()) return json();
        return json::parse(buf, nullptr, false);
    }

    json send_ipc(const json& cmd) { return send_raw(cmd.dump()); }
};

TEST_F(DaemonIPCTest, StatusCommand) {
    Config config;
    Daemon daemon(config, make_supervisor_fake());

    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());

    auto resp = send_ipc({{"cmd", "status"}});
    ASSERT_FALSE(resp.empty());
    EXPECT_TRUE(resp.value("ok", false));
    ASSERT_TRUE(resp.contains("data"));
    const auto& data = resp["data"];
    EXPECT_FALSE(data.value("healthy", true));
    EXPECT_EQ(data.value("state", ""), "starting");
    EXPECT_EQ(data.value("restart_count", -1), 0);
    EXPECT_EQ(data.value("restart_cap", -1), 5);
    EXPECT_FALSE(data.value("owns_child", true));
    EXPECT_EQ(data.value("child_pid", 0), -1);
    EXPECT_FALSE(data.value("external", true));

    daemon.request_stop();
    t.join();
}

TEST_F(DaemonIPCTest, SocketIsOwnerOnly) {
    Config config;
    Daemon daemon(config, make_supervisor_fake());

    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());

    struct stat st;
    ASSERT_EQ(stat(socket_path().c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);

    daemon.request_stop();
    t.join();
    EXPECT_FALSE(fs::exists(socket_path()));
}

TEST_F(DaemonIPCTest, HealthAndRestartCount) {
    Config config;
    Daemon daemon(config, make_supervisor_fake());

    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());

    prober_->push(true);
    auto health = send_ipc({{"cmd", "health"}});
    ASSERT_FALSE(health.empty());
    EXPECT_TRUE(health.value("ok", false));
    EXPECT_TRUE(health["data"].value("healthy", false));

    auto count = send_ipc({{"cmd", "restart_count"}});
    ASSERT_FALSE(count.empty());
    EXPECT_EQ(count["data"].value("restart_count", -1), 0);

    daemon.request_stop();
    t.join();
}

TEST_F(DaemonIPCTest, UnknownCommand) {
    Config config;
    Daemon daemon(config, make_supervisor_fake());

    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());

    auto resp = send_ipc({{"cmd", "nonexistent_cmd"}});
    ASSERT_FALSE(resp.empty());
    EXPECT_FALSE(resp.value("ok", true));
    EXPECT_TRUE(resp.contains("error"));

    daemon.request_stop();
    t.join();
}

TEST_F(DaemonIPCTest, MalformedRequest) {
    Config config;
    Daemon daemon(config, make_supervisor_fake());

    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());

    auto resp = send_raw("{not json");
    ASSERT_FALSE(resp.is_discarded());
    ASSERT_FALSE(resp.empty());
    EXPECT_FALSE(resp.value("ok", true));

    daemon.request_stop();
    t.join();
}

TEST_F(DaemonIPCTest, ClientTalksToDaemon) {
    Config config;
    Daemon daemon(config, make_supervisor_fake());

    DaemonClient client;
    EXPECT_FALSE(client.is_daemon_running());
    EXPECT_FALSE(client.get_status().reachable);

    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());

    EXPECT_TRUE(client.is_daemon_running());
    auto st = client.get_status();
    EXPECT_TRUE(st.reachable);
    EXPECT_EQ(st.state, "starting");
    EXPECT_EQ(st.restart_cap, 5);

    prober_->push(false);
    bool healthy = true;
    std::string err;
    EXPECT_TRUE(client.check_health(healthy, err));
    EXPECT_FALSE(healthy);

    daemon.request_stop();
    t.join();

    EXPECT_FALSE(client.check_health(healthy, err));
    EXPECT_FALSE(err.empty());
}

TEST_F(DaemonIPCTest, HandleCommandDirectly) {
    Config config;
    Daemon daemon(config, make_supervisor_fake());

    auto resp = json::parse(daemon.handle_command(R"({"cmd":"restart_count"})"));
    EXPECT_TRUE(resp.value("ok", false));
    EXPECT_EQ(resp["data"].value("restart_count", -1), 0);

    auto arr = json::parse(daemon.handle_command("[1,2,3]"));
    EXPECT_FALSE(arr.value("ok", true));
}

TEST_F(DaemonIPCTest, ClientHangingUpBeforeReplyIsHarmless) {
    Config config;
    Daemon daemon(config, make_supervisor_fake());
    // Slow live check so the client is gone before the reply is written
    prober_->on_probe = []() { std::this_thread::sleep_for(300ms); };

    std::thread t([&]() { daemon.run(); });
    ASSERT_TRUE(wait_for_socket());

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);
    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::string path = socket_path();
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    ASSERT_EQ(connect(fd, (struct sockaddr*)&addr, sizeof(addr)), 0);
    std::string msg = R"({"cmd":"health"})" "\n";
    ASSERT_EQ(write(fd, msg.data(), msg.size()), (ssize_t)msg.size());
    close(fd);

    std::this_thread::sleep_for(500ms);

    // Still serving
    auto resp = send_ipc({{"cmd", "status"}});
    EXPECT_TRUE(resp.value("ok", false));

    daemon.request_stop();
    t.join();
}

TEST_F(DaemonIPCTest, StopDuringStartupReturnsPromptly) {
    auto prober = std::make_unique<ScriptedProber>();
    auto launcher = std::make_unique<CountingLauncher>();
    CountingLauncher* launcher_ptr = launcher.get();

    SupervisorOptions opts;
    opts.watchdog_enabled = false;
    opts.startup_gate.max_attempts = 1000;
    opts.startup_gate.interval = 10ms;
    opts.shutdown_grace = 1000ms;
    auto sup = std::make_unique<Supervisor>(std::move(prober), std::move(launcher), opts);

    Config config;
    Daemon daemon(config, std::move(sup));

    int ret = -1;
    std::thread t([&]() { ret = daemon.run(); });
    for (int i = 0; i < 400 && launcher_ptr->last_pid.load() <= 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    pid_t pid = launcher_ptr->last_pid.load();
    EXPECT_GT(pid, 0);

    auto begin = std::chrono::steady_clock::now();
    daemon.request_stop();
    t.join();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 2000ms);

    EXPECT_EQ(ret, 0);
    EXPECT_TRUE(process_gone(pid));
    EXPECT_FALSE(fs::exists(socket_path()));
}
