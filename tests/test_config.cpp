#include <gtest/gtest.h>
#include "core/config.hpp"

#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string original_home;
    std::string original_xdg;
    bool had_home = false;
    bool had_xdg = false;

    void SetUp() override {
        // Create a temp directory for test config
        test_dir = fs::temp_directory_path() / ("stocksbot-test-config-" + std::to_string(::getpid()));
        fs::create_directories(test_dir);

        // Save and override HOME; XDG_CONFIG_HOME would win over it
        const char* home = std::getenv("HOME");
        if (home) {
            had_home = true;
            original_home = home;
        }
        const char* xdg = std::getenv("XDG_CONFIG_HOME");
        if (xdg) {
            had_xdg = true;
            original_xdg = xdg;
        }
        setenv("HOME", test_dir.c_str(), 1);
        unsetenv("XDG_CONFIG_HOME");
    }

    void TearDown() override {
        if (had_home) {
            setenv("HOME", original_home.c_str(), 1);
        }
        if (had_xdg) {
            setenv("XDG_CONFIG_HOME", original_xdg.c_str(), 1);
        }
        std::error_code ec;
        fs::remove_all(test_dir, ec);
    }

    void write_config(const std::string& yaml) {
        fs::create_directories(Config::config_dir());
        std::ofstream out(Config::config_path());
        out << yaml;
    }
};

TEST_F(ConfigTest, DefaultValues) {
    Config cfg;
    const auto& d = cfg.data();
    EXPECT_EQ(d.backend_host, "127.0.0.1");
    EXPECT_EQ(d.backend_port, 8000);
    EXPECT_EQ(d.health_path, "/status");
    EXPECT_TRUE(d.autostart);
    EXPECT_EQ(d.binary_name, "stocksbot-backend");
    EXPECT_EQ(d.script_name, "app.py");
    ASSERT_EQ(d.interpreters.size(), 2u);
    EXPECT_EQ(d.interpreters[0], "python3");
    EXPECT_EQ(d.startup_max_attempts, 60);
    EXPECT_EQ(d.startup_interval_ms, 500);
    EXPECT_TRUE(d.watchdog_enabled);
    EXPECT_EQ(d.watchdog_initial_grace_ms, 15000);
    EXPECT_EQ(d.watchdog_interval_ms, 10000);
    EXPECT_EQ(d.failure_threshold, 3);
    EXPECT_EQ(d.restart_cap, 5);
    EXPECT_EQ(d.shutdown_grace_ms, 5000);
    EXPECT_EQ(d.log_level, "info");
}

TEST_F(ConfigTest, ConfigDirPath) {
    std::string dir = Config::config_dir();
    EXPECT_EQ(dir, test_dir + "/.config/stocksbot-shell");
    EXPECT_EQ(Config::config_path(), dir + "/config.yaml");
}

TEST_F(ConfigTest, XdgConfigHomeWins) {
    setenv("XDG_CONFIG_HOME", (test_dir + "/xdg").c_str(), 1);
    EXPECT_EQ(Config::config_dir(), test_dir + "/xdg/stocksbot-shell");
    unsetenv("XDG_CONFIG_HOME");
}

TEST_F(ConfigTest, LoadMissingFileKeepsDefaults) {
    Config cfg;
    EXPECT_FALSE(cfg.load());
    EXPECT_EQ(cfg.data().backend_port, 8000);
}

TEST_F(ConfigTest, SaveAndLoad) {
    {
        Config cfg;
        cfg.data().backend_port = 8123;
        cfg.data().health_path = "/healthz";
        cfg.data().interpreters = {"python3.11"};
        cfg.data().restart_cap = 2;
        cfg.data().watchdog_enabled = false;
        cfg.data().log_level = "debug";
        EXPECT_TRUE(cfg.save());
    }
    EXPECT_TRUE(fs::exists(Config::config_path()));

    Config loaded;
    EXPECT_TRUE(loaded.load());
    const auto& d = loaded.data();
    EXPECT_EQ(d.backend_port, 8123);
    EXPECT_EQ(d.health_path, "/healthz");
    ASSERT_EQ(d.interpreters.size(), 1u);
    EXPECT_EQ(d.interpreters[0], "python3.11");
    EXPECT_EQ(d.restart_cap, 2);
    EXPECT_FALSE(d.watchdog_enabled);
    EXPECT_EQ(d.log_level, "debug");
    EXPECT_EQ(d.backend_host, "127.0.0.1");
}

TEST_F(ConfigTest, PartialFileUsesDefaultsForTheRest) {
    write_config(
        "backend:\n"
        "  port: 9001\n"
        "watchdog:\n"
        "  failure_threshold: 4\n");

    Config cfg;
    EXPECT_TRUE(cfg.load());
    EXPECT_EQ(cfg.data().backend_port, 9001);
    EXPECT_EQ(cfg.data().failure_threshold, 4);
    EXPECT_EQ(cfg.data().restart_cap, 5);
    EXPECT_EQ(cfg.data().health_path, "/status");
}

TEST_F(ConfigTest, MalformedFileFallsBackToDefaults) {
    write_config("backend: [unclosed\n  port: :::\n");

    Config cfg;
    EXPECT_FALSE(cfg.load());
    EXPECT_EQ(cfg.data().backend_port, 8000);
}

TEST_F(ConfigTest, ExpandHome) {
    EXPECT_EQ(Config::expand_home("~/backend"), test_dir + "/backend");
    EXPECT_EQ(Config::expand_home("/opt/backend"), "/opt/backend");
    EXPECT_EQ(Config::expand_home(""), "");
}

TEST_F(ConfigTest, ExecutableDirIsTestBinaryDir) {
    std::string dir = Config::executable_dir();
    EXPECT_FALSE(dir.empty());
    EXPECT_TRUE(fs::is_directory(dir));
}
