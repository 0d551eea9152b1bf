#include "core/config.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() = default;
Config::~Config() = default;

std::string Config::config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/stocksbot-shell";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/stocksbot-shell";
}

std::string Config::config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

std::string Config::executable_dir() {
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty()) return "";
    return exe.parent_path().string();
}

bool Config::load() {
    std::string path = config_path();
    if (path.empty() || !fs::exists(path)) {
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(path);

        if (auto backend = root["backend"]) {
            config_.backend_host = backend["host"].as<std::string>(config_.backend_host);
            config_.backend_port = backend["port"].as<int>(config_.backend_port);
            config_.health_path = backend["health_path"].as<std::string>(config_.health_path);
        }

        if (auto sidecar = root["sidecar"]) {
            config_.autostart = sidecar["autostart"].as<bool>(config_.autostart);
            config_.binary_name = sidecar["binary_name"].as<std::string>(config_.binary_name);
            config_.script_name = sidecar["script_name"].as<std::string>(config_.script_name);
            config_.resource_dir = sidecar["resource_dir"].as<std::string>(config_.resource_dir);
            if (auto interps = sidecar["interpreters"]) {
                std::vector<std::string> list;
                for (const auto& it : interps) {
                    list.push_back(it.as<std::string>());
                }
                if (!list.empty()) config_.interpreters = std::move(list);
            }
        }

        if (auto startup = root["startup"]) {
            config_.startup_max_attempts = startup["max_attempts"].as<int>(config_.startup_max_attempts);
            config_.startup_interval_ms = startup["interval_ms"].as<int>(config_.startup_interval_ms);
        }

        if (auto wd = root["watchdog"]) {
            config_.watchdog_enabled = wd["enabled"].as<bool>(config_.watchdog_enabled);
            config_.watchdog_initial_grace_ms = wd["initial_grace_ms"].as<int>(config_.watchdog_initial_grace_ms);
            config_.watchdog_interval_ms = wd["interval_ms"].as<int>(config_.watchdog_interval_ms);
            config_.watchdog_poll_tick_ms = wd["poll_tick_ms"].as<int>(config_.watchdog_poll_tick_ms);
            config_.failure_threshold = wd["failure_threshold"].as<int>(config_.failure_threshold);
            config_.restart_cap = wd["restart_cap"].as<int>(config_.restart_cap);
        }

        if (auto shutdown = root["shutdown"]) {
            config_.shutdown_grace_ms = shutdown["grace_ms"].as<int>(config_.shutdown_grace_ms);
        }

        if (auto log = root["logging"]) {
            config_.log_level = log["level"].as<std::string>(config_.log_level);
            config_.log_file = log["file"].as<std::string>(config_.log_file);
        }

        return true;
    } catch (const YAML::Exception& e) {
        // Parse failed, use defaults
        spdlog::warn("[Config] Failed to parse {}: {}", path, e.what());
        return false;
    }
}

bool Config::save() {
    std::string dir = config_dir();
    std::string path = config_path();
    if (dir.empty() || path.empty()) return false;

    try {
        fs::create_directories(dir);

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "backend" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "host" << YAML::Value << config_.backend_host;
        out << YAML::Key << "port" << YAML::Value << config_.backend_port;
        out << YAML::Key << "health_path" << YAML::Value << config_.health_path;
        out << YAML::EndMap;

        out << YAML::Key << "sidecar" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "autostart" << YAML::Value << config_.autostart;
        out << YAML::Key << "binary_name" << YAML::Value << config_.binary_name;
        out << YAML::Key << "script_name" << YAML::Value << config_.script_name;
        out << YAML::Key << "interpreters" << YAML::Value << YAML::Flow << config_.interpreters;
        out << YAML::Key << "resource_dir" << YAML::Value << config_.resource_dir;
        out << YAML::EndMap;

        out << YAML::Key << "startup" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "max_attempts" << YAML::Value << config_.startup_max_attempts;
        out << YAML::Key << "interval_ms" << YAML::Value << config_.startup_interval_ms;
        out << YAML::EndMap;

        out << YAML::Key << "watchdog" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "enabled" << YAML::Value << config_.watchdog_enabled;
        out << YAML::Key << "initial_grace_ms" << YAML::Value << config_.watchdog_initial_grace_ms;
        out << YAML::Key << "interval_ms" << YAML::Value << config_.watchdog_interval_ms;
        out << YAML::Key << "poll_tick_ms" << YAML::Value << config_.watchdog_poll_tick_ms;
        out << YAML::Key << "failure_threshold" << YAML::Value << config_.failure_threshold;
        out << YAML::Key << "restart_cap" << YAML::Value << config_.restart_cap;
        out << YAML::EndMap;

        out << YAML::Key << "shutdown" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "grace_ms" << YAML::Value << config_.shutdown_grace_ms;
        out << YAML::EndMap;

        out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << config_.log_level;
        out << YAML::Key << "file" << YAML::Value << config_.log_file;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream fout(path);
        if (!fout.is_open()) return false;
        fout << out.c_str();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("[Config] Failed to save {}: {}", path, e.what());
        return false;
    }
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
