#include "core/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace logging {

namespace {

std::string state_home() {
    const char* xdg = std::getenv("XDG_STATE_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/state";
    }
    return "";
}

} // namespace

std::string resolve_log_file_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }

    std::string base = state_home();
    if (!base.empty()) {
        std::string dir = base + "/stocksbot-shell";
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (!ec) {
            return dir + "/shell.log";
        }
    }

    return "/tmp/stocksbot-shell.log"; // Last resort fallback
}

spdlog::level::level_enum parse_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    std::string file_error;
    if (config.enable_file) {
        std::string path = resolve_log_file_path(config.file_path);
        try {
            // 5MB max size, 3 rotated files
            sinks.push_back(
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, 5 * 1024 * 1024, 3));
        } catch (const spdlog::spdlog_ex& e) {
            file_error = path + ": " + e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("stocksbot", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);

    if (!file_error.empty()) {
        spdlog::warn("[Logging] File sink disabled, cannot open {}", file_error);
    }
}

} // namespace logging
