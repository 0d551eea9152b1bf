#pragma once

#include <spdlog/spdlog.h>
#include <string>

namespace logging {

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    bool enable_console = true;
    bool enable_file = true;
    std::string file_path;  // empty = resolve default under XDG_STATE_HOME
};

/// Install the default "stocksbot" logger built from the configured sinks.
void init(const LogConfig& config);

/// Parse "trace|debug|info|warn|error|critical|off"; unknown → info
spdlog::level::level_enum parse_level(const std::string& name);

/// Resolve the log file location (override wins, then XDG state dir, then /tmp)
std::string resolve_log_file_path(const std::string& override_path);

} // namespace logging
