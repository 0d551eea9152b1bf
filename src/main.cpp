#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "daemon/daemon.hpp"
#include "app.hpp"

#include <spdlog/spdlog.h>
#include <signal.h>

static Daemon* g_daemon = nullptr;
static App* g_app = nullptr;

static void signal_handler(int /*sig*/) {
    if (g_daemon) {
        g_daemon->request_stop();
    }
    if (g_app) {
        g_app->request_stop();
    }
}

// The backend runs in its own process group, so terminal signals reach
// only us; they must be turned into an orderly shutdown.
static void install_signal_handlers() {
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGHUP, &sa, nullptr);

    struct sigaction ignore;
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    ignore.sa_flags = 0;
    sigaction(SIGPIPE, &ignore, nullptr);
}

static void init_logging(const Config& config, bool console) {
    logging::LogConfig lc;
    lc.level = logging::parse_level(config.data().log_level);
    lc.enable_console = console;
    lc.enable_file = true;
    lc.file_path = Config::expand_home(config.data().log_file);
    logging::init(lc);
}

static int run_daemon() {
    Config config;
    config.load();
    init_logging(config, true);

    Daemon daemon(config);
    g_daemon = &daemon;
    install_signal_handlers();

    int ret = daemon.run();
    g_daemon = nullptr;
    return ret;
}

int main(int argc, char* argv[]) {
    int cli_result = CLI::run(argc, argv);

    if (cli_result == -2) {
        // daemon subcommand
        return run_daemon();
    }
    if (cli_result != -1) {
        // handled by CLI (help, version, status, locate, probe, or error)
        return cli_result;
    }

    // No subcommand → launch TUI; console output would corrupt the screen
    {
        Config config;
        config.load();
        init_logging(config, false);
    }

    App app;
    g_app = &app;
    install_signal_handlers();

    int ret = app.run();
    g_app = nullptr;
    return ret;
}
