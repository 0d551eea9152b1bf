#pragma once

#include <string>

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, -1 if no subcommand (caller should launch TUI),
    /// or -2 for headless daemon mode.
    static int run(int argc, char* argv[]);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_status();
    static int cmd_locate();
    static int cmd_probe();
};
