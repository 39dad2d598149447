#pragma once

#include <string>

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, -1 if no subcommand (caller should launch TUI),
    /// or one of the headless codes below (caller runs the Daemon).
    static int run(int argc, char* argv[]);

    static constexpr int LAUNCH_TUI = -1;
    static constexpr int HEADLESS_RUN = -2;
    static constexpr int HEADLESS_STOP = -3;
    static constexpr int HEADLESS_FREE_PORT = -4;

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_status();
};
