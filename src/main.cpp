#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "daemon/daemon.hpp"
#include "app.hpp"

#include <signal.h>

static Daemon* g_daemon = nullptr;

static void signal_handler(int /*sig*/) {
    if (g_daemon) {
        g_daemon->request_stop();
    }
}

static int run_daemon(Daemon::Mode mode) {
    Config config;
    config.load();
    init_logging(config.data(), Config::log_path(), true);

    Daemon daemon(config);
    g_daemon = &daemon;

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);

    int ret = daemon.run(mode);
    g_daemon = nullptr;
    return ret;
}

int main(int argc, char* argv[]) {
    // A closed output pipe must not kill the supervisor
    signal(SIGPIPE, SIG_IGN);

    int cli_result = CLI::run(argc, argv);

    switch (cli_result) {
        case CLI::HEADLESS_RUN: return run_daemon(Daemon::Mode::Run);
        case CLI::HEADLESS_STOP: return run_daemon(Daemon::Mode::Stop);
        case CLI::HEADLESS_FREE_PORT: return run_daemon(Daemon::Mode::FreePort);
        case CLI::LAUNCH_TUI: break;
        default:
            // handled by CLI (help, version, status, or error)
            return cli_result;
    }

    // No subcommand → launch TUI
    App app;
    return app.run();
}
