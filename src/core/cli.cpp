#include "core/cli.hpp"
#include "core/config.hpp"
#include "os/os_probe.hpp"
#include "supervisor/state_store.hpp"

#include <cstring>
#include <iostream>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) return LAUNCH_TUI;

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "status") == 0) {
        return cmd_status();
    }
    if (std::strcmp(cmd, "run") == 0) {
        return HEADLESS_RUN;
    }
    if (std::strcmp(cmd, "stop") == 0) {
        return HEADLESS_STOP;
    }
    if (std::strcmp(cmd, "free-port") == 0) {
        return HEADLESS_FREE_PORT;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'svpanel help' for usage.\n";
    return 1;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "svpanel - control panel for a local service process\n"
        "\n"
        "Usage:\n"
        "  svpanel                Launch TUI (default)\n"
        "  svpanel run            Start the service and supervise it in the foreground\n"
        "  svpanel stop           Stop the running (or adopted) service\n"
        "  svpanel free-port      Kill the process tree blocking the service port\n"
        "  svpanel status         Show PID file, process and port state\n"
        "  svpanel version        Show version\n"
        "  svpanel help           Show this help\n"
        "\n"
        "Configuration: " << Config::config_path() << "\n"
        "\n"
        "Keyboard shortcuts (TUI mode):\n"
        "  S           Start service\n"
        "  T           Stop service\n"
        "  R           Restart service\n"
        "  U           Refresh state\n"
        "  K           Kill process blocking the port\n"
        "  1/2/3       Log filter: all/supervisor/service\n"
        "  F           Freeze log\n"
        "  X           Export log to file\n"
        "  Ctrl+L      Toggle EN/ZH language\n"
        "  Q           Quit\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "svpanel " << APP_VERSION << "\n";
    return 0;
}

// ── status ──────────────────────────────────────────────────

int CLI::cmd_status() {
    Config config;
    config.load();
    auto& d = config.data();

    // Read-only: no instance lock, no state changes
    auto probe = make_os_probe(config.process_name());
    StateStore store(d.pid_file);

    auto recorded = store.read();
    bool alive = recorded && probe->is_process_alive(*recorded);
    bool listening = probe->is_port_listening(d.service_port);

    std::cout << "PID file: " << store.path();
    if (recorded) {
        std::cout << " (pid " << *recorded << ", " << (alive ? "alive" : "not running") << ")\n";
    } else {
        std::cout << " (none)\n";
    }

    std::cout << "Port:     " << d.service_port << " " << (listening ? "listening" : "free");
    if (listening) {
        auto owner = probe->find_port_owner(d.service_port);
        if (owner) {
            auto info = probe->process_info(*owner);
            std::cout << " (pid " << *owner;
            if (info) std::cout << ", " << info->name;
            std::cout << ")";
        } else {
            std::cout << " (owner unknown)";
        }
    }
    std::cout << "\n";

    std::string state = "stopped";
    if (alive && listening) {
        state = "running";
    } else if (listening) {
        state = "port blocked by another process";
    } else if (alive) {
        state = "process alive, port not listening";
    }
    std::cout << "Service:  " << state << "\n";

    return (alive && listening) ? 0 : 3;
}
