#pragma once

#include "core/config.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>

class ControlLoop;
class OsProbe;
class Supervisor;

/// Headless supervision for the `run`, `stop` and `free-port` subcommands.
/// Drives the control loop from the calling thread; supervisor log lines go
/// to spdlog, service output to `out`.
class Daemon {
public:
    enum class Mode { Run, Stop, FreePort };

    explicit Daemon(Config& config, std::ostream& out = std::cout);
    ~Daemon();

    /// Blocks until the mode's operation resolves. Returns the exit code.
    int run(Mode mode);

    /// Request graceful stop (called from signal handler)
    void request_stop();

private:
    Config& config_;
    std::ostream& out_;
    std::atomic<bool> stop_flag_{false};

    int supervise(Supervisor& sup, ControlLoop& loop);
    int stop_service(Supervisor& sup, ControlLoop& loop);
    int free_port(Supervisor& sup, ControlLoop& loop, const OsProbe& probe);

    /// Tick the loop until `done` holds. False on timeout.
    bool tick_until(ControlLoop& loop,
                    const std::function<bool()>& done,
                    std::chrono::milliseconds timeout);
};
