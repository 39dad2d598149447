#include "daemon/daemon.hpp"
#include "api/health_prober.hpp"
#include "core/instance_lock.hpp"
#include "os/os_probe.hpp"
#include "supervisor/control_loop.hpp"
#include "supervisor/state_store.hpp"
#include "supervisor/supervisor.hpp"

#include <spdlog/spdlog.h>

#include <thread>

namespace {

constexpr auto TICK = std::chrono::milliseconds(100);

} // namespace

Daemon::Daemon(Config& config, std::ostream& out)
    : config_(config), out_(out) {}

Daemon::~Daemon() = default;

void Daemon::request_stop() {
    stop_flag_.store(true);
}

bool Daemon::tick_until(ControlLoop& loop,
                        const std::function<bool()>& done,
                        std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        loop.tick();
        if (done()) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(TICK);
    }
}

int Daemon::run(Mode mode) {
    const auto& d = config_.data();

    // 1. Single instance
    InstanceLock lock(d.instance_lock_port);
    std::string err;
    if (!lock.acquire(err)) {
        spdlog::error("{}", err);
        return 1;
    }

    // 2. Compose the supervisor
    auto probe = make_os_probe(config_.process_name());
    StateStore store(d.pid_file);
    HealthProber prober;
    Supervisor sup(config_.supervisor_options(), *probe, store, prober);

    ControlLoop::Callbacks cb;
    cb.on_log = [this](const SupervisorEvent& ev) {
        // Supervisor lines already reach the console through spdlog
        if (ev.source == LogSource::Service) {
            out_ << ev.text << "\n";
            out_.flush();
        }
    };
    ControlLoop loop(sup, std::move(cb), std::chrono::milliseconds(d.tick_interval_ms));

    // 3. Dispatch
    switch (mode) {
        case Mode::Run: return supervise(sup, loop);
        case Mode::Stop: return stop_service(sup, loop);
        case Mode::FreePort: return free_port(sup, loop, *probe);
    }
    return 1;
}

int Daemon::supervise(Supervisor& sup, ControlLoop& loop) {
    if (sup.status() == ServiceStatus::Running) {
        spdlog::info("Supervising already running service (PID {})", sup.pid().value_or(-1));
    } else {
        if (config_.data().service_executable.empty()) {
            spdlog::error("No service executable configured (service.executable in {})",
                          Config::config_path());
            return 1;
        }
        loop.post(ControlLoop::Command::Start);
        // Startup is bounded by the supervisor's own timeout
        tick_until(loop, [&] {
            return stop_flag_.load() || sup.status() != ServiceStatus::Starting;
        }, std::chrono::hours(24));

        if (sup.status() != ServiceStatus::Running) {
            if (sup.status() == ServiceStatus::Starting) {
                // Interrupted; the start worker finishes before we stop it
                tick_until(loop, [&] { return sup.status() != ServiceStatus::Starting; },
                           sup.options().startup_timeout + std::chrono::seconds(5));
            }
            if (sup.has_live_process()) {
                return stop_service(sup, loop) == 0 && stop_flag_.load() ? 0 : 1;
            }
            if (!sup.last_error().empty()) {
                spdlog::error("Start failed: {}", sup.last_error());
            }
            return stop_flag_.load() ? 0 : 1;
        }
    }

    // Until interrupted or the service goes away on its own
    tick_until(loop, [&] {
        return stop_flag_.load() || sup.status() != ServiceStatus::Running;
    }, std::chrono::hours(24 * 365));

    if (stop_flag_.load()) {
        spdlog::info("Interrupted, stopping service");
        return stop_service(sup, loop);
    }

    spdlog::warn("Service is no longer running ({})", status_name(sup.status()));
    return 1;
}

int Daemon::stop_service(Supervisor& sup, ControlLoop& loop) {
    if (sup.status() != ServiceStatus::Running && !sup.has_live_process()) {
        spdlog::info("Service is not running.");
        return 0;
    }

    loop.post(ControlLoop::Command::Stop);
    const auto& opts = sup.options();
    auto bound = opts.graceful_stop + opts.force_kill_confirm + std::chrono::seconds(5);
    bool settled = tick_until(loop, [&] {
        auto s = sup.status();
        return s == ServiceStatus::Stopped || s == ServiceStatus::Error;
    }, bound);

    if (!settled || sup.failure() == FailureReason::StopFailed) {
        spdlog::error("Stop failed: {}", sup.last_error());
        return 1;
    }
    return 0;
}

int Daemon::free_port(Supervisor& sup, ControlLoop& loop, const OsProbe& probe) {
    loop.post(ControlLoop::Command::ResolvePortConflict);

    const auto& opts = sup.options();
    auto bound = opts.graceful_stop + opts.force_kill_confirm +
                 opts.port_free_interval * opts.port_free_attempts + std::chrono::seconds(5);
    // First tick executes the command and marks the operation in flight
    tick_until(loop, [&] { return !sup.operation_in_flight(); }, bound);
    loop.tick();

    if (loop.port_blocked() || probe.is_port_listening(opts.port)) {
        spdlog::error("Port {} is still in use", opts.port);
        return 1;
    }
    return 0;
}
