#pragma once

#include "supervisor/supervisor.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

/// Owns the control thread: executes posted commands, consumes the
/// supervisor's event stream and reconciles the displayed status.
class ControlLoop {
public:
    enum class Command { Start, Stop, Restart, Refresh, ResolvePortConflict };

    struct Callbacks {
        std::function<void(const SupervisorEvent&)> on_log;
        std::function<void(ServiceStatus)> on_status;
        std::function<void(const std::string& url)> on_ready;
        std::function<void(const std::string& reason)> on_timeout;
        std::function<void(const std::string& reason)> on_stopped;
        std::function<void(const std::string& owner)> on_port_blocked;
        std::function<void()> on_port_free;
    };

    ControlLoop(Supervisor& supervisor,
                Callbacks callbacks,
                std::chrono::milliseconds tick_interval = std::chrono::seconds(2));
    ~ControlLoop();

    ControlLoop(const ControlLoop&) = delete;
    ControlLoop& operator=(const ControlLoop&) = delete;

    /// Queue a command for the control thread. Safe from any thread.
    void post(Command command);

    /// One pass: commands, events, passive health check, status reconcile.
    void tick();

    /// Tick on a background thread every interval, or sooner when a command
    /// is posted.
    void run();
    void stop();
    bool running() const { return thread_.joinable(); }

    ServiceStatus displayed_status() const { return displayed_.load(); }
    bool port_blocked() const { return port_blocked_.load(); }

private:
    Supervisor& supervisor_;
    Callbacks callbacks_;
    std::chrono::milliseconds tick_interval_;

    std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<Command> commands_;

    std::thread thread_;
    std::atomic<bool> stop_flag_{false};

    std::atomic<ServiceStatus> displayed_;
    std::atomic<bool> port_blocked_{false};
    bool status_reported_ = false;

    void execute(Command command);
    void dispatch(const SupervisorEvent& event);
    void reconcile();
};

const char* command_name(ControlLoop::Command command);
