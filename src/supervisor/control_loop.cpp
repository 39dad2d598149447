#include "supervisor/control_loop.hpp"

#include <spdlog/spdlog.h>

const char* command_name(ControlLoop::Command command) {
    switch (command) {
        case ControlLoop::Command::Start: return "start";
        case ControlLoop::Command::Stop: return "stop";
        case ControlLoop::Command::Restart: return "restart";
        case ControlLoop::Command::Refresh: return "refresh";
        case ControlLoop::Command::ResolvePortConflict: return "resolve-port-conflict";
    }
    return "unknown";
}

ControlLoop::ControlLoop(Supervisor& supervisor,
                         Callbacks callbacks,
                         std::chrono::milliseconds tick_interval)
    : supervisor_(supervisor),
      callbacks_(std::move(callbacks)),
      tick_interval_(tick_interval),
      displayed_(supervisor.status()) {}

ControlLoop::~ControlLoop() {
    stop();
}

void ControlLoop::post(Command command) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        commands_.push_back(command);
    }
    wake_.notify_one();
}

void ControlLoop::tick() {
    std::deque<Command> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(commands_);
    }
    for (auto command : pending) {
        execute(command);
    }

    for (const auto& event : supervisor_.drain_events()) {
        dispatch(event);
    }

    supervisor_.check_health();
    reconcile();
}

void ControlLoop::run() {
    if (thread_.joinable()) return;
    stop_flag_.store(false);

    thread_ = std::thread([this]() {
        // Report the detected state once up front
        tick();
        while (!stop_flag_.load()) {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                wake_.wait_for(lock, tick_interval_, [this] {
                    return stop_flag_.load() || !commands_.empty();
                });
            }
            if (stop_flag_.load()) break;
            tick();
        }
    });
}

void ControlLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_flag_.store(true);
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ControlLoop::execute(Command command) {
    spdlog::debug("Command: {}", command_name(command));
    switch (command) {
        case Command::Start: supervisor_.start(); break;
        case Command::Stop: supervisor_.stop(); break;
        case Command::Restart: supervisor_.restart(); break;
        case Command::Refresh: supervisor_.refresh(); break;
        case Command::ResolvePortConflict: supervisor_.resolve_port_conflict(); break;
    }
}

void ControlLoop::dispatch(const SupervisorEvent& event) {
    if (event.is_log()) {
        if (callbacks_.on_log) callbacks_.on_log(event);
        return;
    }

    switch (event.sentinel) {
        case Sentinel::Ready:
            if (callbacks_.on_ready) callbacks_.on_ready(event.text);
            break;
        case Sentinel::Timeout:
            if (callbacks_.on_timeout) callbacks_.on_timeout(event.text);
            break;
        case Sentinel::Stopped:
            if (callbacks_.on_stopped) callbacks_.on_stopped(event.text);
            break;
        case Sentinel::PortBlocked:
            port_blocked_.store(true);
            if (callbacks_.on_port_blocked) callbacks_.on_port_blocked(event.text);
            break;
        case Sentinel::PortFree:
            if (port_blocked_.exchange(false) && callbacks_.on_log) {
                callbacks_.on_log(SupervisorEvent::log("Port is now free."));
            }
            if (callbacks_.on_port_free) callbacks_.on_port_free();
            break;
        case Sentinel::RestartNow:
            supervisor_.start();
            break;
    }
}

void ControlLoop::reconcile() {
    ServiceStatus current = supervisor_.status();
    ServiceStatus previous = displayed_.exchange(current);
    if (current != previous || !status_reported_) {
        status_reported_ = true;
        if (callbacks_.on_status) callbacks_.on_status(current);
    }
}
