#include "supervisor/supervisor.hpp"
#include "os/process_tree_killer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace {

constexpr auto SLEEP_SLICE = std::chrono::milliseconds(100);
constexpr auto OUTPUT_POLL = std::chrono::milliseconds(250);

std::string seconds_str(std::chrono::milliseconds ms) {
    auto tenths = ms.count() / 100;
    std::string s = std::to_string(tenths / 10);
    if (tenths % 10) s += "." + std::to_string(tenths % 10);
    return s + "s";
}

} // namespace

const char* status_name(ServiceStatus status) {
    switch (status) {
        case ServiceStatus::Stopped: return "stopped";
        case ServiceStatus::Starting: return "starting";
        case ServiceStatus::Running: return "running";
        case ServiceStatus::Stopping: return "stopping";
        case ServiceStatus::Error: return "error";
    }
    return "unknown";
}

const char* failure_name(FailureReason reason) {
    switch (reason) {
        case FailureReason::None: return "none";
        case FailureReason::SpawnFailed: return "spawn failed";
        case FailureReason::PortBlocked: return "port blocked";
        case FailureReason::EarlyExit: return "exited before ready";
        case FailureReason::StartupTimeout: return "startup timeout";
        case FailureReason::StopFailed: return "stop failed";
    }
    return "unknown";
}

Supervisor::Supervisor(SupervisorOptions options,
                       OsProbe& probe,
                       StateStore& store,
                       HealthProber& prober,
                       ProcessSpawner spawner)
    : options_(std::move(options)),
      probe_(probe),
      store_(store),
      prober_(prober),
      spawner_(std::move(spawner)) {
    detect(false);
}

Supervisor::~Supervisor() {
    shutdown_.store(true);

    // Workers may launch further workers while we join; loop until drained
    while (true) {
        std::vector<Worker> pending;
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            pending.swap(workers_);
        }
        if (pending.empty()) break;
        for (auto& w : pending) {
            if (w.thread.joinable()) w.thread.join();
        }
    }
}

// ── Accessors ───────────────────────────────────────────────

std::string Supervisor::last_error() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_error_;
}

std::optional<pid_t> Supervisor::pid() const {
    pid_t p = pid_.load();
    if (p <= 0) return std::nullopt;
    return p;
}

bool Supervisor::is_adopted() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return pid_.load() > 0 && !handle_;
}

std::shared_ptr<ProcessHandle> Supervisor::current_handle() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return handle_;
}

bool Supervisor::has_live_process() const {
    pid_t p = pid_.load();
    if (p <= 0) return false;
    auto handle = current_handle();
    if (handle && handle->pid() == p) {
        return !handle->has_exited();
    }
    return probe_.is_process_alive(p);
}

bool Supervisor::operation_in_flight() const {
    return refreshing_.load() || restarting_.load() || resolving_.load();
}

// ── Helpers ─────────────────────────────────────────────────

void Supervisor::emit(const std::string& line) {
    spdlog::info("{}", line);
    events_.push(SupervisorEvent::log(line));
}

void Supervisor::emit_warning(const std::string& line) {
    spdlog::warn("{}", line);
    events_.push(SupervisorEvent::log(line));
}

void Supervisor::signal(Sentinel s, const std::string& detail) {
    spdlog::debug("Sentinel {} {}", sentinel_name(s), detail);
    events_.push(SupervisorEvent::signal(s, detail));
}

void Supervisor::fail(FailureReason reason, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_error_ = message;
    }
    failure_.store(reason);
    status_.store(ServiceStatus::Error);
    spdlog::error("{}", message);
    events_.push(SupervisorEvent::log(message));
}

void Supervisor::forget_process() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    retire_handle();
    pid_.store(-1);
}

// Caller holds state_mutex_. A child that has not exited yet is parked
// until check_health() reaps it.
void Supervisor::retire_handle() {
    if (handle_ && !handle_->poll_exit()) {
        spdlog::debug("Parking handle for PID {} until it exits", handle_->pid());
        retired_.push_back(handle_);
    }
    handle_.reset();
}

void Supervisor::reap_retired() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    retired_.erase(std::remove_if(retired_.begin(), retired_.end(),
                                  [](const std::shared_ptr<ProcessHandle>& h) {
                                      return h->poll_exit().has_value();
                                  }),
                   retired_.end());
}

bool Supervisor::owns_port(pid_t pid) const {
    auto owner = probe_.find_port_owner(options_.port);
    if (!owner || *owner == pid) return true;
    auto family = ProcessTreeKiller(probe_).descendants(pid);
    return std::find(family.begin(), family.end(), *owner) != family.end();
}

std::string Supervisor::describe_port_owner() const {
    auto owner = probe_.find_port_owner(options_.port);
    if (!owner) return "owner unknown";
    auto info = probe_.process_info(*owner);
    return "PID " + std::to_string(*owner) + (info ? " (" + info->name + ")" : "");
}

bool Supervisor::sleep_interruptible(std::chrono::milliseconds duration) const {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!shutdown_.load()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(SLEEP_SLICE)));
    }
    return false;
}

bool Supervisor::launch_worker(const char* name,
                               std::function<void()> body,
                               std::function<void(const std::string&)> on_failure) {
    if (shutdown_.load()) return false;

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::string worker_name(name);

    std::thread t([this, worker_name, body = std::move(body),
                   on_failure = std::move(on_failure), done]() {
        try {
            body();
        } catch (const std::exception& e) {
            std::string message = "Internal error in " + worker_name + ": " + e.what();
            spdlog::error("{}", message);
            events_.push(SupervisorEvent::log(message));
            if (on_failure) on_failure(message);
        }
        done->store(true);
    });

    std::lock_guard<std::mutex> lock(workers_mutex_);
    // Reap finished workers so the list stays short
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
    workers_.push_back(Worker{std::move(t), done});
    return true;
}

// ── Detection / adoption ────────────────────────────────────

void Supervisor::detect(bool refreshing) {
    const int port = options_.port;

    if (refreshing) {
        pid_t tracked = pid_.load();
        if (tracked > 0 && !has_live_process()) {
            emit("Managed PID " + std::to_string(tracked) + " is gone. Cleaning up.");
            store_.clear();
            forget_process();
        } else if (tracked > 0) {
            recheck_tracked(tracked);
            return;
        }
    }

    auto recorded = store_.read();
    if (recorded && probe_.is_process_alive(*recorded)) {
        if (probe_.is_port_listening(port)) {
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (pid_.load() != *recorded) {
                    retire_handle();   // a different process than the one we spawned
                    pid_.store(*recorded);
                }
            }
            failure_.store(FailureReason::None);
            status_.store(ServiceStatus::Running);
            emit("Detected running service (PID " + std::to_string(*recorded) +
                 ") on port " + std::to_string(port) + ".");
            if (refreshing) signal(Sentinel::PortFree);
            return;
        }

        auto handle = current_handle();
        if (handle && handle->pid() == *recorded) {
            // Our own child that never came up; keep tracking it so Stop still works
            emit_warning("Service PID " + std::to_string(*recorded) +
                         " is alive but port " + std::to_string(port) + " is not listening.");
            return;
        }
        emit_warning("PID " + std::to_string(*recorded) + " is alive but port " +
                     std::to_string(port) + " is not listening. Treating record as stale.");
    }

    if (recorded) {
        emit("Cleaning up stale PID file (PID " + std::to_string(*recorded) + ").");
        store_.clear();
        if (pid_.load() == *recorded) forget_process();
    }

    if (probe_.is_port_listening(port)) {
        std::string owner = describe_port_owner();
        emit_warning("Port " + std::to_string(port) + " is in use by another process (" + owner +
                     "). Start will fail until that process is stopped.");
        signal(Sentinel::PortBlocked, owner);
    } else if (refreshing) {
        emit("Port is free. Service is stopped.");
        signal(Sentinel::PortFree);
    }

    failure_.store(FailureReason::None);
    status_.store(ServiceStatus::Stopped);
}

// Our own child is still alive: keep it, whatever the PID file says
void Supervisor::recheck_tracked(pid_t tracked) {
    const int port = options_.port;
    const std::string pid_str = std::to_string(tracked);

    auto recorded = store_.read();
    if (!recorded || *recorded != tracked) {
        if (store_.write(tracked)) {
            emit("Restored PID file for service PID " + pid_str + ".");
        } else {
            emit_warning("Could not rewrite PID file for service PID " + pid_str + ".");
        }
    }

    if (!probe_.is_port_listening(port)) {
        emit_warning("Service PID " + pid_str + " is alive but port " + std::to_string(port) +
                     " is not listening.");
        signal(Sentinel::PortFree);
        return;
    }

    if (!owns_port(tracked)) {
        std::string owner = describe_port_owner();
        emit_warning("Service PID " + pid_str + " is alive but port " + std::to_string(port) +
                     " is held by another process (" + owner + ").");
        signal(Sentinel::PortBlocked, owner);
        return;
    }

    ServiceStatus current = status_.load();
    if (current == ServiceStatus::Running || current == ServiceStatus::Error ||
        current == ServiceStatus::Stopped) {
        failure_.store(FailureReason::None);
        status_.compare_exchange_strong(current, ServiceStatus::Running);
    }
    emit("Service (PID " + pid_str + ") is running on port " + std::to_string(port) + ".");
    signal(Sentinel::PortFree);
}

void Supervisor::refresh() {
    ServiceStatus current = status_.load();
    if (current == ServiceStatus::Starting || current == ServiceStatus::Stopping) {
        emit(std::string("Service is ") + status_name(current) + "; refresh ignored.");
        return;
    }
    if (restarting_.load() || resolving_.load() || refreshing_.exchange(true)) {
        emit("Another operation is in progress; refresh ignored.");
        return;
    }

    emit("Refreshing state...");
    launch_worker("refresh", [this] { run_refresh(); },
                  [this](const std::string&) { refreshing_.store(false); });
}

void Supervisor::run_refresh() {
    detect(true);
    refreshing_.store(false);
}

// ── Start ───────────────────────────────────────────────────

void Supervisor::start() {
    if (refreshing_.load() || resolving_.load()) {
        emit("Another operation is in progress; start ignored.");
        return;
    }

    ServiceStatus current = status_.load();
    if (current == ServiceStatus::Running) {
        emit("Service is already running.");
        return;
    }
    if (current == ServiceStatus::Starting || current == ServiceStatus::Stopping) {
        emit(std::string("Service is ") + status_name(current) + "; start ignored.");
        return;
    }
    if (current == ServiceStatus::Error && has_live_process()) {
        emit("Service process (PID " + std::to_string(pid_.load()) +
             ") is still alive. Stop it before starting again.");
        return;
    }
    if (!status_.compare_exchange_strong(current, ServiceStatus::Starting)) {
        emit("Service state changed concurrently; start ignored.");
        return;
    }

    failure_.store(FailureReason::None);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_error_.clear();
    }
    emit("Starting service...");

    launch_worker("start", [this] { run_start(); },
                  [this](const std::string& message) {
                      fail(FailureReason::SpawnFailed, message);
                      signal(Sentinel::Timeout, message);
                  });
}

void Supervisor::run_start() {
    const int port = options_.port;

    // Never start a second instance competing for the port
    if (probe_.is_port_listening(port)) {
        std::string owner = describe_port_owner();
        fail(FailureReason::PortBlocked,
             "Port " + std::to_string(port) + " is already in use (" + owner + "). Cannot start.");
        signal(Sentinel::PortBlocked, owner);
        return;
    }

    std::string error;
    auto spawned = spawner_(options_.launch, error);
    if (!spawned) {
        fail(FailureReason::SpawnFailed, error.empty() ? "Failed to start service" : error);
        return;
    }

    std::shared_ptr<ProcessHandle> handle(std::move(spawned));
    const pid_t child = handle->pid();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        retire_handle();
        handle_ = handle;
        pid_.store(child);
    }

    // Persist before anything else so a supervisor crash cannot lose the child
    if (!store_.write(child)) {
        emit_warning("Could not write PID file " + store_.path() +
                     "; the service will not be re-adopted after a restart.");
    }
    emit("Process spawned (PID " + std::to_string(child) + "). Waiting for HTTP 200 from " +
         options_.health_url + "...");

    launch_worker("output reader", [this, handle] { read_output(handle); }, nullptr);

    // Readiness poller
    auto deadline = std::chrono::steady_clock::now() + options_.startup_timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (shutdown_.load()) return;

        if (auto code = handle->poll_exit()) {
            store_.clear();
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (handle_ == handle) {
                    handle_.reset();
                    pid_.store(-1);
                }
            }
            std::string reason = "Service process exited with code " + std::to_string(*code) +
                                 " before becoming ready.";
            fail(FailureReason::EarlyExit, reason);
            signal(Sentinel::Timeout, reason);
            return;
        }

        if (prober_.check(options_.health_url, options_.health_probe_timeout)) {
            status_.store(ServiceStatus::Running);
            emit("Service ready at " + options_.health_url);
            signal(Sentinel::Ready, options_.health_url);
            return;
        }

        if (!sleep_interruptible(options_.health_poll_interval)) return;
    }

    // Still alive but never healthy: keep tracking it so it can be stopped
    std::string reason = "Service did not respond within " +
                         seconds_str(options_.startup_timeout) + ". Check logs.";
    fail(FailureReason::StartupTimeout, reason);
    signal(Sentinel::Timeout, reason);
}

void Supervisor::read_output(std::shared_ptr<ProcessHandle> handle) {
    std::string line;
    while (!shutdown_.load()) {
        auto result = handle->read_line(line, OUTPUT_POLL);
        if (result == ProcessHandle::ReadResult::Closed) break;
        if (result == ProcessHandle::ReadResult::Line) {
            spdlog::debug("[service] {}", line);
            events_.push(SupervisorEvent::log(line, LogSource::Service));
        }
    }
}

// ── Stop ────────────────────────────────────────────────────

void Supervisor::stop() {
    if (refreshing_.load()) {
        emit("Another operation is in progress; stop ignored.");
        return;
    }

    ServiceStatus current = status_.load();
    if (current == ServiceStatus::Starting || current == ServiceStatus::Stopping) {
        emit(std::string("Service is ") + status_name(current) + "; stop ignored.");
        return;
    }
    bool stoppable = current == ServiceStatus::Running ||
                     (current == ServiceStatus::Error && has_live_process());
    if (!stoppable) {
        emit("Service is not running.");
        return;
    }
    if (!status_.compare_exchange_strong(current, ServiceStatus::Stopping)) {
        emit("Service state changed concurrently; stop ignored.");
        return;
    }

    emit("Stopping service...");
    launch_worker("stop", [this] { run_stop(); },
                  [this](const std::string& message) {
                      fail(FailureReason::StopFailed, message);
                      signal(Sentinel::Stopped, message);
                  });
}

void Supervisor::run_stop() {
    const pid_t target = pid_.load();
    auto handle = current_handle();
    bool survived = false;

    if (handle && !handle->has_exited()) {
        handle->terminate();
        if (handle->wait_for(options_.graceful_stop)) {
            emit("Service stopped gracefully.");
        } else if (handle->has_exited() || !probe_.is_process_alive(handle->pid())) {
            emit("Process already exited.");
        } else {
            emit_warning("Graceful stop timed out. Force killing...");
            handle->kill();
            if (handle->wait_for(options_.force_kill_confirm)) {
                emit("Service force-killed.");
            } else {
                survived = true;
            }
        }
    } else if (!handle && target > 0 && probe_.is_process_alive(target)) {
        // Adopted from the PID file: no handle, escalate by PID
        emit("Terminating adopted process PID " + std::to_string(target) + "...");
        ProcessTreeKiller killer(probe_, options_.graceful_stop, options_.force_kill_confirm);
        auto report = killer.terminate(target);
        if (!report.clean()) {
            survived = true;
        } else if (report.forced > 0) {
            emit("Adopted process force-killed.");
        } else {
            emit("Adopted process stopped.");
        }
    } else {
        emit("Process already exited.");
    }

    if (survived) {
        std::string reason = "Process PID " + std::to_string(target) + " survived SIGKILL.";
        fail(FailureReason::StopFailed, reason);
        signal(Sentinel::Stopped, reason);
        return;
    }

    store_.clear();
    forget_process();
    status_.store(ServiceStatus::Stopped);
    signal(Sentinel::Stopped);
}

// ── Restart ─────────────────────────────────────────────────

void Supervisor::restart() {
    ServiceStatus current = status_.load();
    if (current == ServiceStatus::Starting || current == ServiceStatus::Stopping) {
        emit(std::string("Service is ") + status_name(current) + "; restart ignored.");
        return;
    }
    if (refreshing_.load() || resolving_.load() || restarting_.exchange(true)) {
        emit("Another operation is in progress; restart ignored.");
        return;
    }

    emit("Restarting service...");
    launch_worker("restart", [this] { run_restart(); },
                  [this](const std::string&) { restarting_.store(false); });
}

void Supervisor::run_restart() {
    ServiceStatus current = status_.load();
    if (current == ServiceStatus::Running || has_live_process()) {
        stop();

        auto deadline = std::chrono::steady_clock::now() + options_.restart_wait;
        while (status_.load() == ServiceStatus::Stopping &&
               std::chrono::steady_clock::now() < deadline) {
            if (!sleep_interruptible(SLEEP_SLICE)) {
                restarting_.store(false);
                return;
            }
        }

        if (status_.load() == ServiceStatus::Stopping) {
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                last_error_ = "Stop did not complete within " + seconds_str(options_.restart_wait) +
                              "; restart aborted.";
            }
            emit_warning(last_error());
            restarting_.store(false);
            return;
        }
        if (status_.load() == ServiceStatus::Error) {
            // Never start a new instance next to one that refused to die
            emit_warning("Restart aborted: the previous instance did not stop.");
            restarting_.store(false);
            return;
        }
    }

    if (!sleep_interruptible(options_.restart_settle)) {
        restarting_.store(false);
        return;
    }
    restarting_.store(false);
    signal(Sentinel::RestartNow);
}

// ── Port conflict resolution ────────────────────────────────

void Supervisor::resolve_port_conflict() {
    ServiceStatus current = status_.load();
    if (current == ServiceStatus::Starting || current == ServiceStatus::Stopping) {
        emit(std::string("Service is ") + status_name(current) + "; port resolution ignored.");
        return;
    }
    if (refreshing_.load() || restarting_.load() || resolving_.exchange(true)) {
        emit("Another operation is in progress; port resolution ignored.");
        return;
    }

    launch_worker("port resolver", [this] { run_resolve(); },
                  [this](const std::string& message) {
                      resolving_.store(false);
                      signal(Sentinel::PortBlocked, message);
                  });
}

void Supervisor::run_resolve() {
    const int port = options_.port;
    auto owner = probe_.find_port_owner(port);

    if (!owner) {
        if (!probe_.is_port_listening(port)) {
            emit("Port is already free.");
            resolving_.store(false);
            signal(Sentinel::PortFree);
        } else {
            emit_warning("Port " + std::to_string(port) +
                         " is in use but its owner could not be determined (insufficient permissions?).");
            resolving_.store(false);
            signal(Sentinel::PortBlocked, "owner unknown");
        }
        return;
    }

    ProcessTreeKiller killer(probe_, options_.graceful_stop, options_.force_kill_confirm);

    pid_t managed = pid_.load();
    if (managed > 0) {
        auto family = killer.descendants(managed);
        if (*owner == managed || std::find(family.begin(), family.end(), *owner) != family.end()) {
            emit("Port " + std::to_string(port) + " is held by the managed service (PID " +
                 std::to_string(managed) + "). Use Stop instead.");
            resolving_.store(false);
            return;
        }
    }

    pid_t root = killer.find_tree_root(*owner, probe_.expected_name());
    auto root_info = probe_.process_info(root);
    emit("Found process tree root: " + (root_info ? root_info->name : std::string("?")) +
         " (PID " + std::to_string(root) + ")");

    auto report = killer.kill_tree(root);
    if (report.found) {
        emit("Terminated " + report.summary() + ".");
    }
    if (!report.clean()) {
        emit_warning(std::to_string(report.survivors) + " process(es) survived SIGKILL.");
    }

    // Socket teardown is not always immediate
    for (int attempt = 0; attempt < options_.port_free_attempts; ++attempt) {
        if (!sleep_interruptible(options_.port_free_interval)) break;
        if (!probe_.is_port_listening(port)) {
            emit("Port " + std::to_string(port) + " is now free.");
            resolving_.store(false);
            signal(Sentinel::PortFree);
            return;
        }
    }

    emit_warning("Port " + std::to_string(port) +
                 " still in use. Try closing the terminal that started the process.");
    resolving_.store(false);
    signal(Sentinel::PortBlocked, describe_port_owner());
}

// ── Passive health check ────────────────────────────────────

void Supervisor::check_health() {
    reap_retired();

    ServiceStatus current = status_.load();
    // Starting/Stopping belong to their workers
    if (current != ServiceStatus::Running && current != ServiceStatus::Error) return;

    pid_t tracked = pid_.load();
    if (tracked <= 0) return;

    std::optional<int> exit_code;
    auto handle = current_handle();
    if (handle && handle->pid() == tracked) {
        exit_code = handle->poll_exit();
        if (!exit_code) return;
    } else if (probe_.is_process_alive(tracked)) {
        return;
    }

    std::string message = "Service (PID " + std::to_string(tracked) + ") exited";
    if (exit_code) message += " with code " + std::to_string(*exit_code);
    emit_warning(message + ".");

    store_.clear();
    forget_process();
    if (current == ServiceStatus::Running) {
        status_.compare_exchange_strong(current, ServiceStatus::Stopped);
    }
}
