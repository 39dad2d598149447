#pragma once

#include "api/health_prober.hpp"
#include "os/os_probe.hpp"
#include "os/process_handle.hpp"
#include "supervisor/event.hpp"
#include "supervisor/state_store.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

enum class ServiceStatus { Stopped, Starting, Running, Stopping, Error };

enum class FailureReason { None, SpawnFailed, PortBlocked, EarlyExit, StartupTimeout, StopFailed };

const char* status_name(ServiceStatus status);
const char* failure_name(FailureReason reason);

struct SupervisorOptions {
    LaunchSpec launch;
    int port = 5000;
    std::string health_url = "http://127.0.0.1:5000/";

    std::chrono::milliseconds startup_timeout{30000};
    std::chrono::milliseconds health_poll_interval{500};
    std::chrono::milliseconds health_probe_timeout{2000};
    std::chrono::milliseconds graceful_stop{5000};
    std::chrono::milliseconds force_kill_confirm{3000};
    int port_free_attempts = 6;
    std::chrono::milliseconds port_free_interval{500};
    std::chrono::milliseconds restart_wait{10000};
    std::chrono::milliseconds restart_settle{500};
};

using ProcessSpawner =
    std::function<std::unique_ptr<ProcessHandle>(const LaunchSpec&, std::string& error)>;

/// Lifecycle state machine for the managed service.
///
/// Commands (start, stop, restart, refresh, resolve_port_conflict) return
/// immediately: they either log why they were ignored or hand the blocking
/// work to a background worker. Completion is reported through the event
/// stream (drain_events) and the status accessors.
class Supervisor {
public:
    /// Runs adoption detection before returning, so status() reflects a
    /// service left running by a previous supervisor.
    Supervisor(SupervisorOptions options,
               OsProbe& probe,
               StateStore& store,
               HealthProber& prober,
               ProcessSpawner spawner = ProcessHandle::spawn);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    void start();
    void stop();
    void restart();

    /// Re-run adoption detection from the PID record and live OS state.
    void refresh();

    /// Kill the foreign process tree holding the service port.
    void resolve_port_conflict();

    /// Cheap, network-free liveness check for the control thread.
    void check_health();

    ServiceStatus status() const { return status_.load(); }
    FailureReason failure() const { return failure_.load(); }
    std::string last_error() const;
    std::optional<pid_t> pid() const;
    bool is_adopted() const;
    bool has_live_process() const;

    /// A refresh, restart or port resolution is still running.
    bool operation_in_flight() const;

    std::vector<SupervisorEvent> drain_events() { return events_.drain(); }

    const SupervisorOptions& options() const { return options_; }

private:
    SupervisorOptions options_;
    OsProbe& probe_;
    StateStore& store_;
    HealthProber& prober_;
    ProcessSpawner spawner_;
    EventQueue events_;

    std::atomic<ServiceStatus> status_{ServiceStatus::Stopped};
    std::atomic<FailureReason> failure_{FailureReason::None};
    std::atomic<pid_t> pid_{-1};

    mutable std::mutex state_mutex_;
    std::shared_ptr<ProcessHandle> handle_;   // null for adopted processes
    std::vector<std::shared_ptr<ProcessHandle>> retired_;
    std::string last_error_;

    std::atomic<bool> refreshing_{false};
    std::atomic<bool> restarting_{false};
    std::atomic<bool> resolving_{false};
    std::atomic<bool> shutdown_{false};

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::mutex workers_mutex_;
    std::vector<Worker> workers_;

    // Workers
    void run_start();
    void run_stop();
    void run_restart();
    void run_refresh();
    void run_resolve();
    void read_output(std::shared_ptr<ProcessHandle> handle);

    void detect(bool refreshing);
    void recheck_tracked(pid_t tracked);
    bool launch_worker(const char* name,
                       std::function<void()> body,
                       std::function<void(const std::string&)> on_failure);
    bool sleep_interruptible(std::chrono::milliseconds duration) const;

    void fail(FailureReason reason, const std::string& message);
    void forget_process();
    void retire_handle();
    void reap_retired();
    bool owns_port(pid_t pid) const;
    std::shared_ptr<ProcessHandle> current_handle() const;
    std::string describe_port_owner() const;

    void emit(const std::string& line);
    void emit_warning(const std::string& line);
    void signal(Sentinel s, const std::string& detail = "");
};
