#pragma once

#include <map>
#include <string>
#include <vector>

struct SupervisorOptions;

struct AppConfig {
    // Service
    std::string service_executable;
    std::vector<std::string> service_args;
    std::string service_working_dir;
    std::string service_process_name;   // empty = basename of executable
    std::map<std::string, std::string> service_env;
    int service_port = 5000;
    std::string health_url = "http://127.0.0.1:5000/";

    // Supervisor
    std::string pid_file;
    int instance_lock_port = 59123;
    int startup_timeout_ms = 30000;
    int health_poll_interval_ms = 500;
    int health_probe_timeout_ms = 2000;
    int graceful_stop_ms = 5000;
    int force_kill_confirm_ms = 3000;
    int port_free_attempts = 6;
    int port_free_interval_ms = 500;
    int restart_wait_ms = 10000;
    int restart_settle_ms = 500;
    int tick_interval_ms = 2000;

    // Display
    std::string language = "en";

    // Log
    std::string log_level = "info";
    int log_max_size_kb = 1024;
    int log_max_files = 3;
};

class Config {
public:
    Config();
    ~Config();

    /// Load from config_path(). False when the file is missing or malformed;
    /// defaults stay in place either way.
    bool load();
    bool load_from(const std::string& path);
    bool save();
    bool save_to(const std::string& path) const;

    AppConfig& data();
    const AppConfig& data() const;

    /// Name used for the PID-reuse identity check.
    std::string process_name() const;

    SupervisorOptions supervisor_options() const;

    static bool is_privileged();
    static std::string config_dir();
    static std::string config_path();
    static std::string default_pid_file();
    static std::string log_path();
    static std::string expand_home(const std::string& path);

private:
    AppConfig config_;
};
