#include "core/config.hpp"
#include "supervisor/supervisor.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() {
    config_.pid_file = default_pid_file();
}

Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    if (is_privileged()) {
        return "/etc/svpanel";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/svpanel";
}

std::string Config::config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

std::string Config::default_pid_file() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/service.pid";
}

std::string Config::log_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/svpanel.log";
}

bool Config::load() {
    return load_from(config_path());
}

bool Config::load_from(const std::string& path) {
    if (path.empty() || !fs::exists(path)) {
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(path);

        // Service section
        if (auto svc = root["service"]) {
            config_.service_executable =
                expand_home(svc["executable"].as<std::string>(config_.service_executable));
            if (auto args = svc["args"]) {
                config_.service_args.clear();
                for (const auto& arg : args) {
                    config_.service_args.push_back(arg.as<std::string>());
                }
            }
            config_.service_working_dir =
                expand_home(svc["working_dir"].as<std::string>(config_.service_working_dir));
            config_.service_process_name =
                svc["process_name"].as<std::string>(config_.service_process_name);
            if (auto env = svc["env"]) {
                config_.service_env.clear();
                for (const auto& kv : env) {
                    config_.service_env[kv.first.as<std::string>()] = kv.second.as<std::string>("");
                }
            }
            config_.service_port = svc["port"].as<int>(config_.service_port);
            config_.health_url = svc["health_url"].as<std::string>(config_.health_url);
        }

        // Supervisor section
        if (auto sup = root["supervisor"]) {
            config_.pid_file = expand_home(sup["pid_file"].as<std::string>(config_.pid_file));
            config_.instance_lock_port = sup["instance_lock_port"].as<int>(config_.instance_lock_port);
            config_.startup_timeout_ms = sup["startup_timeout_ms"].as<int>(config_.startup_timeout_ms);
            config_.health_poll_interval_ms =
                sup["health_poll_interval_ms"].as<int>(config_.health_poll_interval_ms);
            config_.health_probe_timeout_ms =
                sup["health_probe_timeout_ms"].as<int>(config_.health_probe_timeout_ms);
            config_.graceful_stop_ms = sup["graceful_stop_ms"].as<int>(config_.graceful_stop_ms);
            config_.force_kill_confirm_ms =
                sup["force_kill_confirm_ms"].as<int>(config_.force_kill_confirm_ms);
            config_.port_free_attempts = sup["port_free_attempts"].as<int>(config_.port_free_attempts);
            config_.port_free_interval_ms =
                sup["port_free_interval_ms"].as<int>(config_.port_free_interval_ms);
            config_.restart_wait_ms = sup["restart_wait_ms"].as<int>(config_.restart_wait_ms);
            config_.restart_settle_ms = sup["restart_settle_ms"].as<int>(config_.restart_settle_ms);
            config_.tick_interval_ms = sup["tick_interval_ms"].as<int>(config_.tick_interval_ms);
        }

        // Display section
        if (auto display = root["display"]) {
            config_.language = display["language"].as<std::string>(config_.language);
        }

        // Log section
        if (auto log = root["log"]) {
            config_.log_level = log["level"].as<std::string>(config_.log_level);
            config_.log_max_size_kb = log["max_size_kb"].as<int>(config_.log_max_size_kb);
            config_.log_max_files = log["max_files"].as<int>(config_.log_max_files);
        }

        return true;
    } catch (const YAML::Exception&) {
        // Parse failed, use defaults
        return false;
    }
}

bool Config::save() {
    std::string dir = config_dir();
    if (dir.empty()) return false;

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) return false;
    return save_to(config_path());
}

bool Config::save_to(const std::string& path) const {
    if (path.empty()) return false;

    YAML::Emitter out;
    out << YAML::BeginMap;

    // Service section
    out << YAML::Key << "service" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "executable" << YAML::Value << config_.service_executable;
    out << YAML::Key << "args" << YAML::Value << YAML::BeginSeq;
    for (const auto& arg : config_.service_args) out << arg;
    out << YAML::EndSeq;
    out << YAML::Key << "working_dir" << YAML::Value << config_.service_working_dir;
    out << YAML::Key << "process_name" << YAML::Value << config_.service_process_name;
    out << YAML::Key << "env" << YAML::Value << YAML::BeginMap;
    for (const auto& kv : config_.service_env) {
        out << YAML::Key << kv.first << YAML::Value << kv.second;
    }
    out << YAML::EndMap;
    out << YAML::Key << "port" << YAML::Value << config_.service_port;
    out << YAML::Key << "health_url" << YAML::Value << config_.health_url;
    out << YAML::EndMap;

    // Supervisor section
    out << YAML::Key << "supervisor" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "pid_file" << YAML::Value << config_.pid_file;
    out << YAML::Key << "instance_lock_port" << YAML::Value << config_.instance_lock_port;
    out << YAML::Key << "startup_timeout_ms" << YAML::Value << config_.startup_timeout_ms;
    out << YAML::Key << "health_poll_interval_ms" << YAML::Value << config_.health_poll_interval_ms;
    out << YAML::Key << "health_probe_timeout_ms" << YAML::Value << config_.health_probe_timeout_ms;
    out << YAML::Key << "graceful_stop_ms" << YAML::Value << config_.graceful_stop_ms;
    out << YAML::Key << "force_kill_confirm_ms" << YAML::Value << config_.force_kill_confirm_ms;
    out << YAML::Key << "port_free_attempts" << YAML::Value << config_.port_free_attempts;
    out << YAML::Key << "port_free_interval_ms" << YAML::Value << config_.port_free_interval_ms;
    out << YAML::Key << "restart_wait_ms" << YAML::Value << config_.restart_wait_ms;
    out << YAML::Key << "restart_settle_ms" << YAML::Value << config_.restart_settle_ms;
    out << YAML::Key << "tick_interval_ms" << YAML::Value << config_.tick_interval_ms;
    out << YAML::EndMap;

    // Display section
    out << YAML::Key << "display" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "language" << YAML::Value << config_.language;
    out << YAML::EndMap;

    // Log section
    out << YAML::Key << "log" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "level" << YAML::Value << config_.log_level;
    out << YAML::Key << "max_size_kb" << YAML::Value << config_.log_max_size_kb;
    out << YAML::Key << "max_files" << YAML::Value << config_.log_max_files;
    out << YAML::EndMap;

    out << YAML::EndMap;

    std::ofstream fout(path);
    if (!fout.is_open()) return false;
    fout << out.c_str();
    return fout.good();
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }

std::string Config::process_name() const {
    if (!config_.service_process_name.empty()) return config_.service_process_name;
    if (config_.service_executable.empty()) return "";
    return fs::path(config_.service_executable).filename().string();
}

SupervisorOptions Config::supervisor_options() const {
    using ms = std::chrono::milliseconds;

    SupervisorOptions opts;
    opts.launch.executable = config_.service_executable;
    opts.launch.args = config_.service_args;
    opts.launch.working_dir = config_.service_working_dir;
    opts.launch.env = config_.service_env;
    opts.port = config_.service_port;
    opts.health_url = config_.health_url;

    opts.startup_timeout = ms(config_.startup_timeout_ms);
    opts.health_poll_interval = ms(config_.health_poll_interval_ms);
    opts.health_probe_timeout = ms(config_.health_probe_timeout_ms);
    opts.graceful_stop = ms(config_.graceful_stop_ms);
    opts.force_kill_confirm = ms(config_.force_kill_confirm_ms);
    opts.port_free_attempts = config_.port_free_attempts;
    opts.port_free_interval = ms(config_.port_free_interval_ms);
    opts.restart_wait = ms(config_.restart_wait_ms);
    opts.restart_settle = ms(config_.restart_settle_ms);
    return opts;
}
