#pragma once

#include "supervisor/supervisor.hpp"

#include <ftxui/component/component.hpp>
#include <chrono>
#include <string>
#include <mutex>
#include <atomic>

/// Localized label for a service status.
const char* status_label(ServiceStatus status);

class StatusBar {
public:
    StatusBar();
    ~StatusBar();

    ftxui::Component component();

    // Thread-safe setters for background updates
    void set_status(ServiceStatus status);
    void set_process(std::optional<pid_t> pid, bool adopted);
    void set_port(int port);
    void set_port_blocked(bool blocked);
    void set_last_error(const std::string& error);

    /// Show a toast for `duration`.
    void notify(const std::string& message, bool is_error = false,
                std::chrono::seconds duration = std::chrono::seconds(4));

    /// Current toast text, empty once expired.
    std::string notification();

private:
    std::mutex mutex_;
    std::atomic<ServiceStatus> status_{ServiceStatus::Stopped};
    std::optional<pid_t> pid_;
    bool adopted_ = false;
    int port_ = 0;
    std::atomic<bool> port_blocked_{false};
    std::string last_error_;

    std::string toast_;
    bool toast_error_ = false;
    std::chrono::steady_clock::time_point toast_until_;
};
