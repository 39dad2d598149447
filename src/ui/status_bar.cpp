#include "ui/status_bar.hpp"
#include "i18n/i18n.hpp"

#include <ftxui/dom/elements.hpp>

using namespace ftxui;

const char* status_label(ServiceStatus status) {
    switch (status) {
        case ServiceStatus::Stopped: return T().status_stopped;
        case ServiceStatus::Starting: return T().status_starting;
        case ServiceStatus::Running: return T().status_running;
        case ServiceStatus::Stopping: return T().status_stopping;
        case ServiceStatus::Error: return T().status_error;
    }
    return T().status_error;
}

StatusBar::StatusBar() = default;
StatusBar::~StatusBar() = default;

void StatusBar::set_status(ServiceStatus status) {
    status_.store(status);
}

void StatusBar::set_process(std::optional<pid_t> pid, bool adopted) {
    std::lock_guard<std::mutex> lock(mutex_);
    pid_ = pid;
    adopted_ = adopted;
}

void StatusBar::set_port(int port) {
    std::lock_guard<std::mutex> lock(mutex_);
    port_ = port;
}

void StatusBar::set_port_blocked(bool blocked) {
    port_blocked_.store(blocked);
}

void StatusBar::set_last_error(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = error;
}

void StatusBar::notify(const std::string& message, bool is_error, std::chrono::seconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    toast_ = message;
    toast_error_ = is_error;
    toast_until_ = std::chrono::steady_clock::now() + duration;
}

std::string StatusBar::notification() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::chrono::steady_clock::now() >= toast_until_) return "";
    return toast_;
}

Component StatusBar::component() {
    return Renderer([this] {
        std::optional<pid_t> pid;
        bool adopted;
        int port;
        std::string last_error;
        bool toast_error;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pid = pid_;
            adopted = adopted_;
            port = port_;
            last_error = last_error_;
            toast_error = toast_error_;
        }
        std::string toast = notification();
        ServiceStatus status = status_.load();

        // Left: PID + ownership
        std::string proc = " " + std::string(T().bar_pid) + ": ";
        if (pid) {
            proc += std::to_string(*pid) + " (" + (adopted ? T().bar_adopted : T().bar_owned) + ")";
        } else {
            proc += "-";
        }
        auto left = hbox({
            text(proc) | bold,
            text("  " + std::string(T().bar_port) + ": " + std::to_string(port) + " "),
        });

        // Center: toast, or last failure while in Error
        Element center = text("");
        if (!toast.empty()) {
            center = text(" " + toast + " ") | bold | color(toast_error ? Color::Red : Color::Green);
        } else if (status == ServiceStatus::Error && !last_error.empty()) {
            center = text(" " + std::string(T().bar_last_error) + ": " + last_error + " ") |
                     color(Color::Red);
        }

        // Right: port indicator
        Elements right_elements;
        if (port_blocked_.load()) {
            right_elements.push_back(
                text(" ● " + std::string(T().bar_port_blocked) + " ") | color(Color::Yellow)
            );
        }
        right_elements.push_back(text(" " + std::string(status_label(status)) + " "));

        return hbox({
            left,
            filler(),
            center,
            filler(),
            hbox(right_elements),
        }) | inverted;
    });
}
