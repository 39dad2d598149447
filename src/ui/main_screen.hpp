#pragma once

#include "supervisor/supervisor.hpp"

#include <ftxui/component/component.hpp>
#include <string>
#include <functional>
#include <memory>

/// Which commands the header offers for a given status.
struct ActionState {
    bool start = false;
    bool stop = false;
    bool restart = false;
};

ActionState actions_for(ServiceStatus status);

class MainScreen {
public:
    enum class QuitChoice { StopAndExit, LeaveRunning };

    struct Callbacks {
        std::function<void()> on_start;
        std::function<void()> on_stop;
        std::function<void()> on_restart;
        std::function<void()> on_refresh;
        std::function<void()> on_kill_blocker;
        std::function<void()> on_toggle_lang;
        std::function<void(QuitChoice)> on_quit;
    };

    MainScreen();
    ~MainScreen();

    void set_callbacks(Callbacks cb);
    void set_status(ServiceStatus status);
    void set_port_blocker(bool blocked, const std::string& owner);
    void set_language_label(const std::string& label);

    /// While set, the quit dialog shows a progress line and ignores keys.
    void set_quitting(bool quitting);

    // Set the main content component (the log panel)
    void set_content(ftxui::Component content);

    // Set the status bar component
    void set_status_bar(ftxui::Component status_bar);

    ftxui::Component component();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
