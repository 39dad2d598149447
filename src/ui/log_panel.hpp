#pragma once

#include "supervisor/event.hpp"

#include <ftxui/component/component.hpp>
#include <functional>
#include <memory>
#include <string>

class LogPanel {
public:
    enum class Filter { All, Supervisor, Service };

    struct Callbacks {
        // Post event to refresh UI
        std::function<void()> post_refresh;
        // Export finished; empty path on failure
        std::function<void(const std::string& path)> on_exported;
    };

    LogPanel();
    ~LogPanel();

    void set_callbacks(Callbacks cb);

    // Push a log event (thread-safe). Sentinels are ignored.
    void push(const SupervisorEvent& event);

    void set_filter(Filter filter);
    Filter filter() const;
    void toggle_freeze();
    bool frozen() const;

    /// Lines kept / lines passing the current filter.
    size_t size() const;
    size_t visible_count() const;

    /// Write visible lines with timestamps to `path`.
    bool export_to(const std::string& path) const;

    ftxui::Component component();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
