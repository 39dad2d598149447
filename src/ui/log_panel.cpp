#include "ui/log_panel.hpp"
#include "i18n/i18n.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/component/event.hpp>
#include <deque>
#include <mutex>
#include <fstream>
#include <ctime>
#include <iomanip>
#include <sstream>

using namespace ftxui;

static const size_t MAX_LOG_LINES = 1000;

struct LogPanel::Impl {
    Callbacks callbacks;

    std::deque<SupervisorEvent> logs;
    mutable std::mutex log_mutex;

    Filter filter = Filter::All;
    bool frozen = false;

    void push(const SupervisorEvent& event) {
        std::lock_guard<std::mutex> lock(log_mutex);
        logs.push_back(event);
        while (logs.size() > MAX_LOG_LINES) {
            logs.pop_front();
        }
    }

    bool matches_filter(const SupervisorEvent& event) const {
        switch (filter) {
            case Filter::All: return true;
            case Filter::Supervisor: return event.source == LogSource::Supervisor;
            case Filter::Service: return event.source == LogSource::Service;
        }
        return true;
    }

    bool export_to(const std::string& path) const {
        std::lock_guard<std::mutex> lock(log_mutex);
        std::ofstream out(path);
        if (!out.is_open()) return false;
        for (const auto& event : logs) {
            if (!matches_filter(event)) continue;
            out << "[" << format_event_time(event.time) << "] "
                << (event.source == LogSource::Service ? "[service] " : "[svpanel] ")
                << event.text << "\n";
        }
        return out.good();
    }

    void export_default() {
        auto t = std::time(nullptr);
        std::tm tm{};
        localtime_r(&t, &tm);
        std::ostringstream oss;
        oss << "svpanel-logs-" << std::put_time(&tm, "%Y%m%d-%H%M%S") << ".log";

        bool ok = export_to(oss.str());
        if (callbacks.on_exported) callbacks.on_exported(ok ? oss.str() : "");
    }
};

LogPanel::LogPanel() : impl_(std::make_unique<Impl>()) {}
LogPanel::~LogPanel() = default;

void LogPanel::set_callbacks(Callbacks cb) { impl_->callbacks = std::move(cb); }

void LogPanel::push(const SupervisorEvent& event) {
    if (!event.is_log()) return;
    impl_->push(event);
    if (impl_->callbacks.post_refresh) impl_->callbacks.post_refresh();
}

void LogPanel::set_filter(Filter filter) {
    std::lock_guard<std::mutex> lock(impl_->log_mutex);
    impl_->filter = filter;
}

LogPanel::Filter LogPanel::filter() const {
    std::lock_guard<std::mutex> lock(impl_->log_mutex);
    return impl_->filter;
}

void LogPanel::toggle_freeze() {
    std::lock_guard<std::mutex> lock(impl_->log_mutex);
    impl_->frozen = !impl_->frozen;
}

bool LogPanel::frozen() const {
    std::lock_guard<std::mutex> lock(impl_->log_mutex);
    return impl_->frozen;
}

size_t LogPanel::size() const {
    std::lock_guard<std::mutex> lock(impl_->log_mutex);
    return impl_->logs.size();
}

size_t LogPanel::visible_count() const {
    std::lock_guard<std::mutex> lock(impl_->log_mutex);
    size_t n = 0;
    for (const auto& event : impl_->logs) {
        if (impl_->matches_filter(event)) ++n;
    }
    return n;
}

bool LogPanel::export_to(const std::string& path) const {
    return impl_->export_to(path);
}

Component LogPanel::component() {
    auto self = impl_.get();

    return Renderer([self](bool /*focused*/) -> Element {
        std::lock_guard<std::mutex> lock(self->log_mutex);

        // Header with filter info
        const char* filter_labels[] = {T().log_all, T().log_supervisor, T().log_service};
        Elements header_items;
        for (int i = 0; i < 3; i++) {
            auto el = text(" " + std::to_string(i + 1) + ":" + filter_labels[i] + " ");
            if (i == static_cast<int>(self->filter)) {
                el = el | bold | inverted;
            } else {
                el = el | dim;
            }
            header_items.push_back(el);
        }
        header_items.push_back(filler());
        header_items.push_back(
            self->frozen
                ? text(" [F] " + std::string(T().log_freeze) + " ") | color(Color::Yellow)
                : text(" [F] " + std::string(T().log_unfreeze) + " ") | dim
        );
        header_items.push_back(text(" [X] " + std::string(T().log_export) + " ") | dim);

        auto header = hbox(std::move(header_items));

        // Log entries
        Elements lines;
        for (const auto& event : self->logs) {
            if (!self->matches_filter(event)) continue;
            bool service = event.source == LogSource::Service;
            lines.push_back(
                hbox({
                    text(format_event_time(event.time) + " ") | dim,
                    text(service ? "│ " : "» ") | bold | color(service ? Color::GrayLight : Color::Cyan),
                    text(event.text),
                })
            );
        }

        if (lines.empty()) {
            lines.push_back(text(std::string("  ") + T().log_empty) | dim);
        }

        auto log_view = vbox(std::move(lines));
        if (!self->frozen) {
            log_view = log_view | focusPositionRelative(0, 1); // auto-scroll to bottom
        }

        return vbox({
            header,
            separator(),
            log_view | vscroll_indicator | frame | flex,
        }) | border;
    }) | CatchEvent([self](Event event) -> bool {
        if (event.is_character()) {
            // 1-3: source filter
            {
                std::lock_guard<std::mutex> lock(self->log_mutex);
                if (event.character() == "1") { self->filter = Filter::All; return true; }
                if (event.character() == "2") { self->filter = Filter::Supervisor; return true; }
                if (event.character() == "3") { self->filter = Filter::Service; return true; }

                // F: toggle freeze
                if (event.character() == "f" || event.character() == "F") {
                    self->frozen = !self->frozen;
                    return true;
                }
            }

            // X: export
            if (event.character() == "x" || event.character() == "X") {
                self->export_default();
                return true;
            }
        }

        return false;
    });
}
