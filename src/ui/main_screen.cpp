#include "ui/main_screen.hpp"
#include "ui/status_bar.hpp"
#include "i18n/i18n.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/component_base.hpp>

#include <atomic>
#include <mutex>

using namespace ftxui;

ActionState actions_for(ServiceStatus status) {
    ActionState a;
    switch (status) {
        case ServiceStatus::Stopped:
        case ServiceStatus::Error:
            a.start = true;
            break;
        case ServiceStatus::Running:
            a.stop = true;
            a.restart = true;
            break;
        case ServiceStatus::Starting:
        case ServiceStatus::Stopping:
            break;
    }
    return a;
}

struct MainScreen::Impl {
    Callbacks callbacks;
    std::atomic<ServiceStatus> status{ServiceStatus::Stopped};
    std::string lang_label = "EN";

    std::mutex blocker_mutex;
    bool port_blocked = false;
    std::string blocker;

    bool quit_dialog = false;
    std::atomic<bool> quitting{false};

    Component content = Renderer([] { return text("Loading..."); });
    Component status_bar = Renderer([] { return text(""); });

    static Color status_color(ServiceStatus s) {
        switch (s) {
            case ServiceStatus::Running: return Color::Green;
            case ServiceStatus::Starting:
            case ServiceStatus::Stopping: return Color::Yellow;
            case ServiceStatus::Error: return Color::Red;
            case ServiceStatus::Stopped: return Color::GrayDark;
        }
        return Color::GrayDark;
    }

    // Custom component: handles global shortcuts AFTER child gets first chance.
    class ScreenComponent : public ComponentBase {
    public:
        explicit ScreenComponent(Impl* impl) : impl_(impl) {}

        bool Focusable() const override {
            for (auto& child : children_) {
                if (child->Focusable()) return true;
            }
            return false;
        }

        Element OnRender() override {
            ServiceStatus status = impl_->status.load();
            ActionState actions = actions_for(status);

            bool blocked;
            std::string blocker;
            {
                std::lock_guard<std::mutex> lock(impl_->blocker_mutex);
                blocked = impl_->port_blocked;
                blocker = impl_->blocker;
            }

            auto action = [](const char* key, const char* label, bool enabled) -> Element {
                auto el = hbox({text(std::string(" [") + key + "]") | bold, text(label)});
                return enabled ? el : el | dim;
            };

            auto header = hbox({
                text(" " + std::string(T().app_title) + " ") | bold | color(Color::Cyan),
                separator(),
                text(" ● ") | color(status_color(status)),
                text(std::string(status_label(status)) + " ") | bold,
                filler(),
                text(" " + impl_->lang_label + " ") | border,
                text(" "),
            });

            Elements footer_items = {
                action("S", T().action_start, actions.start),
                action("T", T().action_stop, actions.stop),
                action("R", T().action_restart, actions.restart),
                action("U", T().action_refresh, true),
            };
            if (blocked) {
                std::string label = std::string(T().action_kill_blocker);
                if (!blocker.empty()) label += " (" + blocker + ")";
                footer_items.push_back(action("K", label.c_str(), true) | color(Color::Yellow));
            }
            footer_items.push_back(action("Q", T().action_quit, true));
            footer_items.push_back(text("  "));
            auto footer = hbox(std::move(footer_items));

            auto body = vbox({
                header,
                separator(),
                impl_->content->Render() | flex,
                separator(),
                impl_->status_bar->Render(),
                footer,
            });

            if (!impl_->quit_dialog) return body;
            return dbox({body, quit_dialog() | clear_under | center});
        }

        Element quit_dialog() {
            if (impl_->quitting.load()) {
                return vbox({
                    text(" " + std::string(T().quit_title) + " ") | bold | center,
                    separator(),
                    text(" " + std::string(T().quit_waiting) + " ") | color(Color::Yellow),
                }) | border;
            }
            return vbox({
                text(" " + std::string(T().quit_title) + " ") | bold | center,
                separator(),
                text(" " + std::string(T().quit_prompt) + " "),
                text(""),
                hbox({text(" [Y] ") | bold, text(T().quit_stop_exit)}),
                hbox({text(" [N] ") | bold, text(T().quit_leave_running)}),
                hbox({text(" [Esc] ") | bold, text(T().cancel)}),
            }) | border;
        }

        bool OnQuitDialogEvent(const Event& event) {
            if (impl_->quitting.load()) return true;
            if (event == Event::Escape) {
                impl_->quit_dialog = false;
                return true;
            }
            if (event.is_character()) {
                auto ch = event.character();
                if (ch == "y" || ch == "Y") {
                    if (impl_->callbacks.on_quit) impl_->callbacks.on_quit(QuitChoice::StopAndExit);
                    return true;
                }
                if (ch == "n" || ch == "N") {
                    impl_->quit_dialog = false;
                    if (impl_->callbacks.on_quit) impl_->callbacks.on_quit(QuitChoice::LeaveRunning);
                    return true;
                }
            }
            return true;  // modal
        }

        bool OnEvent(Event event) override {
            if (impl_->quit_dialog) return OnQuitDialogEvent(event);

            // Phase 1: Truly global keys (always intercept first)
            if (event == Event::Special("\x0C")) {
                if (impl_->callbacks.on_toggle_lang) impl_->callbacks.on_toggle_lang();
                return true;
            }

            // Phase 2: Let child components (log panel) handle first
            if (ComponentBase::OnEvent(event)) {
                return true;
            }

            // Phase 3: Fallback global shortcuts
            if (!event.is_character()) return false;

            auto ch = event.character();
            ActionState actions = actions_for(impl_->status.load());
            auto fire = [](const std::function<void()>& cb) {
                if (cb) cb();
                return true;
            };

            if (ch == "q" || ch == "Q") {
                auto s = impl_->status.load();
                if (s == ServiceStatus::Stopped) {
                    if (impl_->callbacks.on_quit) impl_->callbacks.on_quit(QuitChoice::LeaveRunning);
                } else {
                    impl_->quit_dialog = true;
                }
                return true;
            }
            if ((ch == "s" || ch == "S") && actions.start) return fire(impl_->callbacks.on_start);
            if ((ch == "t" || ch == "T") && actions.stop) return fire(impl_->callbacks.on_stop);
            if ((ch == "r" || ch == "R") && actions.restart) return fire(impl_->callbacks.on_restart);
            if (ch == "u" || ch == "U") return fire(impl_->callbacks.on_refresh);
            if (ch == "k" || ch == "K") {
                bool blocked;
                {
                    std::lock_guard<std::mutex> lock(impl_->blocker_mutex);
                    blocked = impl_->port_blocked;
                }
                if (blocked) return fire(impl_->callbacks.on_kill_blocker);
            }
            return false;
        }

    private:
        Impl* impl_;
    };
};

MainScreen::MainScreen() : impl_(std::make_unique<Impl>()) {}
MainScreen::~MainScreen() = default;

void MainScreen::set_callbacks(Callbacks cb) { impl_->callbacks = std::move(cb); }
void MainScreen::set_status(ServiceStatus status) { impl_->status.store(status); }
void MainScreen::set_language_label(const std::string& label) { impl_->lang_label = label; }
void MainScreen::set_quitting(bool quitting) { impl_->quitting.store(quitting); }
void MainScreen::set_content(Component content) { impl_->content = std::move(content); }
void MainScreen::set_status_bar(Component status_bar) { impl_->status_bar = std::move(status_bar); }

void MainScreen::set_port_blocker(bool blocked, const std::string& owner) {
    std::lock_guard<std::mutex> lock(impl_->blocker_mutex);
    impl_->port_blocked = blocked;
    impl_->blocker = blocked ? owner : "";
}

Component MainScreen::component() {
    auto comp = Make<Impl::ScreenComponent>(impl_.get());
    comp->Add(impl_->content);
    return comp;
}
