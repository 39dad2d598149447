#include "app.hpp"
#include "api/health_prober.hpp"
#include "core/config.hpp"
#include "core/instance_lock.hpp"
#include "core/logging.hpp"
#include "os/os_probe.hpp"
#include "supervisor/control_loop.hpp"
#include "supervisor/state_store.hpp"
#include "supervisor/supervisor.hpp"
#include "ui/main_screen.hpp"
#include "ui/log_panel.hpp"
#include "ui/status_bar.hpp"
#include "i18n/i18n.hpp"

#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/component/component.hpp>
#include <ftxui/dom/elements.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <thread>
#include <atomic>

using namespace ftxui;

struct App::Impl {
    Config config;
    std::unique_ptr<InstanceLock> lock;

    std::unique_ptr<OsProbe> probe;
    std::unique_ptr<StateStore> store;
    HealthProber prober;
    std::unique_ptr<Supervisor> supervisor;
    std::unique_ptr<ControlLoop> loop;

    MainScreen main_screen;
    StatusBar status_bar;
    LogPanel log_panel;

    ScreenInteractive screen = ScreenInteractive::FullscreenAlternateScreen();

    // Quit handling
    std::atomic<bool> quitting{false};
    std::thread quit_thread;

    void refresh_screen() {
        screen.Post(Event::Custom);
    }

    void sync_process_info() {
        status_bar.set_process(supervisor->pid(), supervisor->is_adopted());
        status_bar.set_last_error(supervisor->last_error());
    }

    ControlLoop::Callbacks make_loop_callbacks() {
        ControlLoop::Callbacks cb;

        cb.on_log = [this](const SupervisorEvent& ev) {
            log_panel.push(ev);
        };

        cb.on_status = [this](ServiceStatus status) {
            main_screen.set_status(status);
            status_bar.set_status(status);
            sync_process_info();
            refresh_screen();
        };

        cb.on_ready = [this](const std::string& url) {
            status_bar.notify(std::string(T().notify_ready) + ": " + url);
            sync_process_info();
            refresh_screen();
        };

        cb.on_timeout = [this](const std::string& reason) {
            status_bar.notify(std::string(T().notify_timeout) + ": " + reason, true);
            sync_process_info();
            refresh_screen();
        };

        cb.on_stopped = [this](const std::string& reason) {
            if (reason.empty()) {
                status_bar.notify(T().notify_stopped);
            } else {
                status_bar.notify(reason, true);
            }
            sync_process_info();
            refresh_screen();
        };

        cb.on_port_blocked = [this](const std::string& owner) {
            main_screen.set_port_blocker(true, owner);
            status_bar.set_port_blocked(true);
            status_bar.notify(std::string(T().notify_port_blocked) + " (" + owner + ")", true);
            refresh_screen();
        };

        cb.on_port_free = [this]() {
            main_screen.set_port_blocker(false, "");
            status_bar.set_port_blocked(false);
            refresh_screen();
        };

        return cb;
    }

    void setup_callbacks() {
        MainScreen::Callbacks cb;

        cb.on_start = [this]() { loop->post(ControlLoop::Command::Start); };
        cb.on_stop = [this]() { loop->post(ControlLoop::Command::Stop); };
        cb.on_restart = [this]() { loop->post(ControlLoop::Command::Restart); };
        cb.on_refresh = [this]() { loop->post(ControlLoop::Command::Refresh); };
        cb.on_kill_blocker = [this]() { loop->post(ControlLoop::Command::ResolvePortConflict); };

        cb.on_toggle_lang = [this]() {
            if (current_lang == Lang::ZH) {
                current_lang = Lang::EN;
                main_screen.set_language_label("EN");
                config.data().language = "en";
            } else {
                current_lang = Lang::ZH;
                main_screen.set_language_label("中");
                config.data().language = "zh";
            }
            if (!config.save()) {
                spdlog::warn("Cannot save {}", Config::config_path());
            }
        };

        cb.on_quit = [this](MainScreen::QuitChoice choice) {
            if (choice == MainScreen::QuitChoice::LeaveRunning) {
                spdlog::info("Exiting, service left running");
                screen.Exit();
                return;
            }
            if (quitting.exchange(true)) return;
            main_screen.set_quitting(true);
            refresh_screen();
            start_quit_waiter();
        };

        main_screen.set_callbacks(std::move(cb));
    }

    // Leave only once the stop has resolved. A Start still in flight is
    // allowed to finish first, then stopped.
    void start_quit_waiter() {
        quit_thread = std::thread([this]() {
            const auto& opts = supervisor->options();
            auto deadline = std::chrono::steady_clock::now() + opts.startup_timeout +
                            opts.graceful_stop + opts.force_kill_confirm + std::chrono::seconds(5);
            bool requested = false;
            while (std::chrono::steady_clock::now() < deadline) {
                auto s = supervisor->status();
                if (s == ServiceStatus::Starting || s == ServiceStatus::Stopping) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                    continue;
                }
                if (!requested && (s == ServiceStatus::Running || supervisor->has_live_process())) {
                    loop->post(ControlLoop::Command::Stop);
                    requested = true;
                    // Let the control thread move the status to Stopping
                    std::this_thread::sleep_for(std::chrono::milliseconds(300));
                    continue;
                }
                break;
            }
            screen.Post([this] { screen.Exit(); });
        });
    }
};

App::App() : impl_(std::make_unique<Impl>()) {
    // Load config (use defaults if file doesn't exist)
    impl_->config.load();
    init_logging(impl_->config.data(), Config::log_path(), false);

    // Set language from config
    if (impl_->config.data().language == "zh") {
        current_lang = Lang::ZH;
        impl_->main_screen.set_language_label("中");
    } else {
        current_lang = Lang::EN;
        impl_->main_screen.set_language_label("EN");
    }

    impl_->setup_callbacks();

    // Setup LogPanel callbacks
    {
        LogPanel::Callbacks lcb;
        lcb.post_refresh = [this]() { impl_->refresh_screen(); };
        lcb.on_exported = [this](const std::string& path) {
            if (path.empty()) {
                impl_->status_bar.notify(T().log_export, true);
            } else {
                impl_->status_bar.notify(std::string(T().log_exported) + " " + path);
            }
            impl_->refresh_screen();
        };
        impl_->log_panel.set_callbacks(std::move(lcb));
    }

    impl_->status_bar.set_port(impl_->config.data().service_port);

    impl_->main_screen.set_content(impl_->log_panel.component());
    impl_->main_screen.set_status_bar(impl_->status_bar.component());
}

App::~App() {
    if (impl_->loop) impl_->loop->stop();
    if (impl_->quit_thread.joinable()) impl_->quit_thread.join();
}

int App::run() {
    // 1. Single instance
    const auto& d = impl_->config.data();
    impl_->lock = std::make_unique<InstanceLock>(d.instance_lock_port);
    std::string err;
    if (!impl_->lock->acquire(err)) {
        std::cerr << err << "\n";
        return 1;
    }

    // 2. Compose the supervisor (runs adoption detection)
    impl_->probe = make_os_probe(impl_->config.process_name());
    impl_->store = std::make_unique<StateStore>(d.pid_file);
    impl_->supervisor = std::make_unique<Supervisor>(
        impl_->config.supervisor_options(), *impl_->probe, *impl_->store, impl_->prober);
    impl_->loop = std::make_unique<ControlLoop>(
        *impl_->supervisor, impl_->make_loop_callbacks(),
        std::chrono::milliseconds(d.tick_interval_ms));

    // 3. Control thread
    impl_->loop->run();

    // 4. Run the TUI
    impl_->screen.Loop(impl_->main_screen.component());

    // Cleanup
    impl_->loop->stop();
    if (impl_->quit_thread.joinable()) impl_->quit_thread.join();
    return 0;
}
