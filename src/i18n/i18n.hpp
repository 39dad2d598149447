#pragma once

#include <atomic>

enum class Lang { EN, ZH };

struct Strings {
    // General
    const char* app_title;
    const char* confirm;
    const char* cancel;

    // Service status
    const char* status_stopped;
    const char* status_starting;
    const char* status_running;
    const char* status_stopping;
    const char* status_error;

    // Actions
    const char* action_start;
    const char* action_stop;
    const char* action_restart;
    const char* action_refresh;
    const char* action_kill_blocker;
    const char* action_quit;
    const char* action_language;

    // Status bar
    const char* bar_pid;
    const char* bar_port;
    const char* bar_adopted;
    const char* bar_owned;
    const char* bar_last_error;
    const char* bar_port_blocked;

    // Notifications
    const char* notify_ready;
    const char* notify_timeout;
    const char* notify_stopped;
    const char* notify_port_blocked;
    const char* notify_port_free;

    // Quit dialog
    const char* quit_title;
    const char* quit_prompt;
    const char* quit_stop_exit;
    const char* quit_leave_running;
    const char* quit_waiting;

    // Log panel
    const char* log_all;
    const char* log_supervisor;
    const char* log_service;
    const char* log_freeze;
    const char* log_unfreeze;
    const char* log_export;
    const char* log_exported;
    const char* log_empty;
};

#include "i18n/en.hpp"
#include "i18n/zh.hpp"

inline const Strings EN_STRINGS = EN_STRINGS_DEF;
inline const Strings ZH_STRINGS = ZH_STRINGS_DEF;
inline std::atomic<Lang> current_lang{Lang::EN};

inline const Strings& T() {
    return current_lang.load() == Lang::ZH ? ZH_STRINGS : EN_STRINGS;
}
