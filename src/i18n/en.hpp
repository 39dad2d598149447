#pragma once

// English string table - included by i18n.hpp after Strings is defined

inline constexpr Strings EN_STRINGS_DEF = {
    // General
    "svpanel",
    "Confirm",
    "Cancel",

    // Service status
    "Stopped",
    "Starting",
    "Running",
    "Stopping",
    "Error",

    // Actions
    "Start",
    "Stop",
    "Restart",
    "Refresh",
    "Kill blocking process",
    "Quit",
    "Language",

    // Status bar
    "PID",
    "Port",
    "adopted",
    "owned",
    "Last error",
    "port blocked",

    // Notifications
    "Service is ready",
    "Service failed to start",
    "Service stopped",
    "Port is in use by another process",
    "Port is now free",

    // Quit dialog
    "Quit",
    "The service is still running.",
    "Stop service and exit",
    "Leave running and exit",
    "Stopping service...",

    // Log panel
    "All",
    "Supervisor",
    "Service",
    "Frozen",
    "Live",
    "Export",
    "Log exported to",
    "(no logs)",
};
