#pragma once

#include <spdlog/common.h>

#include <string>

struct AppConfig;

/// Install the default spdlog logger: a rotating file at `file_path`
/// (skipped when empty), plus a colored stderr sink when `console` is set.
/// The TUI must pass console=false, stderr would corrupt the screen.
void init_logging(const AppConfig& config, const std::string& file_path, bool console);

/// "debug", "warn", ... Unknown names map to info.
spdlog::level::level_enum parse_log_level(const std::string& name);
