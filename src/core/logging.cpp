#include "core/logging.hpp"
#include "core/config.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

spdlog::level::level_enum parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto level = spdlog::level::from_str(lower);
    // from_str answers "off" for anything it does not know
    if (level == spdlog::level::off && lower != "off") {
        return spdlog::level::info;
    }
    return level;
}

void init_logging(const AppConfig& config, const std::string& file_path, bool console) {
    std::vector<spdlog::sink_ptr> sinks;

    if (!file_path.empty()) {
        std::error_code ec;
        auto parent = fs::path(file_path).parent_path();
        if (!parent.empty()) fs::create_directories(parent, ec);

        size_t max_size = static_cast<size_t>(std::max(config.log_max_size_kb, 1)) * 1024;
        size_t max_files = static_cast<size_t>(std::max(config.log_max_files, 1));
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file_path, max_size, max_files));
        } catch (const spdlog::spdlog_ex& e) {
            // Keep running without a log file; report only where it can be seen
            if (console) {
                auto err = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
                spdlog::logger("svpanel", err).warn("Cannot open log file {}: {}", file_path, e.what());
            }
        }
    }

    if (console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("svpanel", sinks.begin(), sinks.end());
    logger->set_level(parse_log_level(config.log_level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}
