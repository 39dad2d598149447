#include "supervisor/state_store.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <unistd.h>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

StateStore::StateStore(std::string path) : path_(std::move(path)) {}

bool StateStore::write(pid_t pid) {
    if (path_.empty()) return false;

    std::error_code ec;
    auto parent = fs::path(path_).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            spdlog::warn("Cannot create state directory {}: {}", parent.string(), ec.message());
            return false;
        }
    }

    // Write beside the target, then rename over it
    std::string tmp = path_ + ".tmp." + std::to_string(getpid());
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            spdlog::warn("Cannot write PID file {}", tmp);
            return false;
        }
        out << json({{"pid", pid}}).dump();
        if (!out.good()) {
            spdlog::warn("Short write to PID file {}", tmp);
            fs::remove(tmp, ec);
            return false;
        }
    }

    fs::rename(tmp, path_, ec);
    if (ec) {
        spdlog::warn("Cannot replace PID file {}: {}", path_, ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

std::optional<pid_t> StateStore::read() const {
    std::ifstream in(path_);
    if (!in.is_open()) return std::nullopt;

    try {
        auto j = json::parse(in);
        if (!j.is_object()) return std::nullopt;
        auto it = j.find("pid");
        if (it == j.end() || !it->is_number_integer()) return std::nullopt;
        auto pid = it->get<long long>();
        if (pid <= 0 || pid > 0x7fffffff) return std::nullopt;
        return static_cast<pid_t>(pid);
    } catch (const json::exception& e) {
        spdlog::debug("Ignoring malformed PID file {}: {}", path_, e.what());
        return std::nullopt;
    }
}

void StateStore::clear() {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        spdlog::warn("Cannot remove PID file {}: {}", path_, ec.message());
    }
}
