#include "os/process_tree_killer.hpp"

#include <spdlog/spdlog.h>

#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <set>
#include <sstream>
#include <thread>

namespace {

constexpr auto EXIT_POLL_INTERVAL = std::chrono::milliseconds(100);

} // namespace

std::string KillReport::summary() const {
    if (!found) return "process already gone";
    std::ostringstream oss;
    oss << members.size() << " process(es): "
        << graceful << " stopped gracefully, "
        << forced << " force-killed";
    if (survivors > 0) {
        oss << ", " << survivors << " still alive";
    }
    return oss.str();
}

ProcessTreeKiller::ProcessTreeKiller(const OsProbe& probe,
                                     std::chrono::milliseconds grace,
                                     std::chrono::milliseconds confirm)
    : probe_(probe), grace_(grace), confirm_(confirm) {}

bool ProcessTreeKiller::is_protected(pid_t pid) const {
    if (pid <= 1) return true;

    // Never signal ourselves or anything we descend from
    pid_t cursor = getpid();
    for (int depth = 0; cursor > 1 && depth < 64; ++depth) {
        if (cursor == pid) return true;
        auto info = probe_.process_info(cursor);
        if (!info) break;
        cursor = info->ppid;
    }
    return false;
}

std::vector<pid_t> ProcessTreeKiller::descendants(pid_t pid) const {
    std::vector<pid_t> result;
    std::set<pid_t> seen{pid};
    std::vector<pid_t> stack{pid};

    while (!stack.empty()) {
        pid_t current = stack.back();
        stack.pop_back();
        for (pid_t child : probe_.child_pids(current)) {
            if (!seen.insert(child).second) continue;
            result.push_back(child);
            stack.push_back(child);
        }
    }
    return result;
}

pid_t ProcessTreeKiller::find_tree_root(pid_t pid, const std::string& family_name) const {
    auto start = probe_.process_info(pid);
    if (!start) return pid;

    std::string family = family_name.empty() ? start->name : family_name.substr(0, 15);
    pid_t root = pid;
    pid_t parent = start->ppid;

    for (int depth = 0; depth < 64; ++depth) {
        if (parent <= 1 || is_protected(parent)) break;
        auto info = probe_.process_info(parent);
        if (!info) break;
        if (info->name.find(family) == std::string::npos &&
            info->name != start->name) {
            break;
        }
        root = parent;
        parent = info->ppid;
    }
    return root;
}

std::vector<pid_t> ProcessTreeKiller::wait_for_exit(const std::vector<pid_t>& pids,
                                                    std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<pid_t> alive = pids;

    while (true) {
        alive.erase(std::remove_if(alive.begin(), alive.end(),
                                   [this](pid_t p) { return !probe_.process_exists(p); }),
                    alive.end());
        if (alive.empty() || std::chrono::steady_clock::now() >= deadline) break;
        std::this_thread::sleep_for(EXIT_POLL_INTERVAL);
    }
    return alive;
}

KillReport ProcessTreeKiller::escalate(std::vector<pid_t> members) const {
    KillReport report;
    report.found = true;

    members.erase(std::remove_if(members.begin(), members.end(),
                                 [this](pid_t p) {
                                     if (is_protected(p)) {
                                         spdlog::warn("Refusing to signal protected PID {}", p);
                                         return true;
                                     }
                                     return false;
                                 }),
                  members.end());
    report.members = members;

    for (pid_t p : members) {
        if (::kill(p, SIGTERM) != 0 && errno != ESRCH) {
            spdlog::warn("SIGTERM to PID {} failed: {}", p, std::strerror(errno));
        }
    }

    auto alive = wait_for_exit(members, grace_);
    report.graceful = static_cast<int>(members.size() - alive.size());
    if (alive.empty()) return report;

    for (pid_t p : alive) {
        // Re-validate right before the destructive action
        if (!probe_.process_exists(p)) continue;
        auto info = probe_.process_info(p);
        spdlog::warn("Force-killing {} (PID {})", info ? info->name : "?", p);
        if (::kill(p, SIGKILL) != 0 && errno != ESRCH) {
            spdlog::warn("SIGKILL to PID {} failed: {}", p, std::strerror(errno));
        }
    }

    auto survivors = wait_for_exit(alive, confirm_);
    report.forced = static_cast<int>(alive.size() - survivors.size());
    report.survivors = static_cast<int>(survivors.size());
    for (pid_t p : survivors) {
        spdlog::error("PID {} survived SIGKILL", p);
    }
    return report;
}

KillReport ProcessTreeKiller::kill_tree(pid_t root_pid) const {
    if (!probe_.process_exists(root_pid)) {
        return KillReport{};
    }

    // Snapshot first: root, then every descendant at this moment
    std::vector<pid_t> members{root_pid};
    auto family = descendants(root_pid);
    members.insert(members.end(), family.begin(), family.end());

    auto info = probe_.process_info(root_pid);
    spdlog::info("Terminating {} (PID {}) + {} child process(es)",
                 info ? info->name : "?", root_pid, family.size());
    return escalate(std::move(members));
}

KillReport ProcessTreeKiller::terminate(pid_t pid) const {
    if (!probe_.process_exists(pid)) {
        return KillReport{};
    }
    return escalate({pid});
}
