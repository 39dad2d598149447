#pragma once

#include "os/os_probe.hpp"

#include <chrono>
#include <string>
#include <vector>

struct KillReport {
    bool found = false;      // root existed when the kill started
    int graceful = 0;        // exited within the grace window
    int forced = 0;          // exited after SIGKILL
    int survivors = 0;       // still alive after the confirm window
    std::vector<pid_t> members;

    bool clean() const { return survivors == 0; }
    std::string summary() const;
};

class ProcessTreeKiller {
public:
    ProcessTreeKiller(const OsProbe& probe,
                      std::chrono::milliseconds grace = std::chrono::seconds(5),
                      std::chrono::milliseconds confirm = std::chrono::seconds(3));

    /// SIGTERM the root and every descendant (snapshot taken up front),
    /// wait for the grace window, SIGKILL survivors, wait for confirmation.
    KillReport kill_tree(pid_t root_pid) const;

    /// Same escalation for a single process.
    KillReport terminate(pid_t pid) const;

    /// Climb parent links while the parent belongs to the same process
    /// family (same name as `pid`, or `family_name` when given).
    pid_t find_tree_root(pid_t pid, const std::string& family_name = "") const;

    /// All descendants of pid, depth first.
    std::vector<pid_t> descendants(pid_t pid) const;

private:
    const OsProbe& probe_;
    std::chrono::milliseconds grace_;
    std::chrono::milliseconds confirm_;

    KillReport escalate(std::vector<pid_t> members) const;
    std::vector<pid_t> wait_for_exit(const std::vector<pid_t>& pids,
                                     std::chrono::milliseconds timeout) const;
    bool is_protected(pid_t pid) const;
};
