#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

struct ProcessInfo {
    pid_t pid = -1;
    pid_t ppid = -1;
    std::string name;   // kernel comm name (max 15 chars on Linux)
    char state = '?';   // R, S, D, Z, T, ...
};

/// Read-only queries against the OS process table and TCP socket table.
/// Every call is bounded well under a second.
class OsProbe {
public:
    virtual ~OsProbe() = default;

    /// Process exists, is not a zombie and matches the expected executable
    /// name (guards against PID reuse). An empty expected name skips the
    /// identity check.
    virtual bool is_process_alive(pid_t pid) const = 0;

    /// Process exists and is not a zombie. No identity check.
    virtual bool process_exists(pid_t pid) const = 0;

    /// Short-timeout TCP connect to 127.0.0.1:port.
    virtual bool is_port_listening(int port) const = 0;

    /// PID of the process holding the LISTEN socket for the port.
    virtual std::optional<pid_t> find_port_owner(int port) const = 0;

    virtual std::optional<ProcessInfo> process_info(pid_t pid) const = 0;

    /// Direct children of pid (snapshot).
    virtual std::vector<pid_t> child_pids(pid_t pid) const = 0;

    virtual const std::string& expected_name() const = 0;
};

/// Probe for the host OS (Linux /proc implementation).
std::unique_ptr<OsProbe> make_os_probe(const std::string& expected_name);
