#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

struct LaunchSpec {
    std::string executable;
    std::vector<std::string> args;
    std::string working_dir;                  // empty = inherit
    std::map<std::string, std::string> env;   // added to the inherited environment
};

/// A child process spawned by this supervisor, with its combined
/// stdout/stderr available as a line stream. Destroying the handle closes
/// the output pipe but leaves the process running.
class ProcessHandle {
public:
    enum class ReadResult { Line, Timeout, Closed };

    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    /// Fork and exec the spec. Returns nullptr and fills `error` when the
    /// executable cannot be started (not found, permission denied, bad
    /// working directory).
    static std::unique_ptr<ProcessHandle> spawn(const LaunchSpec& spec, std::string& error);

    pid_t pid() const { return pid_; }

    /// Read one line of output, waiting at most `timeout`.
    ReadResult read_line(std::string& line, std::chrono::milliseconds timeout);

    /// Non-blocking reap. Returns the exit code once the child has exited
    /// (128 + signal number when killed by a signal).
    std::optional<int> poll_exit();

    /// Wait up to `timeout` for the child to exit.
    bool wait_for(std::chrono::milliseconds timeout);

    bool has_exited();

    /// SIGTERM / SIGKILL. No-ops once the child has been reaped.
    bool terminate();
    bool kill();

private:
    ProcessHandle(pid_t pid, int output_fd);

    bool send(int sig);

    pid_t pid_;
    int output_fd_;
    std::string pending_;
    bool eof_ = false;

    std::mutex reap_mutex_;
    std::optional<int> exit_code_;
};
