#include "os/process_handle.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <thread>

namespace {

constexpr auto WAIT_POLL_INTERVAL = std::chrono::milliseconds(50);

std::string describe_spawn_error(int err, const LaunchSpec& spec) {
    switch (err) {
        case ENOENT:
            return "Executable not found: " + spec.executable;
        case EACCES:
        case EPERM:
            return "Permission denied launching " + spec.executable;
        default:
            return "Failed to launch " + spec.executable + ": " + std::strerror(err);
    }
}

} // namespace

ProcessHandle::ProcessHandle(pid_t pid, int output_fd)
    : pid_(pid), output_fd_(output_fd) {}

ProcessHandle::~ProcessHandle() {
    if (output_fd_ >= 0) {
        close(output_fd_);
    }
}

std::unique_ptr<ProcessHandle> ProcessHandle::spawn(const LaunchSpec& spec, std::string& error) {
    if (spec.executable.empty()) {
        error = "No service executable configured";
        return nullptr;
    }

    int out_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) < 0) {
        error = std::string("pipe() failed: ") + std::strerror(errno);
        return nullptr;
    }

    // Close-on-exec pipe: a successful exec closes it, a failed one writes errno.
    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        error = std::string("pipe() failed: ") + std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return nullptr;
    }

    // Build argv/envp before forking; only async-signal-safe calls in the child
    std::vector<const char*> argv;
    argv.push_back(spec.executable.c_str());
    for (const auto& arg : spec.args) {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_entries;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos && spec.env.count(entry.substr(0, eq))) continue;
        env_entries.push_back(std::move(entry));
    }
    for (const auto& kv : spec.env) {
        env_entries.push_back(kv.first + "=" + kv.second);
    }
    std::vector<const char*> envp;
    for (const auto& entry : env_entries) {
        envp.push_back(entry.c_str());
    }
    envp.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("fork() failed: ") + std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return nullptr;
    }

    if (pid == 0) {
        // Child: own process group so terminal signals aimed at the
        // supervisor do not reach the service directly
        setpgid(0, 0);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);

        if (!spec.working_dir.empty() && chdir(spec.working_dir.c_str()) != 0) {
            int err = errno;
            ssize_t n = write(err_pipe[1], &err, sizeof(err));
            (void)n;
            _exit(127);
        }

        execvpe(spec.executable.c_str(),
                const_cast<char* const*>(argv.data()),
                const_cast<char* const*>(envp.data()));

        int err = errno;
        ssize_t n = write(err_pipe[1], &err, sizeof(err));
        (void)n;
        _exit(127);
    }

    // Parent
    close(out_pipe[1]);
    close(err_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status;
        waitpid(pid, &status, 0);
        close(out_pipe[0]);
        if (!spec.working_dir.empty() && child_errno == ENOENT && access(spec.working_dir.c_str(), F_OK) != 0) {
            error = "Working directory not found: " + spec.working_dir;
        } else {
            error = describe_spawn_error(child_errno, spec);
        }
        return nullptr;
    }

    return std::unique_ptr<ProcessHandle>(new ProcessHandle(pid, out_pipe[0]));
}

ProcessHandle::ReadResult ProcessHandle::read_line(std::string& line, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        auto nl = pending_.find('\n');
        if (nl != std::string::npos) {
            line = pending_.substr(0, nl);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            pending_.erase(0, nl + 1);
            return ReadResult::Line;
        }

        if (eof_) {
            // Flush an unterminated last line
            if (!pending_.empty()) {
                line = std::move(pending_);
                pending_.clear();
                return ReadResult::Line;
            }
            return ReadResult::Closed;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) return ReadResult::Timeout;

        struct pollfd pfd;
        pfd.fd = output_fd_;
        pfd.events = POLLIN;
        int ret = poll(&pfd, 1, static_cast<int>(remaining));
        if (ret < 0) {
            if (errno == EINTR) continue;
            eof_ = true;
            continue;
        }
        if (ret == 0) return ReadResult::Timeout;

        char buf[4096];
        ssize_t got = read(output_fd_, buf, sizeof(buf));
        if (got > 0) {
            pending_.append(buf, static_cast<size_t>(got));
        } else if (got == 0 || (errno != EINTR && errno != EAGAIN)) {
            eof_ = true;
        }
    }
}

std::optional<int> ProcessHandle::poll_exit() {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (exit_code_) return exit_code_;

    int status;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        } else {
            exit_code_ = -1;
        }
    } else if (result < 0 && errno == ECHILD) {
        // Reaped elsewhere; the process is gone either way
        exit_code_ = -1;
    }
    return exit_code_;
}

bool ProcessHandle::has_exited() {
    return poll_exit().has_value();
}

bool ProcessHandle::wait_for(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (has_exited()) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(WAIT_POLL_INTERVAL);
    }
}

bool ProcessHandle::send(int sig) {
    // Holding the lock keeps the pid unreaped (and therefore not reusable)
    // while the signal is delivered.
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (exit_code_) return false;
    return ::kill(pid_, sig) == 0;
}

bool ProcessHandle::terminate() { return send(SIGTERM); }
bool ProcessHandle::kill() { return send(SIGKILL); }
