#pragma once

#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

enum class Sentinel { Ready, Timeout, Stopped, PortBlocked, PortFree, RestartNow };

enum class LogSource { Supervisor, Service };

/// One entry of the supervisor's event stream: either a log line or a
/// control sentinel. Sentinels may carry a detail string (blocking PID,
/// failure reason); it is never interpreted as a log line.
struct SupervisorEvent {
    enum class Kind { Log, Sentinel };

    Kind kind = Kind::Log;
    LogSource source = LogSource::Supervisor;
    Sentinel sentinel = Sentinel::Ready;
    std::string text;
    std::chrono::system_clock::time_point time = std::chrono::system_clock::now();

    static SupervisorEvent log(std::string line, LogSource src = LogSource::Supervisor);
    static SupervisorEvent signal(Sentinel s, std::string detail = "");

    bool is_log() const { return kind == Kind::Log; }
    bool is(Sentinel s) const { return kind == Kind::Sentinel && sentinel == s; }
};

const char* sentinel_name(Sentinel s);

/// "HH:MM:SS" in local time.
std::string format_event_time(std::chrono::system_clock::time_point tp);

/// Multi-producer, single-consumer FIFO.
class EventQueue {
public:
    void push(SupervisorEvent event);

    /// Remove and return everything queued, oldest first.
    std::vector<SupervisorEvent> drain();

    bool empty() const;

private:
    mutable std::mutex mutex_;
    std::deque<SupervisorEvent> events_;
};
