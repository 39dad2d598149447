#include "supervisor/event.hpp"

#include <ctime>
#include <iomanip>
#include <iterator>
#include <sstream>

SupervisorEvent SupervisorEvent::log(std::string line, LogSource src) {
    SupervisorEvent e;
    e.kind = Kind::Log;
    e.source = src;
    e.text = std::move(line);
    return e;
}

SupervisorEvent SupervisorEvent::signal(Sentinel s, std::string detail) {
    SupervisorEvent e;
    e.kind = Kind::Sentinel;
    e.sentinel = s;
    e.text = std::move(detail);
    return e;
}

const char* sentinel_name(Sentinel s) {
    switch (s) {
        case Sentinel::Ready: return "Ready";
        case Sentinel::Timeout: return "Timeout";
        case Sentinel::Stopped: return "Stopped";
        case Sentinel::PortBlocked: return "PortBlocked";
        case Sentinel::PortFree: return "PortFree";
        case Sentinel::RestartNow: return "RestartNow";
    }
    return "Unknown";
}

std::string format_event_time(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S");
    return oss.str();
}

void EventQueue::push(SupervisorEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(std::move(event));
}

std::vector<SupervisorEvent> EventQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SupervisorEvent> out(std::make_move_iterator(events_.begin()),
                                     std::make_move_iterator(events_.end()));
    events_.clear();
    return out;
}

bool EventQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.empty();
}
