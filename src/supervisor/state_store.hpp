#pragma once

#include <optional>
#include <string>
#include <sys/types.h>

/// Persists the managed service's PID as {"pid": N} so a restarted
/// supervisor can re-adopt it. The record is advisory: callers re-validate
/// it against the live process table before trusting it.
class StateStore {
public:
    explicit StateStore(std::string path);

    /// Replace the whole file. Returns false when it cannot be written.
    bool write(pid_t pid);

    /// Missing, unreadable or malformed content all read as "no record".
    std::optional<pid_t> read() const;

    /// Remove the record. A missing file is not an error.
    void clear();

    const std::string& path() const { return path_; }

private:
    std::string path_;
};
