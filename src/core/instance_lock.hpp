#pragma once

#include <string>

/// Single-instance guard: holds an exclusive listening socket on
/// 127.0.0.1:<port> for as long as the object lives. A second supervisor
/// trying to acquire the same port fails.
class InstanceLock {
public:
    explicit InstanceLock(int port);
    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    /// Returns false and fills `err` when another instance holds the lock.
    bool acquire(std::string& err);
    void release();

    bool held() const { return fd_ >= 0; }
    int port() const { return port_; }

private:
    int port_;
    int fd_ = -1;
};
