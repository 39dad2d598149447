#include "core/instance_lock.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

InstanceLock::InstanceLock(int port) : port_(port) {}

InstanceLock::~InstanceLock() {
    release();
}

bool InstanceLock::acquire(std::string& err) {
    if (fd_ >= 0) return true;

    // Close-on-exec so the spawned service never inherits the lock
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        err = std::string("Cannot create lock socket: ") + std::strerror(errno);
        return false;
    }

    // No SO_REUSEADDR: the bind itself is the lock
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port_));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int saved = errno;
        close(fd);
        if (saved == EADDRINUSE) {
            err = "Another svpanel instance is already running (lock port " +
                  std::to_string(port_) + " is taken)";
        } else {
            err = "Cannot bind lock port " + std::to_string(port_) + ": " + std::strerror(saved);
        }
        return false;
    }

    if (listen(fd, 1) < 0) {
        err = std::string("Cannot listen on lock port: ") + std::strerror(errno);
        close(fd);
        return false;
    }

    fd_ = fd;
    return true;
}

void InstanceLock::release() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}
