#include "os/os_probe.hpp"

#include <arpa/inet.h>
#include <dirent.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <set>
#include <sstream>

namespace {

constexpr int CONNECT_TIMEOUT_MS = 500;
constexpr auto OWNER_SCAN_BUDGET = std::chrono::milliseconds(800);

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<pid_t> list_pids() {
    std::vector<pid_t> pids;
    DIR* dir = opendir("/proc");
    if (!dir) return pids;

    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        if (!std::isdigit(static_cast<unsigned char>(entry->d_name[0]))) continue;
        pids.push_back(static_cast<pid_t>(std::atoi(entry->d_name)));
    }
    closedir(dir);
    return pids;
}

// Socket inodes in LISTEN state (st == 0A) bound to the given local port.
std::set<std::string> listen_inodes(int port) {
    std::set<std::string> inodes;
    const char* tables[] = {"/proc/net/tcp", "/proc/net/tcp6"};

    for (const char* table : tables) {
        std::ifstream file(table);
        if (!file.is_open()) continue;

        std::string line;
        std::getline(file, line); // header

        while (std::getline(file, line)) {
            std::istringstream iss(line);
            std::vector<std::string> fields;
            std::string field;
            while (iss >> field) fields.push_back(field);
            if (fields.size() < 10) continue;
            if (fields[3] != "0A") continue;

            const std::string& local = fields[1];
            auto colon = local.rfind(':');
            if (colon == std::string::npos) continue;

            int local_port = 0;
            try {
                local_port = std::stoi(local.substr(colon + 1), nullptr, 16);
            } catch (const std::exception&) {
                continue;
            }
            if (local_port == port) {
                inodes.insert(fields[9]);
            }
        }
    }
    return inodes;
}

class LinuxOsProbe : public OsProbe {
public:
    explicit LinuxOsProbe(std::string expected_name)
        : expected_name_(std::move(expected_name)) {}

    bool is_process_alive(pid_t pid) const override {
        auto info = process_info(pid);
        if (!info || info->state == 'Z' || info->state == 'X') return false;
        if (expected_name_.empty()) return true;

        // comm is truncated to 15 characters by the kernel
        std::string want = to_lower(expected_name_.substr(0, 15));
        return to_lower(info->name).find(want) != std::string::npos;
    }

    bool process_exists(pid_t pid) const override {
        auto info = process_info(pid);
        return info && info->state != 'Z' && info->state != 'X';
    }

    bool is_port_listening(int port) const override {
        int fd = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
        if (fd < 0) return false;

        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

        bool connected = false;
        if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0) {
            connected = true;
        } else if (errno == EINPROGRESS) {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLOUT;
            if (poll(&pfd, 1, CONNECT_TIMEOUT_MS) == 1) {
                int err = 0;
                socklen_t len = sizeof(err);
                if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0) {
                    connected = true;
                }
            }
        }

        close(fd);
        return connected;
    }

    std::optional<pid_t> find_port_owner(int port) const override {
        auto inodes = listen_inodes(port);
        if (inodes.empty()) return std::nullopt;

        auto deadline = std::chrono::steady_clock::now() + OWNER_SCAN_BUDGET;
        std::optional<pid_t> owner;

        for (pid_t pid : list_pids()) {
            if (std::chrono::steady_clock::now() > deadline) break;
            if (owner && pid > *owner) continue;

            std::string fd_dir = "/proc/" + std::to_string(pid) + "/fd";
            DIR* dir = opendir(fd_dir.c_str());
            if (!dir) continue; // not ours to inspect, or gone

            struct dirent* entry;
            while ((entry = readdir(dir)) != nullptr) {
                if (entry->d_name[0] == '.') continue;

                std::string link_path = fd_dir + "/" + entry->d_name;
                char link[256];
                ssize_t len = readlink(link_path.c_str(), link, sizeof(link) - 1);
                if (len <= 0) continue;
                link[len] = '\0';

                // "socket:[12345]"
                std::string target(link);
                if (target.compare(0, 8, "socket:[") != 0 || target.back() != ']') continue;
                std::string inode = target.substr(8, target.size() - 9);
                if (inodes.count(inode)) {
                    owner = pid;
                    break;
                }
            }
            closedir(dir);
        }
        return owner;
    }

    std::optional<ProcessInfo> process_info(pid_t pid) const override {
        if (pid <= 0) return std::nullopt;

        std::ifstream file("/proc/" + std::to_string(pid) + "/stat");
        if (!file.is_open()) return std::nullopt;

        std::string line;
        if (!std::getline(file, line)) return std::nullopt;

        // "pid (comm) state ppid ..." where comm may itself contain ')'
        auto open = line.find('(');
        auto close_paren = line.rfind(')');
        if (open == std::string::npos || close_paren == std::string::npos || close_paren < open) {
            return std::nullopt;
        }

        ProcessInfo info;
        info.pid = pid;
        info.name = line.substr(open + 1, close_paren - open - 1);

        std::istringstream iss(line.substr(close_paren + 1));
        iss >> info.state >> info.ppid;
        if (iss.fail()) return std::nullopt;
        return info;
    }

    std::vector<pid_t> child_pids(pid_t pid) const override {
        std::vector<pid_t> children;
        for (pid_t candidate : list_pids()) {
            auto info = process_info(candidate);
            if (info && info->ppid == pid) {
                children.push_back(candidate);
            }
        }
        return children;
    }

    const std::string& expected_name() const override { return expected_name_; }

private:
    std::string expected_name_;
};

} // namespace

std::unique_ptr<OsProbe> make_os_probe(const std::string& expected_name) {
    return std::make_unique<LinuxOsProbe>(expected_name);
}
