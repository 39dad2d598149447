// Stand-in for the managed service in tests.
//
//   fake_service --port N [--ready-after-ms N] [--never-ready]
//                [--exit-after-ms N] [--exit-code N] [--ignore-term]
//                [--tree] [--no-listen]
//
// Serves GET / and GET /health on 127.0.0.1:N. Before readiness both answer
// 503. --tree forks a child which forks a grandchild; all three inherit the
// listening socket, so the port stays busy until the whole tree is gone.

#include <httplib.h>

#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

namespace {

struct Options {
    int port = 0;
    int ready_after_ms = 0;
    bool never_ready = false;
    int exit_after_ms = -1;
    int exit_code = 3;
    bool ignore_term = false;
    bool tree = false;
    bool no_listen = false;
};

bool parse(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](int& out) {
            if (i + 1 >= argc) return false;
            out = std::atoi(argv[++i]);
            return true;
        };
        if (arg == "--port") { if (!next(opts.port)) return false; }
        else if (arg == "--ready-after-ms") { if (!next(opts.ready_after_ms)) return false; }
        else if (arg == "--exit-after-ms") { if (!next(opts.exit_after_ms)) return false; }
        else if (arg == "--exit-code") { if (!next(opts.exit_code)) return false; }
        else if (arg == "--never-ready") opts.never_ready = true;
        else if (arg == "--ignore-term") opts.ignore_term = true;
        else if (arg == "--tree") opts.tree = true;
        else if (arg == "--no-listen") opts.no_listen = true;
        else return false;
    }
    return opts.no_listen || opts.port > 0;
}

void idle_forever() {
    while (true) pause();
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    if (!parse(argc, argv, opts)) {
        std::cerr << "fake_service: bad arguments" << std::endl;
        return 2;
    }

    if (opts.ignore_term) {
        signal(SIGTERM, SIG_IGN);
    }

    std::cout << "fake_service starting (pid " << getpid() << ")" << std::endl;
    std::cerr << "fake_service stderr line" << std::endl;

    if (opts.exit_after_ms >= 0) {
        std::thread([&opts] {
            std::this_thread::sleep_for(std::chrono::milliseconds(opts.exit_after_ms));
            std::cout << "fake_service exiting with " << opts.exit_code << std::endl;
            std::_Exit(opts.exit_code);
        }).detach();
    }

    if (opts.no_listen) {
        idle_forever();
    }

    auto started = std::chrono::steady_clock::now();
    auto ready = [&] {
        if (opts.never_ready) return false;
        return std::chrono::steady_clock::now() - started >=
               std::chrono::milliseconds(opts.ready_after_ms);
    };

    httplib::Server svr;
    auto handler = [&](const httplib::Request&, httplib::Response& res) {
        if (ready()) {
            res.set_content("ok", "text/plain");
        } else {
            res.status = 503;
            res.set_content("warming up", "text/plain");
        }
    };
    svr.Get("/", handler);
    svr.Get("/health", handler);

    if (!svr.bind_to_port("127.0.0.1", opts.port)) {
        std::cerr << "fake_service: cannot bind port " << opts.port << std::endl;
        return 4;
    }

    if (opts.tree) {
        // Child and grandchild hold the inherited listening socket
        pid_t child = fork();
        if (child == 0) {
            pid_t grandchild = fork();
            if (grandchild == 0) idle_forever();
            idle_forever();
        }
    }

    std::cout << "fake_service listening on " << opts.port << std::endl;
    svr.listen_after_bind();
    return 0;
}
