#pragma once

#include <memory>

class App {
public:
    App();
    ~App();

    /// Runs the TUI. Returns the process exit code.
    int run();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
