#pragma once

#include <chrono>
#include <string>

struct HealthUrl {
    std::string base;   // scheme://host:port
    std::string path;   // "/..." (defaults to "/")
    bool valid = false;
};

class HealthProber {
public:
    HealthProber();
    ~HealthProber();

    /// One GET against `url`. True only for an HTTP 200 answer within
    /// `timeout`; connection errors, other status codes and timeouts are
    /// all false. No retries.
    bool check(const std::string& url, std::chrono::milliseconds timeout);

    static HealthUrl split_url(const std::string& url);
};
