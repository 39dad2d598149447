#include "api/health_prober.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

HealthProber::HealthProber() = default;
HealthProber::~HealthProber() = default;

HealthUrl HealthProber::split_url(const std::string& url) {
    HealthUrl out;
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return out;

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") return out;

    auto path_start = url.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
        out.base = url;
        out.path = "/";
    } else {
        out.base = url.substr(0, path_start);
        out.path = url.substr(path_start);
    }
    out.valid = out.base.size() > scheme_end + 3;
    return out;
}

bool HealthProber::check(const std::string& url, std::chrono::milliseconds timeout) {
    auto target = split_url(url);
    if (!target.valid) {
        spdlog::debug("Invalid health URL: {}", url);
        return false;
    }

    try {
        httplib::Client cli(target.base);
        if (!cli.is_valid()) return false;

        auto sec = static_cast<time_t>(timeout.count() / 1000);
        auto usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
        cli.set_connection_timeout(sec, usec);
        cli.set_read_timeout(sec, usec);
        cli.set_write_timeout(sec, usec);
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        // Local service, usually with a self-signed certificate
        cli.enable_server_certificate_verification(false);
#endif

        auto res = cli.Get(target.path);
        return res && res->status == 200;
    } catch (const std::exception& e) {
        spdlog::debug("Health probe {} failed: {}", url, e.what());
        return false;
    }
}
