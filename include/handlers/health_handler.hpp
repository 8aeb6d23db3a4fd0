#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include "gate_config.hpp"
#include "rate_limiter.hpp"
#include "metrics.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace powgate {

class HealthHandler {
public:
    HealthHandler(const GateConfig& config, const RateLimiter& rate_limiter)
        : config_(config), rate_limiter_(rate_limiter) {}

    http::response<http::string_body> handle_health(unsigned version);
    http::response<http::string_body> handle_metrics(unsigned version);

    // Helper used by metrics
    bool verify_admin_request(const http::request<http::string_body>& req);

private:
    const GateConfig& config_;
    const RateLimiter& rate_limiter_;

    template<class Body>
    void add_security_headers(http::response<Body>& res) {
        res.set("X-Content-Type-Options", "nosniff");
        res.set("X-Frame-Options", "DENY");
        res.set("Content-Security-Policy", "default-src 'none'");
        res.set(http::field::cache_control, "no-store");
    }
};

}
