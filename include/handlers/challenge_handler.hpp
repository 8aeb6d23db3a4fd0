#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <string>
#include "gate_config.hpp"
#include "challenge.hpp"
#include "clearance.hpp"
#include "difficulty_policy.hpp"
#include "pow_verifier.hpp"
#include "rate_limiter.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace powgate {

// Long-lived gate components shared by every session.
struct GateContext {
    const GateConfig& config;
    const ChallengeIssuer& issuer;
    const PoWVerifier& verifier;
    const DifficultyPolicy& policy;
    const Clearance& clearance;
    RateLimiter& rate_limiter;
};

// Issues challenges and decides whether a request may pass the gate.
class ChallengeHandler {
public:
    static constexpr const char* FAILURE_MESSAGE = "Proof of Work verification failed. Please try again.";

    explicit ChallengeHandler(const GateContext& ctx)
        : ctx_(ctx) {}

    // GET /pow/challenge
    http::response<http::string_body> handle_challenge(const http::request<http::string_body>& req, const std::string& remote_addr);

    /**
     * Any other GET. Order:
     *   valid clearance cookie -> 200
     *   solution headers present -> verify, replay guard -> 200 + cookie, or 403
     *   nothing presented -> 401 with a fresh challenge
     */
    http::response<http::string_body> handle_protected(const http::request<http::string_body>& req, const std::string& remote_addr);

    static bool has_solution_headers(const http::request<http::string_body>& req);

private:
    const GateContext& ctx_;

    http::response<http::string_body> issue_response(http::status status, unsigned version, const std::string& remote_addr);
    http::response<http::string_body> handle_submission(const http::request<http::string_body>& req, const std::string& remote_addr);
    http::response<http::string_body> handle_forbidden(unsigned version);
    http::response<http::string_body> handle_unavailable(unsigned version);
    http::response<http::string_body> handle_success(unsigned version, const std::string& message, bool set_cookie);

    template<class Body>
    void add_security_headers(http::response<Body>& res) {
        res.set("X-Content-Type-Options", "nosniff");
        res.set("X-Frame-Options", "DENY");
        res.set("Content-Security-Policy", "default-src 'none'");
        res.set(http::field::cache_control, "no-store");
    }
};

}
