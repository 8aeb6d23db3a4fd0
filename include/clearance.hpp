#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "challenge.hpp"

namespace powgate {

// Stateless clearance granted after an accepted solution.
// Token format: "<expiry>.<hex HMAC-SHA256(secret, "clearance|" + expiry)>".
class Clearance {
public:
    static constexpr const char* COOKIE_NAME = "powgate_clearance";
    static constexpr uint64_t DEFAULT_TTL_SEC = 900;

    Clearance(std::string secret, uint64_t ttl_sec = DEFAULT_TTL_SEC, UnixClock clock = system_unix_seconds);

    std::string issue_token() const;

    // Full Set-Cookie header value for a freshly issued token.
    std::string set_cookie_header() const;

    // True for a well-formed, authentic, unexpired token.
    bool is_valid(const std::string& token) const;

    // Looks for COOKIE_NAME in a Cookie request header and validates it.
    bool is_cleared(const std::string& cookie_header) const;

    static std::optional<std::string> find_cookie(const std::string& cookie_header, const std::string& name);

    uint64_t ttl_sec() const { return ttl_sec_; }

private:
    std::string tag_for(uint64_t expiry) const;

    ChallengeSigner signer_;
    uint64_t ttl_sec_;
    UnixClock clock_;
};

}
