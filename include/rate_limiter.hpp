#pragma once

#include <string>

#include "redis_manager.hpp"

namespace powgate {

// Protection layer in front of the gate endpoints.
// Thin wrapper over RedisManager providing distributed rate limiting and the
// single-use guard for solved challenges.
class RateLimiter {
public:
    explicit RateLimiter(RedisManager& redis);
    ~RateLimiter() = default;

    /**
     * Evaluates a rate-limit request against a specific key (e.g., blinded IP).
     * @param key Unique identifier for the rate-limit bucket.
     * @param limit Maximum number of tokens/requests allowed.
     * @param window_sec Period for the token-bucket window.
     * @param cost Resource cost of the current operation.
     * @return Detailed success/failure result with retry metadata.
     */
    RateLimitResult check(const std::string& key, int limit, int window_sec, int cost = 1);

    // True the first time a solved challenge is presented.
    bool consume_challenge(const std::string& challenge_string, int ttl_sec);

    bool available() const { return redis_.is_connected(); }

private:
    RedisManager& redis_;
};

}
