#pragma once

#include <string>
#include <memory>
#include <atomic>
#include <sw/redis++/redis++.h>

namespace powgate {

struct RateLimitResult {
    bool allowed;
    long long current;
    long long limit;
    long long reset_after_sec;
};

// Redis-backed shared state for a fleet of gate instances.
// Provides atomic rate limiting and single-use challenge tracking.
//
// Without a reachable server, rate limiting fails open and the replay guard
// fails closed.
class RedisManager {
public:
    static constexpr const char* SEEN_PREFIX = "powgate:seen:";

    explicit RedisManager(const std::string& redis_url);
    ~RedisManager() = default;

    RedisManager(const RedisManager&) = delete;
    RedisManager& operator=(const RedisManager&) = delete;

    // Connection health check.
    bool is_connected() const { return connected_; }

    // --- Global Rate Limiting ---
    // Implements an atomic token-bucket rate limiter via Lua scripting.
    RateLimitResult rate_limit(const std::string& key, int limit, int period_sec, int cost = 1);

    // --- Replay guard ---
    /**
     * Marks a challenge string as used.
     * @param challenge_string The challenge as echoed by the client.
     * @param ttl_sec Retention; at least the verifier's freshness window.
     * @return true only for the first caller within ttl_sec.
     */
    bool consume_challenge(const std::string& challenge_string, int ttl_sec);

private:
    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> connected_{false};
};

}
