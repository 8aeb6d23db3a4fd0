#include "rate_limiter.hpp"
#include "metrics.hpp"

namespace powgate {

RateLimiter::RateLimiter(RedisManager& redis)
    : redis_(redis)
{}

RateLimitResult RateLimiter::check(const std::string& key, int limit, int window_sec, int cost) {
    RateLimitResult result = redis_.rate_limit(key, limit, window_sec, cost);
    if (!result.allowed) {
        MetricsRegistry::instance().increment_counter("powgate_rate_limited_total");
    }
    return result;
}

bool RateLimiter::consume_challenge(const std::string& challenge_string, int ttl_sec) {
    bool first = redis_.consume_challenge(challenge_string, ttl_sec);
    if (!first) {
        MetricsRegistry::instance().increment_counter("powgate_replay_rejected_total");
    }
    return first;
}

}
