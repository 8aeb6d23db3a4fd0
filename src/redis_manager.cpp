#include "redis_manager.hpp"
#include "security_logger.hpp"

#include <chrono>
#include <iterator>
#include <vector>

namespace powgate {

RedisManager::RedisManager(const std::string& redis_url) {
    try {
        // Initialize the Redis client using the provided connection string.
        redis_ = std::make_unique<sw::redis::Redis>(redis_url);
        redis_->ping();
        connected_ = true;

        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE, "internal",
                            "Redis connected: " + redis_url);
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE, "internal",
                            std::string("Redis connection failed: ") + e.what());
        connected_ = false;
    }
}

// Atomic Token-Bucket implementation using Redis Lua scripting.
// This handles rate-limiting, temporary jail (bans), and violation tracking.
RateLimitResult RedisManager::rate_limit(const std::string& key, int limit, int period_sec, int cost) {
    RateLimitResult result = {true, (long long)0, (long long)limit, 0};

    if (!connected_ || limit <= 0 || period_sec <= 0) return result;

    try {
        static const std::string script = R"(
            local key = KEYS[1]
            local burst = tonumber(ARGV[1])
            local period = tonumber(ARGV[2])
            local now = tonumber(ARGV[3])
            local cost = tonumber(ARGV[4])

            local emission_interval = period / burst
            local jail_key = key .. ":jail"
            local violation_key = key .. ":viol"

            local jail_ttl = redis.call('TTL', jail_key)
            if jail_ttl > 0 then
                return {-1, 0, jail_ttl}
            end

            -- Theoretical Arrival Time (TAT)
            local tat = redis.call('GET', key)
            if not tat then
                tat = now
            else
                tat = tonumber(tat)
            end

            if tat < now then
                tat = now
            end

            local increment = emission_interval * cost
            if tat + increment - now > period then
                local retry_after = tat + increment - now - period
                local viol = redis.call('INCR', violation_key)
                if viol == 1 then
                    redis.call('EXPIRE', violation_key, period * 2)
                end

                -- Repeated violations earn a temporary jail
                if viol > 5 then
                    redis.call('SETEX', jail_key, 300, "banned")
                    return {-1, 0, 300}
                end

                return {0, math.ceil(retry_after), 0}
            end

            local new_tat = tat + increment
            redis.call('SET', key, new_tat, 'EX', period * 2)

            local remaining = math.floor((period - (new_tat - now)) / emission_interval)
            return {1, remaining, 0}
        )";

        auto now = std::chrono::system_clock::now();
        double now_sec = std::chrono::duration<double>(now.time_since_epoch()).count();

        std::vector<std::string> args = {
            std::to_string(limit),
            std::to_string(period_sec),
            std::to_string(now_sec),
            std::to_string(cost)
        };

        std::vector<long long> res;
        std::vector<std::string> keys = {"powgate:rl:" + key};
        redis_->eval(script, keys.begin(), keys.end(), args.begin(), args.end(), std::back_inserter(res));

        if (res.size() >= 3) {
            int status = static_cast<int>(res[0]);
            if (status == 1) {
                result.allowed = true;
                result.current = limit - res[1];
                result.reset_after_sec = 0;
            } else if (status == -1) {
                result.allowed = false;
                result.current = limit;
                result.reset_after_sec = res[2];
            } else {
                result.allowed = false;
                result.current = limit;
                result.reset_after_sec = res[1];
            }
        }
        return result;
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::RATE_LIMIT_HIT, "internal",
                            std::string("Redis rate limit error: ") + e.what());
        return result;
    }
}

bool RedisManager::consume_challenge(const std::string& challenge_string, int ttl_sec) {
    if (!connected_ || ttl_sec <= 0) return false;
    try {
        return redis_->set(SEEN_PREFIX + challenge_string, "1",
                           std::chrono::seconds(ttl_sec), sw::redis::UpdateType::NOT_EXIST);
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::REPLAY_ATTEMPT, "internal",
                            std::string("Replay guard unavailable: ") + e.what());
        return false;
    }
}

}
