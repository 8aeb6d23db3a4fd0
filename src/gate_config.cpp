#include "gate_config.hpp"
#include "hash_oracle.hpp"

#include <cstdlib>
#include <stdexcept>

namespace powgate {

namespace {

const char* env(const char* name) {
    return std::getenv(name);
}

int env_int(const char* name, const char* value) {
    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != std::string(value).size()) throw std::invalid_argument(name);
        return parsed;
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("Invalid integer in ") + name + ": '" + value + "'");
    }
}

uint64_t env_u64(const char* name, const char* value) {
    std::string text(value);
    if (text.empty() || text[0] == '-') {
        throw std::invalid_argument(std::string("Invalid unsigned integer in ") + name + ": '" + text + "'");
    }
    try {
        size_t used = 0;
        unsigned long long parsed = std::stoull(text, &used);
        if (used != text.size()) throw std::invalid_argument(name);
        return static_cast<uint64_t>(parsed);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("Invalid unsigned integer in ") + name + ": '" + text + "'");
    }
}

bool env_bool(const char* name, const char* value) {
    std::string text(value);
    if (text == "1" || text == "true" || text == "yes" || text == "on") return true;
    if (text == "0" || text == "false" || text == "no" || text == "off") return false;
    throw std::invalid_argument(std::string("Invalid boolean in ") + name + ": '" + text + "'");
}

}

bool is_placeholder_secret(const std::string& secret) {
    static const char* const PLACEHOLDERS[] = {
        "CHANGE_ME_IN_PRODUCTION",
        "changeme",
        "secret",
        "default"
    };
    for (const char* p : PLACEHOLDERS) {
        if (secret == p) return true;
    }
    return false;
}

std::vector<std::string> parse_list(const std::string& csv) {
    std::vector<std::string> items;
    std::string rest = csv;
    size_t pos = 0;
    while ((pos = rest.find(',')) != std::string::npos) {
        if (pos > 0) items.push_back(rest.substr(0, pos));
        rest.erase(0, pos + 1);
    }
    if (!rest.empty()) {
        items.push_back(rest);
    }
    return items;
}

void load_config_from_env(GateConfig& config) {
    if (const char* e = env("POWGATE_ADDR")) config.address = e;
    if (const char* e = env("POWGATE_PORT")) {
        int port = env_int("POWGATE_PORT", e);
        if (port <= 0 || port > 65535) {
            throw std::invalid_argument("POWGATE_PORT out of range");
        }
        config.port = static_cast<uint16_t>(port);
    }
    if (const char* e = env("POWGATE_THREADS")) config.thread_count = env_int("POWGATE_THREADS", e);
    if (const char* e = env("POWGATE_REDIS_URL")) config.redis_url = e;

    if (const char* e = env("POWGATE_SECRET")) config.secret = e;
    if (const char* e = env("POWGATE_REQUIRE_SIGNATURE")) config.require_signature = env_bool("POWGATE_REQUIRE_SIGNATURE", e);

    if (const char* e = env("POWGATE_DIFFICULTY")) config.base_difficulty = env_int("POWGATE_DIFFICULTY", e);
    if (const char* e = env("POWGATE_MIN_DIFFICULTY")) config.min_difficulty = env_int("POWGATE_MIN_DIFFICULTY", e);
    if (const char* e = env("POWGATE_MAX_DIFFICULTY")) config.max_difficulty = env_int("POWGATE_MAX_DIFFICULTY", e);
    if (const char* e = env("POWGATE_FRESHNESS_SEC")) config.freshness_window_sec = env_u64("POWGATE_FRESHNESS_SEC", e);
    if (const char* e = env("POWGATE_CLOCK_SKEW_SEC")) config.clock_skew_sec = env_u64("POWGATE_CLOCK_SKEW_SEC", e);
    if (const char* e = env("POWGATE_REPLAY_PROTECTION")) config.replay_protection = env_bool("POWGATE_REPLAY_PROTECTION", e);
    if (const char* e = env("POWGATE_CLEARANCE_TTL_SEC")) config.clearance_ttl_sec = env_u64("POWGATE_CLEARANCE_TTL_SEC", e);

    if (const char* e = env("POWGATE_POW_LIMIT")) config.pow_rate_limit = env_int("POWGATE_POW_LIMIT", e);
    if (const char* e = env("POWGATE_GLOBAL_LIMIT")) config.global_rate_limit = env_int("POWGATE_GLOBAL_LIMIT", e);

    if (const char* e = env("POWGATE_ALLOWED_ORIGINS")) config.allowed_origins = parse_list(e);
    if (const char* e = env("POWGATE_ADMIN_TOKEN")) config.admin_token = e;
    if (const char* e = env("POWGATE_LOG_LEVEL")) config.log_level = e;
}

void validate_config(const GateConfig& config) {
    if (config.max_difficulty < 0 || config.max_difficulty > MAX_NIBBLE_DIFFICULTY) {
        throw std::invalid_argument("max_difficulty must be within [0, 64]");
    }
    if (config.min_difficulty < 0 || config.min_difficulty > config.max_difficulty) {
        throw std::invalid_argument("min_difficulty must be within [0, max_difficulty]");
    }
    if (config.base_difficulty < config.min_difficulty || config.base_difficulty > config.max_difficulty) {
        throw std::invalid_argument("difficulty must be within [min_difficulty, max_difficulty]");
    }
    if (config.freshness_window_sec == 0) {
        throw std::invalid_argument("freshness window must be positive");
    }
    if (config.clearance_ttl_sec == 0) {
        throw std::invalid_argument("clearance TTL must be positive");
    }
    if (config.thread_count < 0) {
        throw std::invalid_argument("thread count must not be negative");
    }
    if (config.pow_rate_limit <= 0 || config.global_rate_limit <= 0) {
        throw std::invalid_argument("rate limits must be positive");
    }
    if (config.max_body_size == 0 || config.read_timeout_sec <= 0) {
        throw std::invalid_argument("body limit and read timeout must be positive");
    }
}

}
