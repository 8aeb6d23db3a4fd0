#pragma once

#include <string>
#include <cstdint>
#include <vector>

namespace powgate {

// Gate server configuration. Defaults below, overridden by CLI arguments and
// POWGATE_* environment variables.
struct GateConfig {
    // --- Network & Infrastructure ---
    std::string address = "0.0.0.0";
    uint16_t port = 8080;
    std::string redis_url = "tcp://127.0.0.1:6379";
    int thread_count = 0;  // 0 defaults to hardware concurrency

    // --- Connection & Resource Management ---
    size_t max_body_size = 16 * 1024;
    size_t max_global_connections = 100000;
    int read_timeout_sec = 30;

    // --- Challenge policy ---
    std::string secret = "";              // HMAC key for challenge and clearance signatures
    bool require_signature = true;
    int base_difficulty = 4;
    int min_difficulty = 0;
    int max_difficulty = 15;
    uint64_t freshness_window_sec = 120;
    uint64_t clock_skew_sec = 5;
    bool replay_protection = true;        // single use challenges via Redis
    uint64_t clearance_ttl_sec = 900;

    // --- Per-Endpoint API Limits (Requests per window, managed by Redis) ---
    int pow_rate_limit = 20;     // challenge fetches, window: 60s
    int global_rate_limit = 120; // everything else, window: 10s

    // --- Access ---
    std::string admin_token = "";         // Used for privileged metrics access
    std::vector<std::string> allowed_origins = {};
    std::vector<std::string> allowed_methods = {"GET", "OPTIONS"};
    std::vector<std::string> allowed_headers = {
        "Content-Type",
        "X-PowGate-Challenge",
        "X-PowGate-Difficulty",
        "X-PowGate-Timestamp",
        "X-PowGate-Signature",
        "X-PowGate-Nonce"
    };

    std::string log_level = "info";
};

// Known placeholder values that must never reach production.
bool is_placeholder_secret(const std::string& secret);

std::vector<std::string> parse_list(const std::string& csv);

/**
 * Applies POWGATE_* environment overrides.
 * @throws std::invalid_argument on a value that does not parse.
 */
void load_config_from_env(GateConfig& config);

/**
 * Rejects inconsistent settings.
 * @throws std::invalid_argument naming the offending setting.
 */
void validate_config(const GateConfig& config);

}
