#pragma once

#include <string>
#include <cctype>
#include <cstdint>
#include <algorithm>
#include <optional>
#include <boost/json.hpp>

namespace powgate {

// Input validation for values arriving from untrusted clients.
class InputValidator {
public:
    static constexpr size_t MAX_CHALLENGE_LENGTH = 256;
    static constexpr size_t MAX_DECIMAL_LENGTH = 20; // UINT64_MAX has 20 digits

    // Validates that a string is a correctly formatted hexadecimal sequence.
    static bool is_valid_hex(const std::string& str, size_t expected_length = 0) {
        if (str.empty()) return false;
        if (expected_length > 0 && str.length() != expected_length) return false;

        return std::all_of(str.begin(), str.end(), [](char c) {
            return std::isxdigit(static_cast<unsigned char>(c));
        });
    }

    // Checks for a valid SHA256 hex hash (64 characters).
    static bool is_valid_hash(const std::string& hash) {
        return is_valid_hex(hash, 64);
    }

    // Challenge strings are opaque bytes; only emptiness and length are checked.
    static bool is_valid_challenge(const std::string& str) {
        return !str.empty() && str.size() <= MAX_CHALLENGE_LENGTH;
    }

    /**
     * Strict decimal parser for nonces, difficulties and timestamps.
     * Rejects signs, whitespace, leading zeros ("0" itself is fine) and
     * values that overflow 64 bits. The accepted form is exactly what
     * HashOracle::format_nonce produces.
     */
    static std::optional<uint64_t> parse_decimal_u64(const std::string& str) {
        if (str.empty() || str.size() > MAX_DECIMAL_LENGTH) return std::nullopt;
        if (str.size() > 1 && str[0] == '0') return std::nullopt;

        uint64_t value = 0;
        for (char c : str) {
            if (c < '0' || c > '9') return std::nullopt;
            uint64_t digit = static_cast<uint64_t>(c - '0');
            if (value > (UINT64_MAX - digit) / 10) return std::nullopt;
            value = value * 10 + digit;
        }
        return value;
    }

    static bool is_within_size_limit(size_t size, size_t max_size) {
        return size <= max_size;
    }

    /**
     * JSON Parsing with recursion depth limits to prevent stack-exhaustion (DoS).
     */
    static boost::json::value safe_parse_json(const std::string& input) {
        boost::json::parse_options opt;
        opt.max_depth = 16;
        return boost::json::parse(input, {}, opt);
    }
};

}
