#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <atomic>
#include <mutex>
#include <cctype>
#include <exception>
#include <stdexcept>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace powgate {

// Logs gate and solver events using blinded IP identifiers (salted hash).
class SecurityLogger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        CHALLENGE_ISSUED,
        POW_ACCEPTED,
        POW_FAILURE,
        SIGNATURE_INVALID,
        CHALLENGE_EXPIRED,
        MALFORMED_SUBMISSION,
        REPLAY_ATTEMPT,
        RATE_LIMIT_HIT,
        STRATEGY_FALLBACK,
        LANE_FAILURE,
        SOLVER,
        CONNECTION_REJECTED,
        LIFECYCLE
    };

    /**
     * Records an event with blinded identifiers.
     * @param level Severity level of the event.
     * @param event The specific type of event.
     * @param remote_addr The source IP address (will be blinded before logging).
     *                    "internal" and "unknown" are logged verbatim.
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& remote_addr,
                   const std::string& message = "") {
        if (static_cast<int>(level) < min_level_ref().load(std::memory_order_relaxed)) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] ";

        ss << "ip=" << blind_address(remote_addr, gmt);

        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }

        // Log to appropriate destination based on severity
        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
    }

    static void set_min_level(Level level) {
        min_level_ref().store(static_cast<int>(level), std::memory_order_relaxed);
    }

    static Level min_level() {
        return static_cast<Level>(min_level_ref().load(std::memory_order_relaxed));
    }

    // Accepts "info", "warn"/"warning", "error", "crit"/"critical".
    static Level level_from_string(const std::string& name) {
        if (name == "info") return Level::INFO;
        if (name == "warn" || name == "warning") return Level::WARNING;
        if (name == "error") return Level::ERROR;
        if (name == "crit" || name == "critical") return Level::CRITICAL;
        throw std::invalid_argument("Unknown log level: " + name);
    }

    // Escapes non-printable characters and quotes to ensure log integrity
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::CHALLENGE_ISSUED: return "CHALLENGE";
            case EventType::POW_ACCEPTED: return "POW_OK";
            case EventType::POW_FAILURE: return "POW_FAILURE";
            case EventType::SIGNATURE_INVALID: return "BAD_SIGNATURE";
            case EventType::CHALLENGE_EXPIRED: return "EXPIRED";
            case EventType::MALFORMED_SUBMISSION: return "MALFORMED";
            case EventType::REPLAY_ATTEMPT: return "REPLAY_ATTEMPT";
            case EventType::RATE_LIMIT_HIT: return "RATE_LIMIT";
            case EventType::STRATEGY_FALLBACK: return "FALLBACK";
            case EventType::LANE_FAILURE: return "LANE_FAILURE";
            case EventType::SOLVER: return "SOLVER";
            case EventType::CONNECTION_REJECTED: return "CONN_REJECTED";
            case EventType::LIFECYCLE: return "LIFECYCLE";
            default: return "UNKNOWN_EVENT";
        }
    }

private:
    static std::atomic<int>& min_level_ref() {
        static std::atomic<int> level{static_cast<int>(Level::INFO)};
        return level;
    }

    static std::string blind_address(const std::string& remote_addr, const struct tm& gmt) {
        if (remote_addr == "unknown" || remote_addr == "internal") {
            return remote_addr;
        }

        // Salt Rotation Logic:
        // A random salt is generated and rotated every 6 hours, so an address
        // hash in old logs cannot be linked to one in new logs.
        static std::mutex salt_mutex;
        static std::string log_salt;
        static std::chrono::steady_clock::time_point last_rotation;

        std::string salt;
        {
            std::lock_guard<std::mutex> lock(salt_mutex);
            auto now_steady = std::chrono::steady_clock::now();
            if (log_salt.empty() || std::chrono::duration_cast<std::chrono::hours>(now_steady - last_rotation).count() >= 6) {
                unsigned char b[32];
                if (RAND_bytes(b, 32) != 1) {
                    std::cerr << "[CRITICAL] CSPRNG failure in SecurityLogger. Terminating instance for safety.\n";
                    std::terminate();
                }
                std::stringstream salt_ss;
                for (int i = 0; i < 32; i++) salt_ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
                log_salt = salt_ss.str();
                last_rotation = now_steady;

                std::cout << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] [INFO] [LIFECYCLE] msg=\"IP blinding salt rotated\"\n";
            }
            salt = log_salt;
        }

        std::string data = remote_addr + salt;
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

        std::stringstream hs;
        for (int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        return "anon_" + hs.str();
    }
};

}
