#pragma once

#include <string>
#include <cstdint>
#include <optional>

#include "challenge.hpp"

namespace powgate {

enum class RejectReason {
    DIFFICULTY_NOT_MET,
    EXPIRED,
    SIGNATURE_INVALID,
    MALFORMED
};

std::string to_string(RejectReason reason);

// Accepted | Rejected(reason)
class VerificationResult {
public:
    static VerificationResult accepted() { return VerificationResult(std::nullopt); }
    static VerificationResult rejected(RejectReason reason) { return VerificationResult(reason); }

    bool is_accepted() const { return !reason_.has_value(); }
    std::optional<RejectReason> reason() const { return reason_; }

    // "accepted" or the rejection reason, used as the metrics label.
    std::string label() const { return reason_ ? to_string(*reason_) : "accepted"; }

    bool operator==(const VerificationResult& other) const { return reason_ == other.reason_; }
    bool operator!=(const VerificationResult& other) const { return !(*this == other); }

private:
    explicit VerificationResult(std::optional<RejectReason> reason) : reason_(reason) {}

    std::optional<RejectReason> reason_;
};

// A solution exactly as it arrived from the client: untrusted text fields.
struct SolutionSubmission {
    std::string challenge_string;
    std::string nonce;
    std::string difficulty;
    std::string issued_at;
    std::optional<std::string> signature;
};

struct VerifierOptions {
    std::string secret;                  // empty: unsigned challenges only
    bool require_signature = true;       // only meaningful with a secret
    uint64_t freshness_window_sec = 120;
    uint64_t clock_skew_sec = 5;         // tolerated future drift of issued_at
    int min_difficulty = 0;
    int max_difficulty = 15;
};

// Stateless Proof-of-Work verification.
// Checks run in a fixed order and stop at the first failure:
// shape, signature, freshness, work.
class PoWVerifier {
public:
    explicit PoWVerifier(VerifierOptions options, UnixClock clock = system_unix_seconds);

    /**
     * Verifies a PoW solution.
     * @param challenge_string The challenge issued by the server.
     * @param nonce Decimal nonce text as submitted by the client.
     * @param difficulty Difficulty echoed by the client.
     * @param issued_at Issuance timestamp (Unix seconds) echoed by the client.
     * @param signature Optional authentication tag echoed by the client.
     */
    VerificationResult verify(const std::string& challenge_string, const std::string& nonce,
                              int difficulty, uint64_t issued_at,
                              const std::optional<std::string>& signature = std::nullopt) const;

    VerificationResult verify(const Challenge& challenge, uint64_t nonce) const;

    // Parses the raw fields; any unparsable field is MALFORMED.
    VerificationResult verify(const SolutionSubmission& submission) const;

    // Pure work check: digest(challenge, nonce) has at least `difficulty` leading zero nibbles.
    static bool check_work(const std::string& challenge_string, uint64_t nonce, int difficulty);

    const VerifierOptions& options() const { return options_; }

private:
    VerificationResult evaluate(const std::string& challenge_string, const std::string& nonce,
                                int difficulty, uint64_t issued_at,
                                const std::optional<std::string>& signature) const;

    VerifierOptions options_;
    UnixClock clock_;
    std::optional<ChallengeSigner> signer_;
};

}
