#include "pow_verifier.hpp"
#include "hash_oracle.hpp"
#include "input_validator.hpp"
#include "metrics.hpp"

namespace powgate {

std::string to_string(RejectReason reason) {
    switch (reason) {
        case RejectReason::DIFFICULTY_NOT_MET: return "difficulty_not_met";
        case RejectReason::EXPIRED: return "expired";
        case RejectReason::SIGNATURE_INVALID: return "signature_invalid";
        case RejectReason::MALFORMED: return "malformed";
        default: return "unknown";
    }
}

PoWVerifier::PoWVerifier(VerifierOptions options, UnixClock clock)
    : options_(std::move(options))
    , clock_(std::move(clock))
{
    if (options_.max_difficulty < 0 || options_.max_difficulty > MAX_NIBBLE_DIFFICULTY) {
        throw std::invalid_argument("max_difficulty must be within [0, 64]");
    }
    if (options_.min_difficulty < 0 || options_.min_difficulty > options_.max_difficulty) {
        throw std::invalid_argument("min_difficulty must be within [0, max_difficulty]");
    }
    if (options_.freshness_window_sec == 0) {
        throw std::invalid_argument("freshness window must be positive");
    }
    if (!options_.secret.empty()) {
        signer_.emplace(options_.secret);
    }
}

bool PoWVerifier::check_work(const std::string& challenge_string, uint64_t nonce, int difficulty) {
    return HashOracle::meets_difficulty(HashOracle::digest(challenge_string, nonce), difficulty);
}

VerificationResult PoWVerifier::verify(const std::string& challenge_string, const std::string& nonce,
                                       int difficulty, uint64_t issued_at,
                                       const std::optional<std::string>& signature) const {
    VerificationResult result = evaluate(challenge_string, nonce, difficulty, issued_at, signature);
    MetricsRegistry::instance().increment_counter(
        "powgate_verifications_total{result=\"" + result.label() + "\"}");
    return result;
}

VerificationResult PoWVerifier::verify(const Challenge& challenge, uint64_t nonce) const {
    return verify(challenge.challenge_string, HashOracle::format_nonce(nonce),
                  challenge.difficulty, challenge.issued_at, challenge.signature);
}

VerificationResult PoWVerifier::verify(const SolutionSubmission& submission) const {
    auto difficulty = InputValidator::parse_decimal_u64(submission.difficulty);
    auto issued_at = InputValidator::parse_decimal_u64(submission.issued_at);
    if (!difficulty || !issued_at || *difficulty > static_cast<uint64_t>(MAX_NIBBLE_DIFFICULTY)) {
        MetricsRegistry::instance().increment_counter("powgate_verifications_total{result=\"malformed\"}");
        return VerificationResult::rejected(RejectReason::MALFORMED);
    }
    return verify(submission.challenge_string, submission.nonce,
                  static_cast<int>(*difficulty), *issued_at, submission.signature);
}

VerificationResult PoWVerifier::evaluate(const std::string& challenge_string, const std::string& nonce,
                                         int difficulty, uint64_t issued_at,
                                         const std::optional<std::string>& signature) const {
    // Shape
    if (!InputValidator::is_valid_challenge(challenge_string)) {
        return VerificationResult::rejected(RejectReason::MALFORMED);
    }
    auto nonce_value = InputValidator::parse_decimal_u64(nonce);
    if (!nonce_value) {
        return VerificationResult::rejected(RejectReason::MALFORMED);
    }
    if (difficulty < 0 || difficulty > options_.max_difficulty) {
        return VerificationResult::rejected(RejectReason::MALFORMED);
    }
    if (signature && !InputValidator::is_valid_hash(*signature)) {
        return VerificationResult::rejected(RejectReason::MALFORMED);
    }

    // (a) Authentication of the echoed parameters
    if (signature) {
        if (!signer_ || !signer_->matches(*signature, challenge_string, difficulty, issued_at)) {
            return VerificationResult::rejected(RejectReason::SIGNATURE_INVALID);
        }
    } else if (signer_ && options_.require_signature) {
        return VerificationResult::rejected(RejectReason::SIGNATURE_INVALID);
    }

    // (b) Freshness
    uint64_t now = clock_();
    if (issued_at > now) {
        if (issued_at - now > options_.clock_skew_sec) {
            return VerificationResult::rejected(RejectReason::EXPIRED);
        }
    } else if (now - issued_at > options_.freshness_window_sec) {
        return VerificationResult::rejected(RejectReason::EXPIRED);
    }

    // (c) Work
    if (difficulty < options_.min_difficulty || !check_work(challenge_string, *nonce_value, difficulty)) {
        return VerificationResult::rejected(RejectReason::DIFFICULTY_NOT_MET);
    }

    return VerificationResult::accepted();
}

}
