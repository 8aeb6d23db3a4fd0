#include <gtest/gtest.h>
#include "pow_verifier.hpp"
#include "hash_oracle.hpp"
#include "metrics.hpp"

using namespace powgate;

namespace {

constexpr uint64_t NOW = 1700000000;

// sha256("abc123:193903") = 00009a82...
constexpr uint64_t ABC123_D4_NONCE = 193903;

VerifierOptions unsigned_options() {
    VerifierOptions o;
    o.max_difficulty = 15;
    return o;
}

UnixClock fixed_clock(uint64_t t) {
    return [t]() { return t; };
}

}

class PoWVerifierTest : public ::testing::Test {
protected:
    PoWVerifier verifier{unsigned_options(), fixed_clock(NOW)};
};

TEST_F(PoWVerifierTest, AcceptsKnownSolution) {
    auto result = verifier.verify("abc123", "193903", 4, NOW);
    EXPECT_TRUE(result.is_accepted());
    EXPECT_EQ(result.label(), "accepted");
}

TEST_F(PoWVerifierTest, RejectsInsufficientWork) {
    // "abc123:907" has exactly three leading zero nibbles.
    EXPECT_EQ(verifier.verify("abc123", "907", 3, NOW), VerificationResult::accepted());
    EXPECT_EQ(verifier.verify("abc123", "907", 4, NOW),
              VerificationResult::rejected(RejectReason::DIFFICULTY_NOT_MET));
    EXPECT_EQ(verifier.verify("abc123", "0", 1, NOW),
              VerificationResult::rejected(RejectReason::DIFFICULTY_NOT_MET));
}

TEST_F(PoWVerifierTest, DifficultyZeroAcceptsAnything) {
    EXPECT_TRUE(verifier.verify("abc123", "0", 0, NOW).is_accepted());
}

TEST_F(PoWVerifierTest, ExpiredChallenge) {
    auto result = verifier.verify("abc123", "193903", 4, NOW - 600);
    ASSERT_FALSE(result.is_accepted());
    EXPECT_EQ(*result.reason(), RejectReason::EXPIRED);

    // Boundary: exactly the window is still fresh.
    EXPECT_TRUE(verifier.verify("abc123", "193903", 4, NOW - 120).is_accepted());
    EXPECT_FALSE(verifier.verify("abc123", "193903", 4, NOW - 121).is_accepted());
}

TEST_F(PoWVerifierTest, FutureTimestampBeyondSkew) {
    EXPECT_TRUE(verifier.verify("abc123", "193903", 4, NOW + 5).is_accepted());
    EXPECT_EQ(verifier.verify("abc123", "193903", 4, NOW + 6),
              VerificationResult::rejected(RejectReason::EXPIRED));
}

TEST_F(PoWVerifierTest, MalformedInputs) {
    auto malformed = VerificationResult::rejected(RejectReason::MALFORMED);
    EXPECT_EQ(verifier.verify("", "1", 1, NOW), malformed);
    EXPECT_EQ(verifier.verify(std::string(257, 'a'), "1", 1, NOW), malformed);
    EXPECT_EQ(verifier.verify("abc123", "", 1, NOW), malformed);
    EXPECT_EQ(verifier.verify("abc123", "-1", 1, NOW), malformed);
    EXPECT_EQ(verifier.verify("abc123", "0193903", 4, NOW), malformed);
    EXPECT_EQ(verifier.verify("abc123", "18446744073709551616", 1, NOW), malformed);
    EXPECT_EQ(verifier.verify("abc123", "12a", 1, NOW), malformed);
    EXPECT_EQ(verifier.verify("abc123", "193903", 16, NOW), malformed);
    EXPECT_EQ(verifier.verify("abc123", "193903", -1, NOW), malformed);
    EXPECT_EQ(verifier.verify("abc123", "193903", 4, NOW, std::string("short")), malformed);
}

TEST_F(PoWVerifierTest, Idempotent) {
    auto first = verifier.verify("abc123", "193903", 4, NOW);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(verifier.verify("abc123", "193903", 4, NOW), first);
    }
    auto rejected = verifier.verify("abc123", "1", 4, NOW);
    EXPECT_EQ(verifier.verify("abc123", "1", 4, NOW), rejected);
}

TEST_F(PoWVerifierTest, AcceptsIffNibbleRuleHolds) {
    // Nonces on both sides of the rule, for every difficulty the digest could claim.
    for (uint64_t nonce = 0; nonce < 2000; ++nonce) {
        int zeros = HashOracle::leading_zero_nibbles(HashOracle::digest("abc123", nonce));
        for (int d = 0; d <= 4; ++d) {
            bool accepted = verifier.verify("abc123", HashOracle::format_nonce(nonce), d, NOW).is_accepted();
            ASSERT_EQ(accepted, zeros >= d) << "nonce " << nonce << " difficulty " << d;
        }
    }
}

TEST_F(PoWVerifierTest, SubmissionOverload) {
    SolutionSubmission s{"abc123", "193903", "4", std::to_string(NOW), std::nullopt};
    EXPECT_TRUE(verifier.verify(s).is_accepted());

    s.difficulty = "04";
    EXPECT_EQ(verifier.verify(s), VerificationResult::rejected(RejectReason::MALFORMED));

    s.difficulty = "4";
    s.issued_at = "";
    EXPECT_EQ(verifier.verify(s), VerificationResult::rejected(RejectReason::MALFORMED));
}

TEST_F(PoWVerifierTest, TypedOverload) {
    Challenge c{"abc123", 4, NOW, std::nullopt};
    EXPECT_TRUE(verifier.verify(c, ABC123_D4_NONCE).is_accepted());
    EXPECT_FALSE(verifier.verify(c, ABC123_D4_NONCE + 1).is_accepted());
}

TEST_F(PoWVerifierTest, MinimumDifficulty) {
    VerifierOptions o = unsigned_options();
    o.min_difficulty = 3;
    PoWVerifier strict(o, fixed_clock(NOW));

    // Valid work for the claimed difficulty, but the claim is below the floor.
    EXPECT_EQ(strict.verify("abc123", "576", 2, NOW),
              VerificationResult::rejected(RejectReason::DIFFICULTY_NOT_MET));
    EXPECT_TRUE(strict.verify("abc123", "907", 3, NOW).is_accepted());
}

TEST(PoWVerifierSignedTest, TamperedDifficultyDetected) {
    ChallengeIssuer issuer({"gate-secret", 15}, fixed_clock(NOW));
    Challenge c = issuer.issue(6);

    VerifierOptions o;
    o.secret = "gate-secret";
    PoWVerifier verifier(o, fixed_clock(NOW));

    // Client claims difficulty 1 and brings any nonce that satisfies it.
    std::string nonce;
    for (uint64_t n = 0;; ++n) {
        if (HashOracle::meets_difficulty(HashOracle::digest(c.challenge_string, n), 1)) {
            nonce = HashOracle::format_nonce(n);
            break;
        }
    }
    auto result = verifier.verify(c.challenge_string, nonce, 1, c.issued_at, c.signature);
    EXPECT_EQ(result, VerificationResult::rejected(RejectReason::SIGNATURE_INVALID));

    // Tampered timestamp
    auto moved = verifier.verify(c.challenge_string, nonce, 6, c.issued_at + 60, c.signature);
    EXPECT_EQ(moved, VerificationResult::rejected(RejectReason::SIGNATURE_INVALID));
}

TEST(PoWVerifierSignedTest, SignedSolutionAccepted) {
    ChallengeSigner signer("gate-secret");
    std::string sig = signer.sign("abc123", 4, NOW);

    VerifierOptions o;
    o.secret = "gate-secret";
    PoWVerifier verifier(o, fixed_clock(NOW));

    EXPECT_TRUE(verifier.verify("abc123", "193903", 4, NOW, sig).is_accepted());
    EXPECT_EQ(verifier.verify("abc123", "193903", 4, NOW),
              VerificationResult::rejected(RejectReason::SIGNATURE_INVALID));

    o.require_signature = false;
    PoWVerifier lenient(o, fixed_clock(NOW));
    EXPECT_TRUE(lenient.verify("abc123", "193903", 4, NOW).is_accepted());
}

TEST(PoWVerifierSignedTest, SignatureWithoutSecret) {
    PoWVerifier verifier(unsigned_options(), fixed_clock(NOW));
    EXPECT_EQ(verifier.verify("abc123", "193903", 4, NOW, std::string(64, 'a')),
              VerificationResult::rejected(RejectReason::SIGNATURE_INVALID));
}

TEST(PoWVerifierSignedTest, SignatureCheckedBeforeFreshness) {
    ChallengeSigner signer("gate-secret");
    VerifierOptions o;
    o.secret = "gate-secret";
    PoWVerifier verifier(o, fixed_clock(NOW));

    // Expired and forged: authentication failure wins.
    EXPECT_EQ(verifier.verify("abc123", "193903", 4, NOW - 600, std::string(64, 'b')),
              VerificationResult::rejected(RejectReason::SIGNATURE_INVALID));
    // Expired but authentic.
    EXPECT_EQ(verifier.verify("abc123", "193903", 4, NOW - 600, signer.sign("abc123", 4, NOW - 600)),
              VerificationResult::rejected(RejectReason::EXPIRED));
}

TEST(PoWVerifierOptionsTest, Validation) {
    VerifierOptions o;
    o.max_difficulty = 65;
    EXPECT_THROW(PoWVerifier(o, fixed_clock(NOW)), std::invalid_argument);

    o = VerifierOptions();
    o.min_difficulty = 16;
    EXPECT_THROW(PoWVerifier(o, fixed_clock(NOW)), std::invalid_argument);

    o = VerifierOptions();
    o.freshness_window_sec = 0;
    EXPECT_THROW(PoWVerifier(o, fixed_clock(NOW)), std::invalid_argument);
}

TEST(PoWVerifierMetricsTest, ResultsCounted) {
    auto& reg = MetricsRegistry::instance();
    double accepted = reg.get_counter("powgate_verifications_total{result=\"accepted\"}");
    double expired = reg.get_counter("powgate_verifications_total{result=\"expired\"}");

    PoWVerifier verifier(unsigned_options(), fixed_clock(NOW));
    verifier.verify("abc123", "193903", 4, NOW);
    verifier.verify("abc123", "193903", 4, NOW - 600);

    EXPECT_EQ(reg.get_counter("powgate_verifications_total{result=\"accepted\"}"), accepted + 1);
    EXPECT_EQ(reg.get_counter("powgate_verifications_total{result=\"expired\"}"), expired + 1);
}

TEST(RejectReasonTest, Labels) {
    EXPECT_EQ(to_string(RejectReason::DIFFICULTY_NOT_MET), "difficulty_not_met");
    EXPECT_EQ(to_string(RejectReason::EXPIRED), "expired");
    EXPECT_EQ(to_string(RejectReason::SIGNATURE_INVALID), "signature_invalid");
    EXPECT_EQ(to_string(RejectReason::MALFORMED), "malformed");
}
