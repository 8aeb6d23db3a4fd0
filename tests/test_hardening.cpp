#include <gtest/gtest.h>
#include "challenge.hpp"
#include "clearance.hpp"
#include "pow_verifier.hpp"
#include <chrono>
#include <iostream>
#include <set>

using namespace powgate;

TEST(SecurityHardening, SignatureComparisonTiming) {
    const int iterations = 20000;
    ChallengeSigner signer("timing-secret");
    std::string good = signer.sign("abc123", 4, 1700000000);

    std::string mismatch_start = good;
    mismatch_start[0] = mismatch_start[0] == '0' ? '1' : '0';
    std::string mismatch_end = good;
    mismatch_end.back() = mismatch_end.back() == '0' ? '1' : '0';

    auto measure = [&](const std::string& sig) {
        int hits = 0;
        auto start = std::chrono::high_resolution_clock::now();
        for (int i = 0; i < iterations; ++i) {
            if (signer.matches(sig, "abc123", 4, 1700000000)) ++hits;
        }
        auto end = std::chrono::high_resolution_clock::now();
        return std::make_pair(hits, std::chrono::duration_cast<std::chrono::microseconds>(end - start).count());
    };

    measure(good);

    auto t_match = measure(good);
    auto t_start = measure(mismatch_start);
    auto t_end = measure(mismatch_end);

    std::cout << "[*] Timing Results (per " << iterations << " iterations):" << std::endl;
    std::cout << "    Match:          " << t_match.second << "us" << std::endl;
    std::cout << "    Mismatch Start: " << t_start.second << "us" << std::endl;
    std::cout << "    Mismatch End:   " << t_end.second << "us" << std::endl;

    EXPECT_EQ(t_match.first, iterations);
    EXPECT_EQ(t_start.first, 0);
    EXPECT_EQ(t_end.first, 0);
}

TEST(SecurityHardening, SignatureOfWrongShapeRejected) {
    ChallengeSigner signer("shape-secret");
    std::string good = signer.sign("abc123", 4, 1700000000);

    EXPECT_FALSE(signer.matches("", "abc123", 4, 1700000000));
    EXPECT_FALSE(signer.matches(good.substr(0, 63), "abc123", 4, 1700000000));
    EXPECT_FALSE(signer.matches(good + "0", "abc123", 4, 1700000000));
}

TEST(SecurityHardening, EchoedParametersAreBound) {
    const uint64_t now = 1700000000;
    ChallengeIssuer issuer({"bound-secret", 15, 16}, [now] { return now; });
    Challenge c = issuer.issue(6);

    VerifierOptions options;
    options.secret = "bound-secret";
    PoWVerifier verifier(options, [now] { return now; });

    // Any edited field breaks the tag before work is considered.
    EXPECT_EQ(verifier.verify(c.challenge_string, "0", 1, c.issued_at, c.signature).reason(),
              RejectReason::SIGNATURE_INVALID);
    EXPECT_EQ(verifier.verify(c.challenge_string, "0", 6, c.issued_at + 1, c.signature).reason(),
              RejectReason::SIGNATURE_INVALID);
    EXPECT_EQ(verifier.verify(c.challenge_string + "x", "0", 6, c.issued_at, c.signature).reason(),
              RejectReason::SIGNATURE_INVALID);
}

TEST(SecurityHardening, ClearanceCannotBeMintedWithChallengeTags) {
    const uint64_t now = 1700000000;
    ChallengeSigner signer("shared-secret");
    Clearance clearance("shared-secret", 900, [now] { return now; });

    // A challenge signature over look-alike fields is not a clearance tag.
    std::string tag = signer.sign("clearance", 0, now + 100);
    EXPECT_FALSE(clearance.is_valid(std::to_string(now + 100) + "." + tag));
}

TEST(SecurityHardening, SeedsAreUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        EXPECT_TRUE(seen.insert(ChallengeIssuer::generate_seed(16)).second);
    }
}
