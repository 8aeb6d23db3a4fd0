#pragma once

#include <string>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>

namespace powgate {

// Unix time in seconds; injectable so freshness logic can be tested.
using UnixClock = std::function<uint64_t()>;

uint64_t system_unix_seconds();

struct Challenge {
    std::string challenge_string;
    int difficulty = 0;
    uint64_t issued_at = 0;
    std::optional<std::string> signature;
};

// Thrown when the CSPRNG cannot deliver bytes. Issuance must stop rather than
// fall back to a predictable source.
class EntropyUnavailable : public std::runtime_error {
public:
    explicit EntropyUnavailable(const std::string& what)
        : std::runtime_error(what) {}
};

// HMAC-SHA256 authentication tag over (challenge_string, difficulty, issued_at).
// Makes tampering with echoed parameters detectable without server-side state.
class ChallengeSigner {
public:
    explicit ChallengeSigner(std::string secret);

    // "challenge|difficulty|issued_at" with plain decimal numbers. The numbers
    // never contain '|', so splitting at the last two separators is unambiguous.
    static std::string signing_payload(const std::string& challenge_string, int difficulty, uint64_t issued_at);

    // Lowercase hex, 64 chars.
    std::string sign(const std::string& challenge_string, int difficulty, uint64_t issued_at) const;

    // Constant-time comparison against a presented tag.
    bool matches(const std::string& signature, const std::string& challenge_string,
                 int difficulty, uint64_t issued_at) const;

    // Generic keyed MAC used for clearance tokens.
    std::string mac_hex(const std::string& message) const;

private:
    std::string secret_;
};

class ChallengeIssuer {
public:
    struct Options {
        std::string secret;          // empty disables signing
        int max_difficulty = 15;
        size_t seed_bytes = 32;
    };

    explicit ChallengeIssuer(Options options, UnixClock clock = system_unix_seconds);

    /**
     * Produces a fresh challenge.
     * @throws EntropyUnavailable if the CSPRNG fails.
     * @throws std::invalid_argument if difficulty is outside [0, max_difficulty].
     */
    Challenge issue(int difficulty) const;

    bool signing_enabled() const { return signer_.has_value(); }

    // Hex-encoded CSPRNG output, 2 * bytes characters.
    static std::string generate_seed(size_t bytes = 32);

private:
    Options options_;
    UnixClock clock_;
    std::optional<ChallengeSigner> signer_;
};

}
