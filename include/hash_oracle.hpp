#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace powgate {

constexpr size_t DIGEST_SIZE = 32;
constexpr int MAX_NIBBLE_DIFFICULTY = static_cast<int>(DIGEST_SIZE * 2);

using Digest = std::array<unsigned char, DIGEST_SIZE>;

// The one-way function shared by issuance, search and verification.
//
// digest(c, n) = SHA-256(c || ":" || decimal(n))
//
// decimal(n) is the plain base-10 ASCII form of the unsigned 64-bit nonce:
// no sign, no leading zeros, no locale grouping. Difficulty is the number of
// leading zero nibbles of the hex digest; both sides of the wire must use this
// exact rule.
class HashOracle {
public:
    static constexpr char SEPARATOR = ':';

    static Digest digest(const std::string& challenge, uint64_t nonce);

    // Exact byte string fed to SHA-256 for (challenge, nonce).
    static std::string format_preimage(const std::string& challenge, uint64_t nonce);

    // Locale-independent decimal rendering of a nonce.
    static std::string format_nonce(uint64_t nonce);

    static std::string to_hex(const Digest& digest);

    static int leading_zero_nibbles(const Digest& digest);

    /**
     * Nibble-prefix acceptance rule.
     * Difficulty 0 always passes; anything above 64 can never pass.
     */
    static bool meets_difficulty(const Digest& digest, int difficulty) {
        if (difficulty <= 0) return true;
        if (difficulty > MAX_NIBBLE_DIFFICULTY) return false;
        return leading_zero_nibbles(digest) >= difficulty;
    }
};

}
