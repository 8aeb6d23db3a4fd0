#include "challenge.hpp"
#include "hash_oracle.hpp"
#include "metrics.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <vector>

namespace powgate {

uint64_t system_unix_seconds() {
    auto now = std::chrono::system_clock::now();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count());
}

ChallengeSigner::ChallengeSigner(std::string secret)
    : secret_(std::move(secret))
{
    if (secret_.empty()) {
        throw std::invalid_argument("Challenge signing secret must not be empty");
    }
}

std::string ChallengeSigner::signing_payload(const std::string& challenge_string, int difficulty, uint64_t issued_at) {
    std::string payload = challenge_string;
    payload += '|';
    payload += std::to_string(difficulty);
    payload += '|';
    payload += HashOracle::format_nonce(issued_at);
    return payload;
}

std::string ChallengeSigner::mac_hex(const std::string& message) const {
    Digest mac;
    unsigned int len = 0;
    unsigned char* res = HMAC(EVP_sha256(),
                              secret_.data(), static_cast<int>(secret_.size()),
                              reinterpret_cast<const unsigned char*>(message.data()), message.size(),
                              mac.data(), &len);
    if (res == nullptr || len != DIGEST_SIZE) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    return HashOracle::to_hex(mac);
}

std::string ChallengeSigner::sign(const std::string& challenge_string, int difficulty, uint64_t issued_at) const {
    return mac_hex(signing_payload(challenge_string, difficulty, issued_at));
}

bool ChallengeSigner::matches(const std::string& signature, const std::string& challenge_string,
                              int difficulty, uint64_t issued_at) const {
    std::string expected = sign(challenge_string, difficulty, issued_at);
    if (signature.size() != expected.size()) return false;

    // Tags are emitted lowercase; compare case-insensitively without branching on content.
    std::string presented = signature;
    for (char& c : presented) {
        if (c >= 'A' && c <= 'F') c = static_cast<char>(c - 'A' + 'a');
    }
    return CRYPTO_memcmp(presented.data(), expected.data(), expected.size()) == 0;
}

ChallengeIssuer::ChallengeIssuer(Options options, UnixClock clock)
    : options_(std::move(options))
    , clock_(std::move(clock))
{
    if (options_.max_difficulty < 0 || options_.max_difficulty > MAX_NIBBLE_DIFFICULTY) {
        throw std::invalid_argument("max_difficulty must be within [0, 64]");
    }
    if (options_.seed_bytes < 16) {
        throw std::invalid_argument("Challenge seeds shorter than 16 bytes are guessable");
    }
    if (!options_.secret.empty()) {
        signer_.emplace(options_.secret);
    }
}

std::string ChallengeIssuer::generate_seed(size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw EntropyUnavailable("CSPRNG Failure - Entropy Exhausted");
    }

    std::stringstream ss;
    for (unsigned char b : buffer) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)b;
    }
    return ss.str();
}

Challenge ChallengeIssuer::issue(int difficulty) const {
    if (difficulty < 0 || difficulty > options_.max_difficulty) {
        throw std::invalid_argument("Difficulty " + std::to_string(difficulty) +
                                    " outside [0, " + std::to_string(options_.max_difficulty) + "]");
    }

    Challenge challenge;
    challenge.challenge_string = generate_seed(options_.seed_bytes);
    challenge.difficulty = difficulty;
    challenge.issued_at = clock_();

    if (signer_) {
        challenge.signature = signer_->sign(challenge.challenge_string, challenge.difficulty, challenge.issued_at);
    }

    MetricsRegistry::instance().increment_counter("powgate_challenges_issued_total");
    return challenge;
}

}
