#include "search_strategy.hpp"
#include "sha256_portable.hpp"
#include "security_logger.hpp"
#include "metrics.hpp"

#include <openssl/evp.h>
#include <stdexcept>

namespace powgate {

namespace {

struct EvpCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using EvpCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter>;

class EvpNonceHasher : public NonceHasher {
public:
    explicit EvpNonceHasher(const std::string& challenge)
        : prefix_(EVP_MD_CTX_new())
        , work_(EVP_MD_CTX_new())
    {
        if (!prefix_ || !work_) {
            throw std::runtime_error("EVP_MD_CTX allocation failed");
        }
        const EVP_MD* md = EVP_sha256();
        if (md == nullptr || EVP_DigestInit_ex(prefix_.get(), md, nullptr) != 1) {
            throw std::runtime_error("EVP SHA-256 unavailable");
        }

        std::string prefix = challenge;
        prefix += HashOracle::SEPARATOR;
        if (EVP_DigestUpdate(prefix_.get(), prefix.data(), prefix.size()) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed on challenge prefix");
        }
    }

    Digest hash(uint64_t nonce) override {
        if (EVP_MD_CTX_copy_ex(work_.get(), prefix_.get()) != 1) {
            throw std::runtime_error("EVP_MD_CTX_copy_ex failed");
        }
        std::string digits = HashOracle::format_nonce(nonce);
        if (EVP_DigestUpdate(work_.get(), digits.data(), digits.size()) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
        Digest out;
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(work_.get(), out.data(), &len) != 1 || len != DIGEST_SIZE) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        return out;
    }

private:
    EvpCtxPtr prefix_;
    EvpCtxPtr work_;
};

class PortableNonceHasher : public NonceHasher {
public:
    explicit PortableNonceHasher(const std::string& challenge) {
        prefix_.update(challenge);
        const unsigned char sep = static_cast<unsigned char>(HashOracle::SEPARATOR);
        prefix_.update(&sep, 1);
    }

    Digest hash(uint64_t nonce) override {
        Sha256 ctx = prefix_;
        ctx.update(HashOracle::format_nonce(nonce));
        Digest out;
        ctx.finish(out.data());
        return out;
    }

private:
    Sha256 prefix_;
};

class AcceleratedStrategy : public SearchStrategy {
public:
    std::string name() const override { return "accelerated"; }
    bool accelerated() const override { return true; }

    std::unique_ptr<NonceHasher> make_hasher(const std::string& challenge) const override {
        return std::make_unique<EvpNonceHasher>(challenge);
    }
};

class PortableStrategy : public SearchStrategy {
public:
    std::string name() const override { return "portable"; }
    bool accelerated() const override { return false; }

    std::unique_ptr<NonceHasher> make_hasher(const std::string& challenge) const override {
        return std::make_unique<PortableNonceHasher>(challenge);
    }
};

// FIPS 180-4 example: SHA-256("abc")
const char* ABC_VECTOR = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

}

std::shared_ptr<const SearchStrategy> make_accelerated_strategy() {
    return std::make_shared<AcceleratedStrategy>();
}

std::shared_ptr<const SearchStrategy> make_portable_strategy() {
    return std::make_shared<PortableStrategy>();
}

bool probe_strategy(const SearchStrategy& strategy) {
    try {
        if (HashOracle::to_hex(Sha256::hash("abc")) != ABC_VECTOR) {
            return false;
        }

        auto hasher = strategy.make_hasher("abc123");
        for (uint64_t nonce : {uint64_t{0}, uint64_t{7}, uint64_t{18446744073709551615ULL}}) {
            if (hasher->hash(nonce) != HashOracle::digest("abc123", nonce)) {
                return false;
            }
        }
        return true;
    } catch (const std::exception& e) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::STRATEGY_FALLBACK,
                            "internal", "Strategy probe failed for " + strategy.name() + ": " + e.what());
        return false;
    }
}

std::shared_ptr<const SearchStrategy> select_strategy(StrategyPreference preference) {
    if (preference == StrategyPreference::PORTABLE) {
        return make_portable_strategy();
    }

    auto accelerated = make_accelerated_strategy();
    if (probe_strategy(*accelerated)) {
        return accelerated;
    }

    if (preference == StrategyPreference::ACCELERATED) {
        throw std::runtime_error("Accelerated search strategy requested but unavailable");
    }

    SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::STRATEGY_FALLBACK,
                        "internal", "Accelerated path unavailable, using portable SHA-256 on all lanes");
    MetricsRegistry::instance().increment_counter("powgate_strategy_fallback_total");
    return make_portable_strategy();
}

StrategyPreference strategy_from_string(const std::string& value) {
    if (value == "auto") return StrategyPreference::AUTO;
    if (value == "accelerated") return StrategyPreference::ACCELERATED;
    if (value == "portable") return StrategyPreference::PORTABLE;
    throw std::invalid_argument("Unknown search strategy: " + value);
}

std::string to_string(StrategyPreference preference) {
    switch (preference) {
        case StrategyPreference::AUTO: return "auto";
        case StrategyPreference::ACCELERATED: return "accelerated";
        case StrategyPreference::PORTABLE: return "portable";
        default: return "unknown";
    }
}

}
