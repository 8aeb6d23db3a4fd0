#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "hash_oracle.hpp"

namespace powgate {

// Per-lane hashing context bound to one challenge string.
// Not thread-safe; every lane owns its own instance.
class NonceHasher {
public:
    virtual ~NonceHasher() = default;

    // Must equal HashOracle::digest(challenge, nonce) byte for byte.
    virtual Digest hash(uint64_t nonce) = 0;
};

// Execution path used by the solver lanes.
// Both implementations absorb "challenge:" once and restart from that
// prefix state for every nonce.
class SearchStrategy {
public:
    virtual ~SearchStrategy() = default;

    virtual std::string name() const = 0;
    virtual bool accelerated() const = 0;

    // Throws std::runtime_error if the backend cannot be initialised.
    virtual std::unique_ptr<NonceHasher> make_hasher(const std::string& challenge) const = 0;
};

enum class StrategyPreference {
    AUTO,
    ACCELERATED,
    PORTABLE
};

std::shared_ptr<const SearchStrategy> make_accelerated_strategy();
std::shared_ptr<const SearchStrategy> make_portable_strategy();

/**
 * Known-answer self-test of a strategy against the reference oracle.
 * Returns false instead of throwing so it can drive fallback decisions.
 */
bool probe_strategy(const SearchStrategy& strategy);

/**
 * Resolves the execution path once.
 * AUTO prefers the accelerated path and falls back to the portable one if the
 * probe fails. ACCELERATED throws std::runtime_error when the probe fails.
 */
std::shared_ptr<const SearchStrategy> select_strategy(StrategyPreference preference = StrategyPreference::AUTO);

StrategyPreference strategy_from_string(const std::string& value);
std::string to_string(StrategyPreference preference);

}
