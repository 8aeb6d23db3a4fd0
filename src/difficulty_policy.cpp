#include "difficulty_policy.hpp"
#include "hash_oracle.hpp"
#include "metrics.hpp"

#include <algorithm>
#include <stdexcept>

namespace powgate {

DifficultyPolicy::DifficultyPolicy(int base, int min_difficulty, int max_difficulty)
    : base_(base)
    , min_(min_difficulty)
    , max_(max_difficulty)
{
    if (min_ < 0 || max_ > MAX_NIBBLE_DIFFICULTY || min_ > max_) {
        throw std::invalid_argument("difficulty bounds must satisfy 0 <= min <= max <= 64");
    }
    if (base_ < min_ || base_ > max_) {
        throw std::invalid_argument("base difficulty must lie within [min, max]");
    }
}

int DifficultyPolicy::clamp(int difficulty) const {
    return std::max(min_, std::min(max_, difficulty));
}

int DifficultyPolicy::required_difficulty(int load_penalty) const {
    double connections = MetricsRegistry::instance().get_gauge("powgate_active_connections");
    int difficulty = base_ + load_penalty;

    if (connections > SEVERE_LOAD_CONNECTIONS) difficulty += 2;
    else if (connections > HIGH_LOAD_CONNECTIONS) difficulty += 1;

    return clamp(difficulty);
}

int DifficultyPolicy::for_bot_score(int score) const {
    if (score < 1 || score > 99) {
        throw std::invalid_argument("bot score must be within [1, 99]");
    }
    const long inverted = 99 - score;           // 0..98
    const long worst = 98L * 98L;
    const long headroom = max_ - base_;

    long extra = (inverted * inverted * headroom) / worst;
    return clamp(base_ + static_cast<int>(extra));
}

}
