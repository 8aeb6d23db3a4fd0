#pragma once

#include <cstddef>

namespace powgate {

// Chooses the difficulty handed out with a new challenge.
class DifficultyPolicy {
public:
    static constexpr size_t HIGH_LOAD_CONNECTIONS = 1000;
    static constexpr size_t SEVERE_LOAD_CONNECTIONS = 5000;

    /**
     * @param base Difficulty under normal load.
     * @param min_difficulty Lower clamp.
     * @param max_difficulty Upper clamp, at most 64.
     * @throws std::invalid_argument unless 0 <= min <= base <= max <= 64.
     */
    DifficultyPolicy(int base, int min_difficulty, int max_difficulty);

    /**
     * Base difficulty plus the caller's penalty, raised under server load.
     * Load is the powgate_active_connections gauge: above 1000 adds one
     * nibble, above 5000 adds two. The result is clamped to [min, max].
     */
    int required_difficulty(int load_penalty = 0) const;

    /**
     * Maps a bot-management score (1 = certainly automated, 99 = certainly
     * human) to a difficulty. The inverted score squared is scaled onto the
     * nibbles between base and max, so lower scores never get easier work.
     * @throws std::invalid_argument if score is outside [1, 99].
     */
    int for_bot_score(int score) const;

    int base() const { return base_; }
    int min_difficulty() const { return min_; }
    int max_difficulty() const { return max_; }

private:
    int clamp(int difficulty) const;

    int base_;
    int min_;
    int max_;
};

}
