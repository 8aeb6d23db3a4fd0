#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "challenge.hpp"
#include "lane_messages.hpp"
#include "search_strategy.hpp"
#include "worker_unit.hpp"

namespace powgate {

struct SolverOptions {
    size_t lanes = 0;                          // 0 = hardware concurrency
    size_t max_lanes = 64;
    uint64_t batch_size = 1000;
    uint64_t max_attempts_per_lane = 10000000;
    std::chrono::milliseconds progress_interval{100};
    StrategyPreference strategy = StrategyPreference::AUTO;
};

struct ProgressSnapshot {
    uint64_t total_attempts = 0;
    double hash_rate = 0.0;                    // attempts per second
    std::chrono::milliseconds elapsed{0};
    size_t active_lanes = 0;
};

using ProgressCallback = std::function<void(const ProgressSnapshot&)>;

struct SolveStats {
    uint64_t total_attempts = 0;
    std::chrono::milliseconds elapsed{0};
    size_t lanes = 0;
    std::string strategy;
};

class SolveError : public std::runtime_error {
public:
    enum class Code {
        TIMEOUT,
        ALL_LANES_FAILED
    };

    SolveError(Code code, const std::string& what)
        : std::runtime_error(what), code_(code) {}

    Code code() const { return code_; }

private:
    Code code_;
};

// Races N search lanes over a stride partition of the nonce space and returns
// the first solution found.
//
// The strategy is selected once at construction. Lanes cancelled after a
// solve are not waited for; they are joined at the start of the next solve
// or when the coordinator is destroyed. solve() calls are serialised.
class SolverCoordinator {
public:
    explicit SolverCoordinator(SolverOptions options = {});
    SolverCoordinator(SolverOptions options, std::shared_ptr<const SearchStrategy> strategy);
    ~SolverCoordinator();

    SolverCoordinator(const SolverCoordinator&) = delete;
    SolverCoordinator& operator=(const SolverCoordinator&) = delete;

    /**
     * Searches for a nonce whose digest meets the difficulty.
     * @param challenge Challenge string as issued.
     * @param difficulty Required leading zero nibbles, 0..64.
     * @param timeout Wall-clock budget, armed when the lanes are dispatched.
     * @param on_progress Optional, called on the calling thread at most once per progress interval.
     * @throws SolveError on timeout or when every lane failed.
     * @throws std::invalid_argument on an empty challenge, bad difficulty or zero timeout.
     */
    Solution solve(const std::string& challenge, int difficulty,
                   std::chrono::milliseconds timeout,
                   const ProgressCallback& on_progress = nullptr);

    Solution solve(const Challenge& challenge, std::chrono::milliseconds timeout,
                   const ProgressCallback& on_progress = nullptr);

    size_t lane_count() const { return lanes_; }
    std::string strategy_name() const { return strategy_->name(); }
    bool accelerated() const { return strategy_->accelerated(); }
    SolveStats last_stats() const;

    // configured > 0 wins; otherwise hardware concurrency, floor 4 when unknown.
    static size_t resolve_lane_count(size_t configured, size_t max_lanes,
                                     unsigned hardware = std::thread::hardware_concurrency());

private:
    void reap_retired();
    void retire(std::vector<std::unique_ptr<WorkerUnit>>& lanes);

    SolverOptions options_;
    std::shared_ptr<const SearchStrategy> strategy_;
    size_t lanes_;

    std::mutex solve_mutex_;
    std::vector<std::unique_ptr<WorkerUnit>> retired_;

    mutable std::mutex stats_mutex_;
    SolveStats last_stats_;
};

}
