#include "solver_coordinator.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

#include <algorithm>

namespace powgate {

namespace {

constexpr size_t DEFAULT_LANE_FLOOR = 4;

ProgressSnapshot make_snapshot(uint64_t total, std::chrono::steady_clock::duration elapsed, size_t active) {
    ProgressSnapshot snapshot;
    snapshot.total_attempts = total;
    snapshot.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed);
    double seconds = std::chrono::duration<double>(elapsed).count();
    snapshot.hash_rate = seconds > 0.0 ? static_cast<double>(total) / seconds : 0.0;
    snapshot.active_lanes = active;
    return snapshot;
}

void record_outcome(const std::string& outcome) {
    MetricsRegistry::instance().increment_counter("powgate_solves_total{outcome=\"" + outcome + "\"}");
}

}

SolverCoordinator::SolverCoordinator(SolverOptions options)
    : SolverCoordinator(options, select_strategy(options.strategy)) {}

SolverCoordinator::SolverCoordinator(SolverOptions options, std::shared_ptr<const SearchStrategy> strategy)
    : options_(std::move(options))
    , strategy_(std::move(strategy))
{
    if (!strategy_) {
        throw std::invalid_argument("SolverCoordinator requires a search strategy");
    }
    if (options_.max_lanes == 0) {
        throw std::invalid_argument("max_lanes must be positive");
    }
    if (options_.batch_size == 0 || options_.max_attempts_per_lane == 0) {
        throw std::invalid_argument("batch_size and max_attempts_per_lane must be positive");
    }
    if (options_.progress_interval.count() <= 0) {
        throw std::invalid_argument("progress_interval must be positive");
    }
    lanes_ = resolve_lane_count(options_.lanes, options_.max_lanes);
    MetricsRegistry::instance().set_gauge("powgate_solver_lanes", static_cast<double>(lanes_));
}

SolverCoordinator::~SolverCoordinator() {
    std::lock_guard<std::mutex> lock(solve_mutex_);
    reap_retired();
}

size_t SolverCoordinator::resolve_lane_count(size_t configured, size_t max_lanes, unsigned hardware) {
    size_t lanes = configured;
    if (lanes == 0) {
        lanes = hardware > 0 ? static_cast<size_t>(hardware) : DEFAULT_LANE_FLOOR;
    }
    return std::max<size_t>(1, std::min(lanes, max_lanes));
}

SolveStats SolverCoordinator::last_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return last_stats_;
}

void SolverCoordinator::reap_retired() {
    for (auto& lane : retired_) {
        lane->cancel();
        lane->join();
    }
    retired_.clear();
}

void SolverCoordinator::retire(std::vector<std::unique_ptr<WorkerUnit>>& lanes) {
    for (auto& lane : lanes) {
        lane->cancel();
        retired_.push_back(std::move(lane));
    }
    lanes.clear();
}

Solution SolverCoordinator::solve(const Challenge& challenge, std::chrono::milliseconds timeout,
                                  const ProgressCallback& on_progress) {
    return solve(challenge.challenge_string, challenge.difficulty, timeout, on_progress);
}

Solution SolverCoordinator::solve(const std::string& challenge, int difficulty,
                                  std::chrono::milliseconds timeout,
                                  const ProgressCallback& on_progress) {
    if (challenge.empty()) {
        throw std::invalid_argument("challenge string must not be empty");
    }
    if (difficulty < 0 || difficulty > MAX_NIBBLE_DIFFICULTY) {
        throw std::invalid_argument("difficulty must be within [0, 64]");
    }
    if (timeout.count() <= 0) {
        throw std::invalid_argument("timeout must be positive");
    }

    std::lock_guard<std::mutex> lock(solve_mutex_);
    reap_retired();

    // A fresh channel per solve keeps late events of retired lanes out.
    auto events = std::make_shared<Channel<LaneEvent>>();
    WorkerLimits limits{options_.batch_size, options_.max_attempts_per_lane};

    std::vector<std::unique_ptr<WorkerUnit>> lanes;
    lanes.reserve(lanes_);

    auto started = std::chrono::steady_clock::now();
    auto deadline = started + timeout;
    uint64_t total_attempts = 0;
    size_t failed = 0;
    std::string last_failure;

    auto finish = [&](const std::string& outcome) {
        events->close();
        retire(lanes);

        auto elapsed = std::chrono::steady_clock::now() - started;
        ProgressSnapshot summary = make_snapshot(total_attempts, elapsed, 0);
        {
            std::lock_guard<std::mutex> stats_lock(stats_mutex_);
            last_stats_ = SolveStats{total_attempts, summary.elapsed, lanes_, strategy_->name()};
        }
        MetricsRegistry::instance().set_gauge("powgate_solver_hash_rate", summary.hash_rate);
        record_outcome(outcome);
        return summary;
    };

    auto last_emit = started;
    bool dirty = false;

    auto emit_progress = [&](std::chrono::steady_clock::time_point now, bool force) {
        if (!on_progress || !dirty) return;
        if (!force && now - last_emit < options_.progress_interval) return;
        last_emit = now;
        dirty = false;
        try {
            on_progress(make_snapshot(total_attempts, now - started, lanes_ - failed));
        } catch (const std::exception& e) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::SOLVER, "internal",
                                std::string("Progress callback threw: ") + e.what());
        }
    };

    // A lane can be reported twice (refused post, then its own LaneError); count it once.
    std::vector<bool> lane_failed(lanes_, false);
    auto record_failure = [&](size_t lane, const std::string& reason) {
        if (lane >= lane_failed.size() || lane_failed[lane]) return;
        lane_failed[lane] = true;
        ++failed;
        last_failure = reason;
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LANE_FAILURE, "internal",
                            "Lane " + std::to_string(lane) + ": " + reason);
    };

    auto fail_if_no_lane_left = [&](std::chrono::steady_clock::time_point now) {
        if (failed < lanes_) return;
        emit_progress(now, true);
        finish("all_lanes_failed");
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::SOLVER, "internal",
                            "All " + std::to_string(lanes_) + " lanes failed");
        throw SolveError(SolveError::Code::ALL_LANES_FAILED, "All lanes failed: " + last_failure);
    };

    try {
        for (const auto& assignment : make_assignments(lanes_)) {
            size_t index = lanes.size();
            auto lane = std::make_unique<WorkerUnit>(index, strategy_, events, limits);
            lane->start();
            if (!lane->post(InitRequest{}) ||
                !lane->post(SolveRequest{challenge, difficulty, assignment})) {
                record_failure(index, "lane stopped before accepting the solve request");
            }
            lanes.push_back(std::move(lane));
        }

        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::SOLVER, "internal",
                            "Dispatched " + std::to_string(lanes_) + " lanes (" + strategy_->name() +
                            ") at difficulty " + std::to_string(difficulty));
        fail_if_no_lane_left(std::chrono::steady_clock::now());

        while (true) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                emit_progress(now, true);
                finish("timeout");
                SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::SOLVER, "internal",
                                    "Solve timed out after " + std::to_string(timeout.count()) + "ms");
                throw SolveError(SolveError::Code::TIMEOUT,
                                 "No solution within " + std::to_string(timeout.count()) + "ms");
            }

            auto wait = std::min<std::chrono::steady_clock::duration>(deadline - now, options_.progress_interval);
            auto event = events->receive_for(wait);
            now = std::chrono::steady_clock::now();

            if (event) {
                if (auto* progress = std::get_if<ProgressReport>(&*event)) {
                    total_attempts += progress->attempts;
                    dirty = true;
                } else if (auto* found = std::get_if<SolutionFound>(&*event)) {
                    emit_progress(now, true);
                    Solution solution = found->solution;
                    ProgressSnapshot summary = finish("found");
                    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::SOLVER, "internal",
                                        "Lane " + std::to_string(solution.lane) + " found nonce " +
                                        std::to_string(solution.nonce) + " after " +
                                        std::to_string(summary.total_attempts) + " attempts");
                    return solution;
                } else if (auto* error = std::get_if<LaneError>(&*event)) {
                    record_failure(error->lane, error->reason);
                    fail_if_no_lane_left(now);
                }
                // InitComplete carries nothing the race needs.
            }

            emit_progress(now, false);
        }
    } catch (const SolveError&) {
        throw;
    } catch (const std::exception&) {
        events->close();
        retire(lanes);
        throw;
    }
}

}
