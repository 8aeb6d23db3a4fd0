#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "channel.hpp"
#include "lane_messages.hpp"
#include "search_strategy.hpp"

namespace powgate {

enum class WorkerState {
    IDLE,
    SEARCHING,
    FOUND,
    CANCELLED,
    EXHAUSTED,
    FAILED
};

std::string to_string(WorkerState state);

struct WorkerLimits {
    uint64_t batch_size = 1000;          // attempts between progress reports / cancellation checks
    uint64_t max_attempts = 10000000;    // safety ceiling per lane
};

/**
 * Stride partition of the nonce space across `lanes` workers.
 * @throws std::invalid_argument if lanes is zero.
 */
std::vector<WorkerAssignment> make_assignments(size_t lanes);

// One search lane running on its own thread.
//
// The lane consumes commands from its inbox (init, then solve) and reports
// through the shared event channel. It never touches coordinator state.
// Cancellation is cooperative and observed at every batch boundary, so a
// cancelled lane computes at most one further batch.
class WorkerUnit {
public:
    WorkerUnit(size_t lane,
               std::shared_ptr<const SearchStrategy> strategy,
               std::shared_ptr<Channel<LaneEvent>> events,
               WorkerLimits limits = {});
    ~WorkerUnit();

    WorkerUnit(const WorkerUnit&) = delete;
    WorkerUnit& operator=(const WorkerUnit&) = delete;

    void start();

    // Returns false once the lane has been cancelled or its thread has exited.
    bool post(LaneCommand command);

    void cancel();
    void join();

    size_t lane() const { return lane_; }
    WorkerState state() const { return state_.load(std::memory_order_acquire); }
    uint64_t attempts() const { return attempts_.load(std::memory_order_relaxed); }
    bool cancel_requested() const { return cancelled_.load(std::memory_order_acquire); }

private:
    void run();
    bool handle_init();
    void search(const SolveRequest& request);
    void fail(const std::string& reason, bool exhausted);

    const size_t lane_;
    std::shared_ptr<const SearchStrategy> strategy_;
    std::shared_ptr<Channel<LaneEvent>> events_;
    WorkerLimits limits_;

    Channel<LaneCommand> inbox_;
    std::atomic<bool> cancelled_{false};
    std::atomic<WorkerState> state_{WorkerState::IDLE};
    std::atomic<uint64_t> attempts_{0};
    std::thread thread_;
};

}
