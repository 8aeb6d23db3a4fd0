#include "worker_unit.hpp"
#include "security_logger.hpp"

#include <limits>
#include <stdexcept>

namespace powgate {

std::string to_string(WorkerState state) {
    switch (state) {
        case WorkerState::IDLE: return "idle";
        case WorkerState::SEARCHING: return "searching";
        case WorkerState::FOUND: return "found";
        case WorkerState::CANCELLED: return "cancelled";
        case WorkerState::EXHAUSTED: return "exhausted";
        case WorkerState::FAILED: return "failed";
        default: return "unknown";
    }
}

std::vector<WorkerAssignment> make_assignments(size_t lanes) {
    if (lanes == 0) {
        throw std::invalid_argument("At least one lane is required");
    }

    std::vector<WorkerAssignment> assignments;
    assignments.reserve(lanes);
    for (size_t i = 0; i < lanes; ++i) {
        assignments.push_back(WorkerAssignment{static_cast<uint64_t>(i), static_cast<uint64_t>(lanes)});
    }
    return assignments;
}

WorkerUnit::WorkerUnit(size_t lane,
                       std::shared_ptr<const SearchStrategy> strategy,
                       std::shared_ptr<Channel<LaneEvent>> events,
                       WorkerLimits limits)
    : lane_(lane)
    , strategy_(std::move(strategy))
    , events_(std::move(events))
    , limits_(limits)
{
    if (!strategy_ || !events_) {
        throw std::invalid_argument("WorkerUnit requires a strategy and an event channel");
    }
    if (limits_.batch_size == 0) {
        throw std::invalid_argument("batch_size must be positive");
    }
}

WorkerUnit::~WorkerUnit() {
    cancel();
    join();
}

void WorkerUnit::start() {
    if (thread_.joinable()) {
        throw std::logic_error("Lane " + std::to_string(lane_) + " already started");
    }
    thread_ = std::thread([this] { run(); });
}

bool WorkerUnit::post(LaneCommand command) {
    if (cancel_requested()) return false;
    return inbox_.send(std::move(command));
}

void WorkerUnit::cancel() {
    cancelled_.store(true, std::memory_order_release);
    inbox_.close();
}

void WorkerUnit::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void WorkerUnit::fail(const std::string& reason, bool exhausted) {
    state_.store(exhausted ? WorkerState::EXHAUSTED : WorkerState::FAILED, std::memory_order_release);
    events_->send(LaneError{lane_, reason, exhausted});
}

void WorkerUnit::run() {
    // Whatever the exit path, later posts must report that nobody is listening.
    struct InboxCloser {
        Channel<LaneCommand>& inbox;
        ~InboxCloser() { inbox.close(); }
    } closer{inbox_};

    try {
        bool initialised = false;
        while (true) {
            LaneCommand command = inbox_.receive();

            if (std::get_if<InitRequest>(&command)) {
                initialised = handle_init();
                if (!initialised) return;
            } else if (auto* request = std::get_if<SolveRequest>(&command)) {
                if (!initialised && !handle_init()) return;
                search(*request);
                return;
            }
        }
    } catch (const ChannelClosedError&) {
        // Cancelled before a solve request arrived.
        if (state() == WorkerState::IDLE) {
            state_.store(WorkerState::CANCELLED, std::memory_order_release);
        }
    } catch (const std::exception& e) {
        fail(std::string("lane execution error: ") + e.what(), false);
    }
}

bool WorkerUnit::handle_init() {
    try {
        // Exercise the backend on this thread before committing to a search.
        auto hasher = strategy_->make_hasher("init");
        hasher->hash(0);
    } catch (const std::exception& e) {
        fail("initialisation of " + strategy_->name() + " path failed: " + e.what(), false);
        return false;
    }
    events_->send(InitComplete{lane_, strategy_->name()});
    return true;
}

void WorkerUnit::search(const SolveRequest& request) {
    const WorkerAssignment& assignment = request.assignment;
    if (assignment.stride == 0) {
        fail("invalid assignment: zero stride", false);
        return;
    }

    auto hasher = strategy_->make_hasher(request.challenge);
    state_.store(WorkerState::SEARCHING, std::memory_order_release);

    uint64_t nonce = assignment.start_nonce;
    uint64_t since_report = 0;
    uint64_t attempts = 0;

    while (true) {
        if (attempts >= limits_.max_attempts) {
            if (since_report > 0) {
                events_->send(ProgressReport{lane_, since_report, nonce});
            }
            fail("attempt ceiling of " + std::to_string(limits_.max_attempts) + " reached", true);
            return;
        }

        Digest digest = hasher->hash(nonce);
        ++attempts;
        ++since_report;
        attempts_.store(attempts, std::memory_order_relaxed);

        if (HashOracle::meets_difficulty(digest, request.difficulty)) {
            state_.store(WorkerState::FOUND, std::memory_order_release);
            events_->send(ProgressReport{lane_, since_report, nonce});
            events_->send(SolutionFound{lane_, Solution{nonce, digest, attempts, lane_}});
            return;
        }

        if (since_report == limits_.batch_size) {
            events_->send(ProgressReport{lane_, since_report, nonce});
            since_report = 0;
            if (cancel_requested()) {
                state_.store(WorkerState::CANCELLED, std::memory_order_release);
                return;
            }
        }

        if (nonce > std::numeric_limits<uint64_t>::max() - assignment.stride) {
            if (since_report > 0) {
                events_->send(ProgressReport{lane_, since_report, nonce});
            }
            fail("nonce space exhausted", true);
            return;
        }
        nonce += assignment.stride;
    }
}

}
