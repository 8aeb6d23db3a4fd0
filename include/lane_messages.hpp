#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

#include "hash_oracle.hpp"

namespace powgate {

// Lane i of N searches start_nonce + k * stride with start_nonce = i, stride = N.
// Together the N assignments cover every non-negative integer exactly once.
struct WorkerAssignment {
    uint64_t start_nonce = 0;
    uint64_t stride = 1;
};

struct Solution {
    uint64_t nonce = 0;
    Digest digest{};
    uint64_t attempts = 0;  // hashes computed by the finding lane, winner included
    size_t lane = 0;

    std::string digest_hex() const { return HashOracle::to_hex(digest); }
};

// --- Coordinator -> lane ---

struct InitRequest {};

struct SolveRequest {
    std::string challenge;
    int difficulty = 0;
    WorkerAssignment assignment;
};

using LaneCommand = std::variant<InitRequest, SolveRequest>;

// --- Lane -> coordinator ---

struct InitComplete {
    size_t lane = 0;
    std::string strategy;
};

struct ProgressReport {
    size_t lane = 0;
    uint64_t attempts = 0;       // since the previous report from this lane
    uint64_t nonce_reached = 0;  // last nonce hashed
};

struct SolutionFound {
    size_t lane = 0;
    Solution solution;
};

struct LaneError {
    size_t lane = 0;
    std::string reason;
    bool exhausted = false;      // attempt ceiling, as opposed to an execution failure
};

using LaneEvent = std::variant<InitComplete, ProgressReport, SolutionFound, LaneError>;

}
