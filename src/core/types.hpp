/**
 * @file types.hpp
 * @brief Fundamental types used throughout ClusterExec.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace cluster_exec {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using SessionId = std::string;
using Bytes = std::vector<uint8_t>;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Executor Statistics
// ─────────────────────────────────────────────

/**
 * @brief Point-in-time counters of a backing executor.
 */
struct ExecutorStats {
    size_t threads{0};
    size_t active{0};              ///< Tasks currently running
    size_t pending{0};             ///< Tasks queued, not yet started
    uint64_t completed{0};         ///< Tasks finished, successfully or not
    uint64_t failed{0};            ///< Subset of completed whose body threw
};

}  // namespace cluster_exec
