/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file health_tracker.hpp
 * @brief Passive health state of the replicas in one upstream group.
 *
 * @details
 * Health is inferred from ordinary traffic only. Each replica moves through
 * three states:
 *
 * - **Healthy**: eligible; failures accumulate into a streak.
 * - **Unavailable**: entered when the streak reaches `max_fails` within
 *   `fail_window`; skipped by replica selection until `cooldown` elapses.
 * - **Probing**: entered lazily on the first availability check after the
 *   cool-down; eligible again. The next outcome decides: a success restores
 *   Healthy, a failure re-enters Unavailable for another cool-down.
 *
 * A single mutex serializes every transition, so two concurrent failures are
 * always counted as two.
 */

#pragma once

#include "uuidmesh/gateway/config.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace uuidmesh::gateway {

enum class ReplicaState { kHealthy, kUnavailable, kProbing };

/// @brief Lower-case state name for logs and the status endpoint.
const char* to_string(ReplicaState state);

/**
 * @struct ReplicaHealth
 * @brief Point-in-time copy of one replica's record.
 */
struct ReplicaHealth {
    std::string name;
    ReplicaState state = ReplicaState::kHealthy;
    int consecutive_failures = 0;
    uint64_t total_failures = 0;
    uint64_t total_successes = 0;
    std::chrono::milliseconds cooldown_remaining{0};
};

class HealthTracker {
  public:
    using Clock = std::chrono::steady_clock;

    /**
     * @param replica_names One entry per replica, in selection order.
     * @param policy Thresholds shared by all replicas of the group.
     */
    HealthTracker(std::vector<std::string> replica_names, HealthPolicy policy);

    /**
     * @brief Tells whether `replica` may receive traffic at `now`.
     *
     * Performs the Unavailable -> Probing transition once the cool-down has elapsed.
     */
    bool is_available(size_t replica, Clock::time_point now);

    /**
     * @brief Records a successful exchange.
     *
     * Resets the failure streak. Restores Healthy from Probing. A late success
     * from a request dispatched before eviction does not shorten the cool-down.
     */
    void record_success(size_t replica, Clock::time_point now);

    /**
     * @brief Records a failed exchange.
     *
     * @return true If this failure made the replica Unavailable.
     */
    bool record_failure(size_t replica, Clock::time_point now);

    ReplicaHealth snapshot(size_t replica, Clock::time_point now) const;

    size_t size() const { return records_.size(); }

  private:
    struct Record {
        std::string name;
        ReplicaState state = ReplicaState::kHealthy;
        int streak = 0;
        Clock::time_point streak_started{};
        Clock::time_point unavailable_until{};
        uint64_t failures = 0;
        uint64_t successes = 0;
    };

    void refresh(Record& record, Clock::time_point now);

    const HealthPolicy policy_;
    mutable std::mutex mutex_;
    std::vector<Record> records_;
};

} // namespace uuidmesh::gateway
