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
 * @file health_tracker.cpp
 * @brief Transitions of the passive health state machine.
 */

#include "uuidmesh/gateway/health_tracker.hpp"

#include "uuidmesh/infra/logger.hpp"

#include <stdexcept>

namespace uuidmesh::gateway {

using infra::LogLevel;
using infra::Logger;

const char* to_string(ReplicaState state)
{
    switch (state) {
    case ReplicaState::kHealthy:
        return "healthy";
    case ReplicaState::kUnavailable:
        return "unavailable";
    case ReplicaState::kProbing:
        return "probing";
    }
    return "unknown";
}

HealthTracker::HealthTracker(std::vector<std::string> replica_names, HealthPolicy policy)
    : policy_(policy)
{
    records_.reserve(replica_names.size());
    for (auto& name : replica_names) {
        Record record;
        record.name = std::move(name);
        records_.push_back(std::move(record));
    }
}

void HealthTracker::refresh(Record& record, Clock::time_point now)
{
    if (record.state == ReplicaState::kUnavailable && now >= record.unavailable_until) {
        record.state = ReplicaState::kProbing;
        Logger::log(LogLevel::INFO,
                    "Health: Cool-down over for '" + record.name + "', probing with live traffic.");
    }
}

bool HealthTracker::is_available(size_t replica, Clock::time_point now)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Record& record = records_.at(replica);
    refresh(record, now);
    return record.state != ReplicaState::kUnavailable;
}

void HealthTracker::record_success(size_t replica, Clock::time_point now)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Record& record = records_.at(replica);
    refresh(record, now);

    record.successes++;
    record.streak = 0;

    if (record.state == ReplicaState::kProbing) {
        record.state = ReplicaState::kHealthy;
        Logger::log(LogLevel::INFO, "Health: Replica '" + record.name + "' recovered.");
    }
}

bool HealthTracker::record_failure(size_t replica, Clock::time_point now)
{
    std::lock_guard<std::mutex> lock(mutex_);
    Record& record = records_.at(replica);
    refresh(record, now);

    record.failures++;

    // Failures of requests already in flight at eviction time do not extend it.
    if (record.state == ReplicaState::kUnavailable) {
        return false;
    }

    if (record.state == ReplicaState::kHealthy) {
        if (record.streak == 0 || now - record.streak_started > policy_.fail_window) {
            record.streak = 0;
            record.streak_started = now;
        }
        record.streak++;
        if (record.streak < policy_.max_fails) {
            return false;
        }
    }

    const std::string cause = record.state == ReplicaState::kProbing
                                  ? "failed probe"
                                  : std::to_string(record.streak) + " consecutive failure(s)";
    record.state = ReplicaState::kUnavailable;
    record.unavailable_until = now + policy_.cooldown;
    Logger::log(LogLevel::WARN, "Health: Replica '" + record.name + "' marked unavailable after " +
                                    cause + " for " + std::to_string(policy_.cooldown.count()) +
                                    "ms.");
    record.streak = 0;
    return true;
}

ReplicaHealth HealthTracker::snapshot(size_t replica, Clock::time_point now) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const Record& record = records_.at(replica);

    ReplicaHealth out;
    out.name = record.name;
    out.state = record.state;
    out.consecutive_failures = record.streak;
    out.total_failures = record.failures;
    out.total_successes = record.successes;

    if (record.state == ReplicaState::kUnavailable) {
        if (now >= record.unavailable_until) {
            out.state = ReplicaState::kProbing;
        } else {
            out.cooldown_remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                record.unavailable_until - now);
        }
    }
    return out;
}

} // namespace uuidmesh::gateway
