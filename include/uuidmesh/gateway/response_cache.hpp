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
 * @file response_cache.hpp
 * @brief Route-scoped store of upstream responses.
 *
 * @details
 * Entries are keyed by a string assembled from the route's key policy. An
 * entry is **fresh** until its validity window ends and **stale** for a
 * further grace window, during which it may only be served as a fallback
 * when every upstream attempt failed.
 *
 * Concurrency: lookups take a shared lock; stores and purges take an
 * exclusive lock.
 */

#pragma once

#include "uuidmesh/gateway/config.hpp"
#include "uuidmesh/http/message.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace uuidmesh::gateway {

/**
 * @brief Builds the cache key of `request` under `policy`.
 *
 * Components are joined with a unit separator so that e.g. path `/a` plus
 * query `b` never collides with path `/ab`. Header components contribute
 * their value, or nothing when the header is absent.
 */
std::string cache_key(const CachePolicy& policy, const http::HttpRequest& request);

class ResponseCache {
  public:
    using Clock = std::chrono::steady_clock;

    explicit ResponseCache(size_t max_entries = 10000);

    /// @brief Returns the stored response if it is still within its validity window.
    std::optional<http::HttpResponse> lookup_fresh(const std::string& key,
                                                   Clock::time_point now) const;

    /// @brief Returns the stored response if it is past validity but within its grace window.
    std::optional<http::HttpResponse> lookup_stale(const std::string& key,
                                                   Clock::time_point now) const;

    /**
     * @brief Inserts or replaces the entry for `key`.
     *
     * When the store is full, expired entries are purged first and then the
     * entry closest to expiry is evicted.
     */
    void store(const std::string& key, http::HttpResponse response,
               std::chrono::milliseconds valid, std::chrono::milliseconds stale,
               Clock::time_point now);

    /// @brief Drops every entry past its grace window. Returns the number removed.
    size_t purge_expired(Clock::time_point now);

    size_t size() const;

  private:
    struct Entry {
        http::HttpResponse response;
        Clock::time_point fresh_until;
        Clock::time_point stale_until;
    };

    const size_t max_entries_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace uuidmesh::gateway
