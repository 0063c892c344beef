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
 * @file response_cache.cpp
 * @brief Key derivation and entry lifecycle of the response cache.
 */

#include "uuidmesh/gateway/response_cache.hpp"

#include <algorithm>
#include <mutex>

namespace uuidmesh::gateway {

namespace {
constexpr char kKeySeparator = '\x1f';
} // namespace

std::string cache_key(const CachePolicy& policy, const http::HttpRequest& request)
{
    std::string key;
    for (const auto& component : policy.key) {
        if (!key.empty()) {
            key += kKeySeparator;
        }
        switch (component.part) {
        case CacheKeyPart::kMethod:
            key += request.method;
            break;
        case CacheKeyPart::kPath:
            key += request.path;
            break;
        case CacheKeyPart::kQuery:
            key += request.query;
            break;
        case CacheKeyPart::kHeader:
            key += request.header(component.header).value_or("");
            break;
        }
    }
    return key;
}

ResponseCache::ResponseCache(size_t max_entries) : max_entries_(std::max<size_t>(1, max_entries))
{
}

std::optional<http::HttpResponse> ResponseCache::lookup_fresh(const std::string& key,
                                                              Clock::time_point now) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end() || now >= it->second.fresh_until) {
        return std::nullopt;
    }
    return it->second.response;
}

std::optional<http::HttpResponse> ResponseCache::lookup_stale(const std::string& key,
                                                              Clock::time_point now) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    const Entry& entry = it->second;
    if (now < entry.fresh_until || now >= entry.stale_until) {
        return std::nullopt;
    }
    return entry.response;
}

void ResponseCache::store(const std::string& key, http::HttpResponse response,
                          std::chrono::milliseconds valid, std::chrono::milliseconds stale,
                          Clock::time_point now)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (entries_.find(key) == entries_.end() && entries_.size() >= max_entries_) {
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (now >= it->second.stale_until) {
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
        if (entries_.size() >= max_entries_) {
            auto oldest = std::min_element(entries_.begin(), entries_.end(),
                                           [](const auto& a, const auto& b) {
                                               return a.second.stale_until < b.second.stale_until;
                                           });
            entries_.erase(oldest);
        }
    }

    Entry entry;
    entry.response = std::move(response);
    entry.fresh_until = now + valid;
    entry.stale_until = entry.fresh_until + stale;
    entries_[key] = std::move(entry);
}

size_t ResponseCache::purge_expired(Clock::time_point now)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now >= it->second.stale_until) {
            it = entries_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t ResponseCache::size() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

} // namespace uuidmesh::gateway
