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
 * @file config.hpp
 * @brief Declarative configuration of the gateway.
 *
 * @details
 * The gateway is driven by a single JSON document describing the listening
 * socket, the upstream replica groups with their health and timeout policies,
 * and the routes that map path prefixes onto those groups. Every structural
 * mistake is reported as a `ConfigError` at load time; nothing is validated
 * lazily while traffic flows.
 */

#pragma once

#include "uuidmesh/http/client.hpp"
#include "uuidmesh/infra/logger.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace uuidmesh::gateway {

/**
 * @class ConfigError
 * @brief Raised for unreadable, malformed or inconsistent configuration.
 */
class ConfigError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// @brief One replica of an upstream group.
struct ReplicaConfig {
    std::string name;
    std::string host;
    int port = 0;
};

/**
 * @struct HealthPolicy
 * @brief Passive health-check thresholds of an upstream group.
 */
struct HealthPolicy {
    int max_fails = 3;                           ///< Consecutive failures before eviction.
    std::chrono::milliseconds fail_window{10000}; ///< Span a failure streak may cover.
    std::chrono::milliseconds cooldown{10000};    ///< Eviction length before probing again.
};

/// @brief A named group of interchangeable replicas.
struct UpstreamConfig {
    std::string name;
    std::vector<ReplicaConfig> replicas;
    HealthPolicy health;
    http::Timeouts timeouts;
    int max_attempts = 0; ///< 0 means one attempt per replica.
    bool count_5xx_as_failure = true;

    /// @brief Effective attempt budget per request.
    size_t attempt_budget() const;
};

/// @brief Elements a cache key may be assembled from.
enum class CacheKeyPart { kMethod, kPath, kQuery, kHeader };

struct CacheKeyComponent {
    CacheKeyPart part = CacheKeyPart::kPath;
    std::string header; ///< Header name when `part == kHeader`.
};

/**
 * @struct CachePolicy
 * @brief Route-scoped response caching parameters.
 */
struct CachePolicy {
    bool enabled = false;
    std::chrono::milliseconds valid{0};
    std::vector<CacheKeyComponent> key;
    bool use_stale = false;
    std::chrono::milliseconds stale{0};
    size_t max_entries = 10000;
};

/**
 * @struct RouteConfig
 * @brief Maps a path prefix onto an upstream group.
 */
struct RouteConfig {
    std::string prefix;
    std::string upstream;
    std::optional<std::string> rewrite; ///< Replacement for `prefix`; absent preserves the path.
    CachePolicy cache;
};

/**
 * @struct GatewayConfig
 * @brief Root of the gateway configuration.
 */
struct GatewayConfig {
    int listen_port = 9090;
    size_t workers = 64;
    infra::LogLevel log_level = infra::LogLevel::INFO;
    std::string status_path; ///< Empty disables the status endpoint.
    std::map<std::string, UpstreamConfig> upstreams;
    std::vector<RouteConfig> routes;

    /**
     * @brief Parses and validates a JSON document.
     * @throws ConfigError On syntax errors, type mismatches or failed validation.
     */
    static GatewayConfig parse(const std::string& json);

    /**
     * @brief Reads `path` and delegates to `parse`.
     * @throws ConfigError If the file cannot be read or is invalid.
     */
    static GatewayConfig load(const std::string& path);

    /**
     * @brief Checks cross-field consistency.
     *
     * Rejects: no routes; empty or duplicate prefixes; prefixes or rewrites not
     * starting with `/`; a rewrite whose trailing slash disagrees with its
     * prefix; routes naming unknown upstreams; upstreams without replicas;
     * replica ports outside 1..65535; non-positive thresholds or timeouts;
     * enabled caches with a zero validity window or an empty key; a status
     * path that collides with a route prefix.
     *
     * @throws ConfigError Describing the first violation found.
     */
    void validate() const;
};

} // namespace uuidmesh::gateway
