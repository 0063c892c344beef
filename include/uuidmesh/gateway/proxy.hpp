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
 * @file proxy.hpp
 * @brief Request pipeline of the gateway.
 *
 * @details
 * The Proxy is the gateway's equivalent of a request handler: it receives a
 * parsed client request and returns the response to send back. Internally it
 * resolves the route, consults the route cache, picks replicas round-robin
 * while skipping unavailable ones, retries transport failures on the next
 * replica and feeds every outcome into the passive health tracker.
 *
 * Time and network are injected so that the whole pipeline can be driven
 * deterministically.
 */

#pragma once

#include "uuidmesh/gateway/config.hpp"
#include "uuidmesh/gateway/health_tracker.hpp"
#include "uuidmesh/gateway/response_cache.hpp"
#include "uuidmesh/http/client.hpp"
#include "uuidmesh/http/message.hpp"
#include "uuidmesh/infra/logger.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace uuidmesh::gateway {

/// @brief Response header reporting how the cache treated a request.
constexpr const char* kCacheStatusHeader = "X-Cache-Status";

class Proxy {
  public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    /**
     * @param config Validated gateway configuration.
     * @param transport Network seam used for every upstream exchange.
     * @param events Sink receiving one `gateway.request` event per request.
     * @param clock Time source for health and cache decisions.
     */
    Proxy(GatewayConfig config, http::Transport& transport, infra::EventSink& events,
          ClockFn clock = &Clock::now);

    Proxy(const Proxy&) = delete;
    Proxy& operator=(const Proxy&) = delete;

    /**
     * @brief Serves one client request.
     *
     * Never throws for upstream conditions; those are mapped to 502 or 504.
     */
    http::HttpResponse handle(const http::HttpRequest& request);

    /// @brief JSON document describing every replica's health.
    std::string status_json() const;

    /// @brief Health snapshot of one replica.
    /// @throws std::out_of_range For an unknown upstream or index.
    ReplicaHealth replica_health(const std::string& upstream, size_t replica) const;

    const GatewayConfig& config() const { return config_; }

  private:
    struct UpstreamRuntime {
        const UpstreamConfig* config = nullptr;
        std::unique_ptr<HealthTracker> health;
        std::atomic<size_t> cursor{0};
    };

    struct RouteRuntime {
        const RouteConfig* config = nullptr;
        UpstreamRuntime* upstream = nullptr;
        std::unique_ptr<ResponseCache> cache;
    };

    const RouteRuntime* match(const std::string& path) const;
    std::optional<size_t> select(UpstreamRuntime& upstream, const std::vector<bool>& tried);
    http::HttpRequest build_upstream_request(const http::HttpRequest& request,
                                             const RouteConfig& route) const;

    void report(const http::HttpRequest& request, const std::string& route, int status,
                const std::string& cache, size_t attempts, const std::string& replica,
                Clock::time_point started);

    GatewayConfig config_;
    http::Transport& transport_;
    infra::EventSink& events_;
    ClockFn clock_;

    std::map<std::string, std::unique_ptr<UpstreamRuntime>> upstreams_;
    std::vector<RouteRuntime> routes_; ///< Sorted by descending prefix length.
};

} // namespace uuidmesh::gateway
