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
 * @file proxy.cpp
 * @brief Routing, replica selection, retry and caching of the gateway.
 *
 * @details
 * Pipeline of `Proxy::handle`:
 * 1. **Status**: The configured status path is answered locally.
 * 2. **Route**: Longest-prefix match; no match is a 404.
 * 3. **Cache**: A fresh entry short-circuits the upstream.
 * 4. **Forward**: Round-robin over available, not yet tried replicas, within
 *    the attempt budget. Transport failures move on to the next replica.
 * 5. **Fallback**: A stale entry if allowed, otherwise 502 or 504.
 */

#include "uuidmesh/gateway/proxy.hpp"

#include "uuidmesh/infra/string.hpp"

#include <algorithm>
#include <cJSON.h>
#include <cstdlib>
#include <stdexcept>

namespace uuidmesh::gateway {

using http::HttpRequest;
using http::HttpResponse;
using infra::LogLevel;
using infra::Logger;
using infra::String;

namespace {

const char* const kHopByHopHeaders[] = {"Connection",          "Keep-Alive", "Proxy-Connection",
                                        "Proxy-Authenticate",  "TE",         "Trailer",
                                        "Proxy-Authorization", "Upgrade",    "Transfer-Encoding"};

/// @brief Drops hop-by-hop headers, including those listed in `Connection`.
void strip_hop_by_hop(http::HeaderList& headers)
{
    std::vector<std::string> listed;
    for (const auto& [name, value] : headers) {
        if (String::iequals(name, "Connection")) {
            for (const auto& token : String::split(value, ',')) {
                std::string trimmed = String::trim(token);
                if (!trimmed.empty()) {
                    listed.push_back(trimmed);
                }
            }
        }
    }

    headers.erase(std::remove_if(headers.begin(), headers.end(),
                                 [&listed](const auto& header) {
                                     for (const char* hop : kHopByHopHeaders) {
                                         if (String::iequals(header.first, hop)) {
                                             return true;
                                         }
                                     }
                                     for (const auto& name : listed) {
                                         if (String::iequals(header.first, name)) {
                                             return true;
                                         }
                                     }
                                     return false;
                                 }),
                  headers.end());
}

long long elapsed_ms(std::chrono::steady_clock::time_point from,
                     std::chrono::steady_clock::time_point to)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

Proxy::Proxy(GatewayConfig config, http::Transport& transport, infra::EventSink& events,
             ClockFn clock)
    : config_(std::move(config)), transport_(transport), events_(events), clock_(std::move(clock))
{
    config_.validate();

    for (const auto& [name, upstream] : config_.upstreams) {
        auto runtime = std::make_unique<UpstreamRuntime>();
        runtime->config = &upstream;

        std::vector<std::string> names;
        names.reserve(upstream.replicas.size());
        for (const auto& replica : upstream.replicas) {
            names.push_back(replica.name);
        }
        runtime->health = std::make_unique<HealthTracker>(std::move(names), upstream.health);
        upstreams_.emplace(name, std::move(runtime));
    }

    for (const auto& route : config_.routes) {
        RouteRuntime runtime;
        runtime.config = &route;
        runtime.upstream = upstreams_.at(route.upstream).get();
        if (route.cache.enabled) {
            runtime.cache = std::make_unique<ResponseCache>(route.cache.max_entries);
        }
        routes_.push_back(std::move(runtime));
    }

    std::stable_sort(routes_.begin(), routes_.end(), [](const auto& a, const auto& b) {
        return a.config->prefix.size() > b.config->prefix.size();
    });
}

// ============================================================================
// Request Pipeline
// ============================================================================

HttpResponse Proxy::handle(const HttpRequest& request)
{
    const Clock::time_point started = clock_();

    if (!config_.status_path.empty() && request.path == config_.status_path) {
        if (request.method != "GET") {
            HttpResponse resp = HttpResponse::error(405, request.path);
            resp.set_header("Allow", "GET");
            return resp;
        }
        return HttpResponse::json(200, status_json());
    }

    const RouteRuntime* route = match(request.path);
    if (!route) {
        HttpResponse resp = HttpResponse::error(404, request.path, "no route for path");
        report(request, "", resp.status, "BYPASS", 0, "", started);
        return resp;
    }

    const RouteConfig& route_config = *route->config;
    UpstreamRuntime& upstream = *route->upstream;
    const UpstreamConfig& upstream_config = *upstream.config;

    const bool cacheable = route->cache && request.method == "GET";
    const std::string key = cacheable ? cache_key(route_config.cache, request) : std::string();

    if (cacheable) {
        if (auto hit = route->cache->lookup_fresh(key, started)) {
            hit->set_header(kCacheStatusHeader, "HIT");
            report(request, route_config.prefix, hit->status, "HIT", 0, "", started);
            return *hit;
        }
    }
    const char* cache_status = cacheable ? "MISS" : "BYPASS";

    const HttpRequest outbound = build_upstream_request(request, route_config);

    const size_t budget = upstream_config.attempt_budget();
    std::vector<bool> tried(upstream_config.replicas.size(), false);
    std::optional<http::TransportStatus> last_failure;
    size_t attempts = 0;

    while (attempts < budget) {
        std::optional<size_t> picked = select(upstream, tried);
        if (!picked) {
            break;
        }
        const size_t idx = *picked;
        const ReplicaConfig& replica = upstream_config.replicas[idx];
        tried[idx] = true;
        attempts++;

        HttpRequest attempt = outbound;
        attempt.set_header("Host", replica.host + ":" + std::to_string(replica.port));

        http::TransportResult result =
            transport_.exchange({replica.host, replica.port}, attempt, upstream_config.timeouts);
        const Clock::time_point finished = clock_();

        if (!result.ok()) {
            last_failure = result.status;
            upstream.health->record_failure(idx, finished);
            Logger::log(LogLevel::WARN, "Proxy: Attempt " + std::to_string(attempts) + " to '" +
                                            replica.name + "' failed (" +
                                            http::to_string(result.status) + "): " + result.detail);
            continue;
        }

        HttpResponse resp = std::move(result.response);
        if (resp.status >= 500 && upstream_config.count_5xx_as_failure) {
            upstream.health->record_failure(idx, finished);
        } else {
            upstream.health->record_success(idx, finished);
        }

        strip_hop_by_hop(resp.headers);
        resp.remove_header(kCacheStatusHeader);

        if (cacheable && resp.status == 200) {
            route->cache->store(key, resp, route_config.cache.valid, route_config.cache.stale,
                                finished);
        }

        resp.set_header(kCacheStatusHeader, cache_status);
        report(request, route_config.prefix, resp.status, cache_status, attempts, replica.name,
               started);
        return resp;
    }

    if (cacheable && route_config.cache.use_stale) {
        if (auto stale = route->cache->lookup_stale(key, clock_())) {
            stale->set_header(kCacheStatusHeader, "STALE");
            report(request, route_config.prefix, stale->status, "STALE", attempts, "", started);
            return *stale;
        }
    }

    HttpResponse failure;
    if (attempts == 0) {
        failure = HttpResponse::error(
            502, request.path, "no available replica in upstream '" + upstream_config.name + "'");
    } else if (last_failure && http::is_timeout(*last_failure)) {
        failure = HttpResponse::error(504, request.path,
                                      "upstream timed out after " + std::to_string(attempts) +
                                          " attempt(s)");
    } else {
        failure = HttpResponse::error(
            502, request.path,
            "upstream failed after " + std::to_string(attempts) + " attempt(s): " +
                (last_failure ? http::to_string(*last_failure) : "unknown"));
    }
    failure.set_header(kCacheStatusHeader, cache_status);
    report(request, route_config.prefix, failure.status, cache_status, attempts, "", started);
    return failure;
}

const Proxy::RouteRuntime* Proxy::match(const std::string& path) const
{
    for (const auto& route : routes_) {
        if (String::starts_with(path, route.config->prefix)) {
            return &route;
        }
    }
    return nullptr;
}

std::optional<size_t> Proxy::select(UpstreamRuntime& upstream, const std::vector<bool>& tried)
{
    const size_t n = upstream.config->replicas.size();
    const size_t start = upstream.cursor.fetch_add(1, std::memory_order_relaxed) % n;
    const Clock::time_point now = clock_();

    for (size_t i = 0; i < n; ++i) {
        const size_t idx = (start + i) % n;
        if (tried[idx]) {
            continue;
        }
        if (upstream.health->is_available(idx, now)) {
            return idx;
        }
    }
    return std::nullopt;
}

HttpRequest Proxy::build_upstream_request(const HttpRequest& request,
                                          const RouteConfig& route) const
{
    HttpRequest out = request;
    out.version = "HTTP/1.1";
    out.params.clear();

    if (route.rewrite) {
        std::string path = *route.rewrite + request.path.substr(route.prefix.size());
        out.set_target(request.query.empty() ? path : path + "?" + request.query);
    }

    strip_hop_by_hop(out.headers);

    if (!request.remote_addr.empty()) {
        auto forwarded = request.header("X-Forwarded-For");
        out.set_header("X-Forwarded-For",
                       forwarded ? *forwarded + ", " + request.remote_addr : request.remote_addr);
    }
    out.set_header("Connection", "close");
    return out;
}

void Proxy::report(const HttpRequest& request, const std::string& route, int status,
                   const std::string& cache, size_t attempts, const std::string& replica,
                   Clock::time_point started)
{
    const LogLevel level = status >= 500 ? LogLevel::WARN : LogLevel::INFO;
    events_.emit(level, "gateway.request",
                 {{"method", request.method},
                  {"path", request.path},
                  {"route", route},
                  {"status", std::to_string(status)},
                  {"cache", cache},
                  {"attempts", std::to_string(attempts)},
                  {"replica", replica},
                  {"duration_ms", std::to_string(elapsed_ms(started, clock_()))}});
}

// ============================================================================
// Introspection
// ============================================================================

std::string Proxy::status_json() const
{
    const Clock::time_point now = clock_();

    cJSON* root = cJSON_CreateObject();
    cJSON* groups = cJSON_AddObjectToObject(root, "upstreams");

    for (const auto& [name, upstream] : upstreams_) {
        cJSON* list = cJSON_AddArrayToObject(groups, name.c_str());
        for (size_t i = 0; i < upstream->health->size(); ++i) {
            ReplicaHealth health = upstream->health->snapshot(i, now);
            const ReplicaConfig& replica = upstream->config->replicas[i];

            cJSON* item = cJSON_CreateObject();
            cJSON_AddStringToObject(item, "name", health.name.c_str());
            cJSON_AddStringToObject(item, "host", replica.host.c_str());
            cJSON_AddNumberToObject(item, "port", replica.port);
            cJSON_AddStringToObject(item, "state", to_string(health.state));
            cJSON_AddNumberToObject(item, "consecutiveFailures", health.consecutive_failures);
            cJSON_AddNumberToObject(item, "totalFailures",
                                    static_cast<double>(health.total_failures));
            cJSON_AddNumberToObject(item, "totalSuccesses",
                                    static_cast<double>(health.total_successes));
            cJSON_AddNumberToObject(item, "cooldownRemainingMs",
                                    static_cast<double>(health.cooldown_remaining.count()));
            cJSON_AddItemToArray(list, item);
        }
    }

    char* raw = cJSON_PrintUnformatted(root);
    std::string body = raw ? raw : "{}";
    free(raw);
    cJSON_Delete(root);
    return body;
}

ReplicaHealth Proxy::replica_health(const std::string& upstream, size_t replica) const
{
    const auto& runtime = upstreams_.at(upstream);
    if (replica >= runtime->health->size()) {
        throw std::out_of_range("replica index out of range");
    }
    return runtime->health->snapshot(replica, clock_());
}

} // namespace uuidmesh::gateway
