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
 * @file proxy_test.cpp
 * @brief Gateway pipeline tests against a scripted transport and a manual clock.
 *
 * @details
 * The `ScriptedTransport` answers per replica host, so each test decides which
 * replicas succeed, fail, time out or return 5xx. The clock only moves when a
 * test advances it, which makes cool-downs and cache windows exact.
 */

#include "framework.hpp"
#include "support.hpp"
#include "uuidmesh/gateway/proxy.hpp"

#include <cJSON.h>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

using uuidmesh::gateway::GatewayConfig;
using uuidmesh::gateway::Proxy;
using uuidmesh::gateway::ReplicaState;
using uuidmesh::gateway::RouteConfig;
using uuidmesh::gateway::UpstreamConfig;
using uuidmesh::http::Endpoint;
using uuidmesh::http::HttpRequest;
using uuidmesh::http::HttpResponse;
using uuidmesh::http::Timeouts;
using uuidmesh::http::TransportResult;
using uuidmesh::http::TransportStatus;
using uuidmesh::test::json_string;
using uuidmesh::test::RecordingSink;
using namespace std::chrono_literals;

namespace {

/**
 * @class ScriptedTransport
 * @brief Transport whose outcome is chosen per host by the test.
 */
class ScriptedTransport : public uuidmesh::http::Transport {
  public:
    using Script = std::function<TransportResult(const Endpoint&, const HttpRequest&)>;

    ScriptedTransport()
    {
        script = [this](const Endpoint& ep, const HttpRequest&) { return ok(ep); };
    }

    TransportResult exchange(const Endpoint& endpoint, const HttpRequest& request,
                             const Timeouts&) override
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hosts.push_back(endpoint.host);
            last_request = request;
        }
        return script(endpoint, request);
    }

    /// @brief A 200 whose body is unique per call.
    TransportResult ok(const Endpoint& endpoint)
    {
        TransportResult result;
        result.response = HttpResponse::json(
            200, "{\"host\":\"" + endpoint.host + "\",\"n\":" + std::to_string(++served_) + "}");
        return result;
    }

    static TransportResult fail(TransportStatus status)
    {
        TransportResult result;
        result.status = status;
        result.detail = "scripted";
        return result;
    }

    size_t calls_to(const std::string& host) const
    {
        size_t n = 0;
        for (const auto& h : hosts) {
            n += (h == host) ? 1 : 0;
        }
        return n;
    }

    Script script;
    std::vector<std::string> hosts;
    HttpRequest last_request;

  private:
    std::mutex mutex_;
    int served_ = 0;
};

struct ManualClock {
    Proxy::Clock::time_point now = Proxy::Clock::time_point{} + 1000s;

    Proxy::ClockFn fn()
    {
        return [this] { return now; };
    }
};

GatewayConfig make_config(size_t replicas, int max_fails = 2)
{
    GatewayConfig cfg;
    cfg.status_path = "/gateway/status";

    UpstreamConfig up;
    up.name = "svc";
    for (size_t i = 1; i <= replicas; ++i) {
        std::string host = "r" + std::to_string(i);
        up.replicas.push_back({host, host, 8080});
    }
    up.health.max_fails = max_fails;
    up.health.fail_window = 10s;
    up.health.cooldown = 10s;
    cfg.upstreams["svc"] = up;

    RouteConfig route;
    route.prefix = "/api/v1/uuid/";
    route.upstream = "svc";
    cfg.routes.push_back(route);
    return cfg;
}

void enable_cache(GatewayConfig& cfg, bool use_stale)
{
    auto& cache = cfg.routes[0].cache;
    cache.enabled = true;
    cache.valid = 5s;
    cache.key = {{uuidmesh::gateway::CacheKeyPart::kMethod, ""},
                 {uuidmesh::gateway::CacheKeyPart::kPath, ""},
                 {uuidmesh::gateway::CacheKeyPart::kQuery, ""}};
    cache.use_stale = use_stale;
    cache.stale = use_stale ? 60s : 0s;
}

HttpRequest get(const std::string& target)
{
    HttpRequest req;
    req.set_target(target);
    req.remote_addr = "10.0.0.1";
    return req;
}

std::string cache_status(const HttpResponse& resp)
{
    return resp.header(uuidmesh::gateway::kCacheStatusHeader).value_or("");
}

} // namespace

// ============================================================================
// Balancing & Failover
// ============================================================================

void test_proxy_round_robin()
{
    ScriptedTransport transport;
    RecordingSink sink;
    ManualClock clock;
    Proxy proxy(make_config(3), transport, sink, clock.fn());

    for (int i = 0; i < 6; ++i) {
        HttpResponse resp = proxy.handle(get("/api/v1/uuid/get"));
        ASSERT_EQ(resp.status, 200);
        ASSERT_EQ(cache_status(resp), std::string("BYPASS"));
    }
    const std::vector<std::string> expected = {"r1", "r2", "r3", "r1", "r2", "r3"};
    ASSERT_TRUE(transport.hosts == expected);
}

void test_proxy_fails_over_to_next_replica()
{
    ScriptedTransport transport;
    transport.script = [&transport](const Endpoint& ep, const HttpRequest&) {
        return ep.host == "r1" ? ScriptedTransport::fail(TransportStatus::kConnectFailed)
                               : transport.ok(ep);
    };
    RecordingSink sink;
    ManualClock clock;
    Proxy proxy(make_config(3), transport, sink, clock.fn());

    HttpResponse resp = proxy.handle(get("/api/v1/uuid/get"));
    ASSERT_EQ(resp.status, 200);
    ASSERT_EQ(json_string(resp.body, "host").value_or(""), std::string("r2"));
    ASSERT_EQ(proxy.replica_health("svc", 0).total_failures, static_cast<uint64_t>(1));

    auto records = sink.records();
    ASSERT_EQ(records.back().field("attempts"), std::string("2"));
    ASSERT_EQ(records.back().field("replica"), std::string("r2"));
}

/**
 * @brief A replica is skipped for the whole cool-down and probed afterwards.
 */
void test_proxy_excludes_until_cooldown_then_probes()
{
    ScriptedTransport transport;
    bool r2_down = true;
    transport.script = [&](const Endpoint& ep, const HttpRequest&) {
        if (ep.host == "r2" && r2_down) {
            return ScriptedTransport::fail(TransportStatus::kConnectFailed);
        }
        return transport.ok(ep);
    };
    RecordingSink sink;
    ManualClock clock;
    Proxy proxy(make_config(2, 2), transport, sink, clock.fn());

    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(proxy.handle(get("/api/v1/uuid/get")).status, 200);
    }
    ASSERT_EQ(transport.calls_to("r2"), static_cast<size_t>(2));
    ASSERT_TRUE(proxy.replica_health("svc", 1).state == ReplicaState::kUnavailable);

    clock.now += 9s;
    for (int i = 0; i < 10; ++i) {
        ASSERT_EQ(proxy.handle(get("/api/v1/uuid/get")).status, 200);
    }
    ASSERT_EQ(transport.calls_to("r2"), static_cast<size_t>(2));

    clock.now += 1s;
    r2_down = false;
    ASSERT_TRUE(proxy.replica_health("svc", 1).state == ReplicaState::kProbing);
    for (int i = 0; i < 2; ++i) {
        ASSERT_EQ(proxy.handle(get("/api/v1/uuid/get")).status, 200);
    }
    ASSERT_EQ(transport.calls_to("r2"), static_cast<size_t>(3));
    ASSERT_TRUE(proxy.replica_health("svc", 1).state == ReplicaState::kHealthy);
}

void test_proxy_counts_5xx_as_failure()
{
    ScriptedTransport transport;
    transport.script = [](const Endpoint&, const HttpRequest&) {
        TransportResult result;
        result.response.status = 500;
        return result;
    };
    RecordingSink sink;
    ManualClock clock;
    Proxy proxy(make_config(1, 2), transport, sink, clock.fn());

    ASSERT_EQ(proxy.handle(get("/api/v1/uuid/get/error")).status, 500);
    HttpResponse second = proxy.handle(get("/api/v1/uuid/get/error"));
    ASSERT_EQ(second.status, 500);
    ASSERT_TRUE(second.body.empty());
    ASSERT_EQ(transport.hosts.size(), static_cast<size_t>(2));

    // Evicted: the gateway answers without contacting the replica.
    HttpResponse third = proxy.handle(get("/api/v1/uuid/get/error"));
    ASSERT_EQ(third.status, 502);
    ASSERT_EQ(transport.hosts.size(), static_cast<size_t>(2));
}

void test_proxy_5xx_ignored_when_disabled()
{
    ScriptedTransport transport;
    transport.script = [](const Endpoint&, const HttpRequest&) {
        TransportResult result;
        result.response.status = 503;
        return result;
    };
    RecordingSink sink;
    ManualClock clock;
    GatewayConfig cfg = make_config(1, 1);
    cfg.upstreams["svc"].count_5xx_as_failure = false;
    Proxy proxy(cfg, transport, sink, clock.fn());

    for (int i = 0; i < 3; ++i) {
        ASSERT_EQ(proxy.handle(get("/api/v1/uuid/get")).status, 503);
    }
    ASSERT_TRUE(proxy.replica_health("svc", 0).state == ReplicaState::kHealthy);
}

void test_proxy_502_on_connect_failures()
{
    ScriptedTransport transport;
    transport.script = [](const Endpoint&, const HttpRequest&) {
        return ScriptedTransport::fail(TransportStatus::kConnectFailed);
    };
    RecordingSink sink;
    ManualClock clock;
    Proxy proxy(make_config(3, 5), transport, sink, clock.fn());

    HttpResponse resp = proxy.handle(get("/api/v1/uuid/get"));
    ASSERT_EQ(resp.status, 502);
    ASSERT_EQ(transport.hosts.size(), static_cast<size_t>(3));
    ASSERT_EQ(json_string(resp.body, "error").value_or(""), std::string("Bad Gateway"));
}

void test_proxy_504_when_last_attempt_timed_out()
{
    ScriptedTransport transport;
    transport.script = [](const Endpoint& ep, const HttpRequest&) {
        return ScriptedTransport::fail(ep.host == "r1" ? TransportStatus::kConnectFailed
                                                       : TransportStatus::kReadTimeout);
    };
    RecordingSink sink;
    ManualClock clock;
    Proxy proxy(make_config(2, 5), transport, sink, clock.fn());

    HttpResponse resp = proxy.handle(get("/api/v1/uuid/get-slow"));
    ASSERT_EQ(resp.status, 504);
    ASSERT_EQ(json_string(resp.body, "error").value_or(""), std::string("Gateway Timeout"));
}

void test_proxy_respects_max_attempts()
{
    ScriptedTransport transport;
    transport.script = [](const Endpoint&, const HttpRequest&) {
        return ScriptedTransport::fail(TransportStatus::kConnectTimeout);
    };
    RecordingSink sink;
    ManualClock clock;
    GatewayConfig cfg = make_config(3, 5);
    cfg.upstreams["svc"].max_attempts = 1;
    Proxy proxy(cfg, transport, sink, clock.fn());

    ASSERT_EQ(proxy.handle(get("/api/v1/uuid/get")).status, 504);
    ASSERT_EQ(transport.hosts.size(), static_cast<size_t>(1));
}

// ============================================================================
// Caching
// ============================================================================

/**
 * @brief Within the validity window the same key yields byte-identical bodies.
 */
void test_proxy_cache_hit_within_validity()
{
    ScriptedTransport transport;
    RecordingSink sink;
    ManualClock clock;
    GatewayConfig cfg = make_config(3);
    enable_cache(cfg, false);
    Proxy proxy(cfg, transport, sink, clock.fn());

    HttpResponse first = proxy.handle(get("/api/v1/uuid/get"));
    ASSERT_EQ(cache_status(first), std::string("MISS"));

    clock.now += 4s;
    HttpResponse second = proxy.handle(get("/api/v1/uuid/get"));
    ASSERT_EQ(cache_status(second), std::string("HIT"));
    ASSERT_EQ(second.body, first.body);
    ASSERT_EQ(transport.hosts.size(), static_cast<size_t>(1));

    // Another key is not served from the first entry.
    HttpResponse other = proxy.handle(get("/api/v1/uuid/get-id?id=1"));
    ASSERT_EQ(cache_status(other), std::string("MISS"));

    clock.now += 2s;
    HttpResponse third = proxy.handle(get("/api/v1/uuid/get"));
    ASSERT_EQ(cache_status(third), std::string("MISS"));
    ASSERT_NE(third.body, first.body);
}

void test_proxy_cache_skips_non_get_and_errors()
{
    ScriptedTransport transport;
    int calls = 0;
    transport.script = [&calls](const Endpoint&, const HttpRequest&) {
        TransportResult result;
        result.response.status = (++calls == 1) ? 404 : 200;
        return result;
    };
    RecordingSink sink;
    ManualClock clock;
    GatewayConfig cfg = make_config(1, 5);
    enable_cache(cfg, false);
    Proxy proxy(cfg, transport, sink, clock.fn());

    ASSERT_EQ(proxy.handle(get("/api/v1/uuid/get")).status, 404);
    ASSERT_EQ(cache_status(proxy.handle(get("/api/v1/uuid/get"))), std::string("MISS"));
    ASSERT_EQ(cache_status(proxy.handle(get("/api/v1/uuid/get"))), std::string("HIT"));

    HttpRequest post = get("/api/v1/uuid/get");
    post.method = "POST";
    ASSERT_EQ(cache_status(proxy.handle(post)), std::string("BYPASS"));
    ASSERT_EQ(calls, 3);
}

/**
 * @brief The bundled configuration caches `get-id` but lets `/get` fan out.
 */
void test_proxy_shipped_config_caches_only_get_id()
{
    ScriptedTransport transport;
    RecordingSink sink;
    ManualClock clock;
    GatewayConfig cfg = GatewayConfig::load(std::string(UUIDMESH_CONFIG_DIR) + "/gateway.json");
    Proxy proxy(cfg, transport, sink, clock.fn());

    std::set<std::string> bodies;
    for (int i = 0; i < 3; ++i) {
        HttpResponse resp = proxy.handle(get("/api/v1/uuid/get"));
        ASSERT_EQ(resp.status, 200);
        ASSERT_EQ(cache_status(resp), std::string("BYPASS"));
        bodies.insert(resp.body);
    }
    ASSERT_EQ(bodies.size(), static_cast<size_t>(3));
    const std::vector<std::string> expected = {"service1", "service2", "service3"};
    ASSERT_TRUE(transport.hosts == expected);

    HttpResponse first = proxy.handle(get("/api/v1/uuid/get-id?id=7"));
    ASSERT_EQ(cache_status(first), std::string("MISS"));
    HttpResponse second = proxy.handle(get("/api/v1/uuid/get-id?id=7"));
    ASSERT_EQ(cache_status(second), std::string("HIT"));
    ASSERT_EQ(second.body, first.body);
}

void test_proxy_serves_stale_when_upstream_fails()
{
    ScriptedTransport transport;
    bool down = false;
    transport.script = [&](const Endpoint& ep, const HttpRequest&) {
        return down ? ScriptedTransport::fail(TransportStatus::kConnectFailed) : transport.ok(ep);
    };
    RecordingSink sink;
    ManualClock clock;
    GatewayConfig cfg = make_config(3);
    enable_cache(cfg, true);
    Proxy proxy(cfg, transport, sink, clock.fn());

    HttpResponse fresh = proxy.handle(get("/api/v1/uuid/get"));
    ASSERT_EQ(fresh.status, 200);

    down = true;
    clock.now += 10s;
    HttpResponse stale = proxy.handle(get("/api/v1/uuid/get"));
    ASSERT_EQ(stale.status, 200);
    ASSERT_EQ(cache_status(stale), std::string("STALE"));
    ASSERT_EQ(stale.body, fresh.body);

    HttpResponse never_cached = proxy.handle(get("/api/v1/uuid/get-id?id=9"));
    ASSERT_EQ(never_cached.status, 502);
}

// ============================================================================
// Routing & Forwarding
// ============================================================================

void test_proxy_rewrites_and_forwards_headers()
{
    ScriptedTransport transport;
    RecordingSink sink;
    ManualClock clock;
    GatewayConfig cfg = make_config(1);
    cfg.routes[0].prefix = "/public/";
    cfg.routes[0].rewrite = std::string("/api/v1/uuid/");
    Proxy proxy(cfg, transport, sink, clock.fn());

    HttpRequest req = get("/public/get-id?id=7");
    req.set_header("Connection", "keep-alive, X-Hop");
    req.set_header("X-Hop", "1");
    req.set_header("Keep-Alive", "timeout=5");
    req.set_header("X-User", "alice");
    ASSERT_EQ(proxy.handle(req).status, 200);

    const HttpRequest& sent = transport.last_request;
    ASSERT_EQ(sent.target, std::string("/api/v1/uuid/get-id?id=7"));
    ASSERT_EQ(sent.header("Host").value_or(""), std::string("r1:8080"));
    ASSERT_EQ(sent.header("X-Forwarded-For").value_or(""), std::string("10.0.0.1"));
    ASSERT_EQ(sent.header("Connection").value_or(""), std::string("close"));
    ASSERT_EQ(sent.header("X-User").value_or(""), std::string("alice"));
    ASSERT_FALSE(sent.header("Keep-Alive").has_value());
    ASSERT_FALSE(sent.header("X-Hop").has_value());
}

void test_proxy_preserves_path_without_rewrite()
{
    ScriptedTransport transport;
    RecordingSink sink;
    ManualClock clock;
    Proxy proxy(make_config(1), transport, sink, clock.fn());

    HttpRequest req = get("/api/v1/uuid/path/get/42");
    req.set_header("X-Forwarded-For", "192.168.1.5");
    ASSERT_EQ(proxy.handle(req).status, 200);
    ASSERT_EQ(transport.last_request.target, std::string("/api/v1/uuid/path/get/42"));
    ASSERT_EQ(transport.last_request.header("X-Forwarded-For").value_or(""),
              std::string("192.168.1.5, 10.0.0.1"));
}

void test_proxy_longest_prefix_wins()
{
    ScriptedTransport transport;
    RecordingSink sink;
    ManualClock clock;
    GatewayConfig cfg = make_config(1);
    RouteConfig fallback;
    fallback.prefix = "/";
    fallback.upstream = "svc";
    fallback.rewrite = std::string("/fallback/");
    cfg.routes.insert(cfg.routes.begin(), fallback);
    Proxy proxy(cfg, transport, sink, clock.fn());

    proxy.handle(get("/api/v1/uuid/get"));
    ASSERT_EQ(transport.last_request.target, std::string("/api/v1/uuid/get"));
    proxy.handle(get("/x"));
    ASSERT_EQ(transport.last_request.target, std::string("/fallback/x"));
}

void test_proxy_unknown_route_is_404()
{
    ScriptedTransport transport;
    RecordingSink sink;
    ManualClock clock;
    Proxy proxy(make_config(1), transport, sink, clock.fn());

    HttpResponse resp = proxy.handle(get("/nothing/here"));
    ASSERT_EQ(resp.status, 404);
    ASSERT_TRUE(transport.hosts.empty());
}

void test_proxy_status_endpoint()
{
    ScriptedTransport transport;
    transport.script = [&transport](const Endpoint& ep, const HttpRequest&) {
        return ep.host == "r2" ? ScriptedTransport::fail(TransportStatus::kConnectFailed)
                               : transport.ok(ep);
    };
    RecordingSink sink;
    ManualClock clock;
    Proxy proxy(make_config(2, 1), transport, sink, clock.fn());

    proxy.handle(get("/api/v1/uuid/get"));
    proxy.handle(get("/api/v1/uuid/get"));

    HttpResponse resp = proxy.handle(get("/gateway/status"));
    ASSERT_EQ(resp.status, 200);

    cJSON* root = cJSON_Parse(resp.body.c_str());
    ASSERT_TRUE(root != nullptr);
    cJSON* list = cJSON_GetObjectItem(cJSON_GetObjectItem(root, "upstreams"), "svc");
    bool shape_ok = cJSON_IsArray(list) && cJSON_GetArraySize(list) == 2;
    std::string r2_state;
    if (shape_ok) {
        cJSON* state = cJSON_GetObjectItem(cJSON_GetArrayItem(list, 1), "state");
        r2_state = cJSON_IsString(state) ? state->valuestring : "";
    }
    cJSON_Delete(root);

    ASSERT_TRUE(shape_ok);
    ASSERT_EQ(r2_state, std::string("unavailable"));
}

void test_proxy_emits_request_events()
{
    ScriptedTransport transport;
    RecordingSink sink;
    ManualClock clock;
    Proxy proxy(make_config(1), transport, sink, clock.fn());

    proxy.handle(get("/api/v1/uuid/get"));
    auto records = sink.records();
    ASSERT_EQ(records.size(), static_cast<size_t>(1));
    ASSERT_EQ(records[0].event, std::string("gateway.request"));
    ASSERT_EQ(records[0].field("status"), std::string("200"));
    ASSERT_EQ(records[0].field("cache"), std::string("BYPASS"));
    ASSERT_EQ(records[0].field("route"), std::string("/api/v1/uuid/"));
}
