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
 * @file config.cpp
 * @brief JSON decoding and validation of the gateway configuration.
 *
 * @details
 * Decoding is strict about types (a port given as a string is an error) but
 * lenient about absence: every optional field falls back to the defaults
 * declared in `config.hpp`.
 */

#include "uuidmesh/gateway/config.hpp"

#include "uuidmesh/infra/string.hpp"

#include <algorithm>
#include <cJSON.h>
#include <cmath>
#include <fstream>
#include <limits>
#include <memory>
#include <set>
#include <sstream>

namespace uuidmesh::gateway {

using infra::String;

namespace {

using JsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;

const cJSON* field(const cJSON* obj, const char* key)
{
    return cJSON_GetObjectItemCaseSensitive(obj, key);
}

/// @brief Largest magnitude a double holds without losing integer precision (2^53).
constexpr long long kMaxExactInt = 9007199254740992LL;

/**
 * @brief Reads an integral number, rejecting values outside [lo, hi].
 *
 * The range check runs on the double, before any conversion.
 */
long long read_int(const cJSON* obj, const char* key, long long fallback, const std::string& where,
                   long long lo = -kMaxExactInt, long long hi = kMaxExactInt)
{
    const cJSON* item = field(obj, key);
    if (item == nullptr) {
        return fallback;
    }
    if (!cJSON_IsNumber(item) || std::floor(item->valuedouble) != item->valuedouble) {
        throw ConfigError(where + "." + key + " must be an integer");
    }
    if (item->valuedouble < static_cast<double>(lo) ||
        item->valuedouble > static_cast<double>(hi)) {
        throw ConfigError(where + "." + key + " must be in [" + std::to_string(lo) + ", " +
                          std::to_string(hi) + "]");
    }
    return static_cast<long long>(item->valuedouble);
}

/// @brief `read_int` for fields stored as `int`.
int read_int32(const cJSON* obj, const char* key, int fallback, const std::string& where)
{
    return static_cast<int>(read_int(obj, key, fallback, where, std::numeric_limits<int>::min(),
                                     std::numeric_limits<int>::max()));
}

std::chrono::milliseconds read_ms(const cJSON* obj, const char* key,
                                  std::chrono::milliseconds fallback, const std::string& where)
{
    return std::chrono::milliseconds(read_int(obj, key, fallback.count(), where));
}

bool read_bool(const cJSON* obj, const char* key, bool fallback, const std::string& where)
{
    const cJSON* item = field(obj, key);
    if (item == nullptr) {
        return fallback;
    }
    if (!cJSON_IsBool(item)) {
        throw ConfigError(where + "." + key + " must be a boolean");
    }
    return cJSON_IsTrue(item);
}

std::optional<std::string> read_string(const cJSON* obj, const char* key, const std::string& where)
{
    const cJSON* item = field(obj, key);
    if (item == nullptr) {
        return std::nullopt;
    }
    if (!cJSON_IsString(item) || item->valuestring == nullptr) {
        throw ConfigError(where + "." + key + " must be a string");
    }
    return std::string(item->valuestring);
}

CacheKeyComponent parse_key_part(const std::string& raw, const std::string& where)
{
    CacheKeyComponent part;
    if (raw == "method") {
        part.part = CacheKeyPart::kMethod;
    } else if (raw == "path") {
        part.part = CacheKeyPart::kPath;
    } else if (raw == "query") {
        part.part = CacheKeyPart::kQuery;
    } else if (String::starts_with(raw, "header:") && raw.size() > 7) {
        part.part = CacheKeyPart::kHeader;
        part.header = raw.substr(7);
    } else {
        throw ConfigError(where + ".key: unknown key part '" + raw +
                          "' (expected method, path, query or header:<Name>)");
    }
    return part;
}

CachePolicy parse_cache(const cJSON* obj, const std::string& where)
{
    CachePolicy cache;
    if (obj == nullptr) {
        return cache;
    }
    if (!cJSON_IsObject(obj)) {
        throw ConfigError(where + " must be an object");
    }
    cache.enabled = read_bool(obj, "enabled", true, where);
    cache.valid = read_ms(obj, "valid_ms", std::chrono::milliseconds(0), where);
    cache.use_stale = read_bool(obj, "use_stale", false, where);
    cache.stale = read_ms(obj, "stale_ms", std::chrono::milliseconds(0), where);
    long long max_entries =
        read_int(obj, "max_entries", static_cast<long long>(cache.max_entries), where);
    if (max_entries < 1) {
        throw ConfigError(where + ".max_entries must be positive");
    }
    cache.max_entries = static_cast<size_t>(max_entries);

    const cJSON* key = field(obj, "key");
    if (key == nullptr) {
        cache.key = {{CacheKeyPart::kMethod, ""}, {CacheKeyPart::kPath, ""},
                     {CacheKeyPart::kQuery, ""}};
    } else {
        if (!cJSON_IsArray(key)) {
            throw ConfigError(where + ".key must be an array of strings");
        }
        const cJSON* item = nullptr;
        cJSON_ArrayForEach(item, key)
        {
            if (!cJSON_IsString(item) || item->valuestring == nullptr) {
                throw ConfigError(where + ".key must be an array of strings");
            }
            cache.key.push_back(parse_key_part(item->valuestring, where));
        }
    }
    return cache;
}

UpstreamConfig parse_upstream(const std::string& name, const cJSON* obj)
{
    const std::string where = "upstreams." + name;
    if (!cJSON_IsObject(obj)) {
        throw ConfigError(where + " must be an object");
    }

    UpstreamConfig up;
    up.name = name;

    const cJSON* replicas = field(obj, "replicas");
    if (replicas != nullptr) {
        if (!cJSON_IsArray(replicas)) {
            throw ConfigError(where + ".replicas must be an array");
        }
        int index = 0;
        const cJSON* item = nullptr;
        cJSON_ArrayForEach(item, replicas)
        {
            const std::string rwhere = where + ".replicas[" + std::to_string(index) + "]";
            if (!cJSON_IsObject(item)) {
                throw ConfigError(rwhere + " must be an object");
            }
            ReplicaConfig replica;
            auto host = read_string(item, "host", rwhere);
            if (!host || host->empty()) {
                throw ConfigError(rwhere + ".host is required");
            }
            replica.host = *host;
            replica.port = read_int32(item, "port", 0, rwhere);
            replica.name = read_string(item, "name", rwhere)
                               .value_or(replica.host + ":" + std::to_string(replica.port));
            up.replicas.push_back(std::move(replica));
            ++index;
        }
    }

    up.health.max_fails = read_int32(obj, "max_fails", up.health.max_fails, where);
    up.health.fail_window = read_ms(obj, "fail_window_ms", up.health.fail_window, where);
    up.health.cooldown = read_ms(obj, "cooldown_ms", up.health.cooldown, where);
    up.timeouts.connect = read_ms(obj, "connect_timeout_ms", up.timeouts.connect, where);
    up.timeouts.send = read_ms(obj, "send_timeout_ms", up.timeouts.send, where);
    up.timeouts.read = read_ms(obj, "read_timeout_ms", up.timeouts.read, where);
    up.max_attempts = read_int32(obj, "max_attempts", 0, where);
    up.count_5xx_as_failure = read_bool(obj, "count_5xx_as_failure", true, where);
    return up;
}

RouteConfig parse_route(const cJSON* obj, int index)
{
    const std::string where = "routes[" + std::to_string(index) + "]";
    if (!cJSON_IsObject(obj)) {
        throw ConfigError(where + " must be an object");
    }

    RouteConfig route;
    route.prefix = read_string(obj, "prefix", where).value_or("");
    route.upstream = read_string(obj, "upstream", where).value_or("");
    route.rewrite = read_string(obj, "rewrite", where);
    route.cache = parse_cache(field(obj, "cache"), where + ".cache");
    return route;
}

} // namespace

size_t UpstreamConfig::attempt_budget() const
{
    if (max_attempts <= 0) {
        return replicas.size();
    }
    return std::min(static_cast<size_t>(max_attempts), replicas.size());
}

GatewayConfig GatewayConfig::parse(const std::string& json)
{
    JsonPtr root(cJSON_Parse(json.c_str()), cJSON_Delete);
    if (!root) {
        const char* err = cJSON_GetErrorPtr();
        std::string near = err ? std::string(err).substr(0, 32) : "";
        throw ConfigError("Invalid JSON syntax near: '" + near + "'");
    }
    if (!cJSON_IsObject(root.get())) {
        throw ConfigError("Configuration root must be an object");
    }

    GatewayConfig cfg;
    const cJSON* doc = root.get();

    cfg.listen_port = read_int32(doc, "listen_port", cfg.listen_port, "root");
    long long workers =
        read_int(doc, "workers", static_cast<long long>(cfg.workers), "root", 1, 4096);
    cfg.workers = static_cast<size_t>(workers);
    cfg.status_path = read_string(doc, "status_path", "root").value_or("");

    if (auto level = read_string(doc, "log_level", "root")) {
        auto parsed = infra::Logger::parse_level(*level);
        if (!parsed) {
            throw ConfigError("root.log_level '" + *level + "' is not a known level");
        }
        cfg.log_level = *parsed;
    }

    const cJSON* upstreams = field(doc, "upstreams");
    if (upstreams != nullptr) {
        if (!cJSON_IsObject(upstreams)) {
            throw ConfigError("root.upstreams must be an object");
        }
        const cJSON* item = nullptr;
        cJSON_ArrayForEach(item, upstreams)
        {
            std::string name = item->string ? item->string : "";
            cfg.upstreams[name] = parse_upstream(name, item);
        }
    }

    const cJSON* routes = field(doc, "routes");
    if (routes != nullptr) {
        if (!cJSON_IsArray(routes)) {
            throw ConfigError("root.routes must be an array");
        }
        int index = 0;
        const cJSON* item = nullptr;
        cJSON_ArrayForEach(item, routes)
        {
            cfg.routes.push_back(parse_route(item, index++));
        }
    }

    cfg.validate();
    return cfg;
}

GatewayConfig GatewayConfig::load(const std::string& path)
{
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open configuration file '" + path + "'");
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parse(ss.str());
}

void GatewayConfig::validate() const
{
    if (listen_port < 0 || listen_port > 65535) {
        throw ConfigError("listen_port must be in [0, 65535]");
    }
    if (workers == 0) {
        throw ConfigError("workers must be positive");
    }
    if (!status_path.empty() && status_path[0] != '/') {
        throw ConfigError("status_path must start with '/'");
    }

    for (const auto& [name, up] : upstreams) {
        const std::string where = "upstreams." + name;
        if (name.empty()) {
            throw ConfigError("Upstream names must not be empty");
        }
        if (up.replicas.empty()) {
            throw ConfigError(where + " has no replicas");
        }
        std::set<std::string> names;
        for (const auto& replica : up.replicas) {
            if (replica.port < 1 || replica.port > 65535) {
                throw ConfigError(where + ": replica '" + replica.name +
                                  "' has a port outside [1, 65535]");
            }
            if (!names.insert(replica.name).second) {
                throw ConfigError(where + ": duplicate replica name '" + replica.name + "'");
            }
        }
        if (up.health.max_fails < 1) {
            throw ConfigError(where + ".max_fails must be at least 1");
        }
        if (up.health.fail_window.count() <= 0 || up.health.cooldown.count() <= 0) {
            throw ConfigError(where + ": fail_window_ms and cooldown_ms must be positive");
        }
        if (up.timeouts.connect.count() <= 0 || up.timeouts.send.count() <= 0 ||
            up.timeouts.read.count() <= 0) {
            throw ConfigError(where + ": timeouts must be positive");
        }
        if (up.max_attempts < 0) {
            throw ConfigError(where + ".max_attempts must not be negative");
        }
    }

    if (routes.empty()) {
        throw ConfigError("At least one route is required");
    }

    std::set<std::string> prefixes;
    for (size_t i = 0; i < routes.size(); ++i) {
        const RouteConfig& route = routes[i];
        const std::string where = "routes[" + std::to_string(i) + "]";

        if (route.prefix.empty() || route.prefix[0] != '/') {
            throw ConfigError(where + ".prefix must start with '/'");
        }
        if (!prefixes.insert(route.prefix).second) {
            throw ConfigError(where + ": duplicate prefix '" + route.prefix + "'");
        }
        if (upstreams.find(route.upstream) == upstreams.end()) {
            throw ConfigError(where + " references unknown upstream '" + route.upstream + "'");
        }
        if (route.rewrite) {
            if (route.rewrite->empty() || (*route.rewrite)[0] != '/') {
                throw ConfigError(where + ".rewrite must start with '/'");
            }
            bool prefix_slash = String::ends_with(route.prefix, "/");
            bool rewrite_slash = String::ends_with(*route.rewrite, "/");
            if (prefix_slash != rewrite_slash) {
                throw ConfigError(where + ": prefix '" + route.prefix + "' and rewrite '" +
                                  *route.rewrite + "' disagree on the trailing slash");
            }
        }
        if (route.prefix == status_path) {
            throw ConfigError(where + ".prefix collides with status_path");
        }

        const CachePolicy& cache = route.cache;
        if (cache.enabled) {
            if (cache.valid.count() <= 0) {
                throw ConfigError(where + ".cache.valid_ms must be positive");
            }
            if (cache.key.empty()) {
                throw ConfigError(where + ".cache.key must not be empty");
            }
            if (cache.stale.count() < 0) {
                throw ConfigError(where + ".cache.stale_ms must not be negative");
            }
            if (cache.use_stale && cache.stale.count() == 0) {
                throw ConfigError(where + ".cache.use_stale requires a positive stale_ms");
            }
            if (cache.max_entries == 0) {
                throw ConfigError(where + ".cache.max_entries must be positive");
            }
        }
    }
}

} // namespace uuidmesh::gateway
