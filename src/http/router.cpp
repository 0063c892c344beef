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
 * @file router.cpp
 * @brief Template matching and dispatch for registered endpoints.
 */

#include "uuidmesh/http/router.hpp"

#include "uuidmesh/infra/string.hpp"

#include <stdexcept>

namespace uuidmesh::http {

using infra::String;

namespace {

bool is_placeholder(const std::string& segment)
{
    return segment.size() > 2 && segment.front() == '{' && segment.back() == '}';
}

} // namespace

void Router::add(const std::string& method, const std::string& pattern, RequestHandler handler)
{
    if (pattern.empty() || pattern[0] != '/') {
        throw std::invalid_argument("Route pattern must start with '/': " + pattern);
    }
    routes_.push_back(Route{method, pattern, String::split(pattern, '/'), std::move(handler)});
}

Router::MatchResult Router::match(const Route& route, const std::vector<std::string>& segments,
                                  std::unordered_map<std::string, std::string>& params)
{
    if (route.segments.size() != segments.size()) {
        return MatchResult::kNoMatch;
    }

    std::unordered_map<std::string, std::string> bound;
    for (size_t i = 0; i < segments.size(); ++i) {
        const std::string& expected = route.segments[i];
        if (!is_placeholder(expected)) {
            if (expected != segments[i]) {
                return MatchResult::kNoMatch;
            }
            continue;
        }
        if (segments[i].empty()) {
            return MatchResult::kNoMatch;
        }
        auto decoded = String::url_decode(segments[i], false);
        if (!decoded) {
            return MatchResult::kBadEncoding;
        }
        bound[expected.substr(1, expected.size() - 2)] = *decoded;
    }

    params = std::move(bound);
    return MatchResult::kMatch;
}

HttpResponse Router::dispatch(HttpRequest& request) const
{
    const auto segments = String::split(request.path, '/');
    std::string allowed;

    for (const Route& route : routes_) {
        std::unordered_map<std::string, std::string> params;
        MatchResult result = match(route, segments, params);
        if (result == MatchResult::kNoMatch) {
            continue;
        }
        if (result == MatchResult::kBadEncoding) {
            return HttpResponse::error(400, request.path, "Malformed percent-encoding in path");
        }
        if (route.method != request.method) {
            if (allowed.find(route.method) == std::string::npos) {
                allowed += allowed.empty() ? route.method : ", " + route.method;
            }
            continue;
        }
        request.params = std::move(params);
        return route.handler(request);
    }

    if (!allowed.empty()) {
        HttpResponse resp = HttpResponse::error(405, request.path);
        resp.set_header("Allow", allowed);
        return resp;
    }
    return HttpResponse::error(404, request.path);
}

} // namespace uuidmesh::http
