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
 * @file router.hpp
 * @brief Explicit route-to-handler registration for HTTP endpoints.
 *
 * @details
 * Endpoints are registered one by one with a method and a path template.
 * Templates are split on `/`; a segment written as `{name}` binds the
 * corresponding (percent-decoded, non-empty) request segment to `name`.
 */

#pragma once

#include "uuidmesh/http/message.hpp"

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace uuidmesh::http {

/// @brief Signature shared by every endpoint and by the gateway's catch-all.
using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @class Router
 * @brief Dispatches requests to the handler registered for their method and path.
 *
 * Routes are evaluated in registration order. Registration happens once at
 * startup; `dispatch` is then safe to call from any number of workers.
 */
class Router {
  public:
    /**
     * @brief Registers a handler.
     *
     * @param method HTTP method, e.g. `"GET"`.
     * @param pattern Path template such as `/api/v1/uuid/path/get/{id}`.
     * @param handler Callable invoked with the request (path params filled in).
     * @throws std::invalid_argument If `pattern` does not start with `/`.
     */
    void add(const std::string& method, const std::string& pattern, RequestHandler handler);

    /**
     * @brief Resolves and invokes the handler for `request`.
     *
     * @return The handler's response; `404` when no template matches the path;
     * `405` with an `Allow` header when templates match but none for this method;
     * `400` when a bound path segment is not valid percent-encoding.
     */
    HttpResponse dispatch(HttpRequest& request) const;

    /// @brief Number of registered routes.
    size_t size() const { return routes_.size(); }

  private:
    struct Route {
        std::string method;
        std::string pattern;
        std::vector<std::string> segments;
        RequestHandler handler;
    };

    enum class MatchResult { kNoMatch, kMatch, kBadEncoding };

    static MatchResult match(const Route& route, const std::vector<std::string>& segments,
                             std::unordered_map<std::string, std::string>& params);

    std::vector<Route> routes_;
};

} // namespace uuidmesh::http
