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
 * @file uuid_service.hpp
 * @brief Request handlers of the UUID service.
 *
 * @details
 * This header declares `UuidService`, the application layer of a replica.
 * It owns the immutable `ServiceConfig`, produces the JSON documents returned
 * by each endpoint, and reports one structured event per request through the
 * injected `EventSink`.
 */

#pragma once

#include "uuidmesh/http/message.hpp"
#include "uuidmesh/http/router.hpp"
#include "uuidmesh/infra/logger.hpp"
#include "uuidmesh/service/config.hpp"

#include <optional>
#include <string>

namespace uuidmesh::service {

/// @brief Route prefix shared by every UUID endpoint.
constexpr const char* kApiPrefix = "/api/v1/uuid";

/**
 * @class UuidService
 * @brief Endpoint implementations for one replica.
 *
 * **Endpoints (all `GET`):**
 * - `/api/v1/uuid/get` -> `{"uuid", "instanceId"}`
 * - `/api/v1/uuid/get-id?id=` -> `{"message", "instanceId"}`
 * - `/api/v1/uuid/path/get/{id}` -> `{"message", "instanceId"}`
 * - `/api/v1/uuid/get-slow` -> `{"uuid", "instanceId"}` after `slow_delay`
 * - `/api/v1/uuid/get/error` -> `500`, empty body (when enabled)
 * - `/actuator/health` -> `{"status": "UP", "instanceId"}`
 *
 * Handlers share no mutable state, so they may run on any number of workers.
 */
class UuidService {
  public:
    /**
     * @param config Replica settings; copied and never modified.
     * @param events Sink for per-request events; must outlive the service.
     */
    UuidService(ServiceConfig config, infra::EventSink& events);

    /**
     * @brief Registers every endpoint on `router`.
     *
     * The router keeps references to this instance, which must outlive it.
     */
    void register_routes(http::Router& router) const;

    http::HttpResponse get_uuid(const http::HttpRequest& request) const;
    http::HttpResponse get_uuid_with_query_id(const http::HttpRequest& request) const;
    http::HttpResponse get_uuid_with_path_id(const http::HttpRequest& request) const;
    http::HttpResponse get_uuid_slow(const http::HttpRequest& request) const;
    http::HttpResponse get_error(const http::HttpRequest& request) const;
    http::HttpResponse health(const http::HttpRequest& request) const;

    /**
     * @brief Builds the correlated message `id <token> : uuid <uuid>`.
     *
     * An absent token is rendered as the literal `null`; an empty token stays empty.
     */
    static std::string compose_message(const std::optional<std::string>& id,
                                       const std::string& uuid);

    const ServiceConfig& config() const { return config_; }

  private:
    /// @brief Serializes `{"<key>": value, "instanceId": ...}` and emits the request event.
    http::HttpResponse respond(const http::HttpRequest& request, const char* key,
                               const std::string& value, const std::string& uuid) const;

    const ServiceConfig config_;
    infra::EventSink& events_;
};

} // namespace uuidmesh::service
