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
 * @file uuid_service.cpp
 * @brief Implementation of the UUID endpoints.
 *
 * @details
 * Every generation endpoint follows the same pipeline:
 * 1. **Generate**: Draw a fresh Version 4 UUID.
 * 2. **Compose**: Optionally embed the caller's correlation token.
 * 3. **Respond**: Serialize the payload together with the instance identity.
 * 4. **Report**: Emit a `uuid.generated` event.
 */

#include "uuidmesh/service/uuid_service.hpp"

#include "uuidmesh/infra/id_generator.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <thread>

namespace uuidmesh::service {

using http::HttpRequest;
using http::HttpResponse;
using infra::LogLevel;

UuidService::UuidService(ServiceConfig config, infra::EventSink& events)
    : config_(std::move(config)), events_(events)
{
}

void UuidService::register_routes(http::Router& router) const
{
    const std::string prefix = kApiPrefix;

    router.add("GET", prefix + "/get", [this](const HttpRequest& r) { return get_uuid(r); });
    router.add("GET", prefix + "/get-id",
               [this](const HttpRequest& r) { return get_uuid_with_query_id(r); });
    router.add("GET", prefix + "/path/get/{id}",
               [this](const HttpRequest& r) { return get_uuid_with_path_id(r); });
    router.add("GET", prefix + "/get-slow",
               [this](const HttpRequest& r) { return get_uuid_slow(r); });
    if (config_.error_endpoint) {
        router.add("GET", prefix + "/get/error",
                   [this](const HttpRequest& r) { return get_error(r); });
    }
    router.add("GET", "/actuator/health", [this](const HttpRequest& r) { return health(r); });
}

HttpResponse UuidService::get_uuid(const HttpRequest& request) const
{
    std::string uuid = infra::IdGenerator::generate();
    return respond(request, "uuid", uuid, uuid);
}

HttpResponse UuidService::get_uuid_with_query_id(const HttpRequest& request) const
{
    std::string uuid = infra::IdGenerator::generate();
    return respond(request, "message", compose_message(request.query_param("id"), uuid), uuid);
}

HttpResponse UuidService::get_uuid_with_path_id(const HttpRequest& request) const
{
    std::string uuid = infra::IdGenerator::generate();
    return respond(request, "message", compose_message(request.path_param("id"), uuid), uuid);
}

HttpResponse UuidService::get_uuid_slow(const HttpRequest& request) const
{
    // Pins this worker only; other connections keep being served.
    std::this_thread::sleep_for(config_.slow_delay);
    std::string uuid = infra::IdGenerator::generate();
    return respond(request, "uuid", uuid, uuid);
}

HttpResponse UuidService::get_error(const HttpRequest& request) const
{
    events_.emit(LogLevel::WARN, "uuid.forced_error",
                 {{"endpoint", request.path}, {"instanceId", config_.instance_id}});

    HttpResponse resp;
    resp.status = 500;
    return resp;
}

HttpResponse UuidService::health(const HttpRequest&) const
{
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "status", "UP");
    cJSON_AddStringToObject(root, "instanceId", config_.instance_id.c_str());

    char* raw = cJSON_PrintUnformatted(root);
    std::string body = raw ? raw : "{}";
    free(raw);
    cJSON_Delete(root);

    return HttpResponse::json(200, std::move(body));
}

std::string UuidService::compose_message(const std::optional<std::string>& id,
                                         const std::string& uuid)
{
    return "id " + id.value_or("null") + " : uuid " + uuid;
}

HttpResponse UuidService::respond(const HttpRequest& request, const char* key,
                                  const std::string& value, const std::string& uuid) const
{
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, key, value.c_str());
    cJSON_AddStringToObject(root, "instanceId", config_.instance_id.c_str());

    char* raw = cJSON_PrintUnformatted(root);
    std::string body = raw ? raw : "{}";
    free(raw);
    cJSON_Delete(root);

    events_.emit(LogLevel::INFO, "uuid.generated",
                 {{"endpoint", request.path}, {"uuid", uuid}, {"instanceId", config_.instance_id}});

    return HttpResponse::json(200, std::move(body));
}

} // namespace uuidmesh::service
