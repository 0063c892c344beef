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
 * @brief Environment parsing for `ServiceConfig`.
 */

#include "uuidmesh/service/config.hpp"

#include "uuidmesh/infra/string.hpp"

#include <cstdlib>
#include <stdexcept>

namespace uuidmesh::service {

using infra::String;

namespace {

long long require_uint(const std::string& name, const std::string& raw, long long max)
{
    auto value = String::parse_uint(String::trim(raw));
    if (!value || *value > max) {
        throw std::runtime_error("Config: " + name + " must be an integer in [0, " +
                                 std::to_string(max) + "], got '" + raw + "'");
    }
    return *value;
}

bool require_bool(const std::string& name, const std::string& raw)
{
    const std::string v = String::to_lower(String::trim(raw));
    if (v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    throw std::runtime_error("Config: " + name + " must be a boolean, got '" + raw + "'");
}

} // namespace

ServiceConfig ServiceConfig::from_env(const EnvLookup& lookup)
{
    ServiceConfig cfg;

    if (auto id = lookup("INSTANCE_ID")) {
        cfg.instance_id = *id;
    }
    if (auto port = lookup("PORT")) {
        cfg.port = static_cast<int>(require_uint("PORT", *port, 65535));
    }
    if (auto delay = lookup("UUID_SLOW_DELAY_MS")) {
        cfg.slow_delay = std::chrono::milliseconds(
            require_uint("UUID_SLOW_DELAY_MS", *delay, 24LL * 60 * 60 * 1000));
    }
    if (auto flag = lookup("UUID_ERROR_ENDPOINT")) {
        cfg.error_endpoint = require_bool("UUID_ERROR_ENDPOINT", *flag);
    }
    if (auto workers = lookup("UUID_WORKERS")) {
        cfg.workers = static_cast<size_t>(require_uint("UUID_WORKERS", *workers, 4096));
    }
    if (auto level = lookup("LOG_LEVEL")) {
        auto parsed = infra::Logger::parse_level(*level);
        if (!parsed) {
            throw std::runtime_error("Config: LOG_LEVEL '" + *level + "' is not a known level");
        }
        cfg.log_level = *parsed;
    }
    return cfg;
}

ServiceConfig ServiceConfig::from_env()
{
    return from_env([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

} // namespace uuidmesh::service
