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
 * @brief Immutable startup configuration of a UUID service replica.
 *
 * @details
 * The configuration is read from the environment exactly once, before the
 * server starts, and is then handed by value to `UuidService`. Nothing in the
 * request path can modify it.
 */

#pragma once

#include "uuidmesh/infra/logger.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace uuidmesh::service {

/**
 * @struct ServiceConfig
 * @brief Settings for one replica.
 *
 * | Variable              | Field            | Default              |
 * |-----------------------|------------------|----------------------|
 * | `INSTANCE_ID`         | `instance_id`    | `"default"`          |
 * | `PORT`                | `port`           | `8080`               |
 * | `UUID_SLOW_DELAY_MS`  | `slow_delay`     | `20000`              |
 * | `UUID_ERROR_ENDPOINT` | `error_endpoint` | enabled              |
 * | `UUID_WORKERS`        | `workers`        | `200`                |
 * | `LOG_LEVEL`           | `log_level`      | `info`               |
 */
struct ServiceConfig {
    std::string instance_id = "default";
    int port = 8080;
    std::chrono::milliseconds slow_delay{20000};
    bool error_endpoint = true;
    size_t workers = 0; ///< Worker ceiling; 0 lets the scheduler pick its default.
    infra::LogLevel log_level = infra::LogLevel::INFO;

    /// @brief Variable lookup; returns `std::nullopt` for unset variables.
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Builds a configuration from an arbitrary variable source.
     *
     * A variable that is set but empty counts as set (an empty `INSTANCE_ID`
     * yields an empty identity).
     *
     * @throws std::runtime_error On a malformed port, delay, worker count,
     * boolean or log level.
     */
    static ServiceConfig from_env(const EnvLookup& lookup);

    /// @brief Builds a configuration from the process environment.
    static ServiceConfig from_env();
};

} // namespace uuidmesh::service
