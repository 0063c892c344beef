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
 * @file service_main.cpp
 * @brief Entry point of one UUID service replica.
 *
 * @details
 * Startup sequence:
 * 1. Argument Parsing.
 * 2. Signal Handling Registration (SIGINT/SIGTERM).
 * 3. Environment Configuration.
 * 4. Route Registration and Accept Loop.
 */

#include "uuidmesh/http/router.hpp"
#include "uuidmesh/http/server.hpp"
#include "uuidmesh/infra/logger.hpp"
#include "uuidmesh/infra/string.hpp"
#include "uuidmesh/service/config.hpp"
#include "uuidmesh/service/uuid_service.hpp"

#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>

using uuidmesh::infra::LogLevel;
using uuidmesh::infra::Logger;

/// @brief Active server instance, reachable from the signal handler.
static uuidmesh::http::Server* g_server = nullptr;

void signal_handler(int signum)
{
    Logger::log(LogLevel::WARN, "System: Interrupt received (Signal " + std::to_string(signum) +
                                    "). Initiating graceful shutdown...");
    if (g_server) {
        g_server->stop();
    }
}

void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [PORT]\n"
              << "Options:\n"
              << "  PORT        TCP port to listen on (overrides $PORT, default 8080)\n"
              << "  --help      Show this help message\n"
              << "Environment:\n"
              << "  INSTANCE_ID, PORT, UUID_SLOW_DELAY_MS, UUID_ERROR_ENDPOINT,\n"
              << "  UUID_WORKERS, LOG_LEVEL\n";
}

int main(int argc, char* argv[])
{
    if (argc > 1 && std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    try {
        uuidmesh::service::ServiceConfig config = uuidmesh::service::ServiceConfig::from_env();

        if (argc > 1) {
            auto port = uuidmesh::infra::String::parse_uint(argv[1]);
            if (!port || *port > 65535) {
                throw std::runtime_error("invalid port argument '" + std::string(argv[1]) + "'");
            }
            config.port = static_cast<int>(*port);
        }

        Logger::set_threshold(config.log_level);
        Logger::log(LogLevel::INFO,
                    "System: Booting uuid-service instance '" + config.instance_id + "'...");
        Logger::log(LogLevel::INFO,
                    "Config: Network Interface binding to port " + std::to_string(config.port));

        uuidmesh::infra::ConsoleEventSink events;
        uuidmesh::service::UuidService service(config, events);

        uuidmesh::http::Router router;
        service.register_routes(router);

        uuidmesh::http::Server server(
            [&router](uuidmesh::http::HttpRequest& request) { return router.dispatch(request); },
            config.port, config.workers);

        g_server = &server;
        server.run();
        g_server = nullptr;

    } catch (const std::exception& e) {
        g_server = nullptr;
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    Logger::log(LogLevel::INFO, "System: Shutdown complete.");
    return 0;
}
