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
 * @file gateway_main.cpp
 * @brief Entry point of the load-balancing gateway.
 */

#include "uuidmesh/gateway/config.hpp"
#include "uuidmesh/gateway/proxy.hpp"
#include "uuidmesh/http/client.hpp"
#include "uuidmesh/http/server.hpp"
#include "uuidmesh/infra/logger.hpp"

#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>

using uuidmesh::infra::LogLevel;
using uuidmesh::infra::Logger;

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
    std::cout << "Usage: " << binary_name << " [CONFIG]\n"
              << "Options:\n"
              << "  CONFIG      Gateway JSON configuration (Default: config/gateway.json)\n"
              << "  --help      Show this help message\n";
}

int main(int argc, char* argv[])
{
    if (argc > 1 && std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return 0;
    }

    std::string config_path = "config/gateway.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    try {
        // Validated before any socket is opened.
        uuidmesh::gateway::GatewayConfig config =
            uuidmesh::gateway::GatewayConfig::load(config_path);

        Logger::set_threshold(config.log_level);
        Logger::log(LogLevel::INFO, "System: Booting uuid-gateway with '" + config_path + "'...");
        for (const auto& [name, upstream] : config.upstreams) {
            Logger::log(LogLevel::INFO, "Config: Upstream '" + name + "' with " +
                                            std::to_string(upstream.replicas.size()) +
                                            " replica(s).");
        }

        const int port = config.listen_port;
        const size_t workers = config.workers;

        uuidmesh::http::HttpClient transport;
        uuidmesh::infra::ConsoleEventSink events;
        uuidmesh::gateway::Proxy proxy(std::move(config), transport, events);

        uuidmesh::http::Server server(
            [&proxy](uuidmesh::http::HttpRequest& request) { return proxy.handle(request); }, port,
            workers);

        g_server = &server;
        server.run();
        g_server = nullptr;

    } catch (const uuidmesh::gateway::ConfigError& e) {
        Logger::log(LogLevel::FATAL, "Config: " + std::string(e.what()));
        return 1;
    } catch (const std::exception& e) {
        g_server = nullptr;
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    Logger::log(LogLevel::INFO, "System: Shutdown complete.");
    return 0;
}
