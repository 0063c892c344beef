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
 * @file server.cpp
 * @brief Implementation of the thread-pooled HTTP server.
 *
 * @details
 * This file implements the listener loop, client connection tracking, and
 * the per-connection session loop that drives the incremental request
 * parser. It handles the raw BSD socket API calls.
 */

#include "uuidmesh/http/server.hpp"

#include "uuidmesh/infra/logger.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <exception>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace uuidmesh::http {

using infra::LogLevel;
using infra::Logger;

Server::Server(Dispatcher dispatcher, int port, size_t workers)
    : dispatcher_(std::move(dispatcher)), port_(port), server_fd_(-1), running_(false),
      scheduler_(workers)
{
}

Server::~Server()
{
    stop();
}

void Server::stop()
{
    bool was_running = running_.exchange(false);

    int fd = server_fd_.exchange(-1);
    if (fd >= 0) {
        shutdown(fd, SHUT_RDWR);
        close(fd);
    }

    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        for (int sock : client_sockets_) {
            shutdown(sock, SHUT_RDWR);
        }
    }

    if (was_running) {
        Logger::log(LogLevel::INFO, "Network: Server on port " + std::to_string(port_) +
                                        " stopped accepting connections.");
    }
}

void Server::listen()
{
    if (running_) {
        return;
    }

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error("Network: Failed to create socket: " +
                                 std::string(std::strerror(errno)));
    }

    // Allow immediate address reuse to facilitate quick restarts.
    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        close(fd);
        throw std::runtime_error("Network: setsockopt(SO_REUSEADDR) failed.");
    }

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(static_cast<uint16_t>(port_));

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) < 0) {
        std::string reason = std::strerror(errno);
        close(fd);
        throw std::runtime_error("Network: Failed to bind to port " + std::to_string(port_) +
                                 ": " + reason);
    }

    if (::listen(fd, 128) < 0) {
        close(fd);
        throw std::runtime_error("Network: Failed to listen on port " + std::to_string(port_));
    }

    socklen_t len = sizeof(address);
    if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&address), &len) == 0) {
        port_ = ntohs(address.sin_port);
    }

    server_fd_ = fd;
    running_ = true;
    Logger::log(LogLevel::INFO, "Network: Listening on port " + std::to_string(port_) + " with up to " +
                                    std::to_string(scheduler_.capacity()) + " workers");
}

void Server::run()
{
    listen();

    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t len = sizeof(client_addr);

        int sock = accept(server_fd_, reinterpret_cast<struct sockaddr*>(&client_addr), &len);

        if (sock < 0) {
            if (!running_) {
                break;
            }
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            Logger::log(LogLevel::ERROR,
                        "Network: Accept failed: " + std::string(std::strerror(errno)));
            continue;
        }

        if (!running_) {
            close(sock);
            break;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        const char* peer = inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        std::string client_ip = peer ? peer : "unknown";

        Logger::log(LogLevel::DEBUG, "Network: New connection from " + client_ip);

        add_client(sock);
        if (!scheduler_.enqueue([this, sock, client_ip]() { handle_client(sock, client_ip); })) {
            remove_client(sock);
            close(sock);
        }
    }

    Logger::log(LogLevel::INFO, "Network: Server event loop terminated.");
}

void Server::handle_client(int sock, const std::string& peer)
{
    struct timeval idle;
    idle.tv_sec = static_cast<time_t>(kIdleTimeout.count());
    idle.tv_usec = 0;
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &idle, sizeof(idle));
    setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &idle, sizeof(idle));

    std::string buffer;
    char chunk[8192];

    while (running_) {
        HttpRequest request;
        ParseStatus status = parse_request(buffer, request);

        if (status == ParseStatus::kIncomplete) {
            ssize_t read_len = recv(sock, chunk, sizeof(chunk), 0);
            if (read_len > 0) {
                buffer.append(chunk, static_cast<size_t>(read_len));
                continue;
            }
            if (read_len == 0) {
                Logger::log(LogLevel::DEBUG, "Network: Client " + peer + " disconnected.");
            } else if (errno == EINTR) {
                continue;
            } else {
                Logger::log(LogLevel::DEBUG, "Network: Read error or idle timeout from " + peer);
            }
            break;
        }

        if (status != ParseStatus::kComplete) {
            int code = status == ParseStatus::kHeaderTooLarge ? 431
                       : status == ParseStatus::kBodyTooLarge ? 413
                                                               : 400;
            Logger::log(LogLevel::WARN, "Network: Rejecting malformed request from " + peer +
                                            " (" + std::to_string(code) + ")");
            send_all(sock, serialize(HttpResponse::error(code, ""), false));
            break;
        }

        request.remote_addr = peer;
        bool keep_alive = request.keep_alive();

        HttpResponse response;
        try {
            response = dispatcher_(request);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::ERROR, "Network: Handler for " + request.method + " " +
                                             request.path + " threw: " + e.what());
            response = HttpResponse::error(500, request.path);
        }

        if (!send_all(sock, serialize(response, keep_alive && running_))) {
            Logger::log(LogLevel::DEBUG, "Network: Send to " + peer + " failed.");
            break;
        }
        if (!keep_alive) {
            break;
        }
    }

    remove_client(sock);
}

void Server::add_client(int sock)
{
    std::lock_guard<std::mutex> lock(client_mutex_);
    client_sockets_.push_back(sock);
}

void Server::remove_client(int sock)
{
    std::lock_guard<std::mutex> lock(client_mutex_);
    auto it = std::find(client_sockets_.begin(), client_sockets_.end(), sock);
    if (it != client_sockets_.end()) {
        client_sockets_.erase(it);
        close(sock);
    }
}

bool send_all(int sock, const std::string& data)
{
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(sock, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

} // namespace uuidmesh::http
