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
 * @file server.hpp
 * @brief Multi-threaded HTTP/1.1 listener and connection dispatcher.
 *
 * @details
 * This header declares the `Server` class, the network entry point of both
 * the UUID service and the gateway. It handles the low-level BSD socket
 * operations (bind, listen, accept) and hands each accepted connection to the
 * worker pool (`infra::Scheduler`), where a keep-alive session loop parses
 * requests and writes responses.
 */

#pragma once

#include "uuidmesh/http/message.hpp"
#include "uuidmesh/infra/scheduler.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace uuidmesh::http {

/// @brief Request entry point invoked by a session for every parsed request.
using Dispatcher = std::function<HttpResponse(HttpRequest&)>;

/**
 * @class Server
 * @brief A thread-pooled HTTP server.
 *
 * @details
 * **Operational Workflow:**
 * 1. **Listen:** `listen()` binds the port (0 picks an ephemeral port).
 * 2. **Accept:** `run()` blocks on `accept()` for incoming connections.
 * 3. **Dispatch:** Each connection is submitted to the `Scheduler`.
 * 4. **Process:** A worker runs `handle_client`, serving requests until the peer
 *    closes, asks to close, idles out, or sends a malformed request.
 * 5. **Cleanup:** Active sockets are tracked so `stop()` can unblock every worker.
 */
class Server {
  public:
    /// @brief A keep-alive connection idle for this long is closed.
    static constexpr std::chrono::seconds kIdleTimeout{30};

    /**
     * @brief Constructs the server without touching the network.
     *
     * @param dispatcher Request entry point; must outlive the server.
     * @param port TCP port to bind (0 for an ephemeral port).
     * @param workers Ceiling of the elastic worker pool, i.e. the number of
     * connections served concurrently. 0 selects `Scheduler::kDefaultMaxWorkers`.
     */
    Server(Dispatcher dispatcher, int port, size_t workers);

    /**
     * @brief Initiates the graceful shutdown sequence and joins the workers.
     */
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /**
     * @brief Creates, binds and listens on the server socket.
     *
     * @throws std::runtime_error If the socket cannot be created, bound or put
     * into listening mode.
     */
    void listen();

    /**
     * @brief Runs the accept loop; calls `listen()` first if needed.
     *
     * @note This function is **blocking**. It returns once `stop()` is called.
     * @throws std::runtime_error Propagated from `listen()`.
     */
    void run();

    /**
     * @brief Signals the server to shut down.
     *
     * **Shutdown Sequence:**
     * 1. Clears the `running_` flag.
     * 2. Shuts down and closes the listener (unblocking `accept`).
     * 3. Shuts down every tracked client socket so its session loop exits
     *    and closes the descriptor itself.
     */
    void stop();

    /// @brief The port actually bound (resolves an ephemeral request).
    int port() const { return port_; }

    /// @brief True between a successful `listen()` and `stop()`.
    bool is_running() const { return running_; }

  private:
    Dispatcher dispatcher_;
    int port_;
    std::atomic<int> server_fd_;
    std::atomic<bool> running_;

    std::vector<int> client_sockets_;
    std::mutex client_mutex_;

    /// @brief Declared last: destroyed first, so sessions never outlive the members above.
    infra::Scheduler scheduler_;

    /**
     * @brief Session loop for one connection (worker thread context).
     * @param socket Client socket; closed before returning.
     * @param peer Dotted IPv4 address of the peer.
     */
    void handle_client(int socket, const std::string& peer);

    void add_client(int socket);
    void remove_client(int socket);
};

/**
 * @brief Writes the whole buffer, retrying on partial writes and `EINTR`.
 * @return false If the peer went away or the send timed out.
 */
bool send_all(int socket, const std::string& data);

} // namespace uuidmesh::http
