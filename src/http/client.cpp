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
 * @file client.cpp
 * @brief Socket-level implementation of `HttpClient`.
 *
 * @details
 * The socket is switched to non-blocking mode right after creation and every
 * phase waits with `poll()` against its own deadline. This keeps the connect,
 * send and read budgets independent of each other and of kernel defaults.
 */

#include "uuidmesh/http/client.hpp"

#include "uuidmesh/infra/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace uuidmesh::http {

namespace {

using Clock = std::chrono::steady_clock;

/// @brief Owns a socket descriptor for the duration of one exchange.
class SocketHandle {
  public:
    explicit SocketHandle(int fd) : fd_(fd) {}
    ~SocketHandle()
    {
        if (fd_ >= 0) {
            close(fd_);
        }
    }
    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    int get() const { return fd_; }

  private:
    int fd_;
};

/// @brief Owns a `getaddrinfo` result list.
class AddrInfoList {
  public:
    AddrInfoList() = default;
    ~AddrInfoList()
    {
        if (head_) {
            freeaddrinfo(head_);
        }
    }
    AddrInfoList(const AddrInfoList&) = delete;
    AddrInfoList& operator=(const AddrInfoList&) = delete;

    struct addrinfo** out() { return &head_; }
    const struct addrinfo* head() const { return head_; }

  private:
    struct addrinfo* head_ = nullptr;
};

int remaining_ms(Clock::time_point deadline)
{
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

/**
 * @brief Waits for `events` on `fd` until `deadline`.
 * @return 1 when ready, 0 on timeout, -1 on error.
 */
int wait_for(int fd, short events, Clock::time_point deadline)
{
    while (true) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = events;
        pfd.revents = 0;

        int rc = poll(&pfd, 1, remaining_ms(deadline));
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        if (rc <= 0) {
            return rc;
        }
        return 1;
    }
}

TransportResult failure(TransportStatus status, std::string detail)
{
    TransportResult result;
    result.status = status;
    result.detail = std::move(detail);
    return result;
}

/**
 * @brief Connect phase: tries each resolved address within one shared deadline.
 */
TransportResult connect_socket(const Endpoint& endpoint, std::chrono::milliseconds budget,
                               int& out_fd)
{
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    AddrInfoList addrs;
    const std::string port = std::to_string(endpoint.port);
    int rc = getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, addrs.out());
    if (rc != 0) {
        return failure(TransportStatus::kResolveFailed,
                       endpoint.host + ": " + std::string(gai_strerror(rc)));
    }

    const auto deadline = Clock::now() + budget;
    TransportResult last = failure(TransportStatus::kConnectFailed, "no usable address");

    for (const struct addrinfo* ai = addrs.head(); ai != nullptr; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last = failure(TransportStatus::kConnectFailed, std::strerror(errno));
            continue;
        }
        fcntl(fd, F_SETFL, fcntl(fd, F_GETFL, 0) | O_NONBLOCK);

        if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            out_fd = fd;
            return TransportResult{};
        }
        if (errno != EINPROGRESS) {
            last = failure(TransportStatus::kConnectFailed, std::strerror(errno));
            close(fd);
            continue;
        }

        int ready = wait_for(fd, POLLOUT, deadline);
        if (ready == 0) {
            close(fd);
            return failure(TransportStatus::kConnectTimeout,
                           "no connection within " + std::to_string(budget.count()) + "ms");
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (ready < 0 || getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 ||
            so_error != 0) {
            last = failure(TransportStatus::kConnectFailed,
                           std::strerror(so_error != 0 ? so_error : errno));
            close(fd);
            continue;
        }

        out_fd = fd;
        return TransportResult{};
    }
    return last;
}

TransportResult send_request(int fd, const std::string& wire, std::chrono::milliseconds budget)
{
    const auto deadline = Clock::now() + budget;
    size_t sent = 0;
    while (sent < wire.size()) {
        ssize_t n = send(fd, wire.data() + sent, wire.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            int ready = wait_for(fd, POLLOUT, deadline);
            if (ready == 0) {
                return failure(TransportStatus::kSendTimeout,
                               "request not written within " + std::to_string(budget.count()) +
                                   "ms");
            }
            if (ready < 0) {
                return failure(TransportStatus::kSendFailed, std::strerror(errno));
            }
            continue;
        }
        return failure(TransportStatus::kSendFailed, std::strerror(errno));
    }
    return TransportResult{};
}

TransportResult read_response(int fd, std::chrono::milliseconds budget)
{
    std::string buffer;
    char chunk[8192];

    while (true) {
        // The budget restarts after every successful read.
        int ready = wait_for(fd, POLLIN, Clock::now() + budget);
        if (ready == 0) {
            return failure(TransportStatus::kReadTimeout,
                           "no response bytes within " + std::to_string(budget.count()) + "ms");
        }
        if (ready < 0) {
            return failure(TransportStatus::kBadResponse, std::strerror(errno));
        }

        ssize_t n = recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            return failure(TransportStatus::kBadResponse, std::strerror(errno));
        }

        bool eof = (n == 0);
        buffer.append(chunk, static_cast<size_t>(n));

        TransportResult result;
        ParseStatus st = parse_response(buffer, eof, result.response);
        if (st == ParseStatus::kComplete) {
            return result;
        }
        if (st != ParseStatus::kIncomplete || eof) {
            return failure(TransportStatus::kBadResponse,
                           eof && buffer.empty() ? "connection closed before response"
                                                 : "malformed response");
        }
    }
}

} // namespace

const char* to_string(TransportStatus status)
{
    switch (status) {
    case TransportStatus::kOk:
        return "ok";
    case TransportStatus::kResolveFailed:
        return "resolve_failed";
    case TransportStatus::kConnectFailed:
        return "connect_failed";
    case TransportStatus::kConnectTimeout:
        return "connect_timeout";
    case TransportStatus::kSendTimeout:
        return "send_timeout";
    case TransportStatus::kSendFailed:
        return "send_failed";
    case TransportStatus::kReadTimeout:
        return "read_timeout";
    case TransportStatus::kBadResponse:
        return "bad_response";
    }
    return "unknown";
}

bool is_timeout(TransportStatus status)
{
    return status == TransportStatus::kConnectTimeout || status == TransportStatus::kSendTimeout ||
           status == TransportStatus::kReadTimeout;
}

TransportResult HttpClient::exchange(const Endpoint& endpoint, const HttpRequest& request,
                                     const Timeouts& timeouts)
{
    int raw_fd = -1;
    TransportResult result = connect_socket(endpoint, timeouts.connect, raw_fd);
    if (!result.ok()) {
        return result;
    }
    SocketHandle sock(raw_fd);

    result = send_request(sock.get(), serialize(request), timeouts.send);
    if (!result.ok()) {
        return result;
    }

    result = read_response(sock.get(), timeouts.read);
    if (!result.ok()) {
        infra::Logger::log(infra::LogLevel::TRACE, "Client: " + endpoint.host + ":" +
                                                       std::to_string(endpoint.port) + " " +
                                                       to_string(result.status));
    }
    return result;
}

TransportResult HttpClient::get(const Endpoint& endpoint, const std::string& target)
{
    HttpRequest request;
    request.method = "GET";
    request.set_target(target);
    request.set_header("Host", endpoint.host + ":" + std::to_string(endpoint.port));
    request.set_header("Connection", "close");
    return exchange(endpoint, request, Timeouts{});
}

} // namespace uuidmesh::http
