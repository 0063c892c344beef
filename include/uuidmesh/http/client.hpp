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
 * @file client.hpp
 * @brief Blocking HTTP/1.1 client with independent per-phase timeouts.
 *
 * @details
 * The gateway talks to replicas through the `Transport` interface. The
 * production implementation, `HttpClient`, opens one connection per exchange
 * and enforces three separate budgets: establishing the connection, writing
 * the request, and waiting for response bytes. Every failure is classified so
 * the caller can attribute it to the replica it was talking to.
 */

#pragma once

#include "uuidmesh/http/message.hpp"

#include <chrono>
#include <string>

namespace uuidmesh::http {

/// @brief Network location of a replica.
struct Endpoint {
    std::string host;
    int port = 0;
};

/// @brief Per-phase timeout budgets for one exchange.
struct Timeouts {
    std::chrono::milliseconds connect{1000};
    std::chrono::milliseconds send{2000};

    /// @brief Maximum silence between two successive reads of the response.
    std::chrono::milliseconds read{5000};
};

/**
 * @enum TransportStatus
 * @brief Outcome classification of an exchange.
 */
enum class TransportStatus {
    kOk,             ///< A complete response was received (any status code).
    kResolveFailed,  ///< Host name could not be resolved.
    kConnectFailed,  ///< Connection refused, reset or unreachable.
    kConnectTimeout, ///< Connect phase exceeded `Timeouts::connect`.
    kSendTimeout,    ///< Request write exceeded `Timeouts::send`.
    kSendFailed,     ///< Peer reset the connection while writing.
    kReadTimeout,    ///< No response bytes within `Timeouts::read`.
    kBadResponse     ///< Response could not be parsed or the peer closed early.
};

/// @brief Short stable name for logs (`connect_timeout`, `bad_response`, ...).
const char* to_string(TransportStatus status);

/// @brief True for the three timeout classifications.
bool is_timeout(TransportStatus status);

/**
 * @struct TransportResult
 * @brief Outcome of one exchange with a replica.
 */
struct TransportResult {
    TransportStatus status = TransportStatus::kOk;
    HttpResponse response;
    std::string detail; ///< Human-readable cause for failures.

    bool ok() const { return status == TransportStatus::kOk; }
};

/**
 * @class Transport
 * @brief Seam between the gateway and the network.
 *
 * Implementations must be safe to call concurrently from many workers.
 */
class Transport {
  public:
    virtual ~Transport() = default;

    /**
     * @brief Sends `request` to `endpoint` and waits for the complete response.
     *
     * Never throws for network conditions; failures are reported through
     * `TransportResult::status`.
     */
    virtual TransportResult exchange(const Endpoint& endpoint, const HttpRequest& request,
                                     const Timeouts& timeouts) = 0;
};

/**
 * @class HttpClient
 * @brief `Transport` over plain TCP sockets, one connection per exchange.
 */
class HttpClient : public Transport {
  public:
    TransportResult exchange(const Endpoint& endpoint, const HttpRequest& request,
                             const Timeouts& timeouts) override;

    /**
     * @brief Convenience wrapper issuing `GET target` with default timeouts.
     */
    TransportResult get(const Endpoint& endpoint, const std::string& target);
};

} // namespace uuidmesh::http
