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
 * @file message.hpp
 * @brief HTTP/1.1 request and response model plus the wire codec.
 *
 * @details
 * The codec is shared by both ends of the system: `http::Server` parses
 * requests and serializes responses, while `http::HttpClient` (used by the
 * gateway) serializes requests and parses responses. Parsing is incremental:
 * callers accumulate socket reads into a buffer and re-invoke the parser until
 * it reports a complete message.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace uuidmesh::http {

/// @brief Upper bound on the request/status line plus header block.
constexpr size_t kMaxHeaderBytes = 8192;

/// @brief Upper bound on a message body accepted by either parser.
constexpr size_t kMaxBodyBytes = 1024 * 1024;

/// @brief Ordered header list. Names keep their original spelling.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * @struct HttpRequest
 * @brief A parsed (or to-be-sent) HTTP request.
 */
struct HttpRequest {
    std::string method = "GET";
    std::string target = "/"; ///< Raw request-target as sent: path plus optional `?query`.
    std::string path = "/";   ///< Raw (still percent-encoded) path component of `target`.
    std::string query;        ///< Raw query string without the leading `?`.
    std::string version = "HTTP/1.1";
    HeaderList headers;
    std::string body;

    /// @brief Decoded path parameters, filled in by `Router::dispatch`.
    std::unordered_map<std::string, std::string> params;

    /// @brief Peer IPv4 address in dotted form, filled in by `Server`.
    std::string remote_addr;

    /// @brief Case-insensitive header lookup; returns the first match.
    std::optional<std::string> header(const std::string& name) const;

    /// @brief Replaces every header called `name` with a single value.
    void set_header(const std::string& name, const std::string& value);

    /// @brief Removes every header called `name`.
    void remove_header(const std::string& name);

    /**
     * @brief Looks up a decoded query parameter.
     *
     * `?id=` yields an empty string and an absent key yields `std::nullopt`.
     * A value with a malformed escape (`?id=%zz`) is returned verbatim.
     */
    std::optional<std::string> query_param(const std::string& name) const;

    /// @brief Looks up a decoded path parameter bound by the router.
    std::optional<std::string> path_param(const std::string& name) const;

    /// @brief Applies HTTP/1.0 and HTTP/1.1 persistence defaults plus the `Connection` header.
    bool keep_alive() const;

    /// @brief Sets `target` and re-derives `path` and `query` from it.
    void set_target(const std::string& new_target);
};

/**
 * @struct HttpResponse
 * @brief An HTTP response as produced by a handler or received from upstream.
 */
struct HttpResponse {
    int status = 200;
    HeaderList headers;
    std::string body;

    std::optional<std::string> header(const std::string& name) const;
    void set_header(const std::string& name, const std::string& value);
    void remove_header(const std::string& name);

    /// @brief Builds a response carrying a JSON document.
    static HttpResponse json(int status, std::string body);

    /**
     * @brief Builds the standard JSON error document.
     *
     * Shape: `{"status": <code>, "error": "<reason phrase>", "message": "...", "path": "..."}`.
     * Empty `message`/`path` are omitted.
     */
    static HttpResponse error(int status, const std::string& path, const std::string& message = "");
};

/// @brief Standard reason phrase for a status code ("Unknown" when unlisted).
const char* reason_phrase(int status);

/**
 * @enum ParseStatus
 * @brief Outcome of one incremental parse attempt.
 */
enum class ParseStatus {
    kIncomplete,     ///< More bytes are needed.
    kComplete,       ///< One message was parsed and removed from the buffer.
    kBadMessage,     ///< Syntax error; the connection must be dropped.
    kHeaderTooLarge, ///< Header block exceeded `kMaxHeaderBytes`.
    kBodyTooLarge    ///< Declared or accumulated body exceeded `kMaxBodyBytes`.
};

/**
 * @brief Attempts to parse one request from the front of `buffer`.
 *
 * On `kComplete` the consumed bytes are erased from `buffer` (pipelined bytes
 * stay) and `out` holds the request. Bodies are framed by `Content-Length`
 * only; chunked request bodies are rejected as `kBadMessage`.
 */
ParseStatus parse_request(std::string& buffer, HttpRequest& out);

/**
 * @brief Attempts to parse a complete response from `buffer`.
 *
 * Supports `Content-Length`, `chunked` transfer coding, and close-delimited
 * bodies. A close-delimited body is complete only once `eof` is true.
 * Chunked bodies are de-chunked into `out.body`.
 */
ParseStatus parse_response(const std::string& buffer, bool eof, HttpResponse& out);

/**
 * @brief Serializes a response, stamping `Content-Length` and `Connection`.
 *
 * Any `Content-Length`, `Transfer-Encoding` or `Connection` headers already on
 * the response are replaced.
 */
std::string serialize(const HttpResponse& response, bool keep_alive);

/// @brief Serializes a request for the wire; `Content-Length` is stamped when a body is present.
std::string serialize(const HttpRequest& request);

} // namespace uuidmesh::http
