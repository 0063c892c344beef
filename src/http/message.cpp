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
 * @file message.cpp
 * @brief HTTP/1.1 message model and incremental wire codec.
 *
 * @details
 * The parsers never throw: malformed input is reported through `ParseStatus`
 * so a single bad peer can only ever cost its own connection.
 */

#include "uuidmesh/http/message.hpp"

#include "uuidmesh/infra/string.hpp"

#include <algorithm>
#include <cJSON.h>
#include <cctype>
#include <cstdlib>

namespace uuidmesh::http {

using infra::String;

namespace {

constexpr const char* kCrlf = "\r\n";
constexpr const char* kHeaderTerminator = "\r\n\r\n";

std::optional<std::string> find_header(const HeaderList& headers, const std::string& name)
{
    for (const auto& [key, value] : headers) {
        if (String::iequals(key, name)) {
            return value;
        }
    }
    return std::nullopt;
}

void erase_header(HeaderList& headers, const std::string& name)
{
    headers.erase(std::remove_if(headers.begin(), headers.end(),
                                 [&name](const auto& h) { return String::iequals(h.first, name); }),
                  headers.end());
}

bool is_token_char(char c)
{
    // RFC 7230 tchar, minus the rarely used punctuation.
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' ||
           c == '!' || c == '#' || c == '$' || c == '%' || c == '&' || c == '\'' || c == '*' ||
           c == '+' || c == '^' || c == '`' || c == '|' || c == '~';
}

bool is_http1_version(const std::string& v)
{
    return v == "HTTP/1.1" || v == "HTTP/1.0";
}

/**
 * @brief Locates the end of the header block and enforces the size limit.
 *
 * @param head_len Set to the length of the head including the blank line.
 */
ParseStatus locate_head(const std::string& buffer, size_t& head_len)
{
    size_t pos = buffer.find(kHeaderTerminator);
    if (pos == std::string::npos) {
        return buffer.size() > kMaxHeaderBytes ? ParseStatus::kHeaderTooLarge
                                               : ParseStatus::kIncomplete;
    }
    if (pos + 4 > kMaxHeaderBytes) {
        return ParseStatus::kHeaderTooLarge;
    }
    head_len = pos + 4;
    return ParseStatus::kComplete;
}

/**
 * @brief Splits the head into its start line and header fields.
 * @return false On a header line without a valid field name.
 */
bool parse_head(const std::string& head, std::string& start_line, HeaderList& headers)
{
    size_t line_end = head.find(kCrlf);
    start_line = head.substr(0, line_end);

    size_t pos = line_end + 2;
    while (pos < head.size()) {
        size_t next = head.find(kCrlf, pos);
        if (next == std::string::npos || next == pos) {
            break;
        }
        std::string line = head.substr(pos, next - pos);
        pos = next + 2;

        // Obsolete line folding is not accepted.
        if (line[0] == ' ' || line[0] == '\t') {
            return false;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return false;
        }
        std::string name = line.substr(0, colon);
        if (!std::all_of(name.begin(), name.end(), is_token_char)) {
            return false;
        }
        headers.emplace_back(name, String::trim(line.substr(colon + 1)));
    }
    return true;
}

/// @brief Reads `Content-Length`, distinguishing "absent" from "invalid".
ParseStatus read_content_length(const HeaderList& headers, std::optional<size_t>& length)
{
    auto raw = find_header(headers, "Content-Length");
    if (!raw) {
        length.reset();
        return ParseStatus::kComplete;
    }
    auto value = String::parse_uint(*raw);
    if (!value) {
        return ParseStatus::kBadMessage;
    }
    if (static_cast<unsigned long long>(*value) > kMaxBodyBytes) {
        return ParseStatus::kBodyTooLarge;
    }
    length = static_cast<size_t>(*value);
    return ParseStatus::kComplete;
}

/**
 * @brief De-chunks a `Transfer-Encoding: chunked` body starting at `pos`.
 */
ParseStatus decode_chunked(const std::string& buffer, size_t pos, std::string& body)
{
    body.clear();
    while (true) {
        size_t line_end = buffer.find(kCrlf, pos);
        if (line_end == std::string::npos) {
            return ParseStatus::kIncomplete;
        }
        std::string size_line = buffer.substr(pos, line_end - pos);
        size_t ext = size_line.find(';');
        if (ext != std::string::npos) {
            size_line.resize(ext);
        }
        size_line = String::trim(size_line);
        if (size_line.empty() || size_line.size() > 8 ||
            !std::all_of(size_line.begin(), size_line.end(),
                         [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); })) {
            return ParseStatus::kBadMessage;
        }
        size_t chunk = std::strtoul(size_line.c_str(), nullptr, 16);
        pos = line_end + 2;

        if (chunk == 0) {
            // Optional trailer section, terminated by an empty line.
            if (buffer.compare(pos, 2, kCrlf) == 0) {
                return ParseStatus::kComplete;
            }
            return buffer.find(kHeaderTerminator, pos) == std::string::npos
                       ? ParseStatus::kIncomplete
                       : ParseStatus::kComplete;
        }

        if (body.size() + chunk > kMaxBodyBytes) {
            return ParseStatus::kBodyTooLarge;
        }
        if (buffer.size() < pos + chunk + 2) {
            return ParseStatus::kIncomplete;
        }
        if (buffer.compare(pos + chunk, 2, kCrlf) != 0) {
            return ParseStatus::kBadMessage;
        }
        body.append(buffer, pos, chunk);
        pos += chunk + 2;
    }
}

bool status_has_no_body(int status)
{
    return (status >= 100 && status < 200) || status == 204 || status == 304;
}

bool is_framing_header(const std::string& name)
{
    return String::iequals(name, "Content-Length") ||
           String::iequals(name, "Transfer-Encoding") || String::iequals(name, "Connection");
}

} // namespace

// ============================================================================
// HttpRequest
// ============================================================================

std::optional<std::string> HttpRequest::header(const std::string& name) const
{
    return find_header(headers, name);
}

void HttpRequest::set_header(const std::string& name, const std::string& value)
{
    erase_header(headers, name);
    headers.emplace_back(name, value);
}

void HttpRequest::remove_header(const std::string& name)
{
    erase_header(headers, name);
}

std::optional<std::string> HttpRequest::query_param(const std::string& name) const
{
    if (query.empty()) {
        return std::nullopt;
    }
    for (const auto& pair : String::split(query, '&')) {
        if (pair.empty()) {
            continue;
        }
        // A malformed escape keeps its raw text, so it still counts as present.
        size_t eq = pair.find('=');
        const std::string raw_key = pair.substr(0, eq);
        if (String::url_decode(raw_key, true).value_or(raw_key) != name) {
            continue;
        }
        if (eq == std::string::npos) {
            return std::string();
        }
        const std::string raw_value = pair.substr(eq + 1);
        return String::url_decode(raw_value, true).value_or(raw_value);
    }
    return std::nullopt;
}

std::optional<std::string> HttpRequest::path_param(const std::string& name) const
{
    auto it = params.find(name);
    if (it == params.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool HttpRequest::keep_alive() const
{
    std::string connection = String::to_lower(header("Connection").value_or(""));
    if (connection.find("close") != std::string::npos) {
        return false;
    }
    if (version == "HTTP/1.0") {
        return connection.find("keep-alive") != std::string::npos;
    }
    return true;
}

void HttpRequest::set_target(const std::string& new_target)
{
    target = new_target;
    size_t q = target.find('?');
    if (q == std::string::npos) {
        path = target;
        query.clear();
    } else {
        path = target.substr(0, q);
        query = target.substr(q + 1);
    }
}

// ============================================================================
// HttpResponse
// ============================================================================

std::optional<std::string> HttpResponse::header(const std::string& name) const
{
    return find_header(headers, name);
}

void HttpResponse::set_header(const std::string& name, const std::string& value)
{
    erase_header(headers, name);
    headers.emplace_back(name, value);
}

void HttpResponse::remove_header(const std::string& name)
{
    erase_header(headers, name);
}

HttpResponse HttpResponse::json(int status, std::string body)
{
    HttpResponse resp;
    resp.status = status;
    resp.headers.emplace_back("Content-Type", "application/json");
    resp.body = std::move(body);
    return resp;
}

HttpResponse HttpResponse::error(int status, const std::string& path, const std::string& message)
{
    cJSON* root = cJSON_CreateObject();
    cJSON_AddNumberToObject(root, "status", status);
    cJSON_AddStringToObject(root, "error", reason_phrase(status));
    if (!message.empty()) {
        cJSON_AddStringToObject(root, "message", message.c_str());
    }
    if (!path.empty()) {
        cJSON_AddStringToObject(root, "path", path.c_str());
    }

    char* raw = cJSON_PrintUnformatted(root);
    std::string body = raw ? raw : "{}";
    free(raw);
    cJSON_Delete(root);

    return json(status, std::move(body));
}

const char* reason_phrase(int status)
{
    switch (status) {
    case 200:
        return "OK";
    case 204:
        return "No Content";
    case 304:
        return "Not Modified";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 413:
        return "Payload Too Large";
    case 431:
        return "Request Header Fields Too Large";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    case 504:
        return "Gateway Timeout";
    default:
        return "Unknown";
    }
}

// ============================================================================
// Codec
// ============================================================================

ParseStatus parse_request(std::string& buffer, HttpRequest& out)
{
    size_t head_len = 0;
    ParseStatus st = locate_head(buffer, head_len);
    if (st != ParseStatus::kComplete) {
        return st;
    }

    HttpRequest req;
    std::string start_line;
    if (!parse_head(buffer.substr(0, head_len), start_line, req.headers)) {
        return ParseStatus::kBadMessage;
    }

    // request-line = method SP request-target SP HTTP-version
    auto parts = String::split(start_line, ' ');
    if (parts.size() != 3 || parts[0].empty() || parts[1].empty()) {
        return ParseStatus::kBadMessage;
    }
    if (!std::all_of(parts[0].begin(), parts[0].end(),
                     [](char c) { return c >= 'A' && c <= 'Z'; })) {
        return ParseStatus::kBadMessage;
    }
    if (parts[1][0] != '/' || !is_http1_version(parts[2])) {
        return ParseStatus::kBadMessage;
    }
    req.method = parts[0];
    req.set_target(parts[1]);
    req.version = parts[2];

    if (req.header("Transfer-Encoding")) {
        return ParseStatus::kBadMessage;
    }
    std::optional<size_t> length;
    st = read_content_length(req.headers, length);
    if (st != ParseStatus::kComplete) {
        return st;
    }
    size_t body_len = length.value_or(0);
    if (buffer.size() < head_len + body_len) {
        return ParseStatus::kIncomplete;
    }

    req.body = buffer.substr(head_len, body_len);
    buffer.erase(0, head_len + body_len);
    out = std::move(req);
    return ParseStatus::kComplete;
}

ParseStatus parse_response(const std::string& buffer, bool eof, HttpResponse& out)
{
    size_t head_len = 0;
    ParseStatus st = locate_head(buffer, head_len);
    if (st != ParseStatus::kComplete) {
        return (st == ParseStatus::kIncomplete && eof) ? ParseStatus::kBadMessage : st;
    }

    HttpResponse resp;
    std::string status_line;
    if (!parse_head(buffer.substr(0, head_len), status_line, resp.headers)) {
        return ParseStatus::kBadMessage;
    }

    // status-line = HTTP-version SP status-code SP [reason-phrase]
    size_t sp = status_line.find(' ');
    if (sp == std::string::npos || !is_http1_version(status_line.substr(0, sp))) {
        return ParseStatus::kBadMessage;
    }
    std::string code = status_line.substr(sp + 1, 3);
    auto status = String::parse_uint(code);
    if (code.size() != 3 || !status || *status < 100) {
        return ParseStatus::kBadMessage;
    }
    resp.status = static_cast<int>(*status);

    if (status_has_no_body(resp.status)) {
        out = std::move(resp);
        return ParseStatus::kComplete;
    }

    std::string te = String::to_lower(resp.header("Transfer-Encoding").value_or(""));
    if (te.find("chunked") != std::string::npos) {
        st = decode_chunked(buffer, head_len, resp.body);
        if (st == ParseStatus::kIncomplete && eof) {
            return ParseStatus::kBadMessage;
        }
        if (st == ParseStatus::kComplete) {
            out = std::move(resp);
        }
        return st;
    }

    std::optional<size_t> length;
    st = read_content_length(resp.headers, length);
    if (st != ParseStatus::kComplete) {
        return st;
    }

    if (length) {
        if (buffer.size() < head_len + *length) {
            return eof ? ParseStatus::kBadMessage : ParseStatus::kIncomplete;
        }
        resp.body = buffer.substr(head_len, *length);
    } else {
        // Close-delimited body.
        if (buffer.size() - head_len > kMaxBodyBytes) {
            return ParseStatus::kBodyTooLarge;
        }
        if (!eof) {
            return ParseStatus::kIncomplete;
        }
        resp.body = buffer.substr(head_len);
    }

    out = std::move(resp);
    return ParseStatus::kComplete;
}

std::string serialize(const HttpResponse& response, bool keep_alive)
{
    std::string out;
    out.reserve(128 + response.body.size());
    out += "HTTP/1.1 ";
    out += std::to_string(response.status);
    out += ' ';
    out += reason_phrase(response.status);
    out += kCrlf;

    for (const auto& [name, value] : response.headers) {
        if (is_framing_header(name)) {
            continue;
        }
        out += name + ": " + value + kCrlf;
    }
    if (!status_has_no_body(response.status)) {
        out += "Content-Length: " + std::to_string(response.body.size()) + kCrlf;
    }
    out += keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    out += kCrlf;

    if (!status_has_no_body(response.status)) {
        out += response.body;
    }
    return out;
}

std::string serialize(const HttpRequest& request)
{
    std::string out = request.method + " " + request.target + " " + request.version + kCrlf;
    for (const auto& [name, value] : request.headers) {
        if (String::iequals(name, "Content-Length") || String::iequals(name, "Transfer-Encoding")) {
            continue;
        }
        out += name + ": " + value + kCrlf;
    }
    if (!request.body.empty() || request.method == "POST" || request.method == "PUT") {
        out += "Content-Length: " + std::to_string(request.body.size()) + kCrlf;
    }
    out += kCrlf;
    out += request.body;
    return out;
}

} // namespace uuidmesh::http
