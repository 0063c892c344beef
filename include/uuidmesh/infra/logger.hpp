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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility and structured event sinks.
 *
 * @details
 * This header declares the `Logger` class, the centralized console reporting
 * interface shared by the UUID service and the gateway, together with the
 * `EventSink` abstraction through which request handlers emit structured
 * per-request events without reaching for a hidden global.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace uuidmesh::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 *
 * Used to categorize the criticality of log entries and determine the
 * appropriate output stream (Standard Output vs. Standard Error).
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details (e.g., socket reads, cache probes).
    DEBUG, ///< Diagnostic information intended for development and troubleshooting.
    INFO,  ///< Nominal operational events (e.g., startup sequence, per-request events).
    WARN,  ///< Non-blocking anomalies (e.g., a replica marked unavailable).
    ERROR, ///< Recoverable runtime errors that do not halt the system.
    FATAL  ///< Critical system failures requiring immediate process termination.
};

/**
 * @class Logger
 * @brief A static utility class providing system-wide logging capabilities.
 *
 * @details
 * The Logger implements a thread-safe, static interface for writing diagnostic
 * artifacts. It utilizes an internal mutex to serialize access to the console,
 * ensuring that log entries from multiple worker threads remain distinct and readable.
 * Entries below the process-wide threshold are discarded before the lock is taken.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout` (Standard Output).
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr` (Standard Error).
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * uuidmesh::infra::Logger::log(LogLevel::INFO, "Network: listening on port 8080");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that reaches the console.
     * @param level Entries strictly below this level are dropped.
     */
    static void set_threshold(LogLevel level);

    /// @brief Returns the current process-wide threshold.
    static LogLevel threshold();

    /**
     * @brief Parses a textual level name (`trace`, `debug`, `info`, `warn`, `error`, `fatal`).
     *
     * Matching is case-insensitive and ignores surrounding whitespace.
     *
     * @param name The textual level, typically read from `LOG_LEVEL`.
     * @return The parsed level, or `std::nullopt` if the name is unknown.
     */
    static std::optional<LogLevel> parse_level(const std::string& name);

  private:
    /// @brief Guards access to `std::cout` and `std::cerr`.
    static std::mutex mutex_;

    /// @brief Minimum severity emitted. Read without locking on the hot path.
    static std::atomic<LogLevel> threshold_;
};

/// @brief Ordered key/value pairs attached to a structured event.
using EventFields = std::vector<std::pair<std::string, std::string>>;

/**
 * @class EventSink
 * @brief Destination for structured, per-request events.
 *
 * @details
 * Request handlers receive an `EventSink&` at construction time instead of
 * calling the static `Logger` directly. Production wiring uses
 * `ConsoleEventSink`; tests substitute a recording implementation.
 */
class EventSink {
  public:
    virtual ~EventSink() = default;

    /**
     * @brief Emits one structured event.
     * @param level Severity of the event.
     * @param event Dotted event name (e.g., `uuid.generated`).
     * @param fields Ordered key/value payload.
     */
    virtual void emit(LogLevel level, const std::string& event, const EventFields& fields) = 0;
};

/**
 * @class ConsoleEventSink
 * @brief Renders events as `event key=value ...` lines through `Logger`.
 */
class ConsoleEventSink : public EventSink {
  public:
    void emit(LogLevel level, const std::string& event, const EventFields& fields) override;

    /**
     * @brief Formats an event the way `emit` writes it.
     *
     * Values containing spaces are double-quoted.
     */
    static std::string format(const std::string& event, const EventFields& fields);
};

} // namespace uuidmesh::infra
