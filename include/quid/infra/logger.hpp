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
 * @brief Thread-safe diagnostic logging facility for the identifier toolkit.
 *
 * @details
 * This header declares the `Logger` class, the single reporting channel used by
 * the generators and the `quidgen` front end. Output to `stdout`/`stderr` is
 * serialised so that lines from concurrent callers never interleave, and a
 * process-wide threshold filters out messages below the configured severity.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace quid::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details.
    DEBUG, ///< Diagnostic information intended for development and troubleshooting.
    INFO,  ///< Nominal operational events.
    WARN,  ///< Non-blocking anomalies (e.g., an unsynchronised time-based clock).
    ERROR, ///< Recoverable runtime errors (e.g., a failed generator call).
    FATAL  ///< Failures that terminate the current command.
};

/**
 * @class Logger
 * @brief A static utility class providing system-wide logging capabilities.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * Messages below the current threshold are discarded before the lock is taken.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * quid::infra::Logger::log(LogLevel::ERROR, "Generator: entropy source unavailable.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that will be written. Defaults to `INFO`.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

    /**
     * @brief Parses a case-insensitive level name (`trace` .. `fatal`).
     *
     * @throws std::invalid_argument If the name is not a known level.
     */
    static LogLevel parse_level(const std::string& name);

  private:
    /// @brief Guards access to `std::cout` and `std::cerr`.
    static std::mutex mutex_;

    /// @brief Minimum severity admitted by `log`.
    static std::atomic<LogLevel> threshold_;
};

} // namespace quid::infra
