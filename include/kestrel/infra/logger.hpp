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
 * @brief Thread-safe diagnostic logging facility for Kestrel.
 *
 * @details
 * This header declares the `Logger` class, the centralized reporting interface
 * for the generator library and its command-line front end. Every entry is
 * written to `stderr` under a single lock, so `stdout` stays reserved for
 * generated tokens and concurrent entries never interleave.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace kestrel::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details.
    DEBUG, ///< Diagnostic information (generator parameters, resolved settings).
    INFO,  ///< Nominal operational events (batch started, batch completed).
    WARN,  ///< Non-blocking anomalies (e.g. hash algorithm fallback).
    ERROR, ///< Recoverable runtime errors.
    FATAL  ///< Failures that terminate the process.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * Messages below the configured threshold are discarded before the lock is
 * taken. The threshold defaults to `LogLevel::INFO`.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to `stderr`.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * kestrel::infra::Logger::log(LogLevel::WARN, "Generator: sha3-256 unavailable");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the minimum severity that will be emitted.
    static void set_level(LogLevel level);

    /// @brief Current minimum severity.
    static LogLevel level();

    /**
     * @brief Parses a level name (`trace`, `debug`, `info`, `warn`/`warning`,
     * `error`, `fatal`), case-insensitively.
     *
     * @return `std::nullopt` for unknown names.
     */
    static std::optional<LogLevel> parse_level(std::string_view name);

  private:
    /// @brief Serializes writes to `std::cerr`.
    static std::mutex mutex_;

    /// @brief Emission threshold. Read without the lock on the fast path.
    static std::atomic<LogLevel> threshold_;
};

} // namespace kestrel::infra
