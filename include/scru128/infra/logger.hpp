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
 * @brief Thread-safe diagnostic logging for the scru128 tools.
 *
 * @details
 * The identifier core is silent by contract; it reports everything through
 * return values and exceptions. Diagnostics emitted by the command line tool
 * go through this logger, which serializes console writes so concurrent
 * messages never interleave and keeps them off `stdout` where generated
 * identifiers are printed.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace scru128::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Per-identifier detail.
    DEBUG, ///< Configuration and control-flow diagnostics.
    INFO,  ///< Nominal operational events.
    WARN,  ///< Rejected input or recoverable anomalies.
    ERROR, ///< Failed operations that do not end the process.
    FATAL  ///< Failures that end the process.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * Every entry is written to `std::cerr` so that tool output on `std::cout`
 * stays machine-readable. Messages below the configured threshold are dropped
 * before the lock is taken.
 */
class Logger {
  public:
    /**
     * @brief Writes a timestamped, severity-tagged message.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @note Thread-safe and blocking.
     *
     * @code
     * // Example Usage:
     * scru128::infra::Logger::log(LogLevel::WARN, "Inspect: rejected 'xyz'");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the lowest severity that is emitted. Defaults to `INFO`.
    static void set_level(LogLevel level);

    /// @brief Returns the current threshold.
    static LogLevel level();

  private:
    /// @brief Guards `std::cerr` and `std::gmtime`'s static buffer.
    static std::mutex mutex_;

    static std::atomic<LogLevel> threshold_;
};

} // namespace scru128::infra
