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
 * @file logger.cpp
 * @brief Implementation of the thread-safe diagnostic logger.
 *
 * @details
 * Entries are formatted as `[YYYY-MM-DD HH:MM:SS] [TAG] message` in UTC with
 * an ANSI colour per severity, and always flushed.
 */

#include "scru128/infra/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace scru128::infra {

std::mutex Logger::mutex_;
std::atomic<LogLevel> Logger::threshold_{LogLevel::INFO};

void Logger::set_level(LogLevel level)
{
    threshold_.store(level);
}

LogLevel Logger::level()
{
    return threshold_.load();
}

void Logger::log(LogLevel level, const std::string& message)
{
    if (level < threshold_.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    // Mutex also protects std::gmtime's internal static buffer.
    std::cerr << "[" << std::put_time(std::gmtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";

    switch (level) {
    case LogLevel::TRACE:
        std::cerr << "\033[90m[TRCE] ";
        break;
    case LogLevel::DEBUG:
        std::cerr << "\033[36m[DBUG] ";
        break;
    case LogLevel::INFO:
        std::cerr << "\033[32m[INFO] ";
        break;
    case LogLevel::WARN:
        std::cerr << "\033[33m[WARN] ";
        break;
    case LogLevel::ERROR:
        std::cerr << "\033[31m[FAIL] ";
        break;
    case LogLevel::FATAL:
        std::cerr << "\033[1;31m[CRIT] ";
        break;
    }

    std::cerr << message << "\033[0m" << std::endl;
}

} // namespace scru128::infra
