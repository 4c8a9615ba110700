/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace sotto {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

// "error", "warn"/"warning", "info", "debug", "trace"; case-insensitive.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(const std::string& value) noexcept;
[[nodiscard]] const char* toString(LogLevel level) noexcept;

// Process-wide stderr logger. Level defaults to SOTTO_LOG_LEVEL, else INFO.
class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }
};

// Name shown in log lines for the calling thread (Main, Accept, Conn-N, Worker-N).
void setThreadName(const std::string& name);
[[nodiscard]] const std::string& threadName();
[[nodiscard]] std::string workerThreadName(int workerId);

}

// The message expression is only evaluated when the level is enabled
#define SOTTO_LOG(level, msg) \
    do { if (::sotto::Logger::enabled(level)) ::sotto::Logger::log(level, msg); } while (0)

#define LOG_ERROR(msg) SOTTO_LOG(::sotto::LogLevel::ERROR, msg)
#define LOG_WARN(msg)  SOTTO_LOG(::sotto::LogLevel::WARN, msg)
#define LOG_INFO(msg)  SOTTO_LOG(::sotto::LogLevel::INFO, msg)
#define LOG_DEBUG(msg) SOTTO_LOG(::sotto::LogLevel::DEBUG, msg)
#define LOG_TRACE(msg) SOTTO_LOG(::sotto::LogLevel::TRACE, msg)
