/*
 * sotto - Resident Speech-to-Text Daemon
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sotto/logger.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <sstream>
#include <thread>

namespace sotto {

namespace {

LogLevel envLevel() noexcept {
    const char* env = std::getenv("SOTTO_LOG_LEVEL");
    if (!env) {
        return LogLevel::INFO;
    }
    return parseLogLevel(env).value_or(LogLevel::INFO);
}

std::atomic<uint8_t>& currentLevel() noexcept {
    static std::atomic<uint8_t> level{static_cast<uint8_t>(envLevel())};
    return level;
}

std::mutex& outputMutex() noexcept {
    static std::mutex mutex;
    return mutex;
}

// Per-thread, so connection threads leave nothing behind when they exit
thread_local std::string t_threadName;

}

std::optional<LogLevel> parseLogLevel(const std::string& value) noexcept {
    std::string lower;
    try {
        lower.reserve(value.size());
        for (char c : value) {
            lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }

    if (lower == "error") return LogLevel::ERROR;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "trace") return LogLevel::TRACE;
    return std::nullopt;
}

const char* toString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

void Logger::setLevel(LogLevel level) noexcept {
    currentLevel().store(static_cast<uint8_t>(level));
}

void Logger::initFromEnv() noexcept {
    currentLevel().store(static_cast<uint8_t>(envLevel()));
}

LogLevel Logger::level() noexcept {
    return static_cast<LogLevel>(currentLevel().load());
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<uint8_t>(level) <= currentLevel().load(std::memory_order_relaxed);
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (!enabled(level)) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto seconds = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local{};
        localtime_r(&seconds, &local);
        char stamp[32];
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

        std::string name = t_threadName;
        if (name.empty()) {
            std::ostringstream oss;
            oss << "T" << std::this_thread::get_id();
            name = oss.str();
        }

        char prefix[64];
        std::snprintf(prefix, sizeof(prefix), "[%s.%03d] [%s] ", stamp,
                      static_cast<int>(ms.count()), toString(level));

        std::string line;
        line.reserve(message.size() + name.size() + 48);
        line.append(prefix).append("[").append(name).append("] ").append(message).push_back('\n');

        // stdout belongs to the CLI tools
        std::lock_guard<std::mutex> lock(outputMutex());
        std::fwrite(line.data(), 1, line.size(), stderr);
        std::fflush(stderr);
    } catch (...) {
        // Logging must never throw
    }
}

void setThreadName(const std::string& name) {
    t_threadName = name;
}

const std::string& threadName() {
    return t_threadName;
}

std::string workerThreadName(int workerId) {
    return "Worker-" + std::to_string(workerId);
}

}
