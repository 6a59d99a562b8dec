/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace gleaner {

enum class LogLevel : uint8_t { 
    ERROR = 0, 
    WARN = 1, 
    INFO = 2, 
    DEBUG = 3, 
    TRACE = 4 
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    // Re-read GLEANER_LOG_LEVEL, discarding any setLevel() override
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept {
        return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Logger::level());
    }

    // "error", "warn"/"warning", "info", "debug", "trace" in any case, or 0-4.
    [[nodiscard]] static std::optional<LogLevel> parseLevel(const std::string& text) noexcept;
    
    static void log(LogLevel level, const std::string& message) noexcept;
    
    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

private:
    static LogLevel envLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Label shown in the thread column. Threads without one show their id.
void setThreadName(const std::string& name);
// Drops the calling thread's label; worker threads call it on exit.
void clearThreadName() noexcept;
[[nodiscard]] std::string threadName();
[[nodiscard]] std::string workerName(int workerId);

}

// The message expression is only evaluated when the level is enabled.
#define GLEANER_LOG(lvl, msg)                                   \
    do {                                                        \
        if (::gleaner::Logger::enabled(lvl)) {                  \
            ::gleaner::Logger::log(lvl, msg);                   \
        }                                                       \
    } while (0)

#define LOG_ERROR(msg) GLEANER_LOG(::gleaner::LogLevel::ERROR, msg)
#define LOG_WARN(msg)  GLEANER_LOG(::gleaner::LogLevel::WARN, msg)
#define LOG_INFO(msg)  GLEANER_LOG(::gleaner::LogLevel::INFO, msg)
#define LOG_DEBUG(msg) GLEANER_LOG(::gleaner::LogLevel::DEBUG, msg)
#define LOG_TRACE(msg) GLEANER_LOG(::gleaner::LogLevel::TRACE, msg)
