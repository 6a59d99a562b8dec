/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gleaner/logger.hpp"
#include <atomic>
#include <iostream>
#include <cctype>
#include <cstdlib>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace gleaner {

namespace {

constexpr int kUnset = -1;

// kUnset until the first level() call or an explicit setLevel()
std::atomic<int> g_level{kUnset};
std::mutex g_out_mutex;
std::mutex g_names_mutex;
std::unordered_map<std::thread::id, std::string> g_thread_names;

}

void Logger::setLevel(LogLevel level) noexcept {
    g_level.store(static_cast<int>(level));
}

void Logger::initFromEnv() noexcept {
    g_level.store(static_cast<int>(envLevel()));
}

LogLevel Logger::level() noexcept {
    int current = g_level.load();
    if (current == kUnset) {
        int parsed = static_cast<int>(envLevel());
        // A concurrent setLevel() wins over the environment.
        g_level.compare_exchange_strong(current, parsed);
        current = g_level.load();
    }
    return static_cast<LogLevel>(current);
}

std::optional<LogLevel> Logger::parseLevel(const std::string& text) noexcept {
    try {
        std::string value;
        for (char c : text) {
            if (!std::isspace(static_cast<unsigned char>(c))) {
                value.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            }
        }

        if (value.size() == 1 && value[0] >= '0' && value[0] <= '4') {
            return static_cast<LogLevel>(value[0] - '0');
        }
        if (value == "error") return LogLevel::ERROR;
        if (value == "warn" || value == "warning") return LogLevel::WARN;
        if (value == "info") return LogLevel::INFO;
        if (value == "debug") return LogLevel::DEBUG;
        if (value == "trace") return LogLevel::TRACE;
    } catch (const std::exception&) {
        // allocation failure: treated as unrecognised
    }
    return std::nullopt;
}

LogLevel Logger::envLevel() noexcept {
    const char* env_val = std::getenv("GLEANER_LOG_LEVEL");
    if (!env_val) return LogLevel::INFO;
    return parseLevel(env_val).value_or(LogLevel::INFO);
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (!enabled(level)) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm local{};
        localtime_r(&time_t, &local);

        std::ostringstream ss;
        ss << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
        ss << " [" << levelToString(level) << "]";
        ss << " [" << threadName() << "]";
        ss << " " << message << '\n';

        std::lock_guard<std::mutex> lock(g_out_mutex);
        std::cerr << ss.str() << std::flush;
    } catch (...) {
        // Never throw from logging
    }
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

void setThreadName(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_names_mutex);
    g_thread_names[std::this_thread::get_id()] = name;
}

void clearThreadName() noexcept {
    std::lock_guard<std::mutex> lock(g_names_mutex);
    g_thread_names.erase(std::this_thread::get_id());
}

std::string threadName() {
    auto tid = std::this_thread::get_id();
    {
        std::lock_guard<std::mutex> lock(g_names_mutex);
        auto it = g_thread_names.find(tid);
        if (it != g_thread_names.end()) {
            return it->second;
        }
    }
    std::ostringstream oss;
    oss << "T" << tid;
    return oss.str();
}

std::string workerName(int workerId) {
    return "Worker-" + std::to_string(workerId);
}

}
