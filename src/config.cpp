/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gleaner/config.hpp"
#include "gleaner/logger.hpp"
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

namespace gleaner {

namespace {
// Counts: unset, unparsable, zero, negative or above maxv keeps the default.
std::size_t env_size(const char* name, std::size_t defv,
                     std::size_t maxv = std::numeric_limits<std::size_t>::max()) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        std::string text(val);
        if (text.find('-') != std::string::npos) {
            throw std::invalid_argument("negative");
        }
        unsigned long long parsed = std::stoull(text);
        if (parsed == 0) {
            return defv;
        }
        if (parsed > maxv) {
            LOG_WARN(std::string("Ignoring out of range ") + name + "=" + val);
            return defv;
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}

int env_int(const char* name, int defv) {
    return static_cast<int>(env_size(name, static_cast<std::size_t>(defv),
                                     static_cast<std::size_t>(std::numeric_limits<int>::max())));
}

// Delays: zero is a valid setting, negative values keep the default.
std::chrono::milliseconds env_millis(const char* name, std::chrono::milliseconds defv) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        long long parsed = std::stoll(val);
        if (parsed < 0) {
            LOG_WARN(std::string("Ignoring negative ") + name + "=" + val);
            return defv;
        }
        return std::chrono::milliseconds(parsed);
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring invalid ") + name + "=" + val);
        return defv;
    }
}
}

EngineConfig EngineConfig::fromEnv() {
    EngineConfig config;
    config.maxWorkers = env_int("GLEANER_MAX_WORKERS", config.maxWorkers);
    config.historyCapacity = env_size("GLEANER_HISTORY_CAPACITY", config.historyCapacity);
    config.waitTimeout = env_millis("GLEANER_WAIT_TIMEOUT_MS", config.waitTimeout);
    config.pageSettleDelay = env_millis("GLEANER_PAGE_SETTLE_MS", config.pageSettleDelay);
    config.itemDelay = env_millis("GLEANER_ITEM_DELAY_MS", config.itemDelay);
    config.clickDelay = env_millis("GLEANER_CLICK_DELAY_MS", config.clickDelay);
    config.maxShowMoreClicks = env_int("GLEANER_MAX_SHOW_MORE", config.maxShowMoreClicks);
    return config;
}

}
