/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>

namespace gleaner {

struct EngineConfig {
    int maxWorkers = 5;
    std::size_t historyCapacity = 20;

    // Upper bound for a single wait-for-element condition
    std::chrono::milliseconds waitTimeout{10'000};

    // Pacing between page interactions
    std::chrono::milliseconds pageSettleDelay{3'000};
    std::chrono::milliseconds itemDelay{2'000};
    std::chrono::milliseconds clickDelay{1'000};

    int maxShowMoreClicks = 1000;

    // Defaults overridden by GLEANER_* environment variables.
    [[nodiscard]] static EngineConfig fromEnv();
};

}
