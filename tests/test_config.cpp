/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <cstdlib>

#include "gleaner/config.hpp"

namespace gleaner {
namespace {

const char* const kVariables[] = {
    "GLEANER_MAX_WORKERS", "GLEANER_HISTORY_CAPACITY", "GLEANER_WAIT_TIMEOUT_MS",
    "GLEANER_PAGE_SETTLE_MS", "GLEANER_ITEM_DELAY_MS", "GLEANER_CLICK_DELAY_MS",
    "GLEANER_MAX_SHOW_MORE"};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : kVariables) {
            unsetenv(name);
        }
    }
};

TEST_F(ConfigTest, DefaultsWithoutEnvironment) {
    auto config = EngineConfig::fromEnv();
    EXPECT_EQ(config.maxWorkers, 5);
    EXPECT_EQ(config.historyCapacity, 20u);
    EXPECT_EQ(config.waitTimeout.count(), 10000);
    EXPECT_EQ(config.pageSettleDelay.count(), 3000);
    EXPECT_EQ(config.itemDelay.count(), 2000);
    EXPECT_EQ(config.clickDelay.count(), 1000);
    EXPECT_EQ(config.maxShowMoreClicks, 1000);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    setenv("GLEANER_MAX_WORKERS", "3", 1);
    setenv("GLEANER_HISTORY_CAPACITY", "50", 1);
    setenv("GLEANER_ITEM_DELAY_MS", "0", 1);
    setenv("GLEANER_WAIT_TIMEOUT_MS", "250", 1);

    auto config = EngineConfig::fromEnv();
    EXPECT_EQ(config.maxWorkers, 3);
    EXPECT_EQ(config.historyCapacity, 50u);
    EXPECT_EQ(config.itemDelay.count(), 0);
    EXPECT_EQ(config.waitTimeout.count(), 250);
}

TEST_F(ConfigTest, NegativeDelaysKeepDefaults) {
    setenv("GLEANER_WAIT_TIMEOUT_MS", "-5", 1);
    setenv("GLEANER_CLICK_DELAY_MS", "-1", 1);

    auto config = EngineConfig::fromEnv();
    EXPECT_EQ(config.waitTimeout.count(), 10000);
    EXPECT_EQ(config.clickDelay.count(), 1000);
}

TEST_F(ConfigTest, CountsOutsideIntRangeKeepDefaults) {
    setenv("GLEANER_MAX_WORKERS", "4294967297", 1);
    setenv("GLEANER_MAX_SHOW_MORE", "-2", 1);

    auto config = EngineConfig::fromEnv();
    EXPECT_EQ(config.maxWorkers, 5);
    EXPECT_EQ(config.maxShowMoreClicks, 1000);
}

TEST_F(ConfigTest, InvalidAndZeroCountsKeepDefaults) {
    setenv("GLEANER_MAX_WORKERS", "many", 1);
    setenv("GLEANER_HISTORY_CAPACITY", "0", 1);

    auto config = EngineConfig::fromEnv();
    EXPECT_EQ(config.maxWorkers, 5);
    EXPECT_EQ(config.historyCapacity, 20u);
}

}
}
