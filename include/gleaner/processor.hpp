/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>

#include "gleaner/config.hpp"
#include "gleaner/extractor.hpp"
#include "gleaner/job.hpp"
#include "gleaner/publisher.hpp"
#include "gleaner/session.hpp"

namespace gleaner {

enum class ProcessResult : uint8_t {
    Completed,
    Failed
};

/**
 * Drives one claimed job from CollectingInfo to a terminal state.
 *
 * Each run opens exactly one page session and closes it before the job is
 * marked terminal. A snapshot is published after subject resolution, after
 * discovery, after every item and on the terminal transition.
 */
class Processor {
public:
    Processor(const EngineConfig& config, SessionFactory& sessions,
              ProgressPublisher& publisher, const std::atomic<bool>& abandon);

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;
    Processor(Processor&&) = delete;
    Processor& operator=(Processor&&) = delete;

    [[nodiscard]] ProcessResult process(Job& job) noexcept;

private:
    void collectInfo(Job& job, PageSession& session);
    void searchItems(Job& job, PageSession& session);
    void publish(EventKind kind, const Job& job) noexcept;
    void checkAbandoned() const;

    EngineConfig config_;
    Extractor extractor_;
    SessionFactory& sessions_;
    ProgressPublisher& publisher_;
    const std::atomic<bool>& abandon_;
};

}
