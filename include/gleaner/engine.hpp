/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "gleaner/config.hpp"
#include "gleaner/job.hpp"
#include "gleaner/registry.hpp"
#include "gleaner/types.hpp"

namespace gleaner {

class Pool;
class Processor;
class ProgressPublisher;
class SessionFactory;

enum class SubmissionError : uint8_t {
    None = 0,
    InvalidRequest,
    NotRunning
};

struct SubmitResult {
    bool ok = false;
    JobId id;
    SubmissionError error = SubmissionError::None;
    std::string message;
    bool duplicate = false;    // identity was already running
    explicit operator bool() const noexcept { return ok; }
};

struct PoolStats {
    std::size_t runningCount = 0;
    std::size_t completedCount = 0;
    std::size_t capacity = 0;          // history capacity
    int maxWorkers = 0;
    std::size_t queuedCount = 0;
    std::vector<JobId> runningIds;
    std::vector<JobId> completedIds;   // completion order, oldest first
};

/**
 * Scrape job engine: registry, bounded worker pool and per-job state machine.
 *
 * The session factory and publisher must outlive the engine. The pool size
 * bounds the number of page sessions open at any time.
 */
class Engine final {
public:
    Engine(const EngineConfig& config, SessionFactory& sessions, ProgressPublisher& publisher);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(Engine&&) = delete;

    [[nodiscard]] bool start();
    // wait: run queued jobs and let in-flight ones finish.
    // !wait: drop queued jobs, stop in-flight ones at the next item.
    void shutdown(bool wait = true) noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    [[nodiscard]] SubmitResult submit(const std::string& sourceUrl, const std::string& clientId,
                                      const std::string& searchId);
    [[nodiscard]] std::optional<JobSnapshot> getStatus(const std::string& clientId,
                                                       const std::string& searchId) const;
    // Only jobs no worker has picked up yet can be cancelled.
    [[nodiscard]] bool cancel(const std::string& clientId, const std::string& searchId);
    [[nodiscard]] std::vector<JobSnapshot> recentCompleted(std::size_t limit = 10) const;
    [[nodiscard]] PoolStats poolStats() const;

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    void runJob(const JobKey& key, int workerId);

    EngineConfig config_;
    SessionFactory& sessions_;
    ProgressPublisher& publisher_;

    // Orders submit's admit-and-queue against start and shutdown.
    std::mutex lifecycleMutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> abandon_{false};

    Registry registry_;
    std::unique_ptr<Pool> pool_;
    std::unique_ptr<Processor> processor_;
};

}
