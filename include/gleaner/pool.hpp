/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "gleaner/types.hpp"

namespace gleaner {

using JobProcessor = std::function<void(const JobKey&, int workerId)>;

class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(JobProcessor processor);
    // With drain, queued jobs still run before the workers exit;
    // otherwise they are discarded. In-flight jobs always finish.
    void stop(bool drain = false) noexcept;
    [[nodiscard]] bool submit(const JobKey& key) noexcept;
    // Removes a job that is still queued.
    bool withdraw(const JobKey& key) noexcept;
    
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    void workerLoop(int workerId);
    
    int workers_;
    JobProcessor processor_;
    
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<bool> drain_{false};
    
    mutable std::mutex queueMutex_;
    std::condition_variable jobAvailable_;
    std::deque<JobKey> jobQueue_;
    
    std::vector<std::thread> workerThreads_;
};

}
