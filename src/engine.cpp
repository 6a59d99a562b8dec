/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gleaner/engine.hpp"
#include "gleaner/logger.hpp"
#include "gleaner/pool.hpp"
#include "gleaner/processor.hpp"
#include "gleaner/publisher.hpp"
#include "gleaner/session.hpp"

namespace gleaner {

Engine::Engine(const EngineConfig& config, SessionFactory& sessions, ProgressPublisher& publisher)
    : config_(config), sessions_(sessions), publisher_(publisher),
      registry_(config.historyCapacity) {
    LOG_DEBUG("Engine created - workers: " + std::to_string(config_.maxWorkers) +
              ", history: " + std::to_string(config_.historyCapacity));
}

Engine::~Engine() {
    shutdown();
}

bool Engine::start() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (running_.load()) {
        LOG_WARN("Engine already running");
        return false;
    }

    LOG_INFO("Starting gleaner engine...");

    try {
        abandon_.store(false);
        processor_ = std::make_unique<Processor>(config_, sessions_, publisher_, abandon_);
        pool_ = std::make_unique<Pool>(config_.maxWorkers);

        if (!pool_->start([this](const JobKey& key, int workerId) {
            runJob(key, workerId);
        })) {
            LOG_ERROR("Failed to start worker pool");
            pool_.reset();
            processor_.reset();
            return false;
        }

        running_.store(true);
        LOG_DEBUG("Engine started successfully");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start engine: " + std::string(e.what()));
        pool_.reset();
        processor_.reset();
        return false;
    }
}

void Engine::shutdown(bool wait) noexcept {
    {
        // Once this section ends no submit can admit or queue another job.
        std::lock_guard<std::mutex> lock(lifecycleMutex_);
        if (!running_.exchange(false)) {
            return;
        }

        LOG_INFO(std::string("Shutting down engine") + (wait ? " (waiting for jobs)..." : "..."));

        if (!wait) {
            abandon_.store(true);
            try {
                auto dropped = registry_.withdrawPending();
                if (!dropped.empty()) {
                    LOG_INFO("Dropped " + std::to_string(dropped.size()) + " pending job(s)");
                }
            } catch (const std::exception& e) {
                LOG_ERROR("Failed to drop pending jobs: " + std::string(e.what()));
            }
        }
    }

    // Joins workers; must not hold the lifecycle lock.
    if (pool_) {
        pool_->stop(wait);
    }

    LOG_INFO("Engine shutdown complete");
}

SubmitResult Engine::submit(const std::string& sourceUrl, const std::string& clientId,
                            const std::string& searchId) {
    if (sourceUrl.empty() || clientId.empty() || searchId.empty()) {
        LOG_DEBUG("Rejected submission with missing url, client or search id");
        return {false, "", SubmissionError::InvalidRequest,
                "source url, client id and search id are required"};
    }

    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!running_.load()) {
        return {false, "", SubmissionError::NotRunning, "engine is not running"};
    }

    JobKey key{clientId, searchId};
    auto admission = registry_.admit(key, sourceUrl);
    const JobId id = key.id();

    if (!admission.created) {
        LOG_WARN("Job " + id + " is already running");
        return {true, id, SubmissionError::None, "", true};
    }

    if (!pool_->submit(key)) {
        (void)registry_.withdraw(key);
        return {false, "", SubmissionError::NotRunning, "engine is shutting down"};
    }

    LOG_INFO("Job submitted: " + id + " -> " + sourceUrl);
    return {true, id, SubmissionError::None, "", false};
}

std::optional<JobSnapshot> Engine::getStatus(const std::string& clientId,
                                             const std::string& searchId) const {
    return registry_.lookup(JobKey{clientId, searchId});
}

bool Engine::cancel(const std::string& clientId, const std::string& searchId) {
    const JobKey key{clientId, searchId};

    if (!registry_.withdraw(key)) {
        LOG_WARN("Cannot cancel job " + key.id() + ": not pending (already started or unknown)");
        return false;
    }
    if (pool_) {
        pool_->withdraw(key);
    }
    LOG_INFO("Job cancelled: " + key.id());
    return true;
}

std::vector<JobSnapshot> Engine::recentCompleted(std::size_t limit) const {
    return registry_.recent(limit);
}

PoolStats Engine::poolStats() const {
    auto registryStats = registry_.stats();

    PoolStats stats;
    stats.runningCount = registryStats.runningCount;
    stats.completedCount = registryStats.completedCount;
    stats.capacity = registryStats.historyCapacity;
    stats.maxWorkers = pool_ ? pool_->workerCount() : config_.maxWorkers;
    stats.queuedCount = pool_ ? pool_->queueSize() : 0;
    stats.runningIds = std::move(registryStats.runningIds);
    stats.completedIds = std::move(registryStats.completedIds);
    return stats;
}

void Engine::runJob(const JobKey& key, int workerId) {
    auto job = registry_.claim(key, workerId);
    if (!job) {
        LOG_DEBUG("Job withdrawn before pickup: " + key.id());
        return;
    }

    LOG_INFO(workerName(workerId) + " claimed job: " + key.id());
    (void)processor_->process(*job);
    registry_.complete(key);
}

}
