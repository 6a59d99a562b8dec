/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gleaner/pool.hpp"
#include "gleaner/logger.hpp"
#include <algorithm>

namespace gleaner {

Pool::Pool(int workers) noexcept : workers_(std::max(1, workers)) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(JobProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid job processor provided");
        return false;
    }

    processor_ = processor;
    running_.store(true);
    shutdown_.store(false);
    drain_.store(false);

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
        
        LOG_INFO("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop(bool drain) noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_DEBUG(std::string("Stopping pool") + (drain ? " after draining queue..." : "..."));

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        drain_.store(drain);
        shutdown_.store(true);
    }
    jobAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();

    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        dropped = jobQueue_.size();
        jobQueue_.clear();
    }
    if (dropped > 0) {
        LOG_INFO("Discarded " + std::to_string(dropped) + " queued job(s)");
    }
    
    LOG_INFO("Pool stopped");
}

bool Pool::submit(const JobKey& key) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_DEBUG("Cannot submit job to stopped pool: " + key.id());
        return false;
    }

    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            jobQueue_.push_back(key);
        }
        
        jobAvailable_.notify_one();
        LOG_DEBUG("Job queued: " + key.id());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue job " + key.id() + ": " + e.what());
        return false;
    }
}

bool Pool::withdraw(const JobKey& key) noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    auto it = std::find(jobQueue_.begin(), jobQueue_.end(), key);
    if (it == jobQueue_.end()) {
        return false;
    }
    jobQueue_.erase(it);
    LOG_DEBUG("Job withdrawn from queue: " + key.id());
    return true;
}

std::size_t Pool::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return jobQueue_.size();
}

void Pool::workerLoop(int workerId) {
    const std::string name = workerName(workerId);
    setThreadName(name);
    LOG_DEBUG(name + " thread started");
    
    try {
        while (true) {
            JobKey key;
            
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                
                jobAvailable_.wait(lock, [this] { 
                    return !jobQueue_.empty() || shutdown_.load(); 
                });
                
                if (shutdown_.load() && (!drain_.load() || jobQueue_.empty())) {
                    break;
                }
                
                key = std::move(jobQueue_.front());
                jobQueue_.pop_front();
            }
            
            // Process job outside of lock
            try {
                processor_(key, workerId);
            } catch (const std::exception& e) {
                LOG_ERROR(name + " job processing error: " + 
                         std::string(e.what()) + " (job: " + key.id() + ")");
            } catch (...) {
                LOG_ERROR(name + " unknown job processing error (job: " + key.id() + ")");
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR(name + " fatal error: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR(name + " unknown fatal error");
    }
    
    LOG_DEBUG(name + " stopped");
    clearThreadName();
}

}
