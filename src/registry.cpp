/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gleaner/registry.hpp"
#include "gleaner/logger.hpp"
#include <algorithm>

namespace gleaner {

Registry::Registry(std::size_t historyCapacity) : history_(historyCapacity) {}

Registry::Admission Registry::admit(const JobKey& key, const std::string& sourceUrl) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = running_.find(key);
    if (it != running_.end()) {
        return {it->second, false};
    }

    auto job = std::make_shared<Job>(key, sourceUrl);
    running_.emplace(key, job);
    return {std::move(job), true};
}

std::shared_ptr<Job> Registry::claim(const JobKey& key, int workerId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = running_.find(key);
    if (it == running_.end()) {
        return nullptr;
    }
    if (!it->second->claim(workerId)) {
        LOG_WARN("Job already claimed: " + key.id());
        return nullptr;
    }
    return it->second;
}

bool Registry::withdraw(const JobKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = running_.find(key);
    if (it == running_.end() || it->second->status() != Status::Pending) {
        return false;
    }
    running_.erase(it);
    return true;
}

std::vector<JobKey> Registry::withdrawPending() {
    std::vector<JobKey> withdrawn;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = running_.begin(); it != running_.end();) {
        if (it->second->status() == Status::Pending) {
            withdrawn.push_back(it->first);
            it = running_.erase(it);
        } else {
            ++it;
        }
    }
    return withdrawn;
}

void Registry::complete(const JobKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = running_.find(key);
    if (it == running_.end()) {
        LOG_WARN("Completed job is not in the running set: " + key.id());
        return;
    }
    auto snapshot = it->second->snapshot();
    running_.erase(it);
    history_.insert(std::move(snapshot));
    LOG_DEBUG("Job moved to history: " + key.id() + " (" + std::to_string(history_.size()) + " kept)");
}

std::optional<JobSnapshot> Registry::lookup(const JobKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = running_.find(key);
    if (it != running_.end()) {
        return it->second->snapshot();
    }
    return history_.find(key);
}

std::vector<JobSnapshot> Registry::recent(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.recent(limit);
}

RegistryStats Registry::stats() const {
    RegistryStats stats;
    std::lock_guard<std::mutex> lock(mutex_);
    stats.runningCount = running_.size();
    stats.completedCount = history_.size();
    stats.historyCapacity = history_.capacity();
    stats.runningIds.reserve(running_.size());
    for (const auto& entry : running_) {
        stats.runningIds.push_back(entry.first.id());
    }
    std::sort(stats.runningIds.begin(), stats.runningIds.end());
    for (const auto& key : history_.order()) {
        stats.completedIds.push_back(key.id());
    }
    return stats;
}

}
