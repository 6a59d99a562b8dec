/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "gleaner/history.hpp"
#include "gleaner/job.hpp"

namespace gleaner {

struct RegistryStats {
    std::size_t runningCount = 0;
    std::size_t completedCount = 0;
    std::size_t historyCapacity = 0;
    std::vector<JobId> runningIds;
    std::vector<JobId> completedIds;   // completion order, oldest first
};

/**
 * Running jobs plus the completed-job history, under a single lock.
 *
 * A job is "running" from admission until its worker hands it over with
 * complete(), which moves it into the history inside the same critical
 * section so that a lookup always finds it in one of the two places.
 * Critical sections only touch the maps; no page work happens under the lock.
 */
class Registry {
public:
    explicit Registry(std::size_t historyCapacity = kDefaultHistoryCapacity);

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    struct Admission {
        std::shared_ptr<Job> job;
        bool created = false;
    };

    // Existing running job for the key, or a new Pending one.
    [[nodiscard]] Admission admit(const JobKey& key, const std::string& sourceUrl);

    // Hands a Pending job to a worker. nullptr if it was withdrawn meanwhile.
    [[nodiscard]] std::shared_ptr<Job> claim(const JobKey& key, int workerId);

    // Removes a job that no worker has claimed yet.
    [[nodiscard]] bool withdraw(const JobKey& key);
    // Withdraws every unclaimed job. Returns their keys.
    std::vector<JobKey> withdrawPending();

    void complete(const JobKey& key);

    [[nodiscard]] std::optional<JobSnapshot> lookup(const JobKey& key) const;
    [[nodiscard]] std::vector<JobSnapshot> recent(std::size_t limit) const;
    [[nodiscard]] RegistryStats stats() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<JobKey, std::shared_ptr<Job>, JobKeyHash> running_;
    HistoryCache history_;
};

}
