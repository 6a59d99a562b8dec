/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <deque>
#include <optional>
#include <unordered_map>
#include <vector>

#include "gleaner/job.hpp"

namespace gleaner {

constexpr std::size_t kDefaultHistoryCapacity = 20;

// Completed jobs, evicted oldest-completion first once over capacity.
// Not synchronised; the owning Registry serialises access.
class HistoryCache {
public:
    explicit HistoryCache(std::size_t capacity = kDefaultHistoryCapacity) noexcept;

    // Re-inserting a key moves it to the most recent position.
    // Returns the keys evicted to stay within capacity.
    std::vector<JobKey> insert(JobSnapshot snapshot);

    [[nodiscard]] std::optional<JobSnapshot> find(const JobKey& key) const;
    [[nodiscard]] bool contains(const JobKey& key) const noexcept;

    // Most recently completed first.
    [[nodiscard]] std::vector<JobSnapshot> recent(std::size_t limit) const;
    // Oldest first.
    [[nodiscard]] std::vector<JobKey> order() const;

    [[nodiscard]] std::size_t size() const noexcept { return order_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    std::size_t capacity_;
    std::unordered_map<JobKey, JobSnapshot, JobKeyHash> entries_;
    std::deque<JobKey> order_;
};

}
