/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gleaner/history.hpp"
#include "gleaner/logger.hpp"
#include <algorithm>

namespace gleaner {

HistoryCache::HistoryCache(std::size_t capacity) noexcept : capacity_(capacity) {}

std::vector<JobKey> HistoryCache::insert(JobSnapshot snapshot) {
    JobKey key = snapshot.key;

    auto existing = std::find(order_.begin(), order_.end(), key);
    if (existing != order_.end()) {
        order_.erase(existing);
    }
    order_.push_back(key);
    entries_[key] = std::move(snapshot);

    std::vector<JobKey> evicted;
    while (order_.size() > capacity_) {
        JobKey oldest = order_.front();
        order_.pop_front();
        entries_.erase(oldest);
        LOG_DEBUG("Evicted completed job from history: " + oldest.id());
        evicted.push_back(std::move(oldest));
    }
    return evicted;
}

std::optional<JobSnapshot> HistoryCache::find(const JobKey& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool HistoryCache::contains(const JobKey& key) const noexcept {
    return entries_.find(key) != entries_.end();
}

std::vector<JobSnapshot> HistoryCache::recent(std::size_t limit) const {
    std::vector<JobSnapshot> result;
    result.reserve(std::min(limit, order_.size()));
    for (auto it = order_.rbegin(); it != order_.rend() && result.size() < limit; ++it) {
        result.push_back(entries_.at(*it));
    }
    return result;
}

std::vector<JobKey> HistoryCache::order() const {
    return {order_.begin(), order_.end()};
}

}
