/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "gleaner/record.hpp"
#include "gleaner/types.hpp"

namespace gleaner {

constexpr double kCollectedProgress = 25.0;
constexpr double kSearchProgressSpan = 70.0;
constexpr double kCompletedProgress = 100.0;

// Point-in-time copy of a job. Safe to hand to other threads.
struct JobSnapshot {
    JobKey key;
    JobId id;
    std::string sourceUrl;
    std::string subjectName;
    Status status = Status::Pending;
    double progress = 0.0;
    std::optional<std::size_t> fetchedCount;
    std::optional<std::size_t> totalCount;
    std::size_t skippedCount = 0;
    std::vector<std::string> itemUrls;
    std::vector<Record> items;
    std::optional<std::string> errorMessage;
    std::chrono::system_clock::time_point startTime;
    std::optional<std::chrono::system_clock::time_point> completedTime;
    int workerId = -1;
};

// Progress after processing item index (0-based) of total, rounded to 2 decimals.
[[nodiscard]] double searchProgress(std::size_t index, std::size_t total) noexcept;

/**
 * Live state of one scrape job.
 *
 * Written only by the worker that claimed it; other threads read it through
 * snapshot(). Once Completed or Error, every mutator is a logged no-op, and
 * progress never moves backwards.
 */
class Job {
public:
    Job(JobKey key, std::string sourceUrl);

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;
    Job(Job&&) = delete;
    Job& operator=(Job&&) = delete;

    [[nodiscard]] const JobKey& key() const noexcept { return key_; }
    [[nodiscard]] const JobId& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& sourceUrl() const noexcept { return sourceUrl_; }

    [[nodiscard]] JobSnapshot snapshot() const;
    [[nodiscard]] Status status() const;
    [[nodiscard]] std::vector<std::string> itemUrls() const;

    // Pending -> CollectingInfo. False if the job was already claimed.
    [[nodiscard]] bool claim(int workerId);
    void setSubject(const std::string& subjectName);
    // CollectingInfo -> CollectedInfo. The URL list is fixed from here on.
    void setItemUrls(std::vector<std::string> urls);
    void beginSearch();
    void beginItem(std::size_t index);
    void addRecord(Record record);
    void skipItem();
    void complete();
    void fail(const std::string& message);

private:
    [[nodiscard]] bool isWritable(const char* operation) const;
    void advanceProgress(double progress) noexcept;

    const JobKey key_;
    const JobId id_;
    const std::string sourceUrl_;

    mutable std::mutex mutex_;
    JobSnapshot state_;
};

}
