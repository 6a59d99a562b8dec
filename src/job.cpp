/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gleaner/job.hpp"
#include "gleaner/logger.hpp"
#include <algorithm>
#include <cmath>

namespace gleaner {

double searchProgress(std::size_t index, std::size_t total) noexcept {
    if (total == 0) {
        return kCollectedProgress;
    }
    double fraction = static_cast<double>(index + 1) / static_cast<double>(total);
    double span = std::round(std::min(fraction, 1.0) * kSearchProgressSpan * 100.0) / 100.0;
    return kCollectedProgress + span;
}

Job::Job(JobKey key, std::string sourceUrl)
    : key_(std::move(key)), id_(key_.id()), sourceUrl_(std::move(sourceUrl)) {
    state_.key = key_;
    state_.id = id_;
    state_.sourceUrl = sourceUrl_;
    state_.startTime = std::chrono::system_clock::now();
}

JobSnapshot Job::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

Status Job::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.status;
}

std::vector<std::string> Job::itemUrls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.itemUrls;
}

bool Job::claim(int workerId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.status != Status::Pending) {
        return false;
    }
    state_.status = Status::CollectingInfo;
    state_.workerId = workerId;
    return true;
}

void Job::setSubject(const std::string& subjectName) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!isWritable("setSubject")) return;
    state_.subjectName = subjectName;
}

void Job::setItemUrls(std::vector<std::string> urls) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!isWritable("setItemUrls")) return;
    if (state_.totalCount) {
        LOG_WARN("Item URLs already discovered for job " + id_ + ", ignoring new list");
        return;
    }
    state_.totalCount = urls.size();
    state_.fetchedCount = 0;
    state_.itemUrls = std::move(urls);
    state_.status = Status::CollectedInfo;
    advanceProgress(kCollectedProgress);
}

void Job::beginSearch() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!isWritable("beginSearch")) return;
    state_.status = Status::SearchingPapers;
}

void Job::beginItem(std::size_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!isWritable("beginItem")) return;
    if (index >= state_.itemUrls.size()) {
        LOG_WARN("Item index " + std::to_string(index) + " out of range for job " + id_);
        return;
    }
    state_.fetchedCount = index + 1;
    advanceProgress(searchProgress(index, state_.itemUrls.size()));
}

void Job::addRecord(Record record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!isWritable("addRecord")) return;
    if (state_.items.size() + state_.skippedCount >= state_.itemUrls.size()) {
        LOG_WARN("More records than item URLs for job " + id_ + ", dropping record");
        return;
    }
    state_.items.push_back(std::move(record));
}

void Job::skipItem() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!isWritable("skipItem")) return;
    ++state_.skippedCount;
}

void Job::complete() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!isWritable("complete")) return;
    state_.status = Status::Completed;
    state_.progress = kCompletedProgress;
    state_.completedTime = std::chrono::system_clock::now();
}

void Job::fail(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!isWritable("fail")) return;
    state_.status = Status::Error;
    state_.errorMessage = message.empty() ? std::string("unknown error") : message;
    state_.completedTime = std::chrono::system_clock::now();
}

bool Job::isWritable(const char* operation) const {
    if (isTerminal(state_.status)) {
        LOG_WARN(std::string(operation) + " ignored: job " + id_ + " is already " +
                 toString(state_.status));
        return false;
    }
    return true;
}

// Completion is the only path to 100.
void Job::advanceProgress(double progress) noexcept {
    progress = std::min(progress, kCollectedProgress + kSearchProgressSpan);
    state_.progress = std::max(state_.progress, progress);
}

}
