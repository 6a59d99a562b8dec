/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gleaner/processor.hpp"
#include "gleaner/errors.hpp"
#include "gleaner/logger.hpp"
#include <chrono>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace {

// Raised at an item boundary once the engine is shutting down without waiting.
class Abandoned : public std::runtime_error {
public:
    Abandoned() : std::runtime_error("engine shutting down") {}
};

void pause(std::chrono::milliseconds delay) {
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
}

std::string seconds(std::chrono::steady_clock::time_point since) {
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - since).count();
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << elapsed << "s";
    return out.str();
}

}

namespace gleaner {

Processor::Processor(const EngineConfig& config, SessionFactory& sessions,
                     ProgressPublisher& publisher, const std::atomic<bool>& abandon)
    : config_(config), extractor_(config), sessions_(sessions),
      publisher_(publisher), abandon_(abandon) {}

ProcessResult Processor::process(Job& job) noexcept {
    const auto startTime = std::chrono::steady_clock::now();
    LOG_INFO("Processing job " + job.id() + ": " + job.sourceUrl());
    publish(EventKind::Progress, job);

    std::optional<std::string> failure;
    try {
        auto opened = sessions_.open();
        if (!opened) {
            throw SessionInitError("factory returned no session");
        }
        ScopedSession session(std::move(opened));
        collectInfo(job, *session);
        searchItems(job, *session);
    } catch (const SessionInitError& e) {
        failure = "session initialisation failed: " + std::string(e.what());
    } catch (const DiscoveryError& e) {
        failure = e.what();
    } catch (const Abandoned& e) {
        failure = e.what();
    } catch (const std::exception& e) {
        failure = "internal error: " + std::string(e.what());
    } catch (...) {
        failure = "unknown internal error";
    }
    // The session is closed at this point on every path.

    if (failure) {
        job.fail(*failure);
        LOG_WARN("JOB FAILED: " + job.id() + " after " + seconds(startTime) + " - " + *failure);
        publish(EventKind::Failed, job);
        return ProcessResult::Failed;
    }

    job.complete();
    const auto snapshot = job.snapshot();
    LOG_INFO("JOB COMPLETED: " + job.id() + " -> " + std::to_string(snapshot.items.size()) +
             "/" + std::to_string(snapshot.itemUrls.size()) + " records in " + seconds(startTime));
    publish(EventKind::Completed, job);
    return ProcessResult::Completed;
}

void Processor::collectInfo(Job& job, PageSession& session) {
    LOG_DEBUG("Collecting info for job " + job.id());

    if (!session.navigate(job.sourceUrl())) {
        throw DiscoveryError("failed to load source page: " + job.sourceUrl());
    }
    pause(config_.pageSettleDelay);

    auto subject = extractor_.resolveSubject(session);
    if (!subject) {
        throw DiscoveryError("could not resolve subject name from " + job.sourceUrl());
    }
    job.setSubject(*subject);
    publish(EventKind::Progress, job);

    extractor_.sortByYear(session);
    extractor_.loadAll(session);

    auto urls = extractor_.discoverItemUrls(session);
    if (urls.empty()) {
        throw DiscoveryError("no item URLs found for " + *subject);
    }
    LOG_INFO("Job " + job.id() + ": " + *subject + " has " + std::to_string(urls.size()) + " items");
    job.setItemUrls(std::move(urls));
    publish(EventKind::Progress, job);
}

void Processor::searchItems(Job& job, PageSession& session) {
    checkAbandoned();
    job.beginSearch();

    const auto urls = job.itemUrls();
    for (std::size_t i = 0; i < urls.size(); ++i) {
        checkAbandoned();
        job.beginItem(i);
        LOG_DEBUG("Job " + job.id() + ": item " + std::to_string(i + 1) + "/" +
                  std::to_string(urls.size()));

        std::optional<Record> record;
        try {
            if (session.navigate(urls[i])) {
                pause(config_.itemDelay);
                record = extractor_.extractRecord(session, urls[i]);
            } else {
                LOG_WARN("Failed to load item page: " + urls[i]);
            }
        } catch (const std::exception& e) {
            LOG_WARN("Item page error for " + urls[i] + ": " + e.what());
        }

        if (record) {
            LOG_DEBUG("Extracted: " + record->title.substr(0, 50));
            job.addRecord(std::move(*record));
        } else {
            LOG_WARN("Skipping item without extractable record: " + urls[i]);
            job.skipItem();
        }
        publish(EventKind::Progress, job);
    }
}

void Processor::publish(EventKind kind, const Job& job) noexcept {
    bool delivered = false;
    try {
        delivered = publisher_.publish(kind, job.snapshot(), job.key().clientId);
    } catch (const std::exception& e) {
        LOG_WARN("Publisher raised for job " + job.id() + ": " + e.what());
    }
    if (!delivered) {
        LOG_WARN(std::string("Failed to publish ") + toString(kind) + " for job " + job.id() +
                 " to client " + job.key().clientId);
    }
}

void Processor::checkAbandoned() const {
    if (abandon_.load()) {
        throw Abandoned();
    }
}

}
