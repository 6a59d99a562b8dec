/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gleaner/types.hpp"

namespace gleaner {

const char* toString(Status status) noexcept {
    switch (status) {
        case Status::Pending:         return "pending";
        case Status::CollectingInfo:  return "collecting_info";
        case Status::CollectedInfo:   return "collected_info";
        case Status::SearchingPapers: return "searching_papers";
        case Status::Completed:       return "completed";
        case Status::Error:           return "error";
        default: return "unknown";
    }
}

const char* toString(VenueType type) noexcept {
    switch (type) {
        case VenueType::Journal:    return "Journal";
        case VenueType::Conference: return "Conference";
        case VenueType::Preprint:   return "Preprint";
        default: return "Unknown";
    }
}

const char* toString(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::Progress:  return "update_fetch_process";
        case EventKind::Completed: return "fetched_completed";
        case EventKind::Failed:    return "failed_fetch";
        default: return "unknown";
    }
}

}
