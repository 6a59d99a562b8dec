/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace gleaner {

// Scrape job lifecycle states. Completed and Error are terminal.
enum class Status : std::uint8_t {
    Pending,
    CollectingInfo,
    CollectedInfo,
    SearchingPapers,
    Completed,
    Error
};

enum class VenueType : std::uint8_t { Unknown, Journal, Conference, Preprint };

// Kind of push event sent to the submitting client.
enum class EventKind : std::uint8_t { Progress, Completed, Failed };

// "<client>_<search>" display form of a job identity. Not unique on its own
// since either part may contain '_'; key containers by JobKey.
using JobId = std::string;

struct JobKey {
    std::string clientId;
    std::string searchId;

    [[nodiscard]] JobId id() const { return clientId + "_" + searchId; }

    bool operator==(const JobKey& other) const noexcept {
        return clientId == other.clientId && searchId == other.searchId;
    }
    bool operator!=(const JobKey& other) const noexcept { return !(*this == other); }
};

struct JobKeyHash {
    std::size_t operator()(const JobKey& key) const noexcept {
        std::size_t seed = std::hash<std::string>{}(key.clientId);
        seed ^= std::hash<std::string>{}(key.searchId) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        return seed;
    }
};

[[nodiscard]] const char* toString(Status status) noexcept;
[[nodiscard]] const char* toString(VenueType type) noexcept;
[[nodiscard]] const char* toString(EventKind kind) noexcept;

[[nodiscard]] inline bool isTerminal(Status status) noexcept {
    return status == Status::Completed || status == Status::Error;
}

}
