/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <optional>
#include <string>
#include <vector>

#include "gleaner/types.hpp"

namespace gleaner {

// Metadata extracted from one discovered item page. Never mutated once built.
struct Record {
    std::string title;
    std::vector<std::string> authors;
    int year = 0;                    // 0 when unknown
    std::string publicationDate;     // YYYY-MM-DD
    std::string sourceUrl;
    std::optional<std::string> artifactUrl;
    int citationCount = 0;
    std::optional<std::string> venue;
    VenueType venueType = VenueType::Unknown;
    std::optional<std::string> summary;
};

}
