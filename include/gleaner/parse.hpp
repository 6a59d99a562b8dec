/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "gleaner/types.hpp"

// Pure text parsers used by the extraction pipeline. None of them throw.
namespace gleaner::parse {

constexpr int kMinYear = 1900;
constexpr int kMaxYear = 2030;
constexpr std::size_t kMaxAuthors = 10;
constexpr std::size_t kMinSummaryChars = 20;
constexpr std::size_t kMaxSummaryChars = 500;
constexpr std::size_t kMinTitleChars = 5;

struct DateInfo {
    int year = 0;
    std::string date;   // YYYY-MM-DD, empty when nothing was recognised
};

struct VenueInfo {
    std::string venue;
    VenueType type = VenueType::Unknown;
};

[[nodiscard]] std::string trim(const std::string& text);
[[nodiscard]] std::string toLower(std::string text);

// Full dates in YYYY/MM/DD, YYYY-MM-DD, MM/DD/YYYY or MM-DD-YYYY form are
// normalised to YYYY-MM-DD. Otherwise a bare year in [1900, 2030] yields
// YYYY-01-01. Otherwise year 0 and an empty date.
[[nodiscard]] DateInfo parseDate(const std::string& text) noexcept;

// Date used on a record when no date was extracted.
[[nodiscard]] std::string defaultDate(int year);

[[nodiscard]] std::vector<std::string> parseAuthors(const std::string& text) noexcept;

// "Cited by N" wins over "N citations", which wins over the first integer.
[[nodiscard]] std::optional<int> parseCitations(const std::string& text) noexcept;

[[nodiscard]] VenueType classifyVenue(const std::string& text) noexcept;
[[nodiscard]] std::optional<VenueInfo> parseVenue(const std::string& text) noexcept;

[[nodiscard]] std::optional<std::string> parseSummary(const std::string& text) noexcept;
[[nodiscard]] std::optional<std::string> parseTitle(const std::string& text) noexcept;

[[nodiscard]] bool isArtifactLink(const std::string& href) noexcept;

// Subject name from a "<name> - <site>" page title.
[[nodiscard]] std::optional<std::string> subjectFromTitle(const std::string& pageTitle) noexcept;

}
