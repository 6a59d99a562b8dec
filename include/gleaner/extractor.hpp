/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "gleaner/config.hpp"
#include "gleaner/parse.hpp"
#include "gleaner/record.hpp"
#include "gleaner/session.hpp"

namespace gleaner {

// One strategy for one field. Returns std::nullopt to defer to the next one.
template <typename T>
using FieldExtractor = std::function<std::optional<T>(PageSession&)>;

template <typename T>
using FieldChain = std::vector<FieldExtractor<T>>;

// Value of the first strategy that yields one. A strategy that throws counts
// as yielding nothing.
template <typename T>
[[nodiscard]] std::optional<T> firstPresent(const FieldChain<T>& chain, PageSession& session) {
    for (const auto& extractor : chain) {
        try {
            if (auto value = extractor(session)) {
                return value;
            }
        } catch (const std::exception&) {
            continue;
        }
    }
    return std::nullopt;
}

/**
 * Reads subject pages and item pages through a PageSession.
 *
 * Discovery operations run against the subject page (the source URL), the
 * record operation against one item page the caller has already navigated to.
 * Nothing here navigates on its own.
 */
class Extractor {
public:
    explicit Extractor(const EngineConfig& config);

    [[nodiscard]] std::optional<std::string> resolveSubject(PageSession& session) const;

    // Best effort; failures are logged and ignored.
    void sortByYear(PageSession& session) const noexcept;
    // Clicks "show more" until no new rows appear. Returns the click count.
    int loadAll(PageSession& session) const noexcept;

    // Absolute item URLs in page order, without duplicates.
    [[nodiscard]] std::vector<std::string> discoverItemUrls(PageSession& session) const;

    // std::nullopt when no title could be extracted.
    [[nodiscard]] std::optional<Record> extractRecord(PageSession& session,
                                                      const std::string& itemUrl) const noexcept;

private:
    std::chrono::milliseconds waitTimeout_;
    std::chrono::milliseconds clickDelay_;
    int maxShowMoreClicks_;

    FieldChain<std::string> subjectChain_;
    FieldChain<std::string> titleChain_;
    FieldChain<std::vector<std::string>> authorsChain_;
    FieldChain<parse::DateInfo> dateChain_;
    FieldChain<std::string> artifactChain_;
    FieldChain<int> citationChain_;
    FieldChain<parse::VenueInfo> venueChain_;
    FieldChain<std::string> summaryChain_;
};

}
