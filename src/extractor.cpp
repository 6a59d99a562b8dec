/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gleaner/extractor.hpp"
#include "gleaner/logger.hpp"
#include <algorithm>
#include <thread>

namespace gleaner {

namespace {

const std::vector<std::string> kSubjectSelectors = {
    "#gsc_prf_in", ".gsc_prf_in", "h1", ".gs_ai_name"};

const std::vector<std::string> kSortSelectors = {
    "#gsc_a_ha", "button[aria-label*='Sort']", ".gsc_a_ha"};

const std::vector<std::string> kYearSortSelectors = {
    "//button[contains(text(), 'Year')]",
    "//a[contains(text(), 'Year')]",
    "//option[contains(text(), 'Year')]"};

const std::vector<std::string> kShowMoreSelectors = {
    "#gsc_bpf_more",
    "button[onclick*='more']",
    ".gsc_bpf_more",
    "//button[contains(text(), 'Show more')]",
    "//button[contains(text(), 'SHOW MORE')]",
    "//a[contains(text(), 'Show more')]"};

const std::vector<std::string> kRowSelectors = {
    ".gsc_a_tr", "tr.gsc_a_tr", ".gs_r.gs_or.gs_scl", ".gsc_a_t"};

const std::vector<std::string> kRowLinkSelectors = {"a.gsc_a_at", "a", ".gsc_a_at"};

const std::vector<std::string> kTitleSelectors = {
    ".gs_rt h3 a", ".gs_rt a", "h1", ".citation_title", "title"};

const std::vector<std::string> kAuthorSelectors = {
    ".gs_a", ".citation_author", ".authors", ".author"};

const std::vector<std::string> kDateSelectors = {
    ".gs_a", ".citation_date", ".year", ".date"};

const std::vector<std::string> kArtifactSelectors = {
    "a[href*='.pdf']", ".gs_or_ggsm a", ".citation_pdf_url",
    "a[href*='doi.org']", "a[href*='arxiv.org']"};

const std::vector<std::string> kCitationSelectors = {
    ".gs_fl a[href*='cites']", ".citation_count", "a[href*='cited']"};

const std::vector<std::string> kSummarySelectors = {
    ".gs_rs", ".citation_abstract", ".abstract", ".description"};

// The byline selector mixes authors, venue and host: "A, B - Venue, 2020 - host"
const std::string kBylineSelector = ".gs_a";
const std::vector<std::string> kVenueSelectors = {
    ".citation_venue", ".journal", ".conference"};

void pause(std::chrono::milliseconds delay) {
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
}

// Strategy reading one selector's text through a parser.
template <typename T, typename Parser>
FieldExtractor<T> textOf(const std::string& selector, Parser parser) {
    return [selector, parser](PageSession& session) -> std::optional<T> {
        auto element = session.find(selector);
        if (!element) {
            return std::nullopt;
        }
        return parser(element->text);
    };
}

template <typename T, typename Parser>
void appendAll(FieldChain<T>& chain, const std::vector<std::string>& selectors, Parser parser) {
    for (const auto& selector : selectors) {
        chain.push_back(textOf<T>(selector, parser));
    }
}

std::optional<std::string> nonEmptyText(const std::string& text) {
    std::string value = parse::trim(text);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

}

Extractor::Extractor(const EngineConfig& config)
    : waitTimeout_(std::max(config.waitTimeout, std::chrono::milliseconds::zero())),
      clickDelay_(config.clickDelay),
      maxShowMoreClicks_(config.maxShowMoreClicks) {
    appendAll(subjectChain_, kSubjectSelectors, nonEmptyText);
    subjectChain_.push_back([](PageSession& session) {
        return parse::subjectFromTitle(session.title());
    });

    appendAll(titleChain_, kTitleSelectors, parse::parseTitle);

    appendAll(authorsChain_, kAuthorSelectors,
        [](const std::string& text) -> std::optional<std::vector<std::string>> {
            auto authors = parse::parseAuthors(text);
            if (authors.empty()) {
                return std::nullopt;
            }
            return authors;
        });

    appendAll(dateChain_, kDateSelectors,
        [](const std::string& text) -> std::optional<parse::DateInfo> {
            auto info = parse::parseDate(text);
            if (info.year == 0) {
                return std::nullopt;
            }
            return info;
        });

    for (const auto& selector : kArtifactSelectors) {
        artifactChain_.push_back([selector](PageSession& session) -> std::optional<std::string> {
            for (const auto& link : session.findAll(selector)) {
                auto href = session.attribute(link, "href");
                if (href && parse::isArtifactLink(*href)) {
                    return href;
                }
            }
            return std::nullopt;
        });
    }

    appendAll(citationChain_, kCitationSelectors, parse::parseCitations);

    venueChain_.push_back(textOf<parse::VenueInfo>(kBylineSelector,
        [](const std::string& text) -> std::optional<parse::VenueInfo> {
            // Without a separator the byline is only an author list
            if (text.find(" - ") == std::string::npos) {
                return std::nullopt;
            }
            return parse::parseVenue(text);
        }));
    appendAll(venueChain_, kVenueSelectors, parse::parseVenue);

    appendAll(summaryChain_, kSummarySelectors, parse::parseSummary);
}

std::optional<std::string> Extractor::resolveSubject(PageSession& session) const {
    try {
        bool ready = session.waitUntil([&session] {
            return session.findFirst(kSubjectSelectors).has_value() ||
                   !session.findAllFirst(kRowSelectors).empty();
        }, waitTimeout_);
        if (!ready) {
            LOG_DEBUG("Subject page did not settle within timeout, reading it anyway");
        }
    } catch (const std::exception& e) {
        LOG_WARN("Waiting for subject page failed: " + std::string(e.what()));
    }

    auto subject = firstPresent(subjectChain_, session);
    if (subject) {
        LOG_DEBUG("Resolved subject: " + *subject);
    }
    return subject;
}

void Extractor::sortByYear(PageSession& session) const noexcept {
    try {
        auto sortButton = session.findFirst(kSortSelectors);
        if (!sortButton) {
            LOG_DEBUG("No sort control found, keeping default order");
            return;
        }
        if (!session.click(*sortButton)) {
            LOG_WARN("Sort control could not be clicked, keeping default order");
            return;
        }
        pause(clickDelay_);

        auto yearOption = session.findFirst(kYearSortSelectors);
        if (yearOption && session.click(*yearOption)) {
            pause(clickDelay_);
            LOG_DEBUG("Items sorted by year");
        }
    } catch (const std::exception& e) {
        LOG_WARN("Sort by year failed, keeping default order: " + std::string(e.what()));
    }
}

int Extractor::loadAll(PageSession& session) const noexcept {
    int clicks = 0;
    try {
        while (clicks < maxShowMoreClicks_) {
            auto button = session.findFirst(kShowMoreSelectors);
            if (!button) {
                break;
            }

            const std::size_t before = session.findAllFirst(kRowSelectors).size();
            if (!session.click(*button)) {
                LOG_DEBUG("Show-more control not clickable, stopping");
                break;
            }
            ++clicks;
            LOG_TRACE("Clicked show-more (" + std::to_string(clicks) + ")");

            bool grew = session.waitUntil([&session, before] {
                return session.findAllFirst(kRowSelectors).size() > before;
            }, waitTimeout_);
            if (!grew) {
                break;
            }
            pause(clickDelay_);
        }
    } catch (const std::exception& e) {
        LOG_WARN("Loading more items failed: " + std::string(e.what()));
    }
    LOG_DEBUG("Show-more clicked " + std::to_string(clicks) + " times");
    return clicks;
}

std::vector<std::string> Extractor::discoverItemUrls(PageSession& session) const {
    std::vector<std::string> urls;
    std::vector<Element> rows;
    try {
        rows = session.findAllFirst(kRowSelectors);
    } catch (const std::exception& e) {
        LOG_WARN("Listing item rows failed: " + std::string(e.what()));
        return urls;
    }

    for (const auto& row : rows) {
        try {
            for (const auto& selector : kRowLinkSelectors) {
                auto link = session.findWithin(row, selector);
                if (!link) {
                    continue;
                }
                auto href = session.attribute(*link, "href");
                if (!href || href->rfind("http", 0) != 0) {
                    continue;
                }
                if (std::find(urls.begin(), urls.end(), *href) == urls.end()) {
                    urls.push_back(*href);
                }
                break;
            }
        } catch (const std::exception& e) {
            LOG_WARN("Skipping unreadable item row: " + std::string(e.what()));
        }
    }
    LOG_DEBUG("Discovered " + std::to_string(urls.size()) + " item URLs");
    return urls;
}

std::optional<Record> Extractor::extractRecord(PageSession& session,
                                               const std::string& itemUrl) const noexcept {
    try {
        auto title = firstPresent(titleChain_, session);
        if (!title) {
            LOG_DEBUG("No title on item page, discarding: " + itemUrl);
            return std::nullopt;
        }

        Record record;
        record.title = std::move(*title);
        record.sourceUrl = itemUrl;

        if (auto authors = firstPresent(authorsChain_, session)) {
            record.authors = std::move(*authors);
        }
        if (auto date = firstPresent(dateChain_, session)) {
            record.year = date->year;
            record.publicationDate = date->date;
        }
        if (record.publicationDate.empty()) {
            record.publicationDate = parse::defaultDate(record.year);
        }
        record.artifactUrl = firstPresent(artifactChain_, session);
        if (auto citations = firstPresent(citationChain_, session)) {
            record.citationCount = *citations;
        }
        if (auto venue = firstPresent(venueChain_, session)) {
            record.venue = venue->venue;
            record.venueType = venue->type;
        }
        record.summary = firstPresent(summaryChain_, session);

        return record;
    } catch (const std::exception& e) {
        LOG_WARN("Extraction failed for " + itemUrl + ": " + e.what());
        return std::nullopt;
    }
}

}
