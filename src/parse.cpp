/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "gleaner/parse.hpp"
#include "gleaner/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <limits>
#include <regex>

namespace gleaner::parse {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool allDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), isDigit);
}

std::string formatDate(int year, int month, int day) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

bool validMonthDay(int month, int day) {
    return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

std::string collapseSpaces(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (char c : text) {
        if (isSpace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(c);
    }
    return out;
}

// Letters (including any UTF-8 multibyte sequence), spaces, '-', '.', '\''.
std::string stripAuthorNoise(const std::string& token) {
    static const std::string kEllipsis = "\xE2\x80\xA6";
    std::string text = token;
    for (auto pos = text.find(kEllipsis); pos != std::string::npos; pos = text.find(kEllipsis)) {
        text.erase(pos, kEllipsis.size());
    }

    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        auto uc = static_cast<unsigned char>(c);
        if (uc >= 0x80 || std::isalpha(uc) || isSpace(c) || c == '-' || c == '.' || c == '\'') {
            out.push_back(c);
        }
    }
    return trim(collapseSpaces(out));
}

// Code points, counting each UTF-8 lead or ASCII byte once.
std::size_t utf8Length(const std::string& text) {
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

// Decimal digits to int, saturating at INT_MAX.
int saturatingCount(const std::string& digits) {
    constexpr int kMax = std::numeric_limits<int>::max();
    int value = 0;
    for (char c : digits) {
        int digit = c - '0';
        if (value > (kMax - digit) / 10) {
            return kMax;
        }
        value = value * 10 + digit;
    }
    return value;
}

// Truncate to at most maxBytes without splitting a UTF-8 sequence.
std::string truncateUtf8(const std::string& text, std::size_t maxBytes) {
    if (text.size() <= maxBytes) {
        return text;
    }
    std::size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

}

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), isSpace);
    auto end = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

DateInfo parseDate(const std::string& text) noexcept {
    try {
        static const std::regex ymd(R"(\b(\d{4})([/-])(\d{1,2})\2(\d{1,2})\b)");
        static const std::regex mdy(R"(\b(\d{1,2})([/-])(\d{1,2})\2(\d{4})\b)");
        static const std::regex bareYear(R"(\b(\d{4})\b)");

        for (std::sregex_iterator it(text.begin(), text.end(), ymd), end; it != end; ++it) {
            int year = std::stoi((*it)[1].str());
            int month = std::stoi((*it)[3].str());
            int day = std::stoi((*it)[4].str());
            if (validMonthDay(month, day)) {
                return {year, formatDate(year, month, day)};
            }
        }

        for (std::sregex_iterator it(text.begin(), text.end(), mdy), end; it != end; ++it) {
            int month = std::stoi((*it)[1].str());
            int day = std::stoi((*it)[3].str());
            int year = std::stoi((*it)[4].str());
            if (validMonthDay(month, day)) {
                return {year, formatDate(year, month, day)};
            }
        }

        for (std::sregex_iterator it(text.begin(), text.end(), bareYear), end; it != end; ++it) {
            int year = std::stoi((*it)[1].str());
            if (year >= kMinYear && year <= kMaxYear) {
                return {year, formatDate(year, 1, 1)};
            }
        }
    } catch (const std::exception& e) {
        LOG_WARN("Failed to parse date from '" + text + "': " + e.what());
    }
    return {};
}

std::string defaultDate(int year) {
    return year > 0 ? formatDate(year, 1, 1) : "1900-01-01";
}

std::vector<std::string> parseAuthors(const std::string& text) noexcept {
    std::vector<std::string> authors;
    try {
        std::string body = text;
        auto dash = body.find(" - ");
        if (dash != std::string::npos) {
            body.erase(dash);
        }

        // A year usually starts the venue fragment: "A Smith, B Jones 2019 Nature"
        static const std::regex yearRun(R"(\d{4})");
        std::smatch match;
        if (std::regex_search(body, match, yearRun)) {
            body.erase(static_cast<std::size_t>(match.position(0)));
        }

        std::size_t start = 0;
        while (start <= body.size() && authors.size() < kMaxAuthors) {
            auto comma = body.find(',', start);
            std::string token = trim(body.substr(start, comma == std::string::npos
                                                           ? std::string::npos
                                                           : comma - start));
            start = comma == std::string::npos ? body.size() + 1 : comma + 1;

            if (token.empty() || allDigits(token)) {
                continue;
            }
            std::string cleaned = stripAuthorNoise(token);
            if (utf8Length(cleaned) <= 1) {
                continue;
            }
            if (std::find(authors.begin(), authors.end(), cleaned) == authors.end()) {
                authors.push_back(std::move(cleaned));
            }
        }
    } catch (const std::exception& e) {
        LOG_WARN("Failed to parse authors from '" + text + "': " + e.what());
    }
    return authors;
}

std::optional<int> parseCitations(const std::string& text) noexcept {
    try {
        static const std::regex citedBy(R"(cited\s+by\s*(\d+))", std::regex::icase);
        static const std::regex countWord(R"((\d+)\s*citations?)", std::regex::icase);
        static const std::regex anyNumber(R"((\d+))");

        for (const auto* pattern : {&citedBy, &countWord, &anyNumber}) {
            std::smatch match;
            if (std::regex_search(text, match, *pattern)) {
                return saturatingCount(match[1].str());
            }
        }
    } catch (const std::exception& e) {
        LOG_WARN("Failed to parse citations from '" + text + "': " + e.what());
    }
    return std::nullopt;
}

VenueType classifyVenue(const std::string& text) noexcept {
    static const std::vector<std::string> journal = {
        "journal", "transactions", "nature", "science", "ieee", "acm"};
    static const std::vector<std::string> conference = {
        "conference", "proceedings", "workshop", "symposium"};
    static const std::vector<std::string> preprint = {
        "arxiv", "preprint", "biorxiv", "medrxiv", "ssrn"};

    try {
        const std::string lower = toLower(text);
        auto containsAny = [&lower](const std::vector<std::string>& keywords) {
            return std::any_of(keywords.begin(), keywords.end(),
                [&lower](const std::string& k) { return lower.find(k) != std::string::npos; });
        };

        if (containsAny(journal)) return VenueType::Journal;
        if (containsAny(conference)) return VenueType::Conference;
        if (containsAny(preprint)) return VenueType::Preprint;
    } catch (const std::exception& e) {
        LOG_WARN("Failed to classify venue: " + std::string(e.what()));
    }
    return VenueType::Unknown;
}

std::optional<VenueInfo> parseVenue(const std::string& text) noexcept {
    try {
        // "authors - venue, year - host" keeps the middle segment
        std::string venue = text;
        auto first = venue.find(" - ");
        if (first != std::string::npos) {
            auto second = venue.find(" - ", first + 3);
            venue = venue.substr(first + 3, second == std::string::npos
                                                ? std::string::npos
                                                : second - first - 3);
        }

        static const std::regex brackets(R"(\([^)]*\))");
        static const std::regex trailingYear(R"(,?\s*\d{4}\s*$)");
        venue = std::regex_replace(venue, brackets, "");
        venue = std::regex_replace(venue, trailingYear, "");
        venue = trim(collapseSpaces(venue));
        while (!venue.empty() && (venue.back() == ',' || venue.back() == ';')) {
            venue.pop_back();
            venue = trim(venue);
        }

        if (venue.empty() || allDigits(venue)) {
            return std::nullopt;
        }
        return VenueInfo{venue, classifyVenue(text)};
    } catch (const std::exception& e) {
        LOG_WARN("Failed to parse venue from '" + text + "': " + e.what());
        return std::nullopt;
    }
}

std::optional<std::string> parseSummary(const std::string& text) noexcept {
    try {
        std::string summary = trim(text);
        if (summary.size() <= kMinSummaryChars) {
            return std::nullopt;
        }
        return truncateUtf8(summary, kMaxSummaryChars);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::string> parseTitle(const std::string& text) noexcept {
    try {
        std::string title = trim(collapseSpaces(text));
        if (title.size() <= kMinTitleChars) {
            return std::nullopt;
        }
        return title;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

bool isArtifactLink(const std::string& href) noexcept {
    try {
        std::string lower = toLower(href);
        auto query = lower.find_first_of("?#");
        std::string path = lower.substr(0, query);
        bool pdf = path.size() >= 4 && path.compare(path.size() - 4, 4, ".pdf") == 0;
        return pdf || lower.find("doi.org") != std::string::npos ||
               lower.find("arxiv.org") != std::string::npos;
    } catch (const std::exception&) {
        return false;
    }
}

std::optional<std::string> subjectFromTitle(const std::string& pageTitle) noexcept {
    try {
        auto dash = pageTitle.find(" - ");
        if (dash == std::string::npos) {
            return std::nullopt;
        }
        std::string name = trim(pageTitle.substr(0, dash));
        if (name.empty()) {
            return std::nullopt;
        }
        return name;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}
