/*
 * gleaner - Scrape Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <limits>

#include "gleaner/parse.hpp"
#include "gleaner/types.hpp"

namespace gleaner::parse {
namespace {

TEST(ParseDate, NormalisesYearFirstDates) {
    auto info = parseDate("Published 2021/3/5 online");
    EXPECT_EQ(info.year, 2021);
    EXPECT_EQ(info.date, "2021-03-05");

    EXPECT_EQ(parseDate("2018-11-30").date, "2018-11-30");
}

TEST(ParseDate, NormalisesMonthFirstDates) {
    auto info = parseDate("3-5-2020");
    EXPECT_EQ(info.year, 2020);
    EXPECT_EQ(info.date, "2020-03-05");
}

TEST(ParseDate, FallsBackToBareYear) {
    auto info = parseDate("A Smith - Nature, 2019 - nature.com");
    EXPECT_EQ(info.year, 2019);
    EXPECT_EQ(info.date, "2019-01-01");
}

TEST(ParseDate, MixedSeparatorsAreNotAFullDate) {
    auto info = parseDate("2020-03/05");
    EXPECT_EQ(info.year, 2020);
    EXPECT_EQ(info.date, "2020-01-01");
}

TEST(ParseDate, InvalidMonthFallsThroughToYear) {
    EXPECT_EQ(parseDate("13/45/2020").date, "2020-01-01");
}

TEST(ParseDate, RejectsYearsOutsideRange) {
    auto info = parseDate("printed 1850");
    EXPECT_EQ(info.year, 0);
    EXPECT_TRUE(info.date.empty());
    EXPECT_EQ(parseDate("no date here").year, 0);
}

TEST(ParseDate, DefaultDate) {
    EXPECT_EQ(defaultDate(0), "1900-01-01");
    EXPECT_EQ(defaultDate(2018), "2018-01-01");
}

TEST(ParseAuthors, StopsAtVenueSeparatorAndDeduplicates) {
    auto authors = parseAuthors("A Smith, B Jones, A Smith - Nature, 2019 - nature.com");
    ASSERT_EQ(authors.size(), 2u);
    EXPECT_EQ(authors[0], "A Smith");
    EXPECT_EQ(authors[1], "B Jones");
}

TEST(ParseAuthors, StopsAtFirstYear) {
    auto authors = parseAuthors("J Doe, K Lee 2019 Some Venue, Other");
    ASSERT_EQ(authors.size(), 2u);
    EXPECT_EQ(authors[1], "K Lee");
}

TEST(ParseAuthors, StripsNoiseAndShortTokens) {
    auto authors = parseAuthors("X, Al Ng\xE2\x80\xA6, M. O'Brien-Hall, (C) Wu");
    ASSERT_EQ(authors.size(), 3u);
    EXPECT_EQ(authors[0], "Al Ng");
    EXPECT_EQ(authors[1], "M. O'Brien-Hall");
    EXPECT_EQ(authors[2], "C Wu");
}

TEST(ParseAuthors, KeepsNonAsciiNames) {
    auto authors = parseAuthors("J M\xC3\xBCller, \xC3\x85 Berg");
    ASSERT_EQ(authors.size(), 2u);
    EXPECT_EQ(authors[0], "J M\xC3\xBCller");
}

TEST(ParseAuthors, SingleNonAsciiLetterIsTooShort) {
    auto authors = parseAuthors("\xC3\x85, J Doe, \xE6\x9D\x8E");
    ASSERT_EQ(authors.size(), 1u);
    EXPECT_EQ(authors[0], "J Doe");
}

TEST(ParseAuthors, CapsAtTen) {
    std::string text;
    for (int i = 0; i < 12; ++i) {
        text += "Author " + std::string(1, static_cast<char>('A' + i)) + ", ";
    }
    EXPECT_EQ(parseAuthors(text).size(), kMaxAuthors);
}

TEST(ParseCitations, PrefersCitedByPhrase) {
    EXPECT_EQ(parseCitations("Cited by 15"), 15);
    EXPECT_EQ(parseCitations("2 versions, cited  by 15"), 15);
    EXPECT_EQ(parseCitations("7 citations"), 7);
    EXPECT_EQ(parseCitations("about 3 things"), 3);
    EXPECT_FALSE(parseCitations("none yet").has_value());
}

TEST(ParseCitations, HugeCountsSaturate) {
    EXPECT_EQ(parseCitations("Cited by 99999999999999999999"), std::numeric_limits<int>::max());
    EXPECT_EQ(parseCitations("Cited by 2147483647"), 2147483647);
}

TEST(ClassifyVenue, KeywordGroups) {
    EXPECT_EQ(classifyVenue("IEEE Transactions on Robotics"), VenueType::Journal);
    EXPECT_EQ(classifyVenue("Proceedings of the Workshop"), VenueType::Conference);
    EXPECT_EQ(classifyVenue("arXiv preprint arXiv:2101.00001"), VenueType::Preprint);
    EXPECT_EQ(classifyVenue("Personal blog"), VenueType::Unknown);
}

TEST(ClassifyVenue, JournalKeywordsWin) {
    EXPECT_EQ(classifyVenue("Journal of Conference Studies"), VenueType::Journal);
}

TEST(ParseVenue, KeepsMiddleSegmentWithoutYearOrBrackets) {
    auto venue = parseVenue("A Smith - Proc. Workshop (WS 19), 2019 - example.org");
    ASSERT_TRUE(venue.has_value());
    EXPECT_EQ(venue->venue, "Proc. Workshop");
    EXPECT_EQ(venue->type, VenueType::Conference);
}

TEST(ParseVenue, PlainVenueText) {
    auto venue = parseVenue("Nature Physics");
    ASSERT_TRUE(venue.has_value());
    EXPECT_EQ(venue->venue, "Nature Physics");
    EXPECT_EQ(venue->type, VenueType::Journal);
}

TEST(ParseVenue, YearOnlyIsNotAVenue) {
    EXPECT_FALSE(parseVenue("A Smith - 2019 - example.org").has_value());
}

TEST(ParseSummary, RequiresMinimumAndTruncates) {
    EXPECT_FALSE(parseSummary("  too short  ").has_value());
    auto summary = parseSummary(std::string(600, 'a'));
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->size(), kMaxSummaryChars);
}

TEST(ParseSummary, TruncationKeepsUtf8Intact) {
    std::string text(499, 'a');
    text += "\xC3\xA9\xC3\xA9";
    auto summary = parseSummary(text);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->size(), 499u);
}

TEST(ParseTitle, CollapsesWhitespace) {
    EXPECT_EQ(parseTitle("  Deep \n  Learning  "), "Deep Learning");
    EXPECT_FALSE(parseTitle("Short").has_value());
    EXPECT_FALSE(parseTitle("   ").has_value());
}

TEST(ArtifactLink, RecognisedForms) {
    EXPECT_TRUE(isArtifactLink("https://x.org/p.PDF?dl=1"));
    EXPECT_TRUE(isArtifactLink("https://doi.org/10.1000/xyz"));
    EXPECT_TRUE(isArtifactLink("https://arxiv.org/abs/2101.00001"));
    EXPECT_FALSE(isArtifactLink("https://x.org/pdf-viewer"));
    EXPECT_FALSE(isArtifactLink(""));
}

TEST(SubjectFromTitle, TakesTextBeforeSeparator) {
    EXPECT_EQ(subjectFromTitle("Jane Doe - Google Scholar"), "Jane Doe");
    EXPECT_FALSE(subjectFromTitle("Google Scholar").has_value());
    EXPECT_FALSE(subjectFromTitle(" - Google Scholar").has_value());
}

TEST(Types, WireNames) {
    EXPECT_STREQ(toString(Status::SearchingPapers), "searching_papers");
    EXPECT_STREQ(toString(EventKind::Progress), "update_fetch_process");
    EXPECT_STREQ(toString(EventKind::Completed), "fetched_completed");
    EXPECT_STREQ(toString(EventKind::Failed), "failed_fetch");
    EXPECT_EQ((JobKey{"client", "search"}.id()), "client_search");
}

}
}
