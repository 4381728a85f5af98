#include <gtest/gtest.h>

#include "follow/schedule_matcher.hpp"

using namespace Follow;

TEST(ScheduleMatcher, FirstLineIsTrimmedAndLowercased) {
    EXPECT_EQ(firstLine("  Opening Prayer \nLord we come"), "opening prayer");
    EXPECT_EQ(firstLine("Single"), "single");
    EXPECT_EQ(firstLine(""), "");
}

TEST(ScheduleMatcher, ExactNormalizedMatchWins) {
    std::vector<std::string> sessions{ "Welcome", "Opening prayer!", "Sermon" };
    auto idx = findMatchingSession(firstLine("Opening Prayer\nverse"), sessions);
    ASSERT_TRUE(idx.has_value());
    EXPECT_EQ(*idx, 1u);
}

TEST(ScheduleMatcher, ContainmentScoresConfiguredValue) {
    std::vector<std::string> sessions{ "Announcements", "Prayer" };

    auto idx = findMatchingSession("opening prayer", sessions);
    ASSERT_TRUE(idx.has_value());
    EXPECT_EQ(*idx, 1u);

    ScheduleMatchOptions strict;
    strict.matchThreshold = 0.95;
    EXPECT_FALSE(findMatchingSession("opening prayer", sessions, strict).has_value());

    // Out-of-range containment score is clamped to 1.0
    strict.containmentScore = 5.0;
    EXPECT_TRUE(findMatchingSession("opening prayer", sessions, strict).has_value());
}

TEST(ScheduleMatcher, WordSimilarity) {
    EXPECT_DOUBLE_EQ(scheduleSimilarity("closing hymn", "closing song"), 0.5);
    EXPECT_DOUBLE_EQ(scheduleSimilarity("", "anything"), 0.0);
    // "offer" is contained in "offering"
    EXPECT_DOUBLE_EQ(scheduleSimilarity("offer", "the offering"), 0.5);
}

TEST(ScheduleMatcher, BelowThresholdOrEmptyInputs) {
    std::vector<std::string> sessions{ "Closing song" };
    EXPECT_FALSE(findMatchingSession("benediction", sessions).has_value());
    EXPECT_FALSE(findMatchingSession("   ", sessions).has_value());
    EXPECT_FALSE(findMatchingSession("closing song", {}).has_value());
}

TEST(ScheduleLoading, AcceptsStringsObjectsAndWrapper) {
    std::vector<std::string> titles;
    std::string err;
    ASSERT_TRUE(loadSessionTitlesFromJson(R"(["Welcome", {"title": "Sermon", "start": "10:30"}])", titles, &err)) << err;
    EXPECT_EQ(titles, (std::vector<std::string>{ "Welcome", "Sermon" }));

    ASSERT_TRUE(loadSessionTitlesFromJson(R"({"sessions": ["Benediction"]})", titles));
    EXPECT_EQ(titles, (std::vector<std::string>{ "Benediction" }));
}

TEST(ScheduleLoading, RejectsEntriesWithoutTitle) {
    std::vector<std::string> titles{ "keep" };
    std::string err;
    EXPECT_FALSE(loadSessionTitlesFromJson(R"(["ok", {"name": "x"}])", titles, &err));
    EXPECT_NE(err.find("no title"), std::string::npos);
    EXPECT_FALSE(loadSessionTitlesFromJson(R"({"title": "x"})", titles, &err));
    EXPECT_EQ(titles, (std::vector<std::string>{ "keep" }));

    EXPECT_FALSE(loadSessionTitlesFromFile("/nonexistent/schedule.json", titles, &err));
}
