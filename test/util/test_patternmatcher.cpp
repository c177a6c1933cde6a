#include <gtest/gtest.h>
#include <regex>
#include <string>
#include <vector>
#include "util/PatternMatcher.hpp"

using namespace gitscribe;

// Test: NUL-delimited output splits into tokens without a trailing empty field
TEST(PatternMatcherTest, SplitNulTerminated) {
    std::string text("a\0b c\0", 6);
    auto fields = PatternMatcher::split(text, '\0');
    ASSERT_EQ(fields.size(), 2u);
    EXPECT_EQ(fields[0], "a");
    EXPECT_EQ(fields[1], "b c");
}

// Test: Empty fields are dropped unless requested
TEST(PatternMatcherTest, SplitKeepEmpty) {
    EXPECT_EQ(PatternMatcher::split("a,,b", ',').size(), 2u);

    auto kept = PatternMatcher::split("a,,b", ',', true);
    ASSERT_EQ(kept.size(), 3u);
    EXPECT_EQ(kept[1], "");

    EXPECT_TRUE(PatternMatcher::split("", ',').empty());
}

// Test: splitLines strips carriage returns at line ends
TEST(PatternMatcherTest, SplitLinesStripsCarriageReturn) {
    auto lines = PatternMatcher::splitLines("one\r\ntwo\nthree");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
    EXPECT_EQ(lines[2], "three");
}

// Test: Progress redraws separated by bare CR become separate lines
TEST(PatternMatcherTest, SplitOutputLinesHandlesRedraws) {
    auto lines = PatternMatcher::splitOutputLines("Counting objects:  50% (1/2)\rCounting objects: 100% (2/2)\n\nDone\n");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "Counting objects:  50% (1/2)");
    EXPECT_EQ(lines[1], "Counting objects: 100% (2/2)");
    EXPECT_EQ(lines[2], "Done");
}

TEST(PatternMatcherTest, TrimAndStartsWith) {
    EXPECT_EQ(PatternMatcher::trim("  body text \n"), "body text");
    EXPECT_EQ(PatternMatcher::trim(" \t\n"), "");
    EXPECT_TRUE(PatternMatcher::startsWith("# branch.head main", "# "));
    EXPECT_FALSE(PatternMatcher::startsWith("#", "# "));
}

// Test: firstMatch returns whole match plus groups, empty on miss
TEST(PatternMatcherTest, FirstMatchGroups) {
    std::regex re("(\\d+)/(\\d+)");
    auto m = PatternMatcher::firstMatch("Receiving objects:  42% (21/50)", re);
    ASSERT_EQ(m.size(), 3u);
    EXPECT_EQ(m[0], "21/50");
    EXPECT_EQ(m[1], "21");
    EXPECT_EQ(m[2], "50");

    EXPECT_TRUE(PatternMatcher::firstMatch("no numbers", re).empty());
    EXPECT_TRUE(PatternMatcher::contains("x 1/2", re));
    EXPECT_FALSE(PatternMatcher::contains("x", re));
}

// Test: fullMatch requires the whole text to match
TEST(PatternMatcherTest, FullMatchAnchorsWholeText) {
    std::regex re("(\\d+)/(\\d+)");
    EXPECT_TRUE(PatternMatcher::fullMatch("x 1/2", re).empty());
    auto m = PatternMatcher::fullMatch("1/2", re);
    ASSERT_EQ(m.size(), 3u);
    EXPECT_EQ(m[2], "2");
}

// Test: prefixMatch anchors at the start but leaves the tail unmatched
TEST(PatternMatcherTest, PrefixMatchLeavesTail) {
    std::regex re("(\\d+)/(\\d+) ");
    EXPECT_TRUE(PatternMatcher::prefixMatch("x 1/2 rest", re).empty());
    std::string text = "1/2 rest of the line";
    auto m = PatternMatcher::prefixMatch(text, re);
    ASSERT_EQ(m.size(), 3u);
    EXPECT_EQ(m[1], "1");
    EXPECT_EQ(text.substr(m[0].size()), "rest of the line");
}

// Test: findAll reports every occurrence in order
TEST(PatternMatcherTest, FindAllOffsets) {
    std::regex re("ab");
    auto spans = PatternMatcher::findAll("ab-ab", re);
    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].begin, 0u);
    EXPECT_EQ(spans[0].end, 2u);
    EXPECT_EQ(spans[1].begin, 3u);
    EXPECT_EQ(spans[1].end, 5u);
}
