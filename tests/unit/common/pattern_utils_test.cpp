/**
 * Tests for pattern_utils.h - glob matching used by `list --cmd`.
 */

#include <gtest/gtest.h>
#include <servherd/common/pattern_utils.h>

#include <string>
#include <vector>

using namespace servherd::common;

TEST(PatternUtilsTest, StarMatchesAnySequence) {
    EXPECT_TRUE(wildcard_match("npx vite --port 3000", "*vite*"));
    EXPECT_TRUE(wildcard_match("", "*"));
    EXPECT_FALSE(wildcard_match("npm start", "*vite*"));
}

TEST(PatternUtilsTest, QuestionMarkMatchesOneChar) {
    EXPECT_TRUE(wildcard_match("v1", "v?"));
    EXPECT_FALSE(wildcard_match("v10", "v?"));
}

TEST(PatternUtilsTest, StarCrossesPathSeparators) {
    EXPECT_TRUE(wildcard_match("node node_modules/.bin/vite", "*vite"));
}

TEST(PatternUtilsTest, MatchIsCaseSensitive) {
    EXPECT_FALSE(wildcard_match("Vite", "vite"));
}

TEST(PatternUtilsTest, ExpandBracesProducesAlternatives) {
    auto expanded = expand_braces("*{vite,storybook}*");
    ASSERT_EQ(expanded.size(), 2u);
    EXPECT_EQ(expanded[0], "*vite*");
    EXPECT_EQ(expanded[1], "*storybook*");
}

TEST(PatternUtilsTest, ExpandBracesHandlesNesting) {
    auto expanded = expand_braces("a{b,c{d,e}}");
    EXPECT_EQ(expanded, (std::vector<std::string>{"ab", "acd", "ace"}));
}

TEST(PatternUtilsTest, BracesWithoutCommaStayLiteral) {
    auto expanded = expand_braces("{{port}}");
    ASSERT_EQ(expanded.size(), 1u);
    EXPECT_EQ(expanded[0], "{{port}}");
}

TEST(PatternUtilsTest, GlobMatchUsesBraceAlternatives) {
    EXPECT_TRUE(glob_match("npx storybook dev", "*{vite,storybook}*"));
    EXPECT_TRUE(glob_match("npx vite", "*{vite,storybook}*"));
    EXPECT_FALSE(glob_match("npm start", "*{vite,storybook}*"));
}
