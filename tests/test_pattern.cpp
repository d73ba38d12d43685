/*
 * Pattern matching tests - cmd-runner
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <cmd-runner/match/pattern.hpp>
#include <string>
#include <vector>

using namespace cmdrun;

TEST(MatchPattern, Table) {
    struct Case { const char* text; const char* pattern; bool expected; };
    std::vector<Case> cases = {
        {"", "", true},
        {"simple test", "", false},
        {"simple test", "no", false},
        {"simple test", "simple", true},
        {"simple test", "test", true},
        {"advanced pattern test", "advanced * test", true},
        {"advanced pattern failed", "advanced * test", false},
        {"advanced pattern with multiple placeholders", "advanced * with * placeholders", true},
        {"advanced pattern lacking multiple placeholders", "advanced * with * placeholders", false},
    };
    for (auto &c : cases) {
        EXPECT_EQ(match_pattern(c.text, c.pattern), c.expected) << c.text << " / " << c.pattern;
    }
}

TEST(MatchPattern, EdgeWildcards) {
    EXPECT_TRUE(match_pattern("simple test", "*test"));
    EXPECT_TRUE(match_pattern("simple test", "simple*"));
    EXPECT_TRUE(match_pattern("simple test", "simple**test"));
    EXPECT_TRUE(match_pattern("x", "**"));
    EXPECT_TRUE(match_pattern("", "*"));
}

TEST(MatchPattern, FragmentsDoNotOverlap) {
    EXPECT_FALSE(match_pattern("aba", "ab*ba"));
    EXPECT_TRUE(match_pattern("abba", "ab*ba"));
    // Order matters.
    EXPECT_FALSE(match_pattern("test simple", "simple*test"));
}

TEST(SplitPattern, KeepsEmptyFragments) {
    auto parts = split_pattern("*a**b*");
    std::vector<std::string> expected = {"", "a", "", "b", ""};
    EXPECT_EQ(parts, expected);
}
