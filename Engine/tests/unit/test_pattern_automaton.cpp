/**
 * @file test_pattern_automaton.cpp
 * @brief Unit tests for word counting, enumeration and matching
 */

#include <gtest/gtest.h>
#include <automaton/pattern_automaton.hpp>
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Regulator;

using Words = std::vector<std::string>;

TEST(PatternAutomatonTest, CountsRuleWords) {
    PatternAutomaton automaton("(dev)([1-3]).example.com");
    EXPECT_EQ(automaton.count_words(1, 256), 3u);
    EXPECT_EQ(automaton.words(), (Words{"dev1.example.com", "dev2.example.com", "dev3.example.com"}));
}

TEST(PatternAutomatonTest, DotIsLiteral) {
    PatternAutomaton automaton("a.b");
    EXPECT_EQ(automaton.count_words(1, 256), 1u);
    EXPECT_TRUE(automaton.matches("a.b"));
    EXPECT_FALSE(automaton.matches("axb"));
}

TEST(PatternAutomatonTest, LexicographicEnumeration) {
    PatternAutomaton automaton("(a|b)?c");
    Words words = automaton.words();
    EXPECT_EQ(words, (Words{"ac", "bc", "c"}));
    EXPECT_TRUE(std::is_sorted(words.begin(), words.end()));
}

TEST(PatternAutomatonTest, CountsDistinctWords) {
    EXPECT_EQ(PatternAutomaton("(a|a)").count_words(1, 256), 1u);
    PatternAutomaton ambiguous("(ab|a)(c|bc)");
    EXPECT_EQ(ambiguous.count_words(1, 256), 3u);
    EXPECT_EQ(ambiguous.words(), (Words{"abbc", "abc", "ac"}));
}

TEST(PatternAutomatonTest, LengthBounds) {
    PatternAutomaton automaton("(a|b)?c");
    EXPECT_EQ(automaton.count_words(1, 1), 1u);
    EXPECT_EQ(automaton.count_words(2, 2), 2u);
    EXPECT_EQ(automaton.count_words(3, 10), 0u);
}

TEST(PatternAutomatonTest, EmptyWordIsSkipped) {
    PatternAutomaton automaton("(a)?");
    EXPECT_EQ(automaton.words(), (Words{"a"}));
    EXPECT_EQ(automaton.count_words(1, 5), 1u);
    EXPECT_EQ(automaton.count_words(0, 5), 2u);

    PatternAutomaton empty("");
    EXPECT_TRUE(empty.words().empty());
    EXPECT_EQ(empty.count_words(1, 256), 0u);
}

TEST(PatternAutomatonTest, NumericRanges) {
    PatternAutomaton automaton("(1?[0-2])");
    EXPECT_EQ(automaton.words(), (Words{"0", "1", "10", "11", "12", "2"}));
    EXPECT_TRUE(automaton.matches("10"));
    EXPECT_FALSE(automaton.matches("13"));
    EXPECT_FALSE(automaton.matches(""));
}

TEST(PatternAutomatonTest, CountSaturates) {
    std::string rule;
    for (int i = 0; i < 20; ++i) rule += "([0-9])";
    PatternAutomaton automaton(rule);
    EXPECT_EQ(automaton.count_words(1, 256), std::numeric_limits<uint64_t>::max());
}

TEST(PatternAutomatonTest, ForEachWordIsRestartable) {
    PatternAutomaton automaton("(www)(.(eu|us))?.example.com");
    Words first, second;
    automaton.for_each_word([&](const std::string& w) { first.push_back(w); });
    automaton.for_each_word([&](const std::string& w) { second.push_back(w); });
    EXPECT_EQ(first, second);
    EXPECT_EQ(first, (Words{"www.eu.example.com", "www.example.com", "www.us.example.com"}));
}

TEST(PatternAutomatonTest, RejectsInvalidText) {
    EXPECT_THROW(PatternAutomaton("(a|b"), std::invalid_argument);
}
