/**
 * @file Strings_uTest.cpp
 * @brief Unit tests for cpufetch::helpers::strings.
 */

#include "src/helpers/inc/Strings.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

using cpufetch::helpers::strings::containsIgnoreCase;
using cpufetch::helpers::strings::equalsIgnoreCase;
using cpufetch::helpers::strings::splitKeyValue;
using cpufetch::helpers::strings::splitLines;
using cpufetch::helpers::strings::splitTokens;
using cpufetch::helpers::strings::startsWith;
using cpufetch::helpers::strings::toLower;
using cpufetch::helpers::strings::trim;

/* ----------------------------- Trimming ----------------------------- */

/** @test trim strips tabs, spaces and CR on both sides. */
TEST(StringsTest, TrimBothSides) { EXPECT_EQ(trim(" \tvalue \r\n"), "value"); }

/** @test trim of whitespace-only input is empty. */
TEST(StringsTest, TrimAllWhitespace) { EXPECT_TRUE(trim(" \t ").empty()); }

/* ----------------------------- Comparison ----------------------------- */

/** @test equalsIgnoreCase compares ASCII letters case-insensitively. */
TEST(StringsTest, EqualsIgnoreCase) {
  EXPECT_TRUE(equalsIgnoreCase("GenuineIntel", "genuineintel"));
  EXPECT_FALSE(equalsIgnoreCase("Intel", "Intel "));
}

/** @test containsIgnoreCase finds fragments anywhere. */
TEST(StringsTest, ContainsIgnoreCase) {
  EXPECT_TRUE(containsIgnoreCase("AuthenticAMD", "amd"));
  EXPECT_TRUE(containsIgnoreCase("Apple M2 Pro", "APPLE"));
  EXPECT_FALSE(containsIgnoreCase("ARM", "armv8"));
}

/** @test An empty needle never matches. */
TEST(StringsTest, ContainsEmptyNeedle) { EXPECT_FALSE(containsIgnoreCase("anything", "")); }

/** @test startsWith checks the prefix only. */
TEST(StringsTest, StartsWith) {
  EXPECT_TRUE(startsWith("cpu12", "cpu"));
  EXPECT_FALSE(startsWith("cp", "cpu"));
}

/** @test toLower leaves non-letters unchanged. */
TEST(StringsTest, ToLower) { EXPECT_EQ(toLower("L1d Cache: 48K"), "l1d cache: 48k"); }

/* ----------------------------- Splitting ----------------------------- */

/** @test splitKeyValue trims both halves and splits at the first separator. */
TEST(StringsTest, SplitKeyValue) {
  std::string_view key;
  std::string_view value;
  ASSERT_TRUE(splitKeyValue("model name\t: Example CPU: X9 ", ':', key, value));
  EXPECT_EQ(key, "model name");
  EXPECT_EQ(value, "Example CPU: X9");
}

/** @test splitKeyValue rejects lines without a separator or with an empty key. */
TEST(StringsTest, SplitKeyValueRejects) {
  std::string_view key;
  std::string_view value;
  EXPECT_FALSE(splitKeyValue("no separator here", ':', key, value));
  EXPECT_FALSE(splitKeyValue("  : value", ':', key, value));
}

/** @test splitTokens drops empty tokens. */
TEST(StringsTest, SplitTokens) {
  const std::vector<std::string> TOKENS = splitTokens("  fpu  vme\tde ");
  EXPECT_EQ(TOKENS, (std::vector<std::string>{"fpu", "vme", "de"}));
}

/** @test splitTokens with custom delimiters. */
TEST(StringsTest, SplitTokensCustomDelimiters) {
  const std::vector<std::string> TOKENS = splitTokens("0-3, 8-11,", ",");
  EXPECT_EQ(TOKENS, (std::vector<std::string>{"0-3", "8-11"}));
}

/** @test splitLines handles CRLF and keeps blank lines. */
TEST(StringsTest, SplitLines) {
  const std::vector<std::string_view> LINES = splitLines("a\r\n\r\nb\n");
  ASSERT_EQ(LINES.size(), 3U);
  EXPECT_EQ(LINES[0], "a");
  EXPECT_TRUE(LINES[1].empty());
  EXPECT_EQ(LINES[2], "b");
}
