// Repository: ReelForge
// Component: Item Label Parser Tests
// Copyright (c) 2025 ReelForge

#include <gtest/gtest.h>

#include <string>

#include "reelforge/timeline/ItemLabelParser.hpp"

namespace reelforge::timeline {
namespace {

const std::string kCoffee = "\xE2\x98\x95";  // U+2615

TEST(ItemLabelParser, InlineNumberedList) {
  const ParsedTitle parsed =
      ItemLabelParser::Parse("Top 5 cafes in Lisbon " + kCoffee + " 1. Cafe A 2. Park B");

  ASSERT_EQ(parsed.labels.size(), 2u);
  EXPECT_EQ(parsed.labels[0], "Cafe A");
  EXPECT_EQ(parsed.labels[1], "Park B");
  EXPECT_EQ(parsed.stated_count, std::optional<size_t>(5));
  EXPECT_EQ(parsed.hook_text, "Top 5 cafes in Lisbon " + kCoffee);
  EXPECT_EQ(parsed.emoji, std::optional<std::string>(kCoffee));

  // Labels win over the stated count.
  EXPECT_EQ(parsed.ItemCount(7), 2u);
}

TEST(ItemLabelParser, HashtagEndsTheLastItem) {
  const ParsedTitle parsed =
      ItemLabelParser::Parse("1. Miradouro 2. Alfama 3. Belem #travel #lisbon");
  ASSERT_EQ(parsed.labels.size(), 3u);
  EXPECT_EQ(parsed.labels[2], "Belem");
}

TEST(ItemLabelParser, TooShortItemsAreDropped) {
  const ParsedTitle parsed = ItemLabelParser::Parse("1. AB 2. Real Place");
  ASSERT_EQ(parsed.labels.size(), 1u);
  EXPECT_EQ(parsed.labels[0], "Real Place");
}

TEST(ItemLabelParser, StatedCountWithoutList) {
  const ParsedTitle parsed = ItemLabelParser::Parse("7 BEST things to do in Porto");
  EXPECT_TRUE(parsed.labels.empty());
  EXPECT_EQ(parsed.stated_count, std::optional<size_t>(7));
  EXPECT_EQ(parsed.ItemCount(5), 7u);
  EXPECT_EQ(parsed.hook_text, "7 BEST things to do in Porto");
}

TEST(ItemLabelParser, YearsAreNotCounts) {
  const ParsedTitle parsed = ItemLabelParser::Parse("2024 best summer");
  EXPECT_FALSE(parsed.stated_count.has_value());
  EXPECT_EQ(parsed.ItemCount(5), 5u);
}

TEST(ItemLabelParser, PlainTitleFallsBack) {
  const ParsedTitle parsed = ItemLabelParser::Parse("A slow morning walk");
  EXPECT_TRUE(parsed.labels.empty());
  EXPECT_FALSE(parsed.stated_count.has_value());
  EXPECT_FALSE(parsed.emoji.has_value());
  EXPECT_EQ(parsed.hook_text, "A slow morning walk");
  EXPECT_EQ(parsed.ItemCount(5), 5u);
}

TEST(ItemLabelParser, TitleStartingWithListUsesTruncatedTitleAsHook) {
  const std::string title = "1. " + std::string(80, 'a');
  const ParsedTitle parsed = ItemLabelParser::Parse(title);
  EXPECT_EQ(parsed.hook_text, title.substr(0, 50));
}

TEST(ItemLabelParser, EmptyTitle) {
  const ParsedTitle parsed = ItemLabelParser::Parse("");
  EXPECT_TRUE(parsed.labels.empty());
  EXPECT_TRUE(parsed.hook_text.empty());
  EXPECT_EQ(parsed.ItemCount(3), 3u);
}

}  // namespace
}  // namespace reelforge::timeline
