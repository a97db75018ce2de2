// Repository: ReelForge
// Component: Item Label Parser
// Purpose: Heuristic item count, labels and hook text from a listicle title
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_TIMELINE_ITEM_LABEL_PARSER_HPP_
#define REELFORGE_TIMELINE_ITEM_LABEL_PARSER_HPP_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace reelforge::timeline {

struct ParsedTitle {
  // Items from an inline numbered list ("1. Cafe A 2. Park B #travel").
  std::vector<std::string> labels;

  // Count quoted in the title ("5 best cafes"); nullopt when absent.
  std::optional<size_t> stated_count;

  // Text before the first "N." marker (≤100 code points), else the first 50
  // code points of the title. Empty only for an empty title.
  std::string hook_text;

  // First pictographic character in the title, if any.
  std::optional<std::string> emoji;

  // labels.size() if any were found, else stated_count, else `fallback`.
  size_t ItemCount(size_t fallback) const {
    if (!labels.empty()) return labels.size();
    if (stated_count && *stated_count > 0) return *stated_count;
    return fallback;
  }
};

// Parses titles of the form "Top 5 cafes in Lisbon ☕ 1. Cafe A 2. Park B".
// Stateless; all methods are pure.
class ItemLabelParser {
 public:
  static ParsedTitle Parse(const std::string& title);

 private:
  static std::vector<std::string> ExtractNumberedItems(const std::string& title);
  static std::optional<size_t> ExtractStatedCount(const std::string& title);
  static std::string ExtractHookText(const std::string& title);
};

}  // namespace reelforge::timeline

#endif  // REELFORGE_TIMELINE_ITEM_LABEL_PARSER_HPP_
