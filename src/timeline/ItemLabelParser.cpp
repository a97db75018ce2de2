// Repository: ReelForge
// Component: Item Label Parser Implementation
// Copyright (c) 2025 ReelForge

#include "reelforge/timeline/ItemLabelParser.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

#include "reelforge/util/Utf8.hpp"

namespace reelforge::timeline {

namespace {

constexpr size_t kMinItemChars = 3;
constexpr size_t kMaxItemChars = 99;
constexpr size_t kMaxHookChars = 100;
constexpr size_t kFallbackHookChars = 50;

// Upper bound on a stated count; "2024 best" is a year, not a list length.
constexpr size_t kMaxStatedCount = 50;

std::string ToLowerAscii(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

}  // namespace

ParsedTitle ItemLabelParser::Parse(const std::string& title) {
  ParsedTitle parsed;
  parsed.labels = ExtractNumberedItems(title);
  parsed.stated_count = ExtractStatedCount(title);
  parsed.hook_text = ExtractHookText(title);
  parsed.emoji = util::FirstEmoji(title);
  return parsed;
}

std::vector<std::string> ItemLabelParser::ExtractNumberedItems(const std::string& title) {
  static const std::regex kNumbered(R"((\d+)\.\s*([^0-9]+?)(?=\d+\.|#|$))");

  std::vector<std::string> items;
  for (auto it = std::sregex_iterator(title.begin(), title.end(), kNumbered);
       it != std::sregex_iterator(); ++it) {
    std::string name = util::CollapseWhitespace((*it)[2].str());
    const size_t len = util::Utf8Length(name);
    if (len >= kMinItemChars && len <= kMaxItemChars) {
      items.push_back(std::move(name));
    }
  }
  return items;
}

std::optional<size_t> ItemLabelParser::ExtractStatedCount(const std::string& title) {
  static const std::regex kCount(
      R"((\d+)\s*(must|best|top|places|things|spots|cafe|restaurant|food|unique))");

  const std::string lower = ToLowerAscii(title);
  std::smatch m;
  if (!std::regex_search(lower, m, kCount)) {
    return std::nullopt;
  }
  const std::string digits = m[1].str();
  if (digits.size() > 3) return std::nullopt;
  const size_t count = static_cast<size_t>(std::stoul(digits));
  if (count == 0 || count > kMaxStatedCount) return std::nullopt;
  return count;
}

std::string ItemLabelParser::ExtractHookText(const std::string& title) {
  static const std::regex kMarker(R"(\d+\.)");

  std::smatch m;
  std::string head = title;
  if (std::regex_search(title, m, kMarker)) {
    head = title.substr(0, static_cast<size_t>(m.position(0)));
  }
  head = util::Utf8Truncate(util::CollapseWhitespace(head), kMaxHookChars);
  if (!head.empty()) return head;
  return util::Utf8Truncate(util::CollapseWhitespace(title), kFallbackHookChars);
}

}  // namespace reelforge::timeline
