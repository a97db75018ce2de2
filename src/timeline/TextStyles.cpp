// Repository: ReelForge
// Component: Text Styles Implementation
// Copyright (c) 2025 ReelForge

#include "reelforge/timeline/TextStyles.hpp"

#include <initializer_list>

namespace reelforge::timeline {

namespace {

constexpr char kWhite[] = "#FFFFFF";
constexpr char kSparkles[] = "\xE2\x9C\xA8";        // U+2728
constexpr char kRoundPushpin[] = "\xF0\x9F\x93\x8D";  // U+1F4CD
constexpr char kPointUp[] = "\xF0\x9F\x91\x86";       // U+1F446

}  // namespace

StyleClass StyleClassForPosition(size_t position, size_t total) {
  if (position <= 1) return StyleClass::kHook;
  if (position >= total) return StyleClass::kCta;
  return StyleClass::kNumbered;
}

TextStyle StyleForClass(StyleClass style_class,
                        const std::optional<std::string>& emoji_override) {
  TextStyle style;
  style.color = kWhite;
  switch (style_class) {
    case StyleClass::kHook:
      style.font_family = "Montserrat";
      style.font_size = 26;
      style.font_weight = "800";
      style.text_shadow = "2px 2px 6px rgba(0,0,0,0.9)";
      style.emoji = kSparkles;
      style.emoji_position = EmojiPosition::kBoth;
      style.position = ScreenPosition::kCenter;
      style.alignment = TextAlignment::kCenter;
      break;
    case StyleClass::kNumbered:
      style.font_family = "Inter";
      style.font_size = 24;
      style.font_weight = "700";
      style.text_shadow = "1px 1px 3px rgba(0,0,0,0.9)";
      style.emoji = kRoundPushpin;
      style.emoji_position = EmojiPosition::kBefore;
      style.position = ScreenPosition::kTop;
      style.alignment = TextAlignment::kLeft;
      break;
    case StyleClass::kCta:
      style.font_family = "Poppins";
      style.font_size = 20;
      style.font_weight = "600";
      style.emoji = kPointUp;
      style.emoji_position = EmojiPosition::kAfter;
      style.position = ScreenPosition::kCenter;
      style.alignment = TextAlignment::kCenter;
      break;
    case StyleClass::kLocationLabel:
      style.font_family = "Poppins";
      style.font_size = 22;
      style.font_weight = "700";
      style.background_color = "rgba(0,0,0,0.6)";
      style.emoji = kRoundPushpin;
      style.emoji_position = EmojiPosition::kBefore;
      style.position = ScreenPosition::kBottom;
      style.alignment = TextAlignment::kLeft;
      break;
  }
  if (emoji_override && !emoji_override->empty() && style.emoji) {
    style.emoji = *emoji_override;
  }
  return style;
}

const char* EmojiPositionName(EmojiPosition p) {
  switch (p) {
    case EmojiPosition::kBefore: return "before";
    case EmojiPosition::kAfter:  return "after";
    case EmojiPosition::kBoth:   return "both";
  }
  return "before";
}

const char* ScreenPositionName(ScreenPosition p) {
  switch (p) {
    case ScreenPosition::kTop:    return "top";
    case ScreenPosition::kCenter: return "center";
    case ScreenPosition::kBottom: return "bottom";
  }
  return "center";
}

const char* TextAlignmentName(TextAlignment a) {
  switch (a) {
    case TextAlignment::kLeft:   return "left";
    case TextAlignment::kCenter: return "center";
    case TextAlignment::kRight:  return "right";
  }
  return "center";
}

std::optional<StyleClass> ParseStyleClass(const std::string& name) {
  for (StyleClass c : {StyleClass::kHook, StyleClass::kNumbered, StyleClass::kCta,
                       StyleClass::kLocationLabel}) {
    if (name == StyleClassName(c)) return c;
  }
  return std::nullopt;
}

std::optional<EmojiPosition> ParseEmojiPosition(const std::string& name) {
  for (EmojiPosition p : {EmojiPosition::kBefore, EmojiPosition::kAfter, EmojiPosition::kBoth}) {
    if (name == EmojiPositionName(p)) return p;
  }
  return std::nullopt;
}

std::optional<ScreenPosition> ParseScreenPosition(const std::string& name) {
  for (ScreenPosition p : {ScreenPosition::kTop, ScreenPosition::kCenter, ScreenPosition::kBottom}) {
    if (name == ScreenPositionName(p)) return p;
  }
  return std::nullopt;
}

std::optional<TextAlignment> ParseTextAlignment(const std::string& name) {
  for (TextAlignment a : {TextAlignment::kLeft, TextAlignment::kCenter, TextAlignment::kRight}) {
    if (name == TextAlignmentName(a)) return a;
  }
  return std::nullopt;
}

}  // namespace reelforge::timeline
