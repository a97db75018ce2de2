// Repository: ReelForge
// Component: Text Styles
// Purpose: Overlay style presets and the position → style-class mapping
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_TIMELINE_TEXT_STYLES_HPP_
#define REELFORGE_TIMELINE_TEXT_STYLES_HPP_

#include <cstddef>
#include <optional>
#include <string>

#include "reelforge/timeline/TimelineTypes.hpp"

namespace reelforge::timeline {

// Style class for the segment at 1-based `position` out of `total` segments.
// Depends on position only, never on segment content:
//   position 1        → kHook
//   position == total → kCta  (the appended outro)
//   otherwise         → kNumbered
// A single-segment timeline is its own intro: kHook.
StyleClass StyleClassForPosition(size_t position, size_t total);

// Preset for a style class.
//   kHook          Montserrat 26/800, centered, flanking emoji
//   kNumbered      Inter 24/700, top-left, leading emoji
//   kCta           Poppins 20/600, centered, trailing emoji
//   kLocationLabel Poppins 22/700, bottom-left, leading pin, dark backdrop
// `emoji_override` replaces the preset emoji (e.g. one detected in a title)
// and is ignored for classes without an emoji slot.
TextStyle StyleForClass(StyleClass style_class,
                        const std::optional<std::string>& emoji_override = std::nullopt);

const char* EmojiPositionName(EmojiPosition p);
const char* ScreenPositionName(ScreenPosition p);
const char* TextAlignmentName(TextAlignment a);

// Inverses of the *Name functions (and StyleClassName); nullopt for unknown
// names.
std::optional<StyleClass> ParseStyleClass(const std::string& name);
std::optional<EmojiPosition> ParseEmojiPosition(const std::string& name);
std::optional<ScreenPosition> ParseScreenPosition(const std::string& name);
std::optional<TextAlignment> ParseTextAlignment(const std::string& name);

}  // namespace reelforge::timeline

#endif  // REELFORGE_TIMELINE_TEXT_STYLES_HPP_
