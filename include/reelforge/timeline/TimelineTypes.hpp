// Repository: ReelForge
// Component: Timeline Types
// Purpose: Data structures shared by detection, allocation and assembly
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_TIMELINE_TYPES_HPP_
#define REELFORGE_TIMELINE_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace reelforge::timeline {

// =============================================================================
// Error Codes
// Terminal, whole-run failures. Per-frame failures never surface here; they
// are skipped and logged by the sampler.
// =============================================================================

enum class ExtractionError {
  // No error
  kNone = 0,

  // Source could not be opened or decoded at all (unreadable, no video stream)
  kDecodeError,

  // The very first scheduled frame overran its per-seek timeout
  kSeekTimeout,

  // The caller-supplied wall-clock budget for the whole run was exceeded
  kExtractionTimeout,

  // Zero usable frames were produced
  kEmptyResult,

  // Invalid input: duration <= 0, threshold outside (0,1), broken partition
  kComputationError,

  // Caller raised the cancel flag; finalized scenes remain valid
  kCancelled,
};

const char* ExtractionErrorToString(ExtractionError error);

// Inverse of ExtractionErrorToString; false for unknown names.
bool ExtractionErrorFromString(const std::string& name, ExtractionError* error);

// =============================================================================
// Scene
// A contiguous video interval produced by the SceneChangeDetector.
// =============================================================================

struct Scene {
  int32_t id = 0;               // 1-based, sequential per run
  int64_t start_ms = 0;
  int64_t end_ms = 0;
  std::vector<uint8_t> thumbnail_jpeg;  // empty when the decoder produced none
  std::string description;

  int64_t duration_ms() const { return end_ms - start_ms; }
};

// =============================================================================
// Segment
// Abstract timeline slot produced by the TimelineAllocator.
// =============================================================================

enum class SegmentKind : int32_t {
  kIntro = 0,
  kContent = 1,
  kOutro = 2,
};

// Overlay style class. Pure function of ordinal position (see TextStyles.hpp).
enum class StyleClass : int32_t {
  kHook = 0,
  kNumbered = 1,
  kCta = 2,
  kLocationLabel = 3,  // scene-derived groups without overlay text
};

inline const char* SegmentKindName(SegmentKind k) {
  switch (k) {
    case SegmentKind::kIntro:   return "INTRO";
    case SegmentKind::kContent: return "CONTENT";
    case SegmentKind::kOutro:   return "OUTRO";
  }
  return "UNKNOWN";
}

inline const char* StyleClassName(StyleClass c) {
  switch (c) {
    case StyleClass::kHook:          return "hook";
    case StyleClass::kNumbered:      return "numbered";
    case StyleClass::kCta:           return "cta";
    case StyleClass::kLocationLabel: return "locationLabel";
  }
  return "unknown";
}

struct Segment {
  int32_t position = 0;         // 1-based ordinal within the run
  SegmentKind kind = SegmentKind::kContent;
  std::string label;            // "Intro", item label, "Outro"
  int64_t start_ms = 0;
  int64_t duration_ms = 0;
  std::optional<std::string> text;  // overlay text; nullopt = overlay shows label
  StyleClass style_class = StyleClass::kNumbered;

  int64_t end_ms() const { return start_ms + duration_ms; }
};

// =============================================================================
// Text Style / Overlay
// =============================================================================

enum class EmojiPosition : int32_t { kBefore = 0, kAfter = 1, kBoth = 2 };
enum class ScreenPosition : int32_t { kTop = 0, kCenter = 1, kBottom = 2 };
enum class TextAlignment : int32_t { kLeft = 0, kCenter = 1, kRight = 2 };

struct TextStyle {
  std::string font_family;
  int32_t font_size = 24;
  std::string font_weight;      // CSS-style weight string, e.g. "700"
  std::string color;            // "#RRGGBB"
  std::optional<std::string> text_shadow;
  std::optional<std::string> background_color;
  std::optional<std::string> emoji;
  std::optional<EmojiPosition> emoji_position;
  ScreenPosition position = ScreenPosition::kCenter;
  TextAlignment alignment = TextAlignment::kCenter;

  bool has_emoji() const { return emoji.has_value(); }
};

struct TextOverlay {
  int32_t group_id = 0;
  std::string text;
  TextStyle style;
  StyleClass style_class = StyleClass::kNumbered;
  int64_t start_ms = 0;         // inclusive
  int64_t end_ms = 0;           // exclusive
};

// =============================================================================
// Clip / Location group
// =============================================================================

struct Clip {
  int32_t index = 0;            // 0-based order in the track
  int32_t group_id = 0;         // owning location group
  int32_t source_id = 0;        // Segment::position or Scene::id
  int64_t start_ms = 0;
  int64_t end_ms = 0;
  std::optional<std::string> media_uri;   // externally supplied footage
  std::vector<uint8_t> thumbnail_jpeg;

  int64_t duration_ms() const { return end_ms - start_ms; }
};

struct SceneInfo {
  int32_t id = 0;
  int64_t start_ms = 0;
  int64_t end_ms = 0;
  std::optional<std::string> text_overlay;
  TextStyle text_style;
  StyleClass style_class = StyleClass::kLocationLabel;
  std::string description;
  std::vector<uint8_t> thumbnail_jpeg;
  std::optional<std::string> media_uri;

  int64_t duration_ms() const { return end_ms - start_ms; }
};

struct LocationGroup {
  int32_t location_id = 0;      // 0 is reserved for the intro
  std::string location_name;
  std::vector<SceneInfo> scenes;

  int64_t total_duration_ms() const {
    int64_t sum = 0;
    for (const auto& s : scenes) sum += s.duration_ms();
    return sum;
  }
};

}  // namespace reelforge::timeline

#endif  // REELFORGE_TIMELINE_TYPES_HPP_
