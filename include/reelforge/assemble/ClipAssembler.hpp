// Repository: ReelForge
// Component: Clip / Overlay Assembler
// Purpose: Turns segments or detected scenes into a clip track, location
//          groups and one text overlay per group.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_ASSEMBLE_CLIP_ASSEMBLER_HPP_
#define REELFORGE_ASSEMBLE_CLIP_ASSEMBLER_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "reelforge/timeline/TimelineTypes.hpp"

namespace reelforge::assemble {

struct AssemblerConfig {
  std::string intro_name = "Intro";
  std::string outro_name = "Outro";
  std::string shot_prefix = "Shot";                  // unlabeled scene groups
  std::string default_outro_text = "Follow for more!";

  // Replaces preset emoji on every overlay (e.g. the emoji found in a title).
  std::optional<std::string> emoji_override;
};

struct AssemblyResult {
  bool ok;
  timeline::ExtractionError error;
  std::string detail;

  std::vector<timeline::Clip> clips;           // contiguous, index order
  std::vector<timeline::TextOverlay> overlays; // one per group, group order
  std::vector<timeline::LocationGroup> groups; // location_id order

  static AssemblyResult Success(std::vector<timeline::Clip> clips,
                                std::vector<timeline::TextOverlay> overlays,
                                std::vector<timeline::LocationGroup> groups) {
    return {true, timeline::ExtractionError::kNone, "", std::move(clips),
            std::move(overlays), std::move(groups)};
  }

  static AssemblyResult Failure(timeline::ExtractionError err, const std::string& detail = "") {
    return {false, err, detail, {}, {}, {}};
  }
};

// Optional overlay text for the first and last group.
struct OverlayText {
  std::optional<std::string> hook;
  std::optional<std::string> outro;
};

// ClipAssembler maps timeline units onto location groups:
//
// FromSegments (allocator output): one group per segment.
//   intro → group 0, content i → group i (named by its label),
//   outro → group N + 1.
//
// FromScenes (detector output):
//   no labels   → scene 1 is group 0 "Intro", scene k is group k-1 "Shot k-1".
//   with labels → scene 1 is the intro; with ≥ 3 scenes the last is the outro;
//                 middle scene j of M goes to label j·N/M (contiguous runs).
//                 When M < N only the first M labels get a group.
//
// Every clip belongs to exactly one group. Each group gets one overlay
// spanning [first clip start, last clip end). media[k] is bound to every clip
// of the k-th group; groups past the end of `media` stay unbound.
//
// Inputs that are not contiguous partitions are rejected with
// kComputationError.
class ClipAssembler {
 public:
  explicit ClipAssembler(AssemblerConfig config = AssemblerConfig());

  AssemblyResult FromSegments(const std::vector<timeline::Segment>& segments,
                              const std::vector<std::string>& media = {}) const;

  AssemblyResult FromScenes(const std::vector<timeline::Scene>& scenes,
                            const std::vector<std::string>& labels = {},
                            const std::vector<std::string>& media = {},
                            const OverlayText& text = OverlayText()) const;

 private:
  // Group assignment for one scene.
  struct GroupSlot {
    int32_t group_id = 0;
    std::string name;
    std::string overlay_text;
    timeline::StyleClass style_class = timeline::StyleClass::kNumbered;
  };

  std::vector<GroupSlot> SlotsForScenes(size_t scene_count,
                                        const std::vector<std::string>& labels,
                                        const OverlayText& text) const;

  // Shared tail: builds clips, groups and overlays from per-unit slots and
  // checks the result.
  struct Unit {
    int32_t source_id = 0;
    int64_t start_ms = 0;
    int64_t end_ms = 0;
    std::string description;
    std::vector<uint8_t> thumbnail_jpeg;
  };

  AssemblyResult Build(const std::vector<Unit>& units,
                       const std::vector<GroupSlot>& slots,
                       const std::vector<std::string>& media) const;

  AssemblerConfig config_;
};

}  // namespace reelforge::assemble

#endif  // REELFORGE_ASSEMBLE_CLIP_ASSEMBLER_HPP_
