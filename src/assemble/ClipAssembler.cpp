// Repository: ReelForge
// Component: Clip / Overlay Assembler Implementation
// Copyright (c) 2025 ReelForge

#include "reelforge/assemble/ClipAssembler.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "reelforge/timeline/TextStyles.hpp"
#include "reelforge/timeline/TimelineValidator.hpp"
#include "reelforge/util/Logger.hpp"

namespace reelforge::assemble {

using timeline::ExtractionError;
using timeline::StyleClass;
using timeline::TimelineValidator;

ClipAssembler::ClipAssembler(AssemblerConfig config) : config_(std::move(config)) {}

AssemblyResult ClipAssembler::FromSegments(const std::vector<timeline::Segment>& segments,
                                           const std::vector<std::string>& media) const {
  if (segments.empty()) {
    return AssemblyResult::Failure(ExtractionError::kComputationError, "no segments");
  }
  auto check = TimelineValidator::ValidateSegments(segments);
  if (!check.valid) {
    return AssemblyResult::Failure(check.error, check.detail);
  }

  std::vector<Unit> units;
  std::vector<GroupSlot> slots;
  units.reserve(segments.size());
  slots.reserve(segments.size());

  int32_t content_index = 0;
  for (size_t i = 0; i < segments.size(); ++i) {
    const timeline::Segment& seg = segments[i];
    GroupSlot slot;
    switch (seg.kind) {
      case timeline::SegmentKind::kIntro:
        slot.group_id = 0;
        break;
      case timeline::SegmentKind::kContent:
        slot.group_id = ++content_index;
        break;
      case timeline::SegmentKind::kOutro:
        slot.group_id = content_index + 1;
        break;
    }
    slot.name = seg.label;
    slot.overlay_text = seg.text.value_or(seg.label);
    slot.style_class = seg.style_class;
    slots.push_back(std::move(slot));

    units.push_back(Unit{seg.position, seg.start_ms, seg.end_ms(), seg.label, {}});
  }
  return Build(units, slots, media);
}

std::vector<ClipAssembler::GroupSlot> ClipAssembler::SlotsForScenes(
    size_t scene_count,
    const std::vector<std::string>& labels,
    const OverlayText& text) const {
  std::vector<GroupSlot> slots;
  slots.reserve(scene_count);

  GroupSlot intro{0, config_.intro_name, text.hook.value_or(config_.intro_name),
                  StyleClass::kHook};
  slots.push_back(intro);

  if (labels.empty()) {
    for (size_t k = 1; k < scene_count; ++k) {
      const std::string name = config_.shot_prefix + " " + std::to_string(k);
      slots.push_back(GroupSlot{static_cast<int32_t>(k), name, name,
                                StyleClass::kLocationLabel});
    }
    return slots;
  }

  const bool has_outro = scene_count >= 3;
  const size_t middle = scene_count - 1 - (has_outro ? 1 : 0);
  const size_t n = labels.size();

  int32_t last_group = 0;
  for (size_t j = 0; j < middle; ++j) {
    const size_t label_index = middle < n ? j : (j * n) / middle;
    const int32_t group_id = static_cast<int32_t>(label_index + 1);
    const std::string& label = labels[label_index];
    slots.push_back(GroupSlot{group_id, label,
                              std::to_string(group_id) + ". " + label,
                              StyleClass::kNumbered});
    last_group = group_id;
  }

  if (has_outro) {
    slots.push_back(GroupSlot{last_group + 1, config_.outro_name,
                              text.outro.value_or(config_.default_outro_text),
                              StyleClass::kCta});
  }
  return slots;
}

AssemblyResult ClipAssembler::FromScenes(const std::vector<timeline::Scene>& scenes,
                                         const std::vector<std::string>& labels,
                                         const std::vector<std::string>& media,
                                         const OverlayText& text) const {
  if (scenes.empty()) {
    return AssemblyResult::Failure(ExtractionError::kComputationError, "no scenes");
  }
  auto check = TimelineValidator::ValidateScenes(scenes);
  if (!check.valid) {
    return AssemblyResult::Failure(check.error, check.detail);
  }

  std::vector<Unit> units;
  units.reserve(scenes.size());
  for (const auto& s : scenes) {
    units.push_back(Unit{s.id, s.start_ms, s.end_ms, s.description, s.thumbnail_jpeg});
  }
  return Build(units, SlotsForScenes(scenes.size(), labels, text), media);
}

AssemblyResult ClipAssembler::Build(const std::vector<Unit>& units,
                                    const std::vector<GroupSlot>& slots,
                                    const std::vector<std::string>& media) const {
  std::vector<timeline::Clip> clips;
  std::vector<timeline::TextOverlay> overlays;
  std::vector<timeline::LocationGroup> groups;
  clips.reserve(units.size());

  for (size_t i = 0; i < units.size(); ++i) {
    const Unit& unit = units[i];
    const GroupSlot& slot = slots[i];

    const bool opens_group = groups.empty() || groups.back().location_id != slot.group_id;
    if (opens_group) {
      timeline::LocationGroup group;
      group.location_id = slot.group_id;
      group.location_name = slot.name;
      groups.push_back(std::move(group));

      timeline::TextOverlay overlay;
      overlay.group_id = slot.group_id;
      overlay.text = slot.overlay_text;
      overlay.style_class = slot.style_class;
      overlay.style = timeline::StyleForClass(slot.style_class, config_.emoji_override);
      overlay.start_ms = unit.start_ms;
      overlay.end_ms = unit.end_ms;
      overlays.push_back(std::move(overlay));
    }
    const size_t group_ordinal = groups.size() - 1;
    overlays.back().end_ms = unit.end_ms;

    timeline::Clip clip;
    clip.index = static_cast<int32_t>(i);
    clip.group_id = slot.group_id;
    clip.source_id = unit.source_id;
    clip.start_ms = unit.start_ms;
    clip.end_ms = unit.end_ms;
    if (group_ordinal < media.size() && !media[group_ordinal].empty()) {
      clip.media_uri = media[group_ordinal];
    }
    clip.thumbnail_jpeg = unit.thumbnail_jpeg;

    // The first scene of a group carries the overlay; the rest are plain
    // location shots.
    timeline::SceneInfo info;
    info.id = unit.source_id;
    info.start_ms = unit.start_ms;
    info.end_ms = unit.end_ms;
    if (opens_group) {
      info.text_overlay = slot.overlay_text;
      info.style_class = slot.style_class;
    } else {
      info.style_class = StyleClass::kLocationLabel;
    }
    info.text_style = timeline::StyleForClass(info.style_class, config_.emoji_override);
    info.description = unit.description;
    info.thumbnail_jpeg = unit.thumbnail_jpeg;
    info.media_uri = clip.media_uri;
    groups.back().scenes.push_back(std::move(info));

    clips.push_back(std::move(clip));
  }

  auto clip_check = TimelineValidator::ValidateClips(clips);
  if (!clip_check.valid) {
    return AssemblyResult::Failure(clip_check.error, clip_check.detail);
  }
  auto overlay_check = TimelineValidator::ValidateOverlays(overlays, clips);
  if (!overlay_check.valid) {
    return AssemblyResult::Failure(overlay_check.error, overlay_check.detail);
  }

  std::ostringstream oss;
  oss << "[ClipAssembler] assembled clips=" << clips.size() << " groups=" << groups.size()
      << " media_bound=" << std::min(media.size(), groups.size());
  util::Logger::Debug(oss.str());

  return AssemblyResult::Success(std::move(clips), std::move(overlays), std::move(groups));
}

}  // namespace reelforge::assemble
