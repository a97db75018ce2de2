// Repository: ReelForge
// Component: Clip Assembler Tests
// Purpose: Group mapping for allocator segments and detected scenes, overlay
//          coverage and media binding.
// Copyright (c) 2025 ReelForge

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "reelforge/assemble/ClipAssembler.hpp"
#include "reelforge/timeline/TimelineAllocator.hpp"
#include "reelforge/timeline/TimelineValidator.hpp"

namespace reelforge::assemble {
namespace {

using timeline::Scene;
using timeline::StyleClass;

std::vector<Scene> ScenesAt(const std::vector<int64_t>& bounds) {
  std::vector<Scene> scenes;
  for (size_t i = 0; i + 1 < bounds.size(); ++i) {
    Scene s;
    s.id = static_cast<int32_t>(i + 1);
    s.start_ms = bounds[i];
    s.end_ms = bounds[i + 1];
    s.description = "Scene " + std::to_string(i + 1);
    s.thumbnail_jpeg = {0xFF, 0xD8, static_cast<uint8_t>(i + 1)};
    scenes.push_back(s);
  }
  return scenes;
}

std::vector<int32_t> GroupIds(const AssemblyResult& r) {
  std::vector<int32_t> ids;
  for (const auto& c : r.clips) ids.push_back(c.group_id);
  return ids;
}

void ExpectOverlaysCoverGroups(const AssemblyResult& r) {
  ASSERT_EQ(r.overlays.size(), r.groups.size());
  for (size_t g = 0; g < r.groups.size(); ++g) {
    const auto& overlay = r.overlays[g];
    EXPECT_EQ(overlay.group_id, r.groups[g].location_id);
    int64_t first = -1;
    int64_t last = -1;
    for (const auto& c : r.clips) {
      if (c.group_id != overlay.group_id) continue;
      if (first < 0) first = c.start_ms;
      last = c.end_ms;
    }
    EXPECT_EQ(overlay.start_ms, first) << "group " << overlay.group_id;
    EXPECT_EQ(overlay.end_ms, last) << "group " << overlay.group_id;
  }
}

// =============================================================================
// Segments
// =============================================================================

TEST(ClipAssemblerSegments, OneGroupPerSegment) {
  timeline::TimelineAllocator allocator;
  timeline::AllocationRequest request;
  request.total_duration_ms = 20000;
  request.item_count = 3;
  request.item_labels = {"Cafe", "Park", "Museum"};
  request.hook_text = "Three stops";
  auto allocation = allocator.Allocate(request);
  ASSERT_TRUE(allocation.ok);

  ClipAssembler assembler;
  AssemblyResult r = assembler.FromSegments(allocation.segments);

  ASSERT_TRUE(r.ok) << r.detail;
  EXPECT_EQ(GroupIds(r), (std::vector<int32_t>{0, 1, 2, 3, 4}));
  ASSERT_EQ(r.groups.size(), 5u);
  EXPECT_EQ(r.groups[0].location_name, "Intro");
  EXPECT_EQ(r.groups[2].location_name, "Park");
  EXPECT_EQ(r.groups[4].location_name, "Outro");

  EXPECT_EQ(r.overlays.front().text, "Three stops");
  EXPECT_EQ(r.overlays.front().style_class, StyleClass::kHook);
  EXPECT_EQ(r.overlays[1].text, "1. Cafe");
  EXPECT_EQ(r.overlays.back().style_class, StyleClass::kCta);
  ExpectOverlaysCoverGroups(r);
  EXPECT_TRUE(timeline::TimelineValidator::ValidateClips(r.clips).valid);
}

TEST(ClipAssemblerSegments, IntroWithoutHookOverlayShowsLabel) {
  timeline::TimelineAllocator allocator;
  timeline::AllocationRequest request;
  request.total_duration_ms = 20000;
  request.item_count = 2;
  auto allocation = allocator.Allocate(request);
  ASSERT_TRUE(allocation.ok);
  ASSERT_FALSE(allocation.segments.front().text.has_value());

  AssemblyResult r = ClipAssembler().FromSegments(allocation.segments);

  ASSERT_TRUE(r.ok) << r.detail;
  ASSERT_EQ(r.overlays.size(), r.groups.size());
  EXPECT_EQ(r.overlays.front().text, "Intro");
  EXPECT_EQ(r.groups.front().scenes.front().text_overlay, std::optional<std::string>("Intro"));
  ExpectOverlaysCoverGroups(r);
}

TEST(ClipAssemblerSegments, BrokenPartitionIsRejected) {
  std::vector<timeline::Segment> segments(2);
  segments[0].position = 1;
  segments[0].kind = timeline::SegmentKind::kIntro;
  segments[0].start_ms = 0;
  segments[0].duration_ms = 1000;
  segments[1].position = 2;
  segments[1].kind = timeline::SegmentKind::kOutro;
  segments[1].start_ms = 1500;
  segments[1].duration_ms = 1000;

  ClipAssembler assembler;
  AssemblyResult r = assembler.FromSegments(segments);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, timeline::ExtractionError::kComputationError);
  EXPECT_TRUE(r.clips.empty());

  EXPECT_EQ(assembler.FromSegments({}).error, timeline::ExtractionError::kComputationError);
}

// =============================================================================
// Scenes
// =============================================================================

TEST(ClipAssemblerScenes, UnlabeledScenesBecomeShots) {
  ClipAssembler assembler;
  AssemblyResult r = assembler.FromScenes(ScenesAt({0, 3000, 6000, 10000}));

  ASSERT_TRUE(r.ok) << r.detail;
  EXPECT_EQ(GroupIds(r), (std::vector<int32_t>{0, 1, 2}));
  EXPECT_EQ(r.groups[0].location_name, "Intro");
  EXPECT_EQ(r.groups[1].location_name, "Shot 1");
  EXPECT_EQ(r.groups[2].location_name, "Shot 2");
  EXPECT_EQ(r.overlays[1].style_class, StyleClass::kLocationLabel);
  ExpectOverlaysCoverGroups(r);

  // Thumbnails and ids flow through to clips.
  EXPECT_EQ(r.clips[2].source_id, 3);
  ASSERT_EQ(r.clips[2].thumbnail_jpeg.size(), 3u);
  EXPECT_EQ(r.clips[2].thumbnail_jpeg[2], 3);
}

TEST(ClipAssemblerScenes, LabelsSpreadOverMiddleScenesInContiguousRuns) {
  ClipAssembler assembler;
  OverlayText text;
  text.hook = "Two spots";
  AssemblyResult r = assembler.FromScenes(
      ScenesAt({0, 2000, 4000, 6000, 8000, 10000, 12000}), {"Cafe", "Park"}, {}, text);

  ASSERT_TRUE(r.ok) << r.detail;
  // Intro, four middle scenes over two labels, outro.
  EXPECT_EQ(GroupIds(r), (std::vector<int32_t>{0, 1, 1, 2, 2, 3}));
  ASSERT_EQ(r.groups.size(), 4u);
  EXPECT_EQ(r.groups[1].location_name, "Cafe");
  EXPECT_EQ(r.groups[1].scenes.size(), 2u);
  EXPECT_EQ(r.groups[3].location_name, "Outro");

  EXPECT_EQ(r.overlays[0].text, "Two spots");
  EXPECT_EQ(r.overlays[2].text, "2. Park");
  EXPECT_EQ(r.overlays[3].text, "Follow for more!");
  ExpectOverlaysCoverGroups(r);

  // Only the first scene of a group carries overlay text.
  EXPECT_TRUE(r.groups[1].scenes[0].text_overlay.has_value());
  EXPECT_FALSE(r.groups[1].scenes[1].text_overlay.has_value());
}

TEST(ClipAssemblerScenes, FewerScenesThanLabelsUsesLeadingLabels) {
  ClipAssembler assembler;
  AssemblyResult r = assembler.FromScenes(ScenesAt({0, 3000, 6000, 9000, 12000}),
                                          {"A", "B", "C", "D", "E"});

  ASSERT_TRUE(r.ok) << r.detail;
  EXPECT_EQ(GroupIds(r), (std::vector<int32_t>{0, 1, 2, 3}));
  EXPECT_EQ(r.groups[1].location_name, "A");
  EXPECT_EQ(r.groups[2].location_name, "B");
  EXPECT_EQ(r.groups[3].location_name, "Outro");
}

TEST(ClipAssemblerScenes, MediaBindsPerGroup) {
  ClipAssembler assembler;
  AssemblyResult r = assembler.FromScenes(ScenesAt({0, 2000, 4000, 6000, 8000, 10000, 12000}),
                                          {"Cafe", "Park"}, {"intro.mp4", "cafe.mp4"});

  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.clips[0].media_uri, std::optional<std::string>("intro.mp4"));
  EXPECT_EQ(r.clips[1].media_uri, std::optional<std::string>("cafe.mp4"));
  EXPECT_EQ(r.clips[2].media_uri, std::optional<std::string>("cafe.mp4"));
  EXPECT_FALSE(r.clips[3].media_uri.has_value());
  EXPECT_FALSE(r.clips[5].media_uri.has_value());
}

TEST(ClipAssemblerScenes, EmojiOverrideAppliesToEveryOverlay) {
  AssemblerConfig config;
  config.emoji_override = "\xE2\x98\x95";  // ☕
  ClipAssembler assembler(config);
  AssemblyResult r = assembler.FromScenes(ScenesAt({0, 3000, 6000, 9000}), {"Cafe"});

  ASSERT_TRUE(r.ok);
  for (const auto& overlay : r.overlays) {
    EXPECT_EQ(overlay.style.emoji, config.emoji_override);
  }
}

TEST(ClipAssemblerScenes, GappedScenesAreRejected) {
  std::vector<Scene> scenes = ScenesAt({0, 3000, 6000});
  scenes[1].start_ms = 3500;

  ClipAssembler assembler;
  AssemblyResult r = assembler.FromScenes(scenes);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, timeline::ExtractionError::kComputationError);
  EXPECT_EQ(assembler.FromScenes({}).error, timeline::ExtractionError::kComputationError);
}

}  // namespace
}  // namespace reelforge::assemble
