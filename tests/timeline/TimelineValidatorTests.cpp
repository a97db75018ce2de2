// Repository: ReelForge
// Component: Timeline Validator Tests
// Copyright (c) 2025 ReelForge

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "reelforge/timeline/TimelineValidator.hpp"

namespace reelforge::timeline {
namespace {

Scene MakeScene(int32_t id, int64_t start_ms, int64_t end_ms) {
  Scene s;
  s.id = id;
  s.start_ms = start_ms;
  s.end_ms = end_ms;
  return s;
}

Clip MakeClip(int32_t index, int32_t group_id, int64_t start_ms, int64_t end_ms) {
  Clip c;
  c.index = index;
  c.group_id = group_id;
  c.start_ms = start_ms;
  c.end_ms = end_ms;
  return c;
}

// =============================================================================
// Scenes
// =============================================================================

TEST(TimelineValidator, ContiguousScenesAccepted) {
  std::vector<Scene> scenes = {MakeScene(1, 0, 2000), MakeScene(2, 2000, 5000),
                               MakeScene(3, 5000, 6000)};
  auto result = TimelineValidator::ValidateScenes(scenes, 1000);
  EXPECT_TRUE(result.valid) << result.detail;
  EXPECT_EQ(result.error, ExtractionError::kNone);
}

TEST(TimelineValidator, SceneGapRejected) {
  std::vector<Scene> scenes = {MakeScene(1, 0, 2000), MakeScene(2, 2500, 5000)};
  auto result = TimelineValidator::ValidateScenes(scenes);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.error, ExtractionError::kComputationError);
  EXPECT_NE(result.detail.find("gap of 500ms"), std::string::npos) << result.detail;
}

TEST(TimelineValidator, SceneOverlapRejected) {
  std::vector<Scene> scenes = {MakeScene(1, 0, 2000), MakeScene(2, 1500, 5000)};
  auto result = TimelineValidator::ValidateScenes(scenes);
  EXPECT_FALSE(result.valid);
  EXPECT_NE(result.detail.find("overlaps"), std::string::npos) << result.detail;
}

TEST(TimelineValidator, ShortSceneRejectedOnlyWithMinimum) {
  std::vector<Scene> scenes = {MakeScene(1, 0, 400), MakeScene(2, 400, 3000)};
  EXPECT_TRUE(TimelineValidator::ValidateScenes(scenes).valid);
  EXPECT_FALSE(TimelineValidator::ValidateScenes(scenes, 1000).valid);
}

TEST(TimelineValidator, EmptyIntervalRejected) {
  std::vector<Scene> scenes = {MakeScene(1, 1000, 1000)};
  EXPECT_FALSE(TimelineValidator::ValidateScenes(scenes).valid);
}

// =============================================================================
// Segments
// =============================================================================

TEST(TimelineValidator, SegmentsMustStartAtZeroAndAbut) {
  Segment a;
  a.position = 1;
  a.start_ms = 0;
  a.duration_ms = 2000;
  Segment b;
  b.position = 2;
  b.start_ms = 2000;
  b.duration_ms = 3000;
  EXPECT_TRUE(TimelineValidator::ValidateSegments({a, b}).valid);

  Segment late = b;
  late.start_ms = 2100;
  EXPECT_FALSE(TimelineValidator::ValidateSegments({a, late}).valid);

  Segment misnumbered = b;
  misnumbered.position = 3;
  EXPECT_FALSE(TimelineValidator::ValidateSegments({a, misnumbered}).valid);

  Segment empty = b;
  empty.duration_ms = 0;
  EXPECT_FALSE(TimelineValidator::ValidateSegments({a, empty}).valid);
}

// =============================================================================
// Clips and overlays
// =============================================================================

TEST(TimelineValidator, ClipsMustBeIndexedAndContiguous) {
  std::vector<Clip> clips = {MakeClip(0, 0, 0, 1000), MakeClip(1, 1, 1000, 4000)};
  EXPECT_TRUE(TimelineValidator::ValidateClips(clips).valid);

  clips[1].start_ms = 1200;
  EXPECT_FALSE(TimelineValidator::ValidateClips(clips).valid);

  clips[1].start_ms = 1000;
  clips[1].index = 5;
  EXPECT_FALSE(TimelineValidator::ValidateClips(clips).valid);
}

TEST(TimelineValidator, OverlayMustStayInsideItsGroup) {
  std::vector<Clip> clips = {MakeClip(0, 0, 0, 1000), MakeClip(1, 1, 1000, 2500),
                             MakeClip(2, 1, 2500, 4000)};

  TextOverlay inside;
  inside.group_id = 1;
  inside.start_ms = 1000;
  inside.end_ms = 4000;
  EXPECT_TRUE(TimelineValidator::ValidateOverlays({inside}, clips).valid);

  TextOverlay spills = inside;
  spills.start_ms = 500;
  EXPECT_FALSE(TimelineValidator::ValidateOverlays({spills}, clips).valid);

  TextOverlay orphan = inside;
  orphan.group_id = 9;
  auto result = TimelineValidator::ValidateOverlays({orphan}, clips);
  EXPECT_FALSE(result.valid);
  EXPECT_NE(result.detail.find("group 9"), std::string::npos);
}

}  // namespace
}  // namespace reelforge::timeline
