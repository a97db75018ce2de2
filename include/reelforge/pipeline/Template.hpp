// Repository: ReelForge
// Component: Template
// Purpose: The persisted edit template produced by one pipeline run
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_PIPELINE_TEMPLATE_HPP_
#define REELFORGE_PIPELINE_TEMPLATE_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "reelforge/timeline/TimelineTypes.hpp"

namespace reelforge::pipeline {

inline constexpr char kTemplateTypeReel[] = "reel";
inline constexpr char kMethodSceneDetection[] = "scene-detection";
inline constexpr char kMethodAllocation[] = "allocation";

struct VideoInfo {
  std::string title;
  std::string source_uri;
  int64_t duration_ms = 0;
};

struct Template {
  std::string id;
  std::string type = kTemplateTypeReel;
  int64_t total_duration_ms = 0;
  std::optional<VideoInfo> video_info;
  std::vector<timeline::LocationGroup> location_groups;
  std::vector<timeline::Scene> detected_scenes;
  std::string extraction_method;
  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;

  // Set when scene detection failed and the allocator produced the groups.
  bool used_fallback = false;
  timeline::ExtractionError detection_error = timeline::ExtractionError::kNone;

  // Allocation drift (see TimelineAllocator); 0 for detected timelines.
  int64_t drift_ms = 0;
};

}  // namespace reelforge::pipeline

#endif  // REELFORGE_PIPELINE_TEMPLATE_HPP_
