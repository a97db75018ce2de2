// Repository: ReelForge
// Component: Timeline Validator
// Purpose: Partition checks for scenes, segments and assembled clip tracks
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_TIMELINE_VALIDATOR_HPP_
#define REELFORGE_TIMELINE_VALIDATOR_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "reelforge/timeline/TimelineTypes.hpp"

namespace reelforge::timeline {

// =============================================================================
// Timeline Validator
// All checks fail fast on the first violation and report it as
// kComputationError with a human-readable detail.
// =============================================================================

class TimelineValidator {
 public:
  struct ValidationResult {
    bool valid;
    ExtractionError error;
    std::string detail;

    static ValidationResult Success() {
      return {true, ExtractionError::kNone, ""};
    }

    static ValidationResult Failure(const std::string& detail) {
      return {false, ExtractionError::kComputationError, detail};
    }
  };

  // Scenes must be non-empty intervals, sorted by start, contiguous
  // (scene[i].end_ms == scene[i+1].start_ms) and start at or after 0.
  // When min_scene_ms > 0 every scene must also last at least that long.
  static ValidationResult ValidateScenes(const std::vector<Scene>& scenes,
                                         int64_t min_scene_ms = 0);

  // Segments must carry positions 1..n in order, start at 0, have positive
  // duration and abut one another.
  static ValidationResult ValidateSegments(const std::vector<Segment>& segments);

  // Clip indices are 0..n-1 in order and clips abut one another.
  static ValidationResult ValidateClips(const std::vector<Clip>& clips);

  // Every overlay must lie inside the clip range of its own group.
  static ValidationResult ValidateOverlays(const std::vector<TextOverlay>& overlays,
                                           const std::vector<Clip>& clips);
};

}  // namespace reelforge::timeline

#endif  // REELFORGE_TIMELINE_VALIDATOR_HPP_
