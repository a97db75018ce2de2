// Repository: ReelForge
// Component: Scene Change Detector
// Purpose: Per-run pixel-difference boundary detection over sampled frames
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_DETECT_SCENE_CHANGE_DETECTOR_HPP_
#define REELFORGE_DETECT_SCENE_CHANGE_DETECTOR_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "reelforge/sampling/FrameTypes.hpp"
#include "reelforge/timeline/TimelineTypes.hpp"

namespace reelforge::detect {

struct DetectorConfig {
  // A frame whose score exceeds this is a candidate boundary. Must lie in (0, 1).
  double threshold = 0.3;

  // Shorter candidate scenes are absorbed into the scene in progress.
  int64_t min_scene_ms = 1000;
};

// SceneChangeDetector consumes frames in timestamp order and emits scenes.
//
// State is per instance (previous raster, scene start, last thumbnail, next
// id); create one per run. Emitted scenes are ordered, contiguous from 0,
// non-overlapping and each at least min_scene_ms long.
//
// Boundary rule at frame t with score > threshold:
//   t - scene_start >= min_scene_ms  → emit [scene_start, t), scene_start = t
//   otherwise                        → ignore; the interval stays in the
//                                      current scene
class SceneChangeDetector {
 public:
  explicit SceneChangeDetector(DetectorConfig config = DetectorConfig());

  // False (with a reason in *detail) when threshold is outside (0, 1) or
  // min_scene_ms is negative.
  static bool ValidateConfig(const DetectorConfig& config, std::string* detail);

  // Mean over pixels of (|dR| + |dG| + |dB|) / 765, in [0, 1].
  // Rasters of different dimensions score 1.0.
  static double FrameDifferenceScore(const sampling::RgbRaster& a,
                                     const sampling::RgbRaster& b);

  // Feeds the next frame; returns the scene it finalized, if any. Frames not
  // strictly after the previous one are ignored.
  std::optional<timeline::Scene> Feed(sampling::SampledFrame frame);

  // Flushes [scene_start, total_ms) if at least min_scene_ms long. After
  // Finish or Abort further calls are no-ops.
  std::optional<timeline::Scene> Finish(int64_t total_ms);

  // Stops without flushing the scene in progress.
  void Abort();

  const std::vector<timeline::Scene>& scenes() const { return scenes_; }
  std::vector<timeline::Scene> TakeScenes() { return std::move(scenes_); }

  size_t frames_fed() const { return frames_fed_; }
  std::optional<double> last_score() const { return last_score_; }
  bool closed() const { return closed_; }

 private:
  timeline::Scene MakeScene(int64_t start_ms, int64_t end_ms);

  DetectorConfig config_;

  std::optional<sampling::RgbRaster> previous_;
  std::optional<int64_t> previous_ts_ms_;
  std::optional<double> last_score_;
  std::vector<uint8_t> last_thumbnail_;
  int64_t scene_start_ms_ = 0;
  int32_t next_id_ = 1;
  size_t frames_fed_ = 0;
  bool closed_ = false;

  std::vector<timeline::Scene> scenes_;
};

}  // namespace reelforge::detect

#endif  // REELFORGE_DETECT_SCENE_CHANGE_DETECTOR_HPP_
