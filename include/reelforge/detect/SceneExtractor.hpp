// Repository: ReelForge
// Component: Scene Extractor
// Purpose: Drives sampler and detector for one run; timeouts, cancel, progress
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_DETECT_SCENE_EXTRACTOR_HPP_
#define REELFORGE_DETECT_SCENE_EXTRACTOR_HPP_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "reelforge/detect/SceneChangeDetector.hpp"
#include "reelforge/sampling/FrameSampler.hpp"
#include "reelforge/sampling/IFrameDecoder.hpp"
#include "reelforge/time/ITimeSource.hpp"
#include "reelforge/timeline/TimelineTypes.hpp"

namespace reelforge::detect {

// Observer for one extraction run. Called on the extracting thread; must not
// block. Observers cannot influence detection output.
class IDetectionObserver {
 public:
  virtual ~IDetectionObserver() = default;

  // Once per scheduled frame, (i + 1) / n, non-decreasing in [0, 1].
  virtual void OnProgress(double fraction) = 0;

  virtual void OnSceneFinalized(const timeline::Scene& scene) { (void)scene; }
};

struct ExtractionConfig {
  sampling::SamplerConfig sampler;
  DetectorConfig detector;

  // Whole-run wall-clock budget; 0 = unlimited.
  int64_t run_budget_ms = 0;

  // Used instead of the probed duration when > 0.
  int64_t duration_override_ms = 0;

  // Checked before every frame; not owned.
  const std::atomic<bool>* cancel = nullptr;
};

struct DetectionResult {
  bool ok;
  timeline::ExtractionError error;
  std::string detail;

  // Finalized scenes. On kCancelled / kExtractionTimeout these are the scenes
  // emitted before the run stopped; no partial trailing scene is included.
  std::vector<timeline::Scene> scenes;

  int64_t total_duration_ms = 0;
  size_t frames_scheduled = 0;
  size_t frames_used = 0;
  size_t frames_skipped = 0;

  static DetectionResult Success(std::vector<timeline::Scene> scenes, int64_t total_ms) {
    DetectionResult r{true, timeline::ExtractionError::kNone, "", std::move(scenes)};
    r.total_duration_ms = total_ms;
    return r;
  }

  static DetectionResult Failure(timeline::ExtractionError err, const std::string& detail = "") {
    return {false, err, detail, {}};
  }
};

// SceneExtractor runs one detection pass over a decoder:
//
//   Open → plan timestamps → for each: cancel? budget? render → feed → progress
//        → Finish(T) → Close
//
// Failure policy:
//   Open() false / unknown duration        → kDecodeError
//   first scheduled frame overran seek     → kSeekTimeout
//   first scheduled frame seek/render fail → kDecodeError
//   other per-frame failures               → skipped, Warn logged
//   run budget exceeded                    → kExtractionTimeout
//   cancel flag raised                     → kCancelled
//   no usable frame                        → kEmptyResult
//   invalid detector config                → kComputationError
//
// Each Run() builds its own detector; a SceneExtractor may be reused
// sequentially but shares nothing mutable between runs.
class SceneExtractor {
 public:
  SceneExtractor(sampling::IFrameDecoder& decoder,
                 const time::ITimeSource& clock,
                 ExtractionConfig config = ExtractionConfig());

  DetectionResult Run(IDetectionObserver* observer = nullptr);

 private:
  DetectionResult Stop(timeline::ExtractionError error,
                       const std::string& detail,
                       SceneChangeDetector& detector,
                       int64_t total_ms) const;

  sampling::IFrameDecoder& decoder_;
  const time::ITimeSource& clock_;
  ExtractionConfig config_;
};

}  // namespace reelforge::detect

#endif  // REELFORGE_DETECT_SCENE_EXTRACTOR_HPP_
