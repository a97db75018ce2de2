// Repository: ReelForge
// Component: Frame Sampler
// Purpose: Timestamp planning and per-timestamp rendering with seek deadlines
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_SAMPLING_FRAME_SAMPLER_HPP_
#define REELFORGE_SAMPLING_FRAME_SAMPLER_HPP_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "reelforge/sampling/FrameTypes.hpp"
#include "reelforge/sampling/IFrameDecoder.hpp"
#include "reelforge/time/ITimeSource.hpp"

namespace reelforge::sampling {

enum class SamplingMode {
  kFixedCadence = 0,  // one sample per interval_ms, count clamped
  kTargetCount,       // exactly target_count samples (at least 2)
  kExplicit,          // caller-supplied timestamps
};

struct SamplerConfig {
  SamplingMode mode = SamplingMode::kFixedCadence;
  int64_t interval_ms = 1000;
  size_t target_count = 10;
  size_t min_samples = 10;
  size_t max_samples = 30;
  std::vector<int64_t> explicit_timestamps_ms;

  // Per-seek wall-clock budget. A frame overrunning it is discarded.
  int64_t seek_timeout_ms = 5000;
};

// FrameSampler plans sample timestamps and renders one timestamp at a time
// through an IFrameDecoder. It holds no per-run state beyond its config, so
// the caller (SceneExtractor) owns iteration, cancellation and progress.
//
// Planned modes always include an early sample (min(100ms, T/4)) and a
// near-final sample (max(T - 1000ms, 0.9T)); the rest are evenly spaced
// between them. All plans are strictly increasing and lie in [0, T).
class FrameSampler {
 public:
  FrameSampler(IFrameDecoder& decoder,
               const time::ITimeSource& clock,
               SamplerConfig config = SamplerConfig());

  static std::vector<int64_t> PlanFixedCadence(int64_t total_ms,
                                               int64_t interval_ms,
                                               size_t min_samples = 10,
                                               size_t max_samples = 30);
  static std::vector<int64_t> PlanTargetCount(int64_t total_ms, size_t count);
  static std::vector<int64_t> PlanExplicit(int64_t total_ms,
                                           std::vector<int64_t> timestamps_ms);

  // Plan for the configured mode.
  std::vector<int64_t> Plan(int64_t total_ms) const;

  // Renders one timestamp. The decoder deadline is now + seek_timeout_ms,
  // tightened to run_deadline_utc_ms when that is earlier (0 = none).
  // Returns kSeekTimeout when the render overran its seek budget even if the
  // decoder itself reported success; `out` is then left cleared.
  FrameStatus SampleAt(int64_t timestamp_ms,
                       int64_t run_deadline_utc_ms,
                       const std::atomic<bool>* cancel,
                       SampledFrame& out);

  const SamplerConfig& config() const { return config_; }

 private:
  // early + (n - 2) evenly spaced + final, deduplicated.
  static std::vector<int64_t> PlanEvenly(int64_t total_ms, size_t n);

  IFrameDecoder& decoder_;
  const time::ITimeSource& clock_;
  SamplerConfig config_;
};

}  // namespace reelforge::sampling

#endif  // REELFORGE_SAMPLING_FRAME_SAMPLER_HPP_
