// Repository: ReelForge
// Component: Scene Extractor Implementation
// Copyright (c) 2025 ReelForge

#include "reelforge/detect/SceneExtractor.hpp"

#include <sstream>
#include <utility>

#include "reelforge/util/Logger.hpp"

namespace reelforge::detect {

using timeline::ExtractionError;

namespace {

// Closes the decoder on every exit path of a run.
class DecoderCloser {
 public:
  explicit DecoderCloser(sampling::IFrameDecoder& decoder) : decoder_(decoder) {}
  ~DecoderCloser() { decoder_.Close(); }

  DecoderCloser(const DecoderCloser&) = delete;
  DecoderCloser& operator=(const DecoderCloser&) = delete;

 private:
  sampling::IFrameDecoder& decoder_;
};

bool IsCancelled(const std::atomic<bool>* cancel) {
  return cancel != nullptr && cancel->load(std::memory_order_acquire);
}

}  // namespace

SceneExtractor::SceneExtractor(sampling::IFrameDecoder& decoder,
                               const time::ITimeSource& clock,
                               ExtractionConfig config)
    : decoder_(decoder), clock_(clock), config_(std::move(config)) {}

DetectionResult SceneExtractor::Stop(ExtractionError error,
                                     const std::string& detail,
                                     SceneChangeDetector& detector,
                                     int64_t total_ms) const {
  detector.Abort();
  DetectionResult result = DetectionResult::Failure(error, detail);
  result.scenes = detector.TakeScenes();
  result.total_duration_ms = total_ms;

  std::ostringstream oss;
  oss << "[SceneExtractor] run stopped: error=" << timeline::ExtractionErrorToString(error)
      << " detail=\"" << detail << "\" finalized_scenes=" << result.scenes.size();
  if (error == ExtractionError::kCancelled) {
    util::Logger::Info(oss.str());
  } else {
    util::Logger::Warn(oss.str());
  }
  return result;
}

DetectionResult SceneExtractor::Run(IDetectionObserver* observer) {
  std::string config_error;
  if (!SceneChangeDetector::ValidateConfig(config_.detector, &config_error)) {
    return DetectionResult::Failure(ExtractionError::kComputationError, config_error);
  }

  if (!decoder_.Open()) {
    util::Logger::Error("[SceneExtractor] source could not be opened");
    return DetectionResult::Failure(ExtractionError::kDecodeError, "source could not be opened");
  }
  DecoderCloser closer(decoder_);

  const int64_t total_ms =
      config_.duration_override_ms > 0 ? config_.duration_override_ms : decoder_.DurationMs();
  if (total_ms <= 0) {
    util::Logger::Error("[SceneExtractor] source duration unknown");
    return DetectionResult::Failure(ExtractionError::kDecodeError, "source duration unknown");
  }

  sampling::FrameSampler sampler(decoder_, clock_, config_.sampler);
  const std::vector<int64_t> plan = sampler.Plan(total_ms);

  SceneChangeDetector detector(config_.detector);
  if (plan.empty()) {
    DetectionResult r = DetectionResult::Failure(ExtractionError::kEmptyResult,
                                                 "no sample timestamps planned");
    r.total_duration_ms = total_ms;
    return r;
  }

  const int64_t run_start = clock_.NowUtcMs();
  const int64_t run_deadline =
      config_.run_budget_ms > 0 ? run_start + config_.run_budget_ms : 0;

  {
    std::ostringstream oss;
    oss << "[SceneExtractor] run start: total_ms=" << total_ms
        << " frames=" << plan.size()
        << " threshold=" << config_.detector.threshold
        << " min_scene_ms=" << config_.detector.min_scene_ms
        << " budget_ms=" << config_.run_budget_ms;
    util::Logger::Info(oss.str());
  }

  size_t used = 0;
  size_t skipped = 0;
  const size_t n = plan.size();

  auto finish_counts = [&](DetectionResult& r) {
    r.frames_scheduled = n;
    r.frames_used = used;
    r.frames_skipped = skipped;
  };

  for (size_t i = 0; i < n; ++i) {
    if (IsCancelled(config_.cancel)) {
      std::ostringstream detail;
      detail << "cancelled after " << i << " of " << n << " frames";
      DetectionResult r = Stop(ExtractionError::kCancelled, detail.str(), detector, total_ms);
      finish_counts(r);
      return r;
    }
    if (run_deadline > 0 && clock_.NowUtcMs() >= run_deadline) {
      std::ostringstream detail;
      detail << "run budget " << config_.run_budget_ms << "ms exceeded after "
             << i << " of " << n << " frames";
      DetectionResult r =
          Stop(ExtractionError::kExtractionTimeout, detail.str(), detector, total_ms);
      finish_counts(r);
      return r;
    }

    sampling::SampledFrame frame;
    const sampling::FrameStatus status =
        sampler.SampleAt(plan[i], run_deadline, config_.cancel, frame);

    if (status == sampling::FrameStatus::kAborted && IsCancelled(config_.cancel)) {
      std::ostringstream detail;
      detail << "cancelled during frame " << (i + 1) << " of " << n;
      DetectionResult r = Stop(ExtractionError::kCancelled, detail.str(), detector, total_ms);
      finish_counts(r);
      return r;
    }
    if (status != sampling::FrameStatus::kOk && run_deadline > 0 &&
        clock_.NowUtcMs() >= run_deadline) {
      std::ostringstream detail;
      detail << "run budget " << config_.run_budget_ms << "ms exceeded during frame "
             << (i + 1) << " of " << n;
      DetectionResult r =
          Stop(ExtractionError::kExtractionTimeout, detail.str(), detector, total_ms);
      finish_counts(r);
      return r;
    }
    if (status == sampling::FrameStatus::kSeekTimeout && i == 0) {
      std::ostringstream detail;
      detail << "first frame at " << plan[i] << "ms exceeded seek timeout "
             << config_.sampler.seek_timeout_ms << "ms";
      DetectionResult r = Stop(ExtractionError::kSeekTimeout, detail.str(), detector, total_ms);
      finish_counts(r);
      return r;
    }
    if (i == 0 && (status == sampling::FrameStatus::kSeekFailed ||
                   status == sampling::FrameStatus::kRenderFailed)) {
      std::ostringstream detail;
      detail << "first frame at " << plan[i] << "ms could not be decoded ("
             << sampling::FrameStatusToString(status) << ")";
      DetectionResult r = Stop(ExtractionError::kDecodeError, detail.str(), detector, total_ms);
      finish_counts(r);
      return r;
    }

    if (status == sampling::FrameStatus::kOk) {
      ++used;
      std::optional<timeline::Scene> scene = detector.Feed(std::move(frame));
      if (scene && observer) observer->OnSceneFinalized(*scene);
    } else {
      ++skipped;
    }

    if (observer) {
      observer->OnProgress(static_cast<double>(i + 1) / static_cast<double>(n));
    }
  }

  if (used == 0) {
    std::ostringstream detail;
    detail << "no usable frames (" << skipped << " of " << n << " skipped)";
    DetectionResult r = Stop(ExtractionError::kEmptyResult, detail.str(), detector, total_ms);
    finish_counts(r);
    return r;
  }

  std::optional<timeline::Scene> last = detector.Finish(total_ms);
  if (last && observer) observer->OnSceneFinalized(*last);

  DetectionResult result = DetectionResult::Success(detector.TakeScenes(), total_ms);
  finish_counts(result);

  std::ostringstream oss;
  oss << "[SceneExtractor] run complete: scenes=" << result.scenes.size()
      << " frames_used=" << used << " frames_skipped=" << skipped
      << " elapsed_ms=" << (clock_.NowUtcMs() - run_start);
  util::Logger::Info(oss.str());
  return result;
}

}  // namespace reelforge::detect
