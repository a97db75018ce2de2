// Repository: ReelForge
// Component: Frame Sampler Implementation
// Copyright (c) 2025 ReelForge

#include "reelforge/sampling/FrameSampler.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "reelforge/util/Logger.hpp"

namespace reelforge::sampling {

namespace {

constexpr int64_t kEarlySampleMs = 100;
constexpr int64_t kFinalLeadMs = 1000;

void SortUnique(std::vector<int64_t>& v) {
  std::sort(v.begin(), v.end());
  v.erase(std::unique(v.begin(), v.end()), v.end());
}

}  // namespace

const char* FrameStatusToString(FrameStatus status) {
  switch (status) {
    case FrameStatus::kOk:
      return "OK";
    case FrameStatus::kSeekFailed:
      return "SEEK_FAILED";
    case FrameStatus::kSeekTimeout:
      return "SEEK_TIMEOUT";
    case FrameStatus::kRenderFailed:
      return "RENDER_FAILED";
    case FrameStatus::kAborted:
      return "ABORTED";
  }
  return "UNKNOWN";
}

FrameSampler::FrameSampler(IFrameDecoder& decoder,
                           const time::ITimeSource& clock,
                           SamplerConfig config)
    : decoder_(decoder), clock_(clock), config_(std::move(config)) {}

std::vector<int64_t> FrameSampler::PlanEvenly(int64_t total_ms, size_t n) {
  std::vector<int64_t> out;
  if (total_ms <= 0 || n == 0) return out;

  const int64_t last = total_ms - 1;
  const int64_t early = std::min(kEarlySampleMs, total_ms / 4);
  const int64_t final_ts =
      std::min(last, std::max(total_ms - kFinalLeadMs, (total_ms * 9) / 10));

  out.reserve(n);
  out.push_back(early);
  if (n >= 2) {
    const int64_t span = final_ts - early;
    const int64_t steps = static_cast<int64_t>(n) - 1;
    for (int64_t k = 1; k < steps; ++k) {
      out.push_back(early + (span * k) / steps);
    }
    out.push_back(final_ts);
  }
  SortUnique(out);
  return out;
}

std::vector<int64_t> FrameSampler::PlanFixedCadence(int64_t total_ms,
                                                    int64_t interval_ms,
                                                    size_t min_samples,
                                                    size_t max_samples) {
  if (interval_ms <= 0) interval_ms = 1000;
  if (max_samples < min_samples) max_samples = min_samples;
  const size_t raw =
      total_ms > 0 ? static_cast<size_t>(total_ms / interval_ms) : 0;
  const size_t n = std::clamp(raw, min_samples, max_samples);
  return PlanEvenly(total_ms, n);
}

std::vector<int64_t> FrameSampler::PlanTargetCount(int64_t total_ms, size_t count) {
  return PlanEvenly(total_ms, std::max<size_t>(count, 2));
}

std::vector<int64_t> FrameSampler::PlanExplicit(int64_t total_ms,
                                                std::vector<int64_t> timestamps_ms) {
  if (total_ms <= 0) return {};
  for (auto& ts : timestamps_ms) {
    ts = std::clamp<int64_t>(ts, 0, total_ms - 1);
  }
  SortUnique(timestamps_ms);
  return timestamps_ms;
}

std::vector<int64_t> FrameSampler::Plan(int64_t total_ms) const {
  switch (config_.mode) {
    case SamplingMode::kFixedCadence:
      return PlanFixedCadence(total_ms, config_.interval_ms,
                              config_.min_samples, config_.max_samples);
    case SamplingMode::kTargetCount:
      return PlanTargetCount(total_ms, config_.target_count);
    case SamplingMode::kExplicit:
      return PlanExplicit(total_ms, config_.explicit_timestamps_ms);
  }
  return {};
}

FrameStatus FrameSampler::SampleAt(int64_t timestamp_ms,
                                   int64_t run_deadline_utc_ms,
                                   const std::atomic<bool>* cancel,
                                   SampledFrame& out) {
  out = SampledFrame{};
  out.timestamp_ms = timestamp_ms;

  const int64_t started = clock_.NowUtcMs();
  FrameDeadline deadline;
  deadline.cancel = cancel;
  if (config_.seek_timeout_ms > 0) {
    deadline.deadline_utc_ms = started + config_.seek_timeout_ms;
  }
  if (run_deadline_utc_ms > 0 &&
      (deadline.deadline_utc_ms == 0 || run_deadline_utc_ms < deadline.deadline_utc_ms)) {
    deadline.deadline_utc_ms = run_deadline_utc_ms;
  }

  FrameStatus status = decoder_.RenderAt(timestamp_ms, deadline, out);
  const int64_t elapsed = clock_.NowUtcMs() - started;

  if (status == FrameStatus::kOk && config_.seek_timeout_ms > 0 &&
      elapsed > config_.seek_timeout_ms) {
    status = FrameStatus::kSeekTimeout;
  }
  if (status == FrameStatus::kOk && !out.raster.well_formed()) {
    status = FrameStatus::kRenderFailed;
  }

  if (status != FrameStatus::kOk) {
    out = SampledFrame{};
    out.timestamp_ms = timestamp_ms;
    if (status != FrameStatus::kAborted) {
      std::ostringstream oss;
      oss << "[FrameSampler] frame skipped: ts_ms=" << timestamp_ms
          << " status=" << FrameStatusToString(status)
          << " elapsed_ms=" << elapsed;
      util::Logger::Warn(oss.str());
    }
    return status;
  }

  if (util::Logger::DebugEnabled()) {
    std::ostringstream oss;
    oss << "[FrameSampler] rendered ts_ms=" << timestamp_ms
        << " size=" << out.raster.width << "x" << out.raster.height
        << " thumb_bytes=" << out.thumbnail_jpeg.size()
        << " elapsed_ms=" << elapsed;
    util::Logger::Debug(oss.str());
  }
  return FrameStatus::kOk;
}

}  // namespace reelforge::sampling
