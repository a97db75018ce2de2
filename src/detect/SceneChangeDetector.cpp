// Repository: ReelForge
// Component: Scene Change Detector Implementation
// Copyright (c) 2025 ReelForge

#include "reelforge/detect/SceneChangeDetector.hpp"

#include <cstdlib>
#include <sstream>
#include <utility>

#include "reelforge/util/Logger.hpp"

namespace reelforge::detect {

namespace {

constexpr double kMaxChannelSum = 255.0 * 3.0;

}  // namespace

SceneChangeDetector::SceneChangeDetector(DetectorConfig config)
    : config_(config) {}

bool SceneChangeDetector::ValidateConfig(const DetectorConfig& config, std::string* detail) {
  std::ostringstream oss;
  if (!(config.threshold > 0.0 && config.threshold < 1.0)) {
    oss << "threshold (" << config.threshold << ") outside (0, 1)";
  } else if (config.min_scene_ms < 0) {
    oss << "min_scene_ms (" << config.min_scene_ms << ") < 0";
  } else {
    return true;
  }
  if (detail) *detail = oss.str();
  return false;
}

double SceneChangeDetector::FrameDifferenceScore(const sampling::RgbRaster& a,
                                                 const sampling::RgbRaster& b) {
  if (a.width != b.width || a.height != b.height) return 1.0;
  if (!a.well_formed() || !b.well_formed()) return 1.0;

  // Integer accumulation: at most 765 per pixel, exact for any raster size
  // that fits in memory.
  uint64_t sum = 0;
  const uint8_t* pa = a.data.data();
  const uint8_t* pb = b.data.data();
  const size_t bytes = a.data.size();
  for (size_t i = 0; i < bytes; ++i) {
    sum += static_cast<uint64_t>(std::abs(static_cast<int>(pa[i]) - static_cast<int>(pb[i])));
  }
  return static_cast<double>(sum) /
         (kMaxChannelSum * static_cast<double>(a.pixel_count()));
}

timeline::Scene SceneChangeDetector::MakeScene(int64_t start_ms, int64_t end_ms) {
  timeline::Scene scene;
  scene.id = next_id_++;
  scene.start_ms = start_ms;
  scene.end_ms = end_ms;
  scene.thumbnail_jpeg = last_thumbnail_;
  scene.description = "Scene " + std::to_string(scene.id);
  return scene;
}

std::optional<timeline::Scene> SceneChangeDetector::Feed(sampling::SampledFrame frame) {
  if (closed_) return std::nullopt;

  if (previous_ts_ms_ && frame.timestamp_ms <= *previous_ts_ms_) {
    std::ostringstream oss;
    oss << "[SceneChangeDetector] out-of-order frame ignored: ts_ms=" << frame.timestamp_ms
        << " previous_ts_ms=" << *previous_ts_ms_;
    util::Logger::Warn(oss.str());
    return std::nullopt;
  }

  ++frames_fed_;
  std::optional<timeline::Scene> emitted;

  if (previous_) {
    const double score = FrameDifferenceScore(*previous_, frame.raster);
    last_score_ = score;

    if (util::Logger::DebugEnabled()) {
      std::ostringstream oss;
      oss << "[SceneChangeDetector] ts_ms=" << frame.timestamp_ms << " score=" << score;
      util::Logger::Debug(oss.str());
    }

    if (score > config_.threshold) {
      const int64_t t = frame.timestamp_ms;
      if (t - scene_start_ms_ >= config_.min_scene_ms) {
        scenes_.push_back(MakeScene(scene_start_ms_, t));
        emitted = scenes_.back();
        scene_start_ms_ = t;
      } else if (util::Logger::DebugEnabled()) {
        std::ostringstream oss;
        oss << "[SceneChangeDetector] boundary suppressed: ts_ms=" << t
            << " scene_start_ms=" << scene_start_ms_
            << " min_scene_ms=" << config_.min_scene_ms;
        util::Logger::Debug(oss.str());
      }
    }
  }

  previous_ = std::move(frame.raster);
  previous_ts_ms_ = frame.timestamp_ms;
  last_thumbnail_ = std::move(frame.thumbnail_jpeg);
  return emitted;
}

std::optional<timeline::Scene> SceneChangeDetector::Finish(int64_t total_ms) {
  if (closed_) return std::nullopt;
  closed_ = true;
  previous_.reset();

  if (total_ms - scene_start_ms_ >= config_.min_scene_ms && total_ms > scene_start_ms_) {
    scenes_.push_back(MakeScene(scene_start_ms_, total_ms));
    return scenes_.back();
  }

  std::ostringstream oss;
  oss << "[SceneChangeDetector] trailing remainder dropped: [" << scene_start_ms_
      << ", " << total_ms << ")";
  util::Logger::Debug(oss.str());
  return std::nullopt;
}

void SceneChangeDetector::Abort() {
  closed_ = true;
  previous_.reset();
}

}  // namespace reelforge::detect
