// Repository: ReelForge
// Component: Scene Extractor Tests
// Purpose: Run orchestration over a scripted decoder: failure policy,
//          timeouts, cancellation and progress.
// Copyright (c) 2025 ReelForge

#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <vector>

#include "reelforge/detect/SceneExtractor.hpp"
#include "support/DeterministicTimeSource.hpp"
#include "support/FakeFrameDecoder.hpp"
#include "support/RasterFixtures.hpp"

namespace reelforge::detect {
namespace {

using sampling::FrameStatus;
using test::DeterministicTimeSource;
using test::FakeFrameDecoder;
using test::Grey;
using timeline::ExtractionError;

class RecordingObserver : public IDetectionObserver {
 public:
  void OnProgress(double fraction) override { progress.push_back(fraction); }
  void OnSceneFinalized(const timeline::Scene& scene) override { scenes.push_back(scene); }

  std::vector<double> progress;
  std::vector<timeline::Scene> scenes;
};

// Ten one-second samples; shots change at 3000 and 6000.
ExtractionConfig ExplicitConfig() {
  ExtractionConfig config;
  config.sampler.mode = sampling::SamplingMode::kExplicit;
  for (int64_t t = 0; t < 10000; t += 1000) config.sampler.explicit_timestamps_ms.push_back(t);
  return config;
}

void ScriptThreeShots(FakeFrameDecoder& decoder) {
  decoder.AddShot(0, Grey(0), 1);
  decoder.AddShot(3000, Grey(255), 2);
  decoder.AddShot(6000, Grey(0), 3);
}

TEST(SceneExtractor, DetectsScenesAcrossWholeSource) {
  DeterministicTimeSource clock;
  FakeFrameDecoder decoder(clock, 10000);
  ScriptThreeShots(decoder);
  RecordingObserver observer;

  SceneExtractor extractor(decoder, clock, ExplicitConfig());
  DetectionResult result = extractor.Run(&observer);

  ASSERT_TRUE(result.ok) << result.detail;
  EXPECT_EQ(result.error, ExtractionError::kNone);
  EXPECT_EQ(result.total_duration_ms, 10000);
  ASSERT_EQ(result.scenes.size(), 3u);
  EXPECT_EQ(result.scenes[0].end_ms, 3000);
  EXPECT_EQ(result.scenes[1].end_ms, 6000);
  EXPECT_EQ(result.scenes[2].end_ms, 10000);
  EXPECT_EQ(result.frames_scheduled, 10u);
  EXPECT_EQ(result.frames_used, 10u);
  EXPECT_EQ(result.frames_skipped, 0u);

  EXPECT_EQ(observer.scenes.size(), 3u);
  EXPECT_EQ(decoder.open_count(), 1);
  EXPECT_EQ(decoder.close_count(), 1);
}

TEST(SceneExtractor, ProgressIsMonotonicAndEndsAtOne) {
  DeterministicTimeSource clock;
  FakeFrameDecoder decoder(clock, 10000);
  ScriptThreeShots(decoder);
  decoder.FailAt(4000, FrameStatus::kSeekFailed);
  RecordingObserver observer;

  SceneExtractor extractor(decoder, clock, ExplicitConfig());
  ASSERT_TRUE(extractor.Run(&observer).ok);

  ASSERT_EQ(observer.progress.size(), 10u);
  for (size_t i = 1; i < observer.progress.size(); ++i) {
    EXPECT_LE(observer.progress[i - 1], observer.progress[i]);
  }
  EXPECT_GT(observer.progress.front(), 0.0);
  EXPECT_DOUBLE_EQ(observer.progress.back(), 1.0);
}

TEST(SceneExtractor, OpenFailureIsDecodeError) {
  DeterministicTimeSource clock;
  FakeFrameDecoder decoder(clock, 10000);
  decoder.SetOpenFails(true);

  SceneExtractor extractor(decoder, clock, ExplicitConfig());
  DetectionResult result = extractor.Run();

  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, ExtractionError::kDecodeError);
  EXPECT_TRUE(decoder.render_calls().empty());
}

TEST(SceneExtractor, UnknownDurationIsDecodeErrorUnlessOverridden) {
  DeterministicTimeSource clock;
  FakeFrameDecoder decoder(clock, 0);
  ScriptThreeShots(decoder);

  SceneExtractor probed(decoder, clock, ExplicitConfig());
  DetectionResult result = probed.Run();
  EXPECT_EQ(result.error, ExtractionError::kDecodeError);
  EXPECT_EQ(decoder.close_count(), 1);

  ExtractionConfig config = ExplicitConfig();
  config.duration_override_ms = 10000;
  SceneExtractor overridden(decoder, clock, config);
  result = overridden.Run();
  ASSERT_TRUE(result.ok) << result.detail;
  EXPECT_EQ(result.total_duration_ms, 10000);
  EXPECT_EQ(result.scenes.size(), 3u);
}

TEST(SceneExtractor, FirstFrameSeekTimeoutIsFatal) {
  DeterministicTimeSource clock;
  FakeFrameDecoder decoder(clock, 10000);
  ScriptThreeShots(decoder);
  decoder.SetLatencyAt(0, 6000);

  SceneExtractor extractor(decoder, clock, ExplicitConfig());
  DetectionResult result = extractor.Run();

  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, ExtractionError::kSeekTimeout);
  EXPECT_EQ(decoder.render_calls().size(), 1u);
  EXPECT_EQ(decoder.close_count(), 1);
}

TEST(SceneExtractor, FirstFrameRenderFailureIsDecodeError) {
  DeterministicTimeSource clock;
  FakeFrameDecoder decoder(clock, 10000);
  decoder.AddShot(0, Grey(0), 1);
  decoder.AddShot(3000, Grey(255), 2);
  decoder.FailAt(0, FrameStatus::kRenderFailed);

  SceneExtractor extractor(decoder, clock, ExplicitConfig());
  DetectionResult result = extractor.Run();

  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, ExtractionError::kDecodeError);
  EXPECT_TRUE(result.scenes.empty());
  EXPECT_EQ(decoder.render_calls().size(), 1u);
  EXPECT_EQ(decoder.close_count(), 1);
}

TEST(SceneExtractor, FirstFrameSeekFailureIsDecodeError) {
  DeterministicTimeSource clock;
  FakeFrameDecoder decoder(clock, 10000);  // no shots: every seek fails

  SceneExtractor extractor(decoder, clock, ExplicitConfig());
  DetectionResult result = extractor.Run();

  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, ExtractionError::kDecodeError);
  EXPECT_EQ(result.frames_used, 0u);
  EXPECT_EQ(decoder.render_calls().size(), 1u);
}

TEST(SceneExtractor, LaterFrameFailuresAreSkipped) {
  DeterministicTimeSource clock;
  FakeFrameDecoder decoder(clock, 10000);
  ScriptThreeShots(decoder);
  decoder.FailAt(4000, FrameStatus::kRenderFailed);
  decoder.SetLatencyAt(5000, 6000);

  SceneExtractor extractor(decoder, clock, ExplicitConfig());
  DetectionResult result = extractor.Run();

  ASSERT_TRUE(result.ok) << result.detail;
  EXPECT_EQ(result.frames_used, 8u);
  EXPECT_EQ(result.frames_skipped, 2u);
  ASSERT_EQ(result.scenes.size(), 3u);
  EXPECT_EQ(result.scenes[1].start_ms, 3000);
  EXPECT_EQ(result.scenes[1].end_ms, 6000);
}

TEST(SceneExtractor, RunBudgetExceededIsExtractionTimeout) {
  DeterministicTimeSource clock;
  FakeFrameDecoder decoder(clock, 10000);
  ScriptThreeShots(decoder);
  decoder.SetDefaultLatencyMs(1000);

  ExtractionConfig config = ExplicitConfig();
  config.run_budget_ms = 2500;
  SceneExtractor extractor(decoder, clock, config);
  DetectionResult result = extractor.Run();

  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, ExtractionError::kExtractionTimeout);
  EXPECT_EQ(result.frames_used, 2u);
  EXPECT_TRUE(result.scenes.empty());
  EXPECT_EQ(decoder.close_count(), 1);
}

TEST(SceneExtractor, CancelStopsAtNextFrameAndKeepsFinalizedScenes) {
  DeterministicTimeSource clock;
  FakeFrameDecoder decoder(clock, 10000);
  ScriptThreeShots(decoder);

  std::atomic<bool> cancel{false};
  decoder.CancelAfterRenders(4, &cancel);

  ExtractionConfig config = ExplicitConfig();
  config.cancel = &cancel;
  SceneExtractor extractor(decoder, clock, config);
  DetectionResult result = extractor.Run();

  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, ExtractionError::kCancelled);
  EXPECT_EQ(decoder.render_calls().size(), 4u);
  // The 3000 boundary was finalized; the scene in progress is not flushed.
  ASSERT_EQ(result.scenes.size(), 1u);
  EXPECT_EQ(result.scenes[0].start_ms, 0);
  EXPECT_EQ(result.scenes[0].end_ms, 3000);
  EXPECT_EQ(decoder.close_count(), 1);
}

TEST(SceneExtractor, NoUsableFrameIsEmptyResult) {
  DeterministicTimeSource clock;
  FakeFrameDecoder decoder(clock, 10000);  // no shots: every seek fails
  decoder.FailAt(0, FrameStatus::kAborted);  // first render interrupted, not failed

  SceneExtractor extractor(decoder, clock, ExplicitConfig());
  DetectionResult result = extractor.Run();

  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, ExtractionError::kEmptyResult);
  EXPECT_EQ(result.frames_skipped, 10u);
  EXPECT_TRUE(result.scenes.empty());
}

TEST(SceneExtractor, InvalidThresholdIsComputationError) {
  DeterministicTimeSource clock;
  FakeFrameDecoder decoder(clock, 10000);

  ExtractionConfig config = ExplicitConfig();
  config.detector.threshold = 1.5;
  SceneExtractor extractor(decoder, clock, config);
  DetectionResult result = extractor.Run();

  EXPECT_EQ(result.error, ExtractionError::kComputationError);
  EXPECT_EQ(decoder.open_count(), 0);
}

TEST(SceneExtractor, DefaultCadenceSamplesLongSourcesThirtyTimes) {
  DeterministicTimeSource clock;
  FakeFrameDecoder decoder(clock, 120000);
  decoder.AddShot(0, Grey(40));

  SceneExtractor extractor(decoder, clock);
  DetectionResult result = extractor.Run();

  ASSERT_TRUE(result.ok) << result.detail;
  EXPECT_EQ(result.frames_scheduled, 30u);
  ASSERT_EQ(result.scenes.size(), 1u);
  EXPECT_EQ(result.scenes[0].end_ms, 120000);
}

TEST(SceneExtractor, RunsAreIndependent) {
  DeterministicTimeSource clock;
  FakeFrameDecoder decoder(clock, 10000);
  ScriptThreeShots(decoder);

  SceneExtractor extractor(decoder, clock, ExplicitConfig());
  DetectionResult first = extractor.Run();
  DetectionResult second = extractor.Run();

  ASSERT_EQ(first.scenes.size(), second.scenes.size());
  for (size_t i = 0; i < first.scenes.size(); ++i) {
    EXPECT_EQ(first.scenes[i].id, second.scenes[i].id);
    EXPECT_EQ(first.scenes[i].start_ms, second.scenes[i].start_ms);
    EXPECT_EQ(first.scenes[i].end_ms, second.scenes[i].end_ms);
  }
}

}  // namespace
}  // namespace reelforge::detect
