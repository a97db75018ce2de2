// Repository: ReelForge
// Component: Template Pipeline Tests
// Purpose: Detection path, allocator fallback, cancellation, item requests
//          and persistence.
// Copyright (c) 2025 ReelForge

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "reelforge/pipeline/TemplatePipeline.hpp"
#include "support/DeterministicTimeSource.hpp"
#include "support/FakeFrameDecoder.hpp"
#include "support/InMemoryTemplateStore.hpp"
#include "support/RasterFixtures.hpp"

namespace reelforge::pipeline {
namespace {

using test::DeterministicTimeSource;
using test::FakeFrameDecoder;
using test::Grey;
using timeline::ExtractionError;

PipelineConfig ExplicitSamplingConfig() {
  PipelineConfig config;
  config.extraction.sampler.mode = sampling::SamplingMode::kExplicit;
  for (int64_t t = 0; t < 10000; t += 1000) {
    config.extraction.sampler.explicit_timestamps_ms.push_back(t);
  }
  return config;
}

// Five two-second shots over a ten-second source.
sampling::FrameDecoderFactory FiveShotFactory(DeterministicTimeSource& clock) {
  return [&clock](const std::string&) -> std::unique_ptr<sampling::IFrameDecoder> {
    auto decoder = std::make_unique<FakeFrameDecoder>(clock, 10000);
    for (int i = 0; i < 5; ++i) {
      decoder->AddShot(i * 2000, Grey(i % 2 == 0 ? 0 : 255), static_cast<uint8_t>(i + 1));
    }
    return decoder;
  };
}

sampling::FrameDecoderFactory UnopenableFactory(DeterministicTimeSource& clock) {
  return [&clock](const std::string&) -> std::unique_ptr<sampling::IFrameDecoder> {
    auto decoder = std::make_unique<FakeFrameDecoder>(clock, 10000);
    decoder->SetOpenFails(true);
    return decoder;
  };
}

// =============================================================================
// BuildFromVideo
// =============================================================================

TEST(TemplatePipelineVideo, DetectedScenesBecomeLabeledGroups) {
  DeterministicTimeSource clock;
  test::InMemoryTemplateStore store;
  TemplatePipeline pipeline(FiveShotFactory(clock), clock, ExplicitSamplingConfig(), &store);

  VideoRequest request;
  request.video_uri = "/videos/lisbon.mp4";
  request.title = "3 spots in Lisbon";
  request.item_labels = {"Cafe", "Park", "Museum"};
  request.media_uris = {"intro.mp4", "cafe.mp4"};

  PipelineResult result = pipeline.BuildFromVideo(request);

  ASSERT_TRUE(result.ok) << result.detail;
  const Template& tmpl = result.tmpl;
  EXPECT_EQ(tmpl.extraction_method, kMethodSceneDetection);
  EXPECT_FALSE(tmpl.used_fallback);
  EXPECT_EQ(tmpl.detection_error, ExtractionError::kNone);
  EXPECT_EQ(tmpl.total_duration_ms, 10000);
  EXPECT_EQ(tmpl.detected_scenes.size(), 5u);

  ASSERT_EQ(tmpl.location_groups.size(), 5u);
  EXPECT_EQ(tmpl.location_groups[0].location_name, "Intro");
  EXPECT_EQ(tmpl.location_groups[1].location_name, "Cafe");
  EXPECT_EQ(tmpl.location_groups[3].location_name, "Museum");
  EXPECT_EQ(tmpl.location_groups[4].location_name, "Outro");

  ASSERT_FALSE(result.overlays.empty());
  EXPECT_EQ(result.overlays.front().text, "3 spots in Lisbon");
  EXPECT_EQ(result.clips[1].media_uri, std::optional<std::string>("cafe.mp4"));
  EXPECT_EQ(result.frames_used, 10u);

  ASSERT_TRUE(tmpl.video_info.has_value());
  EXPECT_EQ(tmpl.video_info->source_uri, "/videos/lisbon.mp4");
  EXPECT_TRUE(TemplateIdGenerator::IsWellFormed(tmpl.id));
  EXPECT_EQ(tmpl.created_at_ms, clock.NowUtcMs());

  EXPECT_TRUE(result.persisted);
  EXPECT_TRUE(store.Get(tmpl.id).has_value());
}

TEST(TemplatePipelineVideo, UnopenableSourceFallsBackToAllocator) {
  DeterministicTimeSource clock;
  TemplatePipeline pipeline(UnopenableFactory(clock), clock, ExplicitSamplingConfig());

  VideoRequest request;
  request.video_uri = "/videos/missing.mp4";
  request.item_labels = {"Cafe A", "Park B", "Museum C", "Beach D"};
  request.duration_ms = 20000;

  PipelineResult result = pipeline.BuildFromVideo(request);

  ASSERT_TRUE(result.ok) << result.detail;
  const Template& tmpl = result.tmpl;
  EXPECT_TRUE(tmpl.used_fallback);
  EXPECT_EQ(tmpl.detection_error, ExtractionError::kDecodeError);
  EXPECT_EQ(tmpl.extraction_method, kMethodAllocation);
  EXPECT_EQ(tmpl.total_duration_ms, 20000);
  EXPECT_TRUE(tmpl.detected_scenes.empty());

  ASSERT_EQ(tmpl.location_groups.size(), 6u);
  EXPECT_EQ(tmpl.location_groups[2].location_name, "Park B");
  EXPECT_EQ(tmpl.location_groups[2].total_duration_ms(), 4000);
  ASSERT_EQ(result.clips.size(), 6u);
  EXPECT_EQ(result.clips.back().start_ms, 18000);
  EXPECT_EQ(result.clips.back().end_ms, 20000);
  EXPECT_FALSE(result.persisted);
}

TEST(TemplatePipelineVideo, MissingDecoderUsesTitleCountAndDefaultDuration) {
  DeterministicTimeSource clock;
  auto no_decoder = [](const std::string&) -> std::unique_ptr<sampling::IFrameDecoder> {
    return nullptr;
  };
  TemplatePipeline pipeline(no_decoder, clock);

  VideoRequest request;
  request.video_uri = "rtsp://nowhere";
  request.title = "7 best things to do in Porto";

  PipelineResult result = pipeline.BuildFromVideo(request);

  ASSERT_TRUE(result.ok) << result.detail;
  EXPECT_TRUE(result.tmpl.used_fallback);
  EXPECT_EQ(result.tmpl.detection_error, ExtractionError::kDecodeError);
  EXPECT_EQ(result.tmpl.total_duration_ms, 30000);
  EXPECT_EQ(result.tmpl.location_groups.size(), 9u);
  EXPECT_EQ(result.tmpl.location_groups[1].location_name, "Location 1");
}

TEST(TemplatePipelineVideo, NoUsableFrameFallsBackWithProbedDuration) {
  DeterministicTimeSource clock;
  auto blank = [&clock](const std::string&) -> std::unique_ptr<sampling::IFrameDecoder> {
    auto decoder = std::make_unique<FakeFrameDecoder>(clock, 12000);  // every seek fails
    decoder->FailAt(0, sampling::FrameStatus::kAborted);
    return decoder;
  };
  TemplatePipeline pipeline(blank, clock, ExplicitSamplingConfig());

  VideoRequest request;
  request.video_uri = "/videos/black.mp4";
  request.item_labels = {"One place"};

  PipelineResult result = pipeline.BuildFromVideo(request);

  ASSERT_TRUE(result.ok) << result.detail;
  EXPECT_EQ(result.tmpl.detection_error, ExtractionError::kEmptyResult);
  EXPECT_EQ(result.tmpl.total_duration_ms, 12000);
  EXPECT_EQ(result.frames_skipped, 10u);
}

TEST(TemplatePipelineVideo, UndecodableFirstFrameFallsBack) {
  DeterministicTimeSource clock;
  auto broken = [&clock](const std::string&) -> std::unique_ptr<sampling::IFrameDecoder> {
    auto decoder = std::make_unique<FakeFrameDecoder>(clock, 12000);
    decoder->AddShot(0, Grey(0), 1);
    decoder->FailAt(0, sampling::FrameStatus::kRenderFailed);
    return decoder;
  };
  TemplatePipeline pipeline(broken, clock, ExplicitSamplingConfig());

  VideoRequest request;
  request.video_uri = "/videos/corrupt.mp4";
  request.item_labels = {"One place"};

  PipelineResult result = pipeline.BuildFromVideo(request);

  ASSERT_TRUE(result.ok) << result.detail;
  EXPECT_TRUE(result.tmpl.used_fallback);
  EXPECT_EQ(result.tmpl.detection_error, ExtractionError::kDecodeError);
  EXPECT_EQ(result.tmpl.total_duration_ms, 12000);
}

TEST(TemplatePipelineVideo, CancelledRunIsAFailureAndNotSaved) {
  DeterministicTimeSource clock;
  test::InMemoryTemplateStore store;
  TemplatePipeline pipeline(FiveShotFactory(clock), clock, ExplicitSamplingConfig(), &store);

  std::atomic<bool> cancel{true};
  VideoRequest request;
  request.video_uri = "/videos/lisbon.mp4";
  request.cancel = &cancel;

  PipelineResult result = pipeline.BuildFromVideo(request);

  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, ExtractionError::kCancelled);
  EXPECT_EQ(store.save_calls(), 0);
}

TEST(TemplatePipelineVideo, InvalidDetectorConfigIsAFailure) {
  DeterministicTimeSource clock;
  PipelineConfig config = ExplicitSamplingConfig();
  config.extraction.detector.threshold = 0.0;
  TemplatePipeline pipeline(FiveShotFactory(clock), clock, config);

  VideoRequest request;
  request.video_uri = "/videos/lisbon.mp4";
  PipelineResult result = pipeline.BuildFromVideo(request);

  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, ExtractionError::kComputationError);
}

TEST(TemplatePipelineVideo, ObserverSeesProgress) {
  class CountingObserver : public detect::IDetectionObserver {
   public:
    void OnProgress(double fraction) override { last = fraction; ++calls; }
    double last = 0.0;
    int calls = 0;
  };

  DeterministicTimeSource clock;
  TemplatePipeline pipeline(FiveShotFactory(clock), clock, ExplicitSamplingConfig());
  CountingObserver observer;

  VideoRequest request;
  request.video_uri = "/videos/lisbon.mp4";
  ASSERT_TRUE(pipeline.BuildFromVideo(request, &observer).ok);
  EXPECT_EQ(observer.calls, 10);
  EXPECT_DOUBLE_EQ(observer.last, 1.0);
}

// =============================================================================
// BuildFromItems
// =============================================================================

TEST(TemplatePipelineItems, AllocatesRequestedItems) {
  DeterministicTimeSource clock;
  TemplatePipeline pipeline(nullptr, clock);

  ItemsRequest request;
  request.total_duration_ms = 30000;
  request.item_count = 5;

  PipelineResult result = pipeline.BuildFromItems(request);

  ASSERT_TRUE(result.ok) << result.detail;
  EXPECT_EQ(result.tmpl.extraction_method, kMethodAllocation);
  EXPECT_FALSE(result.tmpl.used_fallback);
  EXPECT_FALSE(result.tmpl.video_info.has_value());
  ASSERT_EQ(result.tmpl.location_groups.size(), 7u);
  EXPECT_EQ(result.tmpl.location_groups[1].total_duration_ms(), 5200);
  EXPECT_EQ(result.tmpl.drift_ms, 0);
}

TEST(TemplatePipelineItems, CountResolvesFromLabelsThenTitle) {
  DeterministicTimeSource clock;
  TemplatePipeline pipeline(nullptr, clock);

  ItemsRequest labeled;
  labeled.total_duration_ms = 30000;
  labeled.title = "7 best things to do in Porto";
  labeled.item_labels = {"Ribeira", "Livraria Lello"};
  EXPECT_EQ(pipeline.BuildFromItems(labeled).tmpl.location_groups.size(), 4u);

  ItemsRequest titled;
  titled.total_duration_ms = 30000;
  titled.title = "7 best things to do in Porto";
  PipelineResult result = pipeline.BuildFromItems(titled);
  ASSERT_TRUE(result.ok);
  EXPECT_EQ(result.tmpl.location_groups.size(), 9u);
  EXPECT_EQ(result.overlays.front().text, "7 best things to do in Porto");
  ASSERT_TRUE(result.tmpl.video_info.has_value());
  EXPECT_EQ(result.tmpl.video_info->title, "7 best things to do in Porto");

  ItemsRequest explicit_count = titled;
  explicit_count.item_count = 2;
  EXPECT_EQ(pipeline.BuildFromItems(explicit_count).tmpl.location_groups.size(), 4u);
}

TEST(TemplatePipelineItems, HookAndOutroOverridesReachOverlays) {
  DeterministicTimeSource clock;
  TemplatePipeline pipeline(nullptr, clock);

  ItemsRequest request;
  request.total_duration_ms = 20000;
  request.item_count = 2;
  request.title = "2 hidden bars";
  request.hook_text = "You missed these";
  request.outro_text = "Save for later";

  PipelineResult result = pipeline.BuildFromItems(request);
  ASSERT_TRUE(result.ok);
  EXPECT_EQ(result.overlays.front().text, "You missed these");
  EXPECT_EQ(result.overlays.back().text, "Save for later");
}

TEST(TemplatePipelineItems, NonPositiveDurationIsRejected) {
  DeterministicTimeSource clock;
  test::InMemoryTemplateStore store;
  TemplatePipeline pipeline(nullptr, clock, PipelineConfig(), &store);

  ItemsRequest request;
  request.total_duration_ms = 0;
  request.item_count = 3;

  PipelineResult result = pipeline.BuildFromItems(request);
  EXPECT_FALSE(result.ok);
  EXPECT_EQ(result.error, ExtractionError::kComputationError);
  EXPECT_EQ(store.save_calls(), 0);
}

TEST(TemplatePipelineItems, FailedSaveStillReturnsTemplate) {
  DeterministicTimeSource clock;
  test::InMemoryTemplateStore store;
  store.SetFailSaves(true);
  TemplatePipeline pipeline(nullptr, clock, PipelineConfig(), &store);

  ItemsRequest request;
  request.total_duration_ms = 15000;
  request.item_count = 3;

  PipelineResult result = pipeline.BuildFromItems(request);
  ASSERT_TRUE(result.ok);
  EXPECT_FALSE(result.persisted);
  EXPECT_EQ(store.save_calls(), 1);
  EXPECT_EQ(store.size(), 0u);
}

TEST(TemplatePipelineItems, EachBuildGetsAFreshId) {
  DeterministicTimeSource clock;
  test::InMemoryTemplateStore store;
  TemplatePipeline pipeline(nullptr, clock, PipelineConfig(), &store);

  ItemsRequest request;
  request.total_duration_ms = 15000;
  request.item_count = 3;

  const std::string first = pipeline.BuildFromItems(request).tmpl.id;
  clock.AdvanceMs(1);
  const std::string second = pipeline.BuildFromItems(request).tmpl.id;
  EXPECT_NE(first, second);
  EXPECT_EQ(store.List().size(), 2u);
  EXPECT_EQ(store.List()[0].id, second);
}

}  // namespace
}  // namespace reelforge::pipeline
