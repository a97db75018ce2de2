// Repository: ReelForge
// Component: Template Pipeline
// Purpose: Scene detection with count-based fallback, template build and save
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_PIPELINE_TEMPLATE_PIPELINE_HPP_
#define REELFORGE_PIPELINE_TEMPLATE_PIPELINE_HPP_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "reelforge/assemble/ClipAssembler.hpp"
#include "reelforge/detect/SceneExtractor.hpp"
#include "reelforge/pipeline/Template.hpp"
#include "reelforge/pipeline/TemplateIdGenerator.hpp"
#include "reelforge/sampling/IFrameDecoder.hpp"
#include "reelforge/store/ITemplateStore.hpp"
#include "reelforge/time/ITimeSource.hpp"
#include "reelforge/timeline/TimelineAllocator.hpp"

namespace reelforge::pipeline {

struct PipelineConfig {
  detect::ExtractionConfig extraction;
  timeline::AllocatorConfig allocator;
  assemble::AssemblerConfig assembler;

  // Fallback duration when none was supplied or probed.
  int64_t fallback_duration_ms = 30000;

  // Item count when neither labels nor the title give one.
  size_t default_item_count = 5;
};

struct VideoRequest {
  std::string video_uri;
  std::string title;
  std::vector<std::string> item_labels;
  int64_t duration_ms = 0;                 // 0 = probe
  std::vector<std::string> media_uris;
  const std::atomic<bool>* cancel = nullptr;
};

struct ItemsRequest {
  int64_t total_duration_ms = 0;
  std::optional<size_t> item_count;        // nullopt = labels, then title
  std::vector<std::string> item_labels;
  std::string title;
  std::optional<std::string> hook_text;    // nullopt = from title
  std::optional<std::string> outro_text;
  std::vector<std::string> media_uris;
};

struct PipelineResult {
  bool ok;
  timeline::ExtractionError error;
  std::string detail;

  Template tmpl;
  std::vector<timeline::Clip> clips;
  std::vector<timeline::TextOverlay> overlays;

  size_t frames_used = 0;
  size_t frames_skipped = 0;

  // True once the configured store accepted the template. A failed Save still
  // returns the template with ok = true.
  bool persisted = false;

  static PipelineResult Success(Template tmpl,
                                std::vector<timeline::Clip> clips,
                                std::vector<timeline::TextOverlay> overlays) {
    return {true, timeline::ExtractionError::kNone, "", std::move(tmpl), std::move(clips),
            std::move(overlays)};
  }

  static PipelineResult Failure(timeline::ExtractionError err, const std::string& detail = "") {
    return {false, err, detail, {}, {}, {}};
  }
};

// TemplatePipeline composes the engine for one request:
//
//   BuildFromVideo: decoder → SceneExtractor → ClipAssembler::FromScenes
//     on kDecodeError / kSeekTimeout / kExtractionTimeout / kEmptyResult
//     (or zero scenes): TimelineAllocator → ClipAssembler::FromSegments,
//     with used_fallback = true and detection_error recorded.
//     kCancelled and kComputationError are returned as failures.
//
//   BuildFromItems: TimelineAllocator → ClipAssembler::FromSegments.
//
// Item count for allocation: explicit count, else label count, else the count
// parsed from the title, else default_item_count.
//
// Successful templates get a fresh id and timestamps and, when a store is
// set, are saved. Safe to call concurrently: each call builds its own
// decoder and run objects.
class TemplatePipeline {
 public:
  TemplatePipeline(sampling::FrameDecoderFactory decoder_factory,
                   const time::ITimeSource& clock,
                   PipelineConfig config = PipelineConfig(),
                   store::ITemplateStore* store = nullptr);

  PipelineResult BuildFromVideo(const VideoRequest& request,
                                detect::IDetectionObserver* observer = nullptr);

  PipelineResult BuildFromItems(const ItemsRequest& request);

  const PipelineConfig& config() const { return config_; }

 private:
  // Allocator + FromSegments for a resolved count/duration.
  PipelineResult Allocate(int64_t total_ms,
                          size_t item_count,
                          const std::vector<std::string>& labels,
                          const std::optional<std::string>& hook_text,
                          const std::optional<std::string>& outro_text,
                          const std::optional<std::string>& emoji,
                          const std::vector<std::string>& media);

  // Cleans caller labels the way the allocator displays them.
  std::vector<std::string> DisplayLabels(const std::vector<std::string>& labels) const;

  void Finalize(PipelineResult& result);

  sampling::FrameDecoderFactory decoder_factory_;
  const time::ITimeSource& clock_;
  PipelineConfig config_;
  store::ITemplateStore* store_;
  TemplateIdGenerator ids_;
  timeline::TimelineAllocator allocator_;
};

}  // namespace reelforge::pipeline

#endif  // REELFORGE_PIPELINE_TEMPLATE_PIPELINE_HPP_
