// Repository: ReelForge
// Component: Template Pipeline Implementation
// Copyright (c) 2025 ReelForge

#include "reelforge/pipeline/TemplatePipeline.hpp"

#include <memory>
#include <sstream>
#include <utility>

#include "reelforge/timeline/ItemLabelParser.hpp"
#include "reelforge/util/Logger.hpp"

namespace reelforge::pipeline {

using timeline::ExtractionError;

namespace {

// Errors after which the count-based allocator takes over.
bool FallsBackToAllocator(ExtractionError error) {
  switch (error) {
    case ExtractionError::kDecodeError:
    case ExtractionError::kSeekTimeout:
    case ExtractionError::kExtractionTimeout:
    case ExtractionError::kEmptyResult:
      return true;
    default:
      return false;
  }
}

std::optional<std::string> NonEmpty(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

}  // namespace

TemplatePipeline::TemplatePipeline(sampling::FrameDecoderFactory decoder_factory,
                                   const time::ITimeSource& clock,
                                   PipelineConfig config,
                                   store::ITemplateStore* store)
    : decoder_factory_(std::move(decoder_factory)),
      clock_(clock),
      config_(std::move(config)),
      store_(store),
      ids_(clock),
      allocator_(config_.allocator) {}

std::vector<std::string> TemplatePipeline::DisplayLabels(
    const std::vector<std::string>& labels) const {
  timeline::AllocationRequest request;
  request.item_count = labels.size();
  request.item_labels = labels;

  std::vector<std::string> out;
  out.reserve(labels.size());
  for (size_t i = 1; i <= labels.size(); ++i) {
    out.push_back(allocator_.ItemLabel(request, i));
  }
  return out;
}

PipelineResult TemplatePipeline::Allocate(int64_t total_ms,
                                          size_t item_count,
                                          const std::vector<std::string>& labels,
                                          const std::optional<std::string>& hook_text,
                                          const std::optional<std::string>& outro_text,
                                          const std::optional<std::string>& emoji,
                                          const std::vector<std::string>& media) {
  timeline::AllocationRequest request;
  request.total_duration_ms = total_ms;
  request.item_count = item_count;
  request.item_labels = labels;
  request.hook_text = hook_text;
  request.outro_text = outro_text;

  timeline::AllocationResult allocation = allocator_.Allocate(request);
  if (!allocation.ok) {
    return PipelineResult::Failure(allocation.error, allocation.detail);
  }

  assemble::AssemblerConfig assembler_config = config_.assembler;
  if (emoji) assembler_config.emoji_override = emoji;
  assemble::ClipAssembler assembler(assembler_config);

  assemble::AssemblyResult assembly = assembler.FromSegments(allocation.segments, media);
  if (!assembly.ok) {
    return PipelineResult::Failure(assembly.error, assembly.detail);
  }

  Template tmpl;
  tmpl.total_duration_ms = total_ms;
  tmpl.location_groups = std::move(assembly.groups);
  tmpl.extraction_method = kMethodAllocation;
  tmpl.drift_ms = allocation.drift_ms;

  return PipelineResult::Success(std::move(tmpl), std::move(assembly.clips),
                                 std::move(assembly.overlays));
}

void TemplatePipeline::Finalize(PipelineResult& result) {
  const int64_t now_ms = clock_.NowUtcMs();
  result.tmpl.id = ids_.Next();
  result.tmpl.created_at_ms = now_ms;
  result.tmpl.updated_at_ms = now_ms;

  if (store_ != nullptr) {
    result.persisted = store_->Save(result.tmpl);
    if (!result.persisted) {
      util::Logger::Error("[TemplatePipeline] template not persisted id=" + result.tmpl.id);
    }
  }

  std::ostringstream oss;
  oss << "[TemplatePipeline] built id=" << result.tmpl.id
      << " method=" << result.tmpl.extraction_method
      << " groups=" << result.tmpl.location_groups.size()
      << " clips=" << result.clips.size()
      << " total_ms=" << result.tmpl.total_duration_ms
      << " fallback=" << (result.tmpl.used_fallback ? "yes" : "no");
  util::Logger::Info(oss.str());
}

PipelineResult TemplatePipeline::BuildFromVideo(const VideoRequest& request,
                                                detect::IDetectionObserver* observer) {
  const timeline::ParsedTitle parsed = timeline::ItemLabelParser::Parse(request.title);
  const std::vector<std::string> labels =
      DisplayLabels(request.item_labels.empty() ? parsed.labels : request.item_labels);
  const std::optional<std::string> hook = NonEmpty(parsed.hook_text);

  detect::DetectionResult detection =
      detect::DetectionResult::Failure(ExtractionError::kDecodeError, "no decoder for source");

  std::unique_ptr<sampling::IFrameDecoder> decoder;
  if (decoder_factory_) decoder = decoder_factory_(request.video_uri);
  if (decoder) {
    detect::ExtractionConfig extraction = config_.extraction;
    if (request.duration_ms > 0) extraction.duration_override_ms = request.duration_ms;
    if (request.cancel != nullptr) extraction.cancel = request.cancel;

    detect::SceneExtractor extractor(*decoder, clock_, extraction);
    detection = extractor.Run(observer);
  } else {
    util::Logger::Error("[TemplatePipeline] no decoder for " + request.video_uri);
  }

  if (detection.ok && !detection.scenes.empty()) {
    assemble::AssemblerConfig assembler_config = config_.assembler;
    if (parsed.emoji) assembler_config.emoji_override = parsed.emoji;
    assemble::ClipAssembler assembler(assembler_config);

    assemble::OverlayText text;
    text.hook = hook;
    assemble::AssemblyResult assembly =
        assembler.FromScenes(detection.scenes, labels, request.media_uris, text);
    if (!assembly.ok) {
      return PipelineResult::Failure(assembly.error, assembly.detail);
    }

    Template tmpl;
    tmpl.total_duration_ms = detection.total_duration_ms;
    tmpl.video_info = VideoInfo{request.title, request.video_uri, detection.total_duration_ms};
    tmpl.location_groups = std::move(assembly.groups);
    tmpl.detected_scenes = std::move(detection.scenes);
    tmpl.extraction_method = kMethodSceneDetection;

    PipelineResult result = PipelineResult::Success(
        std::move(tmpl), std::move(assembly.clips), std::move(assembly.overlays));
    result.frames_used = detection.frames_used;
    result.frames_skipped = detection.frames_skipped;
    Finalize(result);
    return result;
  }

  const ExtractionError detection_error =
      detection.ok ? ExtractionError::kEmptyResult : detection.error;
  if (!FallsBackToAllocator(detection_error)) {
    PipelineResult failed = PipelineResult::Failure(detection_error, detection.detail);
    failed.frames_used = detection.frames_used;
    failed.frames_skipped = detection.frames_skipped;
    return failed;
  }

  int64_t total_ms = request.duration_ms;
  if (total_ms <= 0) total_ms = detection.total_duration_ms;
  if (total_ms <= 0) total_ms = config_.fallback_duration_ms;

  const size_t item_count =
      labels.empty() ? parsed.ItemCount(config_.default_item_count) : labels.size();

  std::ostringstream oss;
  oss << "[TemplatePipeline] detection unavailable ("
      << timeline::ExtractionErrorToString(detection_error)
      << "), allocating " << item_count << " items over " << total_ms << "ms";
  util::Logger::Warn(oss.str());

  PipelineResult result = Allocate(total_ms, item_count, labels, hook, std::nullopt,
                                   parsed.emoji, request.media_uris);
  if (!result.ok) return result;

  result.tmpl.video_info = VideoInfo{request.title, request.video_uri, total_ms};
  result.tmpl.used_fallback = true;
  result.tmpl.detection_error = detection_error;
  result.frames_used = detection.frames_used;
  result.frames_skipped = detection.frames_skipped;
  Finalize(result);
  return result;
}

PipelineResult TemplatePipeline::BuildFromItems(const ItemsRequest& request) {
  const timeline::ParsedTitle parsed = timeline::ItemLabelParser::Parse(request.title);
  const std::vector<std::string> labels =
      DisplayLabels(request.item_labels.empty() ? parsed.labels : request.item_labels);

  size_t item_count = config_.default_item_count;
  if (request.item_count) {
    item_count = *request.item_count;
  } else if (!labels.empty()) {
    item_count = labels.size();
  } else {
    item_count = parsed.ItemCount(config_.default_item_count);
  }

  const std::optional<std::string> hook =
      request.hook_text ? request.hook_text : NonEmpty(parsed.hook_text);

  PipelineResult result = Allocate(request.total_duration_ms, item_count, labels, hook,
                                   request.outro_text, parsed.emoji, request.media_uris);
  if (!result.ok) {
    util::Logger::Warn("[TemplatePipeline] allocation rejected: " + result.detail);
    return result;
  }

  if (!request.title.empty()) {
    result.tmpl.video_info = VideoInfo{request.title, "", request.total_duration_ms};
  }
  Finalize(result);
  return result;
}

}  // namespace reelforge::pipeline
