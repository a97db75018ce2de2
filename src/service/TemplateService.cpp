// Repository: ReelForge
// Component: TemplateForge gRPC Service Implementation
// Purpose: Implements the TemplateForge service on top of TemplatePipeline and
//          an ITemplateStore.
// Copyright (c) 2025 ReelForge

#include "TemplateService.h"

#include <atomic>
#include <chrono>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "reelforge/store/TemplateProto.hpp"
#include "reelforge/util/Logger.hpp"

namespace reelforge::service {

using timeline::ExtractionError;

namespace {

constexpr char kApiVersion[] = "1.0.0";

// Deadlines further out than this are treated as "none".
constexpr int64_t kMaxContextBudgetMs = 24LL * 60 * 60 * 1000;

// Raises the run's cancel flag once the client has gone away.
class ContextCancelWatcher : public detect::IDetectionObserver {
 public:
  ContextCancelWatcher(grpc::ServerContext* context, std::atomic<bool>& cancel)
      : context_(context), cancel_(cancel) {}

  void OnProgress(double fraction) override {
    (void)fraction;
    if (context_ != nullptr && context_->IsCancelled()) {
      cancel_.store(true, std::memory_order_release);
    }
  }

 private:
  grpc::ServerContext* context_;
  std::atomic<bool>& cancel_;
};

std::vector<std::string> ToVector(const google::protobuf::RepeatedPtrField<std::string>& field) {
  return std::vector<std::string>(field.begin(), field.end());
}

grpc::Status NoStore(const char* rpc) {
  util::Logger::Warn(std::string("[") + rpc + "] no template store configured");
  return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, "no template store configured");
}

}  // namespace

grpc::StatusCode StatusCodeFor(ExtractionError error) {
  switch (error) {
    case ExtractionError::kNone:
      return grpc::StatusCode::OK;
    case ExtractionError::kComputationError:
      return grpc::StatusCode::INVALID_ARGUMENT;
    case ExtractionError::kCancelled:
      return grpc::StatusCode::CANCELLED;
    case ExtractionError::kSeekTimeout:
    case ExtractionError::kExtractionTimeout:
      return grpc::StatusCode::DEADLINE_EXCEEDED;
    case ExtractionError::kDecodeError:
      return grpc::StatusCode::FAILED_PRECONDITION;
    case ExtractionError::kEmptyResult:
      return grpc::StatusCode::NOT_FOUND;
  }
  return grpc::StatusCode::INTERNAL;
}

TemplateServiceImpl::TemplateServiceImpl(sampling::FrameDecoderFactory decoder_factory,
                                         const time::ITimeSource& clock,
                                         pipeline::PipelineConfig config,
                                         store::ITemplateStore* store)
    : decoder_factory_(std::move(decoder_factory)),
      clock_(clock),
      config_(std::move(config)),
      store_(store) {
  util::Logger::Info(std::string("[TemplateServiceImpl] Service initialized (API version: ") +
                     kApiVersion + ")");
}

TemplateServiceImpl::~TemplateServiceImpl() {
  util::Logger::Info("[TemplateServiceImpl] Service shutting down");
}

pipeline::PipelineConfig TemplateServiceImpl::ConfigFor(const v1::AnalyzeVideoRequest& request,
                                                        grpc::ServerContext* context) const {
  pipeline::PipelineConfig config = config_;
  detect::ExtractionConfig& extraction = config.extraction;

  if (request.threshold() != 0.0) extraction.detector.threshold = request.threshold();
  if (request.min_scene_ms() != 0) extraction.detector.min_scene_ms = request.min_scene_ms();
  if (request.sample_interval_ms() > 0) {
    extraction.sampler.mode = sampling::SamplingMode::kFixedCadence;
    extraction.sampler.interval_ms = request.sample_interval_ms();
  }
  if (request.budget_ms() > 0) extraction.run_budget_ms = request.budget_ms();

  // A client deadline tightens the run budget.
  if (context != nullptr) {
    const auto deadline = context->deadline();
    if (deadline != std::chrono::system_clock::time_point::max()) {
      const int64_t remaining_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                       deadline - std::chrono::system_clock::now())
                                       .count();
      if (remaining_ms > 0 && remaining_ms < kMaxContextBudgetMs &&
          (extraction.run_budget_ms == 0 || remaining_ms < extraction.run_budget_ms)) {
        extraction.run_budget_ms = remaining_ms;
      }
    }
  }
  return config;
}

grpc::Status TemplateServiceImpl::AnalyzeVideo(grpc::ServerContext* context,
                                               const v1::AnalyzeVideoRequest* request,
                                               v1::AnalyzeVideoResponse* response) {
  util::Logger::Info("[AnalyzeVideo] Request received: video_uri=" + request->video_uri() +
                     " title=\"" + request->title() + "\"");

  if (request->video_uri().empty()) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "video_uri is required");
  }
  if (request->duration_ms() < 0) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "duration_ms must be >= 0");
  }

  std::atomic<bool> cancel{false};
  ContextCancelWatcher watcher(context, cancel);

  pipeline::TemplatePipeline pipeline(decoder_factory_, clock_, ConfigFor(*request, context),
                                      store_);

  pipeline::VideoRequest video;
  video.video_uri = request->video_uri();
  video.title = request->title();
  video.item_labels = ToVector(request->item_labels());
  video.duration_ms = request->duration_ms();
  video.media_uris = ToVector(request->media_uris());
  video.cancel = &cancel;

  pipeline::PipelineResult result = pipeline.BuildFromVideo(video, &watcher);
  if (!result.ok) {
    util::Logger::Warn(std::string("[AnalyzeVideo] failed: error=") +
                       timeline::ExtractionErrorToString(result.error) + " detail=\"" +
                       result.detail + "\"");
    return grpc::Status(StatusCodeFor(result.error), result.detail);
  }
  if (store_ != nullptr && !result.persisted) {
    return grpc::Status(grpc::StatusCode::INTERNAL, "template could not be saved");
  }

  store::ToProto(result.tmpl, response->mutable_tmpl());
  response->set_used_fallback(result.tmpl.used_fallback);
  response->set_detection_error(timeline::ExtractionErrorToString(result.tmpl.detection_error));
  response->set_frames_used(static_cast<int32_t>(result.frames_used));
  response->set_frames_skipped(static_cast<int32_t>(result.frames_skipped));

  std::ostringstream oss;
  oss << "[AnalyzeVideo] Template " << result.tmpl.id << " built: groups="
      << result.tmpl.location_groups.size() << " fallback="
      << (result.tmpl.used_fallback ? "yes" : "no");
  util::Logger::Info(oss.str());
  return grpc::Status::OK;
}

grpc::Status TemplateServiceImpl::AllocateTimeline(grpc::ServerContext* context,
                                                   const v1::AllocateTimelineRequest* request,
                                                   v1::AllocateTimelineResponse* response) {
  (void)context;
  std::ostringstream req;
  req << "[AllocateTimeline] Request received: total_duration_ms="
      << request->total_duration_ms() << " labels=" << request->item_labels_size();
  util::Logger::Info(req.str());

  if (request->has_item_count() && request->item_count() < 0) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "item_count must be >= 0");
  }
  if (request->has_item_count() &&
      static_cast<size_t>(request->item_count()) > config_.allocator.max_items) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT,
                        "item_count must be <= " + std::to_string(config_.allocator.max_items));
  }

  pipeline::TemplatePipeline pipeline(decoder_factory_, clock_, config_, store_);

  pipeline::ItemsRequest items;
  items.total_duration_ms = request->total_duration_ms();
  if (request->has_item_count()) {
    items.item_count = static_cast<size_t>(request->item_count());
  }
  items.item_labels = ToVector(request->item_labels());
  items.title = request->title();
  if (request->has_hook_text()) items.hook_text = request->hook_text();
  if (request->has_outro_text()) items.outro_text = request->outro_text();
  items.media_uris = ToVector(request->media_uris());

  pipeline::PipelineResult result = pipeline.BuildFromItems(items);
  if (!result.ok) {
    return grpc::Status(StatusCodeFor(result.error), result.detail);
  }
  if (store_ != nullptr && !result.persisted) {
    return grpc::Status(grpc::StatusCode::INTERNAL, "template could not be saved");
  }

  store::ToProto(result.tmpl, response->mutable_tmpl());
  response->set_drift_ms(result.tmpl.drift_ms);

  util::Logger::Info("[AllocateTimeline] Template " + result.tmpl.id + " built");
  return grpc::Status::OK;
}

grpc::Status TemplateServiceImpl::GetTemplate(grpc::ServerContext* context,
                                              const v1::GetTemplateRequest* request,
                                              v1::Template* response) {
  (void)context;
  util::Logger::Info("[GetTemplate] Request received: id=" + request->id());
  if (store_ == nullptr) return NoStore("GetTemplate");

  if (!store::IsValidTemplateKey(request->id())) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "malformed template id");
  }
  auto tmpl = store_->Get(request->id());
  if (!tmpl) {
    return grpc::Status(grpc::StatusCode::NOT_FOUND, "template " + request->id() + " not found");
  }
  store::ToProto(*tmpl, response);
  return grpc::Status::OK;
}

grpc::Status TemplateServiceImpl::ListTemplates(grpc::ServerContext* context,
                                                const v1::ListTemplatesRequest* request,
                                                v1::ListTemplatesResponse* response) {
  (void)context;
  util::Logger::Info("[ListTemplates] Request received: limit=" +
                     std::to_string(request->limit()));
  if (store_ == nullptr) return NoStore("ListTemplates");

  if (request->limit() < 0) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "limit must be >= 0");
  }
  for (const auto& summary : store_->List(static_cast<size_t>(request->limit()))) {
    v1::TemplateIndexEntry* entry = response->add_templates();
    entry->set_id(summary.id);
    entry->set_updated_at_ms(summary.updated_at_ms);
    entry->set_title(summary.title);
  }
  return grpc::Status::OK;
}

grpc::Status TemplateServiceImpl::DeleteTemplate(grpc::ServerContext* context,
                                                 const v1::DeleteTemplateRequest* request,
                                                 v1::DeleteTemplateResponse* response) {
  (void)context;
  util::Logger::Info("[DeleteTemplate] Request received: id=" + request->id());
  if (store_ == nullptr) return NoStore("DeleteTemplate");

  if (!store::IsValidTemplateKey(request->id())) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "malformed template id");
  }
  if (!store_->Delete(request->id())) {
    return grpc::Status(grpc::StatusCode::NOT_FOUND, "template " + request->id() + " not found");
  }
  response->set_deleted(true);
  return grpc::Status::OK;
}

grpc::Status TemplateServiceImpl::GetVersion(grpc::ServerContext* context,
                                             const v1::ApiVersionRequest* request,
                                             v1::ApiVersion* response) {
  (void)context;
  (void)request;
  util::Logger::Info("[GetVersion] Request received");
  response->set_version(kApiVersion);
  return grpc::Status::OK;
}

}  // namespace reelforge::service
