// Repository: ReelForge
// Component: TemplateForge gRPC Service Implementation
// Purpose: Implements the TemplateForge service on top of TemplatePipeline and
//          an ITemplateStore.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_SERVICE_TEMPLATE_SERVICE_H_
#define REELFORGE_SERVICE_TEMPLATE_SERVICE_H_

#include <grpcpp/grpcpp.h>

#include "reelforge/pipeline/TemplatePipeline.hpp"
#include "reelforge/sampling/IFrameDecoder.hpp"
#include "reelforge/store/ITemplateStore.hpp"
#include "reelforge/time/ITimeSource.hpp"
#include "reelforge/timeline/TimelineTypes.hpp"
#include "reelforge_service.grpc.pb.h"
#include "reelforge_template.pb.h"

namespace reelforge::service {

// Status code for a pipeline failure.
grpc::StatusCode StatusCodeFor(timeline::ExtractionError error);

// TemplateServiceImpl implements the gRPC service defined in
// reelforge_service.proto. It is a thin adapter: each analysis RPC builds its
// own pipeline (per-request detector settings) over the shared decoder factory,
// clock and store, so concurrent RPCs share nothing mutable but the store.
class TemplateServiceImpl final : public v1::TemplateForge::Service {
 public:
  // `store` may be null; the store RPCs then fail with FAILED_PRECONDITION and
  // analysis results are returned without being saved.
  TemplateServiceImpl(sampling::FrameDecoderFactory decoder_factory,
                      const time::ITimeSource& clock,
                      pipeline::PipelineConfig config,
                      store::ITemplateStore* store);
  ~TemplateServiceImpl() override;

  // Disable copy and move
  TemplateServiceImpl(const TemplateServiceImpl&) = delete;
  TemplateServiceImpl& operator=(const TemplateServiceImpl&) = delete;

  // RPC implementations
  grpc::Status AnalyzeVideo(grpc::ServerContext* context,
                            const v1::AnalyzeVideoRequest* request,
                            v1::AnalyzeVideoResponse* response) override;

  grpc::Status AllocateTimeline(grpc::ServerContext* context,
                                const v1::AllocateTimelineRequest* request,
                                v1::AllocateTimelineResponse* response) override;

  grpc::Status GetTemplate(grpc::ServerContext* context,
                           const v1::GetTemplateRequest* request,
                           v1::Template* response) override;

  grpc::Status ListTemplates(grpc::ServerContext* context,
                             const v1::ListTemplatesRequest* request,
                             v1::ListTemplatesResponse* response) override;

  grpc::Status DeleteTemplate(grpc::ServerContext* context,
                              const v1::DeleteTemplateRequest* request,
                              v1::DeleteTemplateResponse* response) override;

  grpc::Status GetVersion(grpc::ServerContext* context,
                          const v1::ApiVersionRequest* request,
                          v1::ApiVersion* response) override;

 private:
  // Base config with the request's non-zero overrides applied.
  pipeline::PipelineConfig ConfigFor(const v1::AnalyzeVideoRequest& request,
                                     grpc::ServerContext* context) const;

  sampling::FrameDecoderFactory decoder_factory_;
  const time::ITimeSource& clock_;
  pipeline::PipelineConfig config_;
  store::ITemplateStore* store_;
};

}  // namespace reelforge::service

#endif  // REELFORGE_SERVICE_TEMPLATE_SERVICE_H_
