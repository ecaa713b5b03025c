// Repository: ReelPlan
// Component: PlanService gRPC Service Implementation
// Purpose: Exposes plan intake and timeline composition over gRPC.
// Copyright (c) 2026 ReelPlan

#ifndef REELPLAN_PLAN_SERVICE_H_
#define REELPLAN_PLAN_SERVICE_H_

#include <functional>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "plan_service.grpc.pb.h"
#include "plan_service.pb.h"
#include "reelplan/plan/PlanConfig.hpp"
#include "reelplan/plan/PlanTypes.hpp"
#include "reelplan/plan/SchemaValidator.hpp"
#include "reelplan/timeline/IAssetResolver.hpp"
#include "reelplan/timeline/TimelineConfig.hpp"

namespace reelplan {
namespace service {

// Builds the resolver for one ComposeTimeline call.
using AssetResolverFactory =
    std::function<std::unique_ptr<timeline::IAssetResolver>(const timeline::AssetLayout&)>;

// PlanServiceImpl implements the gRPC service defined in plan_service.proto.
// Stateless per call: every request builds its own validators, resolver and
// composer from the server defaults plus the request's overrides, so calls
// may run concurrently.
class PlanServiceImpl final : public PlanService::Service {
 public:
  // schema: result of SchemaValidator::Load. If it failed, every plan RPC
  // returns INTERNAL with the load failure.
  // asset_factory: defaults to FileAssetResolver.
  PlanServiceImpl(plan::SchemaLoadResult schema,
                  plan::ValidationConfig validation = {},
                  timeline::CompositionConfig composition = {},
                  AssetResolverFactory asset_factory = nullptr);
  ~PlanServiceImpl() override;

  PlanServiceImpl(const PlanServiceImpl&) = delete;
  PlanServiceImpl& operator=(const PlanServiceImpl&) = delete;

  grpc::Status ValidatePlan(grpc::ServerContext* context,
                            const ValidatePlanRequest* request,
                            ValidatePlanResponse* response) override;

  grpc::Status ComposeTimeline(grpc::ServerContext* context,
                               const ComposeTimelineRequest* request,
                               ComposeTimelineResponse* response) override;

  grpc::Status GetVersion(grpc::ServerContext* context,
                          const ApiVersionRequest* request,
                          ApiVersion* response) override;

  static grpc::StatusCode StatusCodeFor(plan::PlanError error);

 private:
  plan::SchemaLoadResult schema_;
  plan::ValidationConfig validation_;
  timeline::CompositionConfig composition_;
  AssetResolverFactory asset_factory_;

  plan::ValidationConfig ApplyOverrides(const ValidationOptions& options) const;
  timeline::CompositionConfig ApplyOverrides(const TimingOptions& options) const;
};

}  // namespace service
}  // namespace reelplan

#endif  // REELPLAN_PLAN_SERVICE_H_
