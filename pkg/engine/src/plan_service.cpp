// Repository: ReelPlan
// Component: PlanService gRPC Service Implementation
// Purpose: Exposes plan intake and timeline composition over gRPC.
// Copyright (c) 2026 ReelPlan

#include "plan_service.h"

#include <sstream>
#include <string>
#include <utility>

#include "reelplan/plan/InvariantValidator.hpp"
#include "reelplan/plan/PlanIntake.hpp"
#include "reelplan/plan/PlanJson.hpp"
#include "reelplan/subtitle/SubtitleEmitter.hpp"
#include "reelplan/timeline/FileAssetResolver.hpp"
#include "reelplan/timeline/SegmentManifest.hpp"
#include "reelplan/timeline/TimelineComposer.hpp"
#include "reelplan/util/Logger.hpp"

namespace reelplan
{
  namespace service
  {

    namespace
    {
      constexpr char kApiVersion[] = "1.0.0";

      using util::Logger;

      void FillFailure(const plan::PlanFailure &failure, PlanFailure *out)
      {
        out->set_error(plan::PlanErrorToString(failure.error));
        out->set_detail(failure.detail);
        if (failure.error == plan::PlanError::kInvariantViolation)
        {
          out->set_rule(plan::InvariantRuleToString(failure.rule));
        }
        out->set_clip_index(failure.clip_index);
        for (const auto &issue : failure.issues)
        {
          auto *i = out->add_issues();
          i->set_path(issue.path);
          i->set_message(issue.message);
        }
      }

      grpc::Status FailureStatus(const char *rpc, const plan::PlanFailure &failure)
      {
        const std::string message = failure.Describe();
        Logger::Error(std::string("[") + rpc + "] " + message);
        return grpc::Status(PlanServiceImpl::StatusCodeFor(failure.error), message);
      }
    } // namespace

    PlanServiceImpl::PlanServiceImpl(plan::SchemaLoadResult schema,
                                     plan::ValidationConfig validation,
                                     timeline::CompositionConfig composition,
                                     AssetResolverFactory asset_factory)
        : schema_(std::move(schema)),
          validation_(validation),
          composition_(composition),
          asset_factory_(std::move(asset_factory))
    {
      if (!asset_factory_)
      {
        asset_factory_ = [](const timeline::AssetLayout &layout) {
          return std::make_unique<timeline::FileAssetResolver>(layout);
        };
      }
      if (!schema_.valid)
      {
        Logger::Warn("[PlanServiceImpl] Schema unavailable, plan RPCs will fail: " +
                     schema_.failure.Describe());
      }
      Logger::Info("[PlanServiceImpl] Service initialized (API version: " +
                   std::string(kApiVersion) + ")");
    }

    PlanServiceImpl::~PlanServiceImpl()
    {
      Logger::Info("[PlanServiceImpl] Service shutting down");
    }

    grpc::StatusCode PlanServiceImpl::StatusCodeFor(plan::PlanError error)
    {
      switch (error)
      {
      case plan::PlanError::kNone:
        return grpc::StatusCode::OK;
      case plan::PlanError::kMalformedOutput:
      case plan::PlanError::kSchemaViolation:
      case plan::PlanError::kInvariantViolation:
        return grpc::StatusCode::INVALID_ARGUMENT;
      case plan::PlanError::kMissingAsset:
        return grpc::StatusCode::FAILED_PRECONDITION;
      case plan::PlanError::kSchemaLoadError:
      case plan::PlanError::kIoError:
        break;
      }
      return grpc::StatusCode::INTERNAL;
    }

    plan::ValidationConfig PlanServiceImpl::ApplyOverrides(const ValidationOptions &options) const
    {
      plan::ValidationConfig config = validation_;
      if (options.has_fixed_clip_count())
        config.fixed_clip_count = options.fixed_clip_count();
      if (options.has_fixed_clip_sec())
        config.fixed_clip_sec = options.fixed_clip_sec();
      return config;
    }

    timeline::CompositionConfig PlanServiceImpl::ApplyOverrides(const TimingOptions &options) const
    {
      timeline::CompositionConfig config = composition_;
      if (options.has_lead_sec())
        config.lead_sec = options.lead_sec();
      if (options.has_trail_sec())
        config.trail_sec = options.trail_sec();
      if (options.has_min_segment_sec())
        config.min_segment_sec = options.min_segment_sec();
      return config;
    }

    grpc::Status PlanServiceImpl::ValidatePlan(grpc::ServerContext * /*context*/,
                                               const ValidatePlanRequest *request,
                                               ValidatePlanResponse *response)
    {
      Logger::Debug("[ValidatePlan] Request received: " +
                    std::to_string(request->raw_text().size()) + " bytes");

      if (!schema_.valid)
      {
        FillFailure(schema_.failure, response->mutable_failure());
        return FailureStatus("ValidatePlan", schema_.failure);
      }

      plan::InvariantValidator invariants(ApplyOverrides(request->validation()));
      auto intake = plan::IntakeModelOutput(request->raw_text(), *schema_.validator, invariants);

      response->set_success(intake.valid);
      if (!intake.valid)
      {
        FillFailure(intake.failure, response->mutable_failure());
        return FailureStatus("ValidatePlan", intake.failure);
      }

      response->set_plan_json(plan::PlanToJson(intake.plan).dump());
      response->set_version(plan::PlanVersionName(intake.plan.version));
      response->set_clip_count(static_cast<int32_t>(intake.plan.clips.size()));
      return grpc::Status::OK;
    }

    grpc::Status PlanServiceImpl::ComposeTimeline(grpc::ServerContext * /*context*/,
                                                  const ComposeTimelineRequest *request,
                                                  ComposeTimelineResponse *response)
    {
      Logger::Debug("[ComposeTimeline] Request received: image_dir=" + request->image_dir() +
                    ", audio_dir=" + request->audio_dir());

      if (!schema_.valid)
      {
        FillFailure(schema_.failure, response->mutable_failure());
        return FailureStatus("ComposeTimeline", schema_.failure);
      }

      // Caller-supplied plans go through full intake.
      plan::InvariantValidator invariants(ApplyOverrides(request->validation()));
      auto intake = plan::IntakeModelOutput(request->plan_json(), *schema_.validator, invariants);
      if (!intake.valid)
      {
        response->set_success(false);
        FillFailure(intake.failure, response->mutable_failure());
        return FailureStatus("ComposeTimeline", intake.failure);
      }

      timeline::AssetLayout layout;
      if (!request->image_dir().empty())
        layout.image_dir = request->image_dir();
      if (!request->audio_dir().empty())
        layout.audio_dir = request->audio_dir();
      auto assets = asset_factory_(layout);

      timeline::TimelineComposer composer(ApplyOverrides(request->timing()));
      auto composed = composer.Compose(intake.plan, *assets);
      if (!composed.ok)
      {
        response->set_success(false);
        FillFailure(composed.failure, response->mutable_failure());
        return FailureStatus("ComposeTimeline", composed.failure);
      }

      for (const auto &seg : composed.segments)
      {
        auto *out = response->add_segments();
        out->set_clip_index(seg.clip_index);
        out->set_start_sec(seg.start_sec);
        out->set_end_sec(seg.end_sec);
        out->set_image_ref(seg.image_ref);
        out->set_audio_present(seg.audio_source.present);
        out->set_audio_ref(seg.audio_source.ref);
        out->set_lead_silence_sec(seg.audio_fit.lead_silence_sec);
        out->set_speech_sec(seg.audio_fit.speech_sec);
        out->set_trail_silence_sec(seg.audio_fit.trail_silence_sec);
        out->set_trimmed(seg.audio_fit.trimmed);
        out->set_silence_sample_rate(seg.audio_fit.sample_rate);
        out->set_silence_channels(seg.audio_fit.channels);
      }

      auto records = subtitle::BuildSubtitleRecords(intake.plan, composed.segments);
      response->set_success(true);
      response->set_total_duration_sec(composed.total_duration_sec());
      response->set_srt(subtitle::RenderSrt(records));
      response->set_manifest_json(timeline::SegmentsToJson(composed).dump(2));

      std::ostringstream oss;
      oss << "[ComposeTimeline] " << composed.segments.size() << " segments, "
          << composed.total_duration_sec() << "s";
      Logger::Info(oss.str());
      return grpc::Status::OK;
    }

    grpc::Status PlanServiceImpl::GetVersion(grpc::ServerContext * /*context*/,
                                             const ApiVersionRequest * /*request*/,
                                             ApiVersion *response)
    {
      response->set_version(kApiVersion);
      return grpc::Status::OK;
    }

  } // namespace service
} // namespace reelplan
