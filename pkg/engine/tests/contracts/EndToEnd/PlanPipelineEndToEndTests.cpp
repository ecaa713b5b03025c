// Repository: ReelPlan
// Component: Plan Pipeline End-to-End Tests
// Purpose: Raw generator output through intake, composition and subtitles.
// Copyright (c) 2026 ReelPlan

#include <gtest/gtest.h>

#include <string>

#include "reelplan/jobs/JobMapper.hpp"
#include "reelplan/plan/InvariantValidator.hpp"
#include "reelplan/plan/PlanIntake.hpp"
#include "reelplan/subtitle/SubtitleEmitter.hpp"
#include "reelplan/timeline/TimelineComposer.hpp"
#include "fixtures/FakeAssetResolver.h"
#include "fixtures/PlanFixtures.h"

namespace reelplan {
namespace {

using nlohmann::json;
using tests::fixtures::FakeAssetResolver;
using tests::fixtures::LogCapture;
using tests::fixtures::MakeV1Plan;
using tests::fixtures::MakeV2DialogueClip;
using tests::fixtures::MakeV2Plan;
using tests::fixtures::ProjectSchema;

plan::IntakeResult Intake(const std::string& raw) {
  plan::InvariantValidator invariants;
  return plan::IntakeModelOutput(raw, ProjectSchema(), invariants);
}

// =============================================================================
// Six ten-second clips, all assets present
// =============================================================================

TEST(PlanPipelineEndToEnd, FixedSixClipPlanProducesSixtySecondVideo) {
  auto intake = Intake(MakeV1Plan().dump(2));
  ASSERT_TRUE(intake.valid) << intake.failure.Describe();

  FakeAssetResolver assets;
  assets.AddImages(6);
  for (int i = 1; i <= 6; ++i) assets.SetAudio(i, 9.0);

  timeline::TimelineComposer composer;
  auto composed = composer.Compose(intake.plan, assets);
  ASSERT_TRUE(composed.ok) << composed.failure.Describe();
  ASSERT_EQ(composed.segments.size(), 6u);
  EXPECT_DOUBLE_EQ(composed.segments.front().start_sec, 0.0);
  EXPECT_DOUBLE_EQ(composed.segments.back().end_sec, 60.0);

  auto records = subtitle::BuildSubtitleRecords(intake.plan, composed.segments);
  auto srt = subtitle::RenderSrt(records);
  EXPECT_NE(srt.find("6\n00:00:50,000 --> 00:01:00,000\n"), std::string::npos) << srt;

  auto parsed = subtitle::ParseSrt(srt);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->size(), 6u);

  auto images = jobs::PlanToImageJobs(intake.plan);
  auto speech = jobs::PlanToSpeechJobs(intake.plan);
  EXPECT_EQ(jobs::SummarizeJobs(images, speech), "images=6, tts_lines=6");
}

// =============================================================================
// Five clips: rejected before composition
// =============================================================================

TEST(PlanPipelineEndToEnd, FiveClipPlanRejectedWithCountRule) {
  auto intake = Intake(MakeV1Plan(5).dump());
  ASSERT_FALSE(intake.valid);
  EXPECT_EQ(intake.failure.error, plan::PlanError::kInvariantViolation);
  EXPECT_EQ(intake.failure.rule, plan::InvariantRule::kClipCount);
  EXPECT_NE(intake.failure.Describe().find("CLIP_COUNT"), std::string::npos);
}

// =============================================================================
// v2 with one narrated and one silent clip
// =============================================================================

TEST(PlanPipelineEndToEnd, PaddedPlanWithSilentClip) {
  auto intake = Intake(MakeV2Plan({MakeV2DialogueClip(1), MakeV2DialogueClip(2)}).dump());
  ASSERT_TRUE(intake.valid) << intake.failure.Describe();

  FakeAssetResolver assets;
  assets.AddImages(2);
  assets.SetAudio(1, 4.0);

  timeline::CompositionConfig config;
  config.lead_sec = 1.5;
  config.trail_sec = 2.0;
  config.min_segment_sec = 6.0;

  LogCapture logs;
  timeline::TimelineComposer composer(config);
  auto composed = composer.Compose(intake.plan, assets);
  ASSERT_TRUE(composed.ok) << composed.failure.Describe();
  ASSERT_EQ(composed.segments.size(), 2u);
  EXPECT_DOUBLE_EQ(composed.segments[0].end_sec, 7.5);
  EXPECT_DOUBLE_EQ(composed.segments[1].start_sec, 7.5);
  EXPECT_DOUBLE_EQ(composed.segments[1].end_sec, 13.5);
  EXPECT_TRUE(LogCapture::Contains(logs.info, "DegradedAsset: clip 2"));

  auto srt = subtitle::RenderSrt(
      subtitle::BuildSubtitleRecords(intake.plan, composed.segments));
  EXPECT_NE(srt.find("00:00:07,500 --> 00:00:13,500"), std::string::npos) << srt;
}

// =============================================================================
// Missing image
// =============================================================================

TEST(PlanPipelineEndToEnd, MissingImageNamesClipAndEmitsNothing) {
  auto intake = Intake(MakeV1Plan().dump());
  ASSERT_TRUE(intake.valid) << intake.failure.Describe();

  FakeAssetResolver assets;
  assets.AddImages(6);
  assets.RemoveImage(4);

  timeline::TimelineComposer composer;
  auto composed = composer.Compose(intake.plan, assets);
  ASSERT_FALSE(composed.ok);
  EXPECT_EQ(composed.failure.error, plan::PlanError::kMissingAsset);
  EXPECT_EQ(composed.failure.clip_index, 4);
  EXPECT_TRUE(composed.segments.empty());
}

}  // namespace
}  // namespace reelplan
