// Repository: ReelPlan
// Component: Job Mapper Tests
// Copyright (c) 2026 ReelPlan

#include <gtest/gtest.h>

#include "reelplan/jobs/JobMapper.hpp"

namespace reelplan::jobs {
namespace {

plan::Plan MakePlan() {
  plan::Plan p;
  p.title = "Harbor Lights";
  p.version = plan::PlanVersion::kV2;

  plan::Clip c1;
  c1.index = 1;
  c1.image_prompt = "  Lantern light over a harbor  ";
  c1.spoken_text = "The boats come home.";

  plan::Clip c2;
  c2.index = 2;
  c2.image_prompt = "   ";
  c2.spoken_text = "Night falls.";

  plan::Clip c3;
  c3.index = 3;
  c3.image_prompt = "Empty pier at night";

  p.clips = {c1, c2, c3};
  return p;
}

TEST(JobMapper, ImageJobsSkipBlankPrompts) {
  auto jobs = PlanToImageJobs(MakePlan());
  ASSERT_EQ(jobs.size(), 2u);
  EXPECT_EQ(jobs[0].scene_id, "clip1");
  EXPECT_EQ(jobs[0].prompt, "Lantern light over a harbor");
  EXPECT_EQ(jobs[0].aspect, "16:9");
  EXPECT_EQ(jobs[1].scene_id, "clip3");
}

TEST(JobMapper, SpeechJobsUseSpokenTextAndVoice) {
  auto jobs = PlanToSpeechJobs(MakePlan(), "en_US-amy");
  ASSERT_EQ(jobs.size(), 2u);
  EXPECT_EQ(jobs[0].line_id, "clip1");
  EXPECT_EQ(jobs[0].voice, "en_US-amy");
  EXPECT_EQ(jobs[0].text, "The boats come home.");
  EXPECT_EQ(jobs[1].line_id, "clip2");
}

TEST(JobMapper, DefaultVoice) {
  auto jobs = PlanToSpeechJobs(MakePlan());
  ASSERT_FALSE(jobs.empty());
  EXPECT_EQ(jobs[0].voice, "default");
}

TEST(JobMapper, Summary) {
  auto plan = MakePlan();
  EXPECT_EQ(SummarizeJobs(PlanToImageJobs(plan), PlanToSpeechJobs(plan)),
            "images=2, tts_lines=2");
  EXPECT_EQ(SummarizeJobs({}, {}), "images=0, tts_lines=0");
}

TEST(JobMapper, JsonPayloads) {
  auto plan = MakePlan();
  auto images = ImageJobsToJson(PlanToImageJobs(plan));
  ASSERT_TRUE(images.is_array());
  EXPECT_EQ(images[0]["scene_id"], "clip1");
  EXPECT_EQ(images[0]["aspect"], "16:9");

  auto speech = SpeechJobsToJson(PlanToSpeechJobs(plan, "v"));
  EXPECT_EQ(speech[1]["text"], "Night falls.");
  EXPECT_EQ(speech[1]["voice"], "v");
}

}  // namespace
}  // namespace reelplan::jobs
