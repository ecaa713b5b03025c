// Repository: ReelPlan
// Component: Job Mapper Implementation
// Copyright (c) 2026 ReelPlan

#include "reelplan/jobs/JobMapper.hpp"

namespace reelplan::jobs {

using nlohmann::json;

std::string SceneIdFor(int32_t clip_index) {
  return "clip" + std::to_string(clip_index);
}

std::vector<ImageJob> PlanToImageJobs(const plan::Plan& plan) {
  std::vector<ImageJob> jobs;
  for (const auto& clip : plan.clips) {
    std::string prompt = plan::NormalizeWhitespace(clip.image_prompt);
    if (prompt.empty()) continue;

    ImageJob job;
    job.scene_id = SceneIdFor(clip.index);
    job.prompt = std::move(prompt);
    jobs.push_back(std::move(job));
  }
  return jobs;
}

std::vector<SpeechJob> PlanToSpeechJobs(const plan::Plan& plan,
                                        const std::string& voice) {
  std::vector<SpeechJob> jobs;
  for (const auto& clip : plan.clips) {
    if (clip.spoken_text.empty()) continue;

    SpeechJob job;
    job.line_id = SceneIdFor(clip.index);
    job.voice = voice;
    job.text = clip.spoken_text;
    jobs.push_back(std::move(job));
  }
  return jobs;
}

std::string SummarizeJobs(const std::vector<ImageJob>& images,
                          const std::vector<SpeechJob>& speech) {
  return "images=" + std::to_string(images.size()) +
         ", tts_lines=" + std::to_string(speech.size());
}

json ImageJobsToJson(const std::vector<ImageJob>& jobs) {
  json out = json::array();
  for (const auto& job : jobs) {
    out.push_back({{"scene_id", job.scene_id},
                   {"prompt", job.prompt},
                   {"aspect", job.aspect}});
  }
  return out;
}

json SpeechJobsToJson(const std::vector<SpeechJob>& jobs) {
  json out = json::array();
  for (const auto& job : jobs) {
    out.push_back({{"line_id", job.line_id},
                   {"voice", job.voice},
                   {"text", job.text}});
  }
  return out;
}

}  // namespace reelplan::jobs
