// Repository: ReelPlan
// Component: Job Mapper
// Purpose: Map a validated Plan to the image-generation and speech-synthesis
//          job payloads consumed by the upstream asset generators.
// Copyright (c) 2026 ReelPlan

#ifndef REELPLAN_JOBS_JOB_MAPPER_HPP_
#define REELPLAN_JOBS_JOB_MAPPER_HPP_

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "reelplan/plan/PlanTypes.hpp"

namespace reelplan::jobs {

struct ImageJob {
  std::string scene_id;  // "clip<N>", matches the image asset name
  std::string prompt;
  std::string aspect = "16:9";
};

struct SpeechJob {
  std::string line_id;   // "clip<N>", matches the audio asset name
  std::string voice;
  std::string text;
};

std::string SceneIdFor(int32_t clip_index);

// Clips with a blank prompt are skipped.
std::vector<ImageJob> PlanToImageJobs(const plan::Plan& plan);

// Clips with no spoken text are skipped.
std::vector<SpeechJob> PlanToSpeechJobs(const plan::Plan& plan,
                                        const std::string& voice = "default");

// "images=<n>, tts_lines=<m>"
std::string SummarizeJobs(const std::vector<ImageJob>& images,
                          const std::vector<SpeechJob>& speech);

nlohmann::json ImageJobsToJson(const std::vector<ImageJob>& jobs);
nlohmann::json SpeechJobsToJson(const std::vector<SpeechJob>& jobs);

}  // namespace reelplan::jobs

#endif  // REELPLAN_JOBS_JOB_MAPPER_HPP_
