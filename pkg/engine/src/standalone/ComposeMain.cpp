// Repository: ReelPlan
// Component: reelplan_compose
// Purpose: Command-line front end: validate a plan, compose its timeline
//          against assets on disk, and write the encoder inputs.
// Copyright (c) 2026 ReelPlan
//
// OUTPUTS (in --outdir):
//   plan.json        normalized plan (re-validates to the same Plan)
//   segments.json    segment manifest for the encoder
//   subtitles.srt    SubRip captions timed to the composed timeline
//   image_jobs.json  image-generation payloads
//   tts_jobs.json    speech-synthesis payloads
//
// EXIT STATUS:
//   0 success, 1 usage/IO error, 2 plan rejected, 3 missing asset

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "reelplan/jobs/JobMapper.hpp"
#include "reelplan/plan/InvariantValidator.hpp"
#include "reelplan/plan/PlanIntake.hpp"
#include "reelplan/plan/PlanJson.hpp"
#include "reelplan/plan/SchemaValidator.hpp"
#include "reelplan/subtitle/SubtitleEmitter.hpp"
#include "reelplan/timeline/FileAssetResolver.hpp"
#include "reelplan/timeline/SegmentManifest.hpp"
#include "reelplan/timeline/TimelineComposer.hpp"
#include "reelplan/util/Logger.hpp"

namespace {

using reelplan::util::Logger;

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitRejected = 2;
constexpr int kExitMissingAsset = 3;

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  // Input (exactly one)
  std::string raw_path;   // raw model output
  std::string plan_path;  // previously persisted plan.json
  std::string schema_path = "schemas/plan_schema.json";

  std::string out_dir = "outputs";
  reelplan::timeline::AssetLayout layout;
  reelplan::plan::ValidationConfig validation;
  reelplan::timeline::CompositionConfig composition;
  std::string voice = "default";

  bool help = false;
  bool valid = false;
  std::string error;

  const std::string& InputPath() const {
    return raw_path.empty() ? plan_path : raw_path;
  }
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " (--raw FILE | --plan FILE) [OPTIONS]\n"
            << "\n"
            << "Validate a video plan and compose its timeline.\n"
            << "\n"
            << "INPUT:\n"
            << "  --raw FILE           Raw generator output (JSON text)\n"
            << "  --plan FILE          Persisted plan.json (re-validated)\n"
            << "  --schema FILE        Plan JSON schema (default: schemas/plan_schema.json)\n"
            << "\n"
            << "ASSETS / OUTPUT:\n"
            << "  --imgdir DIR         Clip images, clip<N>.png (default: outputs/images)\n"
            << "  --audiodir DIR       Clip narration, clip<N>.wav (default: outputs/audio)\n"
            << "  --outdir DIR         Output directory (default: outputs)\n"
            << "\n"
            << "TIMING:\n"
            << "  --lead SEC           v2 silence before speech (default: 1.5)\n"
            << "  --trail SEC          v2 silence after speech (default: 2.0)\n"
            << "  --min SEC            v2 minimum segment without audio (default: 6.0)\n"
            << "  --clips N            v1 required clip count (default: 6)\n"
            << "  --clip-sec SEC       v1 required clip duration (default: 10.0)\n"
            << "\n"
            << "JOBS:\n"
            << "  --voice NAME         Voice for speech jobs (default: default)\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "EXIT STATUS:\n"
            << "  0 ok, 1 usage/IO error, 2 plan rejected, 3 missing asset\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      bool has_value = i + 1 < argc;

      if (arg == "--help" || arg == "-h") {
        args.help = true;
        args.valid = true;
        return args;
      } else if (arg == "--raw" && has_value) {
        args.raw_path = argv[++i];
      } else if (arg == "--plan" && has_value) {
        args.plan_path = argv[++i];
      } else if (arg == "--schema" && has_value) {
        args.schema_path = argv[++i];
      } else if (arg == "--imgdir" && has_value) {
        args.layout.image_dir = argv[++i];
      } else if (arg == "--audiodir" && has_value) {
        args.layout.audio_dir = argv[++i];
      } else if (arg == "--outdir" && has_value) {
        args.out_dir = argv[++i];
      } else if (arg == "--lead" && has_value) {
        args.composition.lead_sec = std::stod(argv[++i]);
      } else if (arg == "--trail" && has_value) {
        args.composition.trail_sec = std::stod(argv[++i]);
      } else if (arg == "--min" && has_value) {
        args.composition.min_segment_sec = std::stod(argv[++i]);
      } else if (arg == "--clips" && has_value) {
        args.validation.fixed_clip_count = std::stoi(argv[++i]);
      } else if (arg == "--clip-sec" && has_value) {
        args.validation.fixed_clip_sec = std::stod(argv[++i]);
      } else if (arg == "--voice" && has_value) {
        args.voice = argv[++i];
      } else {
        args.error = "Unknown argument: " + arg;
        return args;
      }
    }
  } catch (const std::exception& e) {
    args.error = std::string("Invalid numeric value: ") + e.what();
    return args;
  }

  if (args.raw_path.empty() == args.plan_path.empty()) {
    args.error = "Must specify exactly one of --raw or --plan";
    return args;
  }
  if (args.composition.lead_sec < 0 || args.composition.trail_sec < 0 ||
      args.composition.min_segment_sec < 0) {
    args.error = "--lead, --trail and --min must be non-negative";
    return args;
  }
  if (args.validation.fixed_clip_count < 1 || args.validation.fixed_clip_sec <= 0) {
    args.error = "--clips and --clip-sec must be positive";
    return args;
  }

  args.valid = true;
  return args;
}

int ExitCodeFor(reelplan::plan::PlanError error) {
  using reelplan::plan::PlanError;
  switch (error) {
    case PlanError::kMalformedOutput:
    case PlanError::kSchemaViolation:
    case PlanError::kInvariantViolation:
      return kExitRejected;
    case PlanError::kMissingAsset:
      return kExitMissingAsset;
    case PlanError::kNone:
    case PlanError::kSchemaLoadError:
    case PlanError::kIoError:
      break;
  }
  return kExitUsage;
}

bool WriteTextFile(const std::string& path, const std::string& text) {
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out.is_open()) return false;
  out << text;
  out.flush();
  return static_cast<bool>(out);
}

int Run(const CliArgs& args) {
  namespace plan = reelplan::plan;
  namespace timeline = reelplan::timeline;

  auto schema = plan::SchemaValidator::Load(args.schema_path);
  if (!schema.valid) {
    Logger::Error("[reelplan_compose] " + schema.failure.Describe());
    return ExitCodeFor(schema.failure.error);
  }
  plan::InvariantValidator invariants(args.validation);

  auto intake = plan::ReadPlanFile(args.InputPath(), *schema.validator, invariants);
  if (!intake.valid) {
    std::cerr << intake.failure.Describe() << "\n";
    return ExitCodeFor(intake.failure.error);
  }
  const plan::Plan& validated = intake.plan;

  timeline::FileAssetResolver assets(args.layout);
  timeline::TimelineComposer composer(args.composition);
  auto composed = composer.Compose(validated, assets);
  if (!composed.ok) {
    std::cerr << composed.failure.Describe() << "\n";
    return ExitCodeFor(composed.failure.error);
  }

  auto records = reelplan::subtitle::BuildSubtitleRecords(validated, composed.segments);
  auto image_jobs = reelplan::jobs::PlanToImageJobs(validated);
  auto speech_jobs = reelplan::jobs::PlanToSpeechJobs(validated, args.voice);

  const std::string dir = args.out_dir + "/";
  auto written = plan::WriteJsonFiles({
      {dir + "plan.json", plan::PlanToJson(validated)},
      {dir + "segments.json", timeline::SegmentsToJson(composed)},
      {dir + "image_jobs.json", reelplan::jobs::ImageJobsToJson(image_jobs)},
      {dir + "tts_jobs.json", reelplan::jobs::SpeechJobsToJson(speech_jobs)}});
  if (!written.ok) {
    std::cerr << written.failure.Describe() << "\n";
    return kExitUsage;
  }
  if (!WriteTextFile(dir + "subtitles.srt", reelplan::subtitle::RenderSrt(records))) {
    std::cerr << "IO_ERROR: cannot write " << dir << "subtitles.srt\n";
    return kExitUsage;
  }

  std::cout << "OK: \"" << validated.title << "\" " << plan::PlanVersionName(validated.version)
            << ", " << composed.segments.size() << " segments, "
            << composed.total_duration_sec() << "s ("
            << reelplan::jobs::SummarizeJobs(image_jobs, speech_jobs) << ")\n";
  return kExitOk;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return kExitOk;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return kExitUsage;
  }

  return Run(args);
}
