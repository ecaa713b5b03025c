// Repository: ReelPlan
// Component: TimelineComposer Implementation
// Copyright (c) 2026 ReelPlan

#include "reelplan/timeline/TimelineComposer.hpp"

#include <sstream>

#include "reelplan/util/Logger.hpp"

namespace reelplan::timeline {

TimelineComposer::TimelineComposer(CompositionConfig config)
    : config_(config) {}

CompositionResult TimelineComposer::Compose(const plan::Plan& plan,
                                            const IAssetResolver& assets) const {
  auto policy = MakeCompositionPolicy(plan.version, config_);
  return Compose(plan, assets, *policy);
}

CompositionResult TimelineComposer::Compose(const plan::Plan& plan,
                                            const IAssetResolver& assets,
                                            const CompositionPolicy& policy) const {
  // Images first: a missing image anywhere rejects the plan before any
  // audio is probed.
  for (const auto& clip : plan.clips) {
    if (!assets.ImageExists(clip.index)) {
      plan::PlanFailure f;
      f.error = plan::PlanError::kMissingAsset;
      f.clip_index = clip.index;
      f.detail = "missing image for clip " + std::to_string(clip.index) +
                 ": " + assets.ImageRef(clip.index);
      util::Logger::Error("[TimelineComposer] " + f.Describe());
      return CompositionResult::Failure(std::move(f));
    }
  }

  std::vector<Segment> segments;
  segments.reserve(plan.clips.size());

  double cursor = 0.0;
  for (const auto& clip : plan.clips) {
    AudioInfo audio = assets.GetAudioInfo(clip.index);
    SegmentFit fit = policy.Fit(clip, audio);

    if (!audio.exists) {
      std::ostringstream oss;
      oss << "[TimelineComposer] DegradedAsset: clip " << clip.index
          << " has no audio, using " << fit.duration_sec << "s of silence";
      util::Logger::Info(oss.str());
    } else if (fit.audio.trimmed) {
      std::ostringstream oss;
      oss << "[TimelineComposer] clip " << clip.index << " audio trimmed "
          << audio.duration_sec << "s -> " << fit.audio.speech_sec << "s";
      util::Logger::Debug(oss.str());
    }

    Segment seg;
    seg.clip_index = clip.index;
    seg.start_sec = cursor;
    seg.duration_sec = fit.duration_sec;
    seg.end_sec = cursor + fit.duration_sec;
    seg.image_ref = assets.ImageRef(clip.index);
    seg.audio_source.present = audio.exists;
    seg.audio_source.duration_sec = audio.exists ? audio.duration_sec : 0.0;
    seg.audio_source.ref = audio.exists ? audio.ref : std::string();
    seg.audio_fit = fit.audio;

    cursor = seg.end_sec;
    segments.push_back(std::move(seg));
  }

  std::ostringstream oss;
  oss << "[TimelineComposer] Composed " << segments.size() << " segments ("
      << policy.Name() << "), total " << cursor << "s";
  util::Logger::Info(oss.str());

  return CompositionResult::Success(std::move(segments), policy.Name());
}

}  // namespace reelplan::timeline
