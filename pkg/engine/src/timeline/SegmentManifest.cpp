// Repository: ReelPlan
// Component: Segment Manifest Implementation
// Copyright (c) 2026 ReelPlan

#include "reelplan/timeline/SegmentManifest.hpp"

namespace reelplan::timeline {

using nlohmann::json;

namespace {

// Zero-length silence is omitted by the encoder; only nonzero spans are
// subject to the one-sample floor.
int64_t SamplesFor(double duration_sec, int32_t sample_rate) {
  return duration_sec > 0.0 ? SilenceSampleCount(duration_sec, sample_rate) : 0;
}

}  // namespace

json SegmentsToJson(const CompositionResult& result) {
  json root;
  root["policy"] = result.policy_name;
  root["total_duration_sec"] = result.total_duration_sec();
  root["segments"] = json::array();

  for (const auto& seg : result.segments) {
    const AudioFit& fit = seg.audio_fit;

    json audio;
    audio["source"] = seg.audio_source.present ? json(seg.audio_source.ref) : json(nullptr);
    audio["source_duration_sec"] = seg.audio_source.duration_sec;
    audio["lead_silence_sec"] = fit.lead_silence_sec;
    audio["speech_sec"] = fit.speech_sec;
    audio["trail_silence_sec"] = fit.trail_silence_sec;
    audio["trimmed"] = fit.trimmed;
    audio["silence_sample_rate"] = fit.sample_rate;
    audio["silence_channels"] = fit.channels;
    audio["lead_silence_samples"] = SamplesFor(fit.lead_silence_sec, fit.sample_rate);
    audio["trail_silence_samples"] = SamplesFor(fit.trail_silence_sec, fit.sample_rate);

    json s;
    s["clip_index"] = seg.clip_index;
    s["start_sec"] = seg.start_sec;
    s["end_sec"] = seg.end_sec;
    s["duration_sec"] = seg.duration_sec;
    s["image"] = seg.image_ref;
    s["audio"] = std::move(audio);
    root["segments"].push_back(std::move(s));
  }
  return root;
}

}  // namespace reelplan::timeline
