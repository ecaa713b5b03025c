// Repository: ReelPlan
// Component: CompositionPolicy Implementation
// Copyright (c) 2026 ReelPlan

#include "reelplan/timeline/CompositionPolicy.hpp"

#include <algorithm>
#include <cmath>

namespace reelplan::timeline {

int64_t SilenceSampleCount(double duration_sec, int32_t sample_rate) {
  auto samples = static_cast<int64_t>(
      std::nearbyint(duration_sec * static_cast<double>(sample_rate)));
  return std::max<int64_t>(1, samples);
}

namespace {

// Silence keeps the source's format so the encoder can concatenate without
// resampling. Falls back per field when the probe could not tell.
void ApplyFormat(AudioFit& fit, const AudioInfo& audio,
                 const CompositionConfig& config) {
  fit.sample_rate = (audio.exists && audio.sample_rate > 0)
                        ? audio.sample_rate : config.default_sample_rate;
  fit.channels = (audio.exists && audio.channels > 0)
                     ? audio.channels : config.default_channels;
}

}  // namespace

// =============================================================================
// SlotFitPolicy
// =============================================================================

SlotFitPolicy::SlotFitPolicy(CompositionConfig config)
    : config_(config) {}

SegmentFit SlotFitPolicy::Fit(const plan::Clip& clip,
                              const AudioInfo& audio) const {
  SegmentFit out;
  out.duration_sec = std::max(config_.min_slot_sec, clip.end_sec - clip.start_sec);
  ApplyFormat(out.audio, audio, config_);

  if (!audio.exists) {
    out.audio.trail_silence_sec = out.duration_sec;
    return out;
  }

  double a = std::max(0.0, audio.duration_sec);
  out.audio.speech_sec = std::min(a, out.duration_sec);
  out.audio.trail_silence_sec = std::max(0.0, out.duration_sec - a);
  out.audio.trimmed = a > out.duration_sec;
  return out;
}

// =============================================================================
// LeadTrailPadPolicy
// =============================================================================

LeadTrailPadPolicy::LeadTrailPadPolicy(CompositionConfig config)
    : config_(config) {}

SegmentFit LeadTrailPadPolicy::Fit(const plan::Clip& /*clip*/,
                                   const AudioInfo& audio) const {
  SegmentFit out;
  ApplyFormat(out.audio, audio, config_);

  if (!audio.exists) {
    out.duration_sec = std::max(config_.min_segment_sec,
                                config_.lead_sec + config_.trail_sec);
    out.audio.lead_silence_sec = out.duration_sec;
    return out;
  }

  double a = std::max(0.0, audio.duration_sec);
  out.audio.lead_silence_sec = config_.lead_sec;
  out.audio.speech_sec = a;
  out.audio.trail_silence_sec = config_.trail_sec;
  out.duration_sec = config_.lead_sec + a + config_.trail_sec;
  return out;
}

std::unique_ptr<CompositionPolicy> MakeCompositionPolicy(
    plan::PlanVersion version, const CompositionConfig& config) {
  if (version == plan::PlanVersion::kV2) {
    return std::make_unique<LeadTrailPadPolicy>(config);
  }
  return std::make_unique<SlotFitPolicy>(config);
}

}  // namespace reelplan::timeline
