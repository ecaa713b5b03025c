// Repository: ReelPlan
// Component: CompositionPolicy
// Purpose: Decides a clip's realized duration and audio layout from its
//          declared slot and its measured audio.
//          v1 plans use SlotFitPolicy; v2 plans use LeadTrailPadPolicy.
// Copyright (c) 2026 ReelPlan

#ifndef REELPLAN_TIMELINE_COMPOSITION_POLICY_HPP_
#define REELPLAN_TIMELINE_COMPOSITION_POLICY_HPP_

#include <memory>

#include "reelplan/plan/PlanTypes.hpp"
#include "reelplan/timeline/TimelineConfig.hpp"
#include "reelplan/timeline/TimelineTypes.hpp"

namespace reelplan::timeline {

struct SegmentFit {
  double duration_sec = 0.0;
  AudioFit audio;
};

class CompositionPolicy {
 public:
  virtual ~CompositionPolicy() = default;

  // Short name recorded in the segment manifest.
  virtual const char* Name() const = 0;

  virtual SegmentFit Fit(const plan::Clip& clip, const AudioInfo& audio) const = 0;
};

// =============================================================================
// SlotFitPolicy
// Segment duration is the declared slot D = max(min_slot_sec, end - start).
// Audio longer than D is trimmed; shorter audio is followed by silence
// at the audio's own format. No audio: D seconds of default-format silence.
// =============================================================================

class SlotFitPolicy final : public CompositionPolicy {
 public:
  explicit SlotFitPolicy(CompositionConfig config = {});

  const char* Name() const override { return "slot_fit"; }
  SegmentFit Fit(const plan::Clip& clip, const AudioInfo& audio) const override;

 private:
  CompositionConfig config_;
};

// =============================================================================
// LeadTrailPadPolicy
// Declared timing is ignored. With audio: lead + audio + trail, silence at
// the audio's format. Without: max(min_segment_sec, lead + trail) of
// default-format silence.
// =============================================================================

class LeadTrailPadPolicy final : public CompositionPolicy {
 public:
  explicit LeadTrailPadPolicy(CompositionConfig config = {});

  const char* Name() const override { return "lead_trail_pad"; }
  SegmentFit Fit(const plan::Clip& clip, const AudioInfo& audio) const override;

 private:
  CompositionConfig config_;
};

// Policy selected by plan version.
std::unique_ptr<CompositionPolicy> MakeCompositionPolicy(
    plan::PlanVersion version, const CompositionConfig& config);

}  // namespace reelplan::timeline

#endif  // REELPLAN_TIMELINE_COMPOSITION_POLICY_HPP_
