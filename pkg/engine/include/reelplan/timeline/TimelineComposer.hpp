// Repository: ReelPlan
// Component: TimelineComposer
// Purpose: Turns a validated Plan plus per-clip assets into an ordered,
//          gap-free list of Segments.
// Copyright (c) 2026 ReelPlan

#ifndef REELPLAN_TIMELINE_TIMELINE_COMPOSER_HPP_
#define REELPLAN_TIMELINE_TIMELINE_COMPOSER_HPP_

#include <string>
#include <vector>

#include "reelplan/plan/PlanTypes.hpp"
#include "reelplan/timeline/CompositionPolicy.hpp"
#include "reelplan/timeline/IAssetResolver.hpp"
#include "reelplan/timeline/TimelineConfig.hpp"
#include "reelplan/timeline/TimelineTypes.hpp"

namespace reelplan::timeline {

struct CompositionResult {
  bool ok;
  plan::PlanFailure failure;
  std::vector<Segment> segments;
  std::string policy_name;

  static CompositionResult Success(std::vector<Segment> segs, std::string policy) {
    return {true, {}, std::move(segs), std::move(policy)};
  }

  static CompositionResult Failure(plan::PlanFailure f) {
    return {false, std::move(f), {}, {}};
  }

  double total_duration_sec() const {
    return segments.empty() ? 0.0 : segments.back().end_sec;
  }
};

class TimelineComposer {
 public:
  explicit TimelineComposer(CompositionConfig config = {});

  // Compose with the policy implied by plan.version.
  //
  // A clip without an image fails the whole composition with kMissingAsset;
  // no segments are returned. A clip without audio degrades to silence and
  // is logged.
  //
  // Segments satisfy: segments[0].start_sec == 0 and
  // segments[i].start_sec == segments[i-1].end_sec.
  CompositionResult Compose(const plan::Plan& plan,
                            const IAssetResolver& assets) const;

  CompositionResult Compose(const plan::Plan& plan,
                            const IAssetResolver& assets,
                            const CompositionPolicy& policy) const;

  const CompositionConfig& config() const { return config_; }

 private:
  CompositionConfig config_;
};

}  // namespace reelplan::timeline

#endif  // REELPLAN_TIMELINE_TIMELINE_COMPOSER_HPP_
