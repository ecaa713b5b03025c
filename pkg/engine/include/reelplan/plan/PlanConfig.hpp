// Repository: ReelPlan
// Component: Plan Validation Configuration
// Purpose: Run-level constants agreed with the upstream plan generator.
// Copyright (c) 2026 ReelPlan

#ifndef REELPLAN_PLAN_PLAN_CONFIG_HPP_
#define REELPLAN_PLAN_PLAN_CONFIG_HPP_

#include <cstddef>
#include <cstdint>

namespace reelplan::plan {

// Configuration for InvariantValidator
// POD struct - immutable after construction
struct ValidationConfig {
  int32_t fixed_clip_count = 6;           // v1: exact number of clips
  double fixed_clip_sec = 10.0;           // v1: exact duration of every clip
  double duration_tolerance_sec = 1e-6;   // v1: allowed |duration - fixed_clip_sec|
  size_t min_speech_chars = 90;           // below this, spoken text logs a warning
  double v2_default_clip_sec = 10.0;      // v2: span given to clips without timing
};

}  // namespace reelplan::plan

#endif  // REELPLAN_PLAN_PLAN_CONFIG_HPP_
