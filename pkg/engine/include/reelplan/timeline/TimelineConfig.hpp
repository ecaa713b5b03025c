// Repository: ReelPlan
// Component: Timeline Configuration
// Purpose: Run-level timing constants and on-disk asset layout.
// Copyright (c) 2026 ReelPlan

#ifndef REELPLAN_TIMELINE_TIMELINE_CONFIG_HPP_
#define REELPLAN_TIMELINE_TIMELINE_CONFIG_HPP_

#include <cstdint>
#include <string>

namespace reelplan::timeline {

// Configuration for TimelineComposer and the composition policies
// POD struct - immutable after construction
struct CompositionConfig {
  double lead_sec = 1.5;            // v2: silence before speech
  double trail_sec = 2.0;           // v2: silence after speech
  double min_segment_sec = 6.0;     // v2: floor for clips without audio
  double min_slot_sec = 0.01;       // v1: floor for a degenerate slot
  int32_t default_sample_rate = 24000;  // silence format when no audio exists (TTS default)
  int32_t default_channels = 1;
};

// Where per-clip assets live. "{index}" in a pattern is replaced by the
// 1-based clip index.
struct AssetLayout {
  std::string image_dir = "outputs/images";
  std::string audio_dir = "outputs/audio";
  std::string image_pattern = "clip{index}.png";
  std::string audio_pattern = "clip{index}.wav";
};

}  // namespace reelplan::timeline

#endif  // REELPLAN_TIMELINE_TIMELINE_CONFIG_HPP_
