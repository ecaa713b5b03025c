// Repository: ReelPlan
// Component: Timeline Types
// Purpose: Segments produced by composition and the audio layout the
//          external encoder must realize for each of them.
// Copyright (c) 2026 ReelPlan

#ifndef REELPLAN_TIMELINE_TIMELINE_TYPES_HPP_
#define REELPLAN_TIMELINE_TIMELINE_TYPES_HPP_

#include <cstdint>
#include <string>

namespace reelplan::timeline {

// Reported by the asset resolver for one clip.
struct AudioInfo {
  bool exists = false;
  double duration_sec = 0.0;
  int32_t sample_rate = 0;
  int32_t channels = 0;
  std::string ref;  // file path (empty when absent)
};

// Audio laid down for one segment, in order:
//   [lead silence][speech_sec of source audio][trail silence]
// Silence is synthesized at sample_rate / channels.
struct AudioFit {
  double lead_silence_sec = 0.0;
  double speech_sec = 0.0;
  double trail_silence_sec = 0.0;
  bool trimmed = false;  // source audio was cut to fit
  int32_t sample_rate = 0;
  int32_t channels = 0;
};

struct AudioSource {
  bool present = false;
  double duration_sec = 0.0;  // full length of the source file
  std::string ref;
};

// =============================================================================
// Segment
// One realized, timed unit of the final video. Never mutated after creation.
// =============================================================================

struct Segment {
  int32_t clip_index = 0;
  double start_sec = 0.0;
  double end_sec = 0.0;
  double duration_sec = 0.0;  // exact policy duration (end - start may round)
  std::string image_ref;
  AudioSource audio_source;
  AudioFit audio_fit;
};

// Samples of synthesized silence: max(1, round(duration * rate)), ties to even.
int64_t SilenceSampleCount(double duration_sec, int32_t sample_rate);

}  // namespace reelplan::timeline

#endif  // REELPLAN_TIMELINE_TIMELINE_TYPES_HPP_
