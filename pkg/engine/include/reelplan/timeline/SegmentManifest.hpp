// Repository: ReelPlan
// Component: Segment Manifest
// Purpose: JSON rendering of composed segments for the external encoder.
// Copyright (c) 2026 ReelPlan

#ifndef REELPLAN_TIMELINE_SEGMENT_MANIFEST_HPP_
#define REELPLAN_TIMELINE_SEGMENT_MANIFEST_HPP_

#include <nlohmann/json.hpp>

#include "reelplan/timeline/TimelineComposer.hpp"

namespace reelplan::timeline {

// {
//   "policy": "slot_fit",
//   "total_duration_sec": 60.0,
//   "segments": [
//     { "clip_index": 1, "start_sec": 0.0, "end_sec": 10.0, "duration_sec": 10.0,
//       "image": "outputs/images/clip1.png",
//       "audio": { "source": "outputs/audio/clip1.wav" | null,
//                  "source_duration_sec": 8.2,
//                  "lead_silence_sec": 0.0, "speech_sec": 8.2,
//                  "trail_silence_sec": 1.8, "trimmed": false,
//                  "silence_sample_rate": 24000, "silence_channels": 1,
//                  "lead_silence_samples": 0, "trail_silence_samples": 43200 } }
//   ]
// }
nlohmann::json SegmentsToJson(const CompositionResult& result);

}  // namespace reelplan::timeline

#endif  // REELPLAN_TIMELINE_SEGMENT_MANIFEST_HPP_
