// Repository: ReelPlan
// Component: SubtitleEmitter
// Purpose: SubRip (.srt) rendering of composed segments, timed to the
//          realized timeline.
// Copyright (c) 2026 ReelPlan

#ifndef REELPLAN_SUBTITLE_SUBTITLE_EMITTER_HPP_
#define REELPLAN_SUBTITLE_SUBTITLE_EMITTER_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "reelplan/plan/PlanTypes.hpp"
#include "reelplan/timeline/TimelineTypes.hpp"

namespace reelplan::subtitle {

struct SubtitleRecord {
  int32_t index = 0;  // 1-based
  double start_sec = 0.0;
  double end_sec = 0.0;
  std::string text;   // single line
};

bool operator==(const SubtitleRecord& a, const SubtitleRecord& b);

// One record per segment, captions looked up by segment clip_index in the
// plan. A segment without a matching clip gets empty text.
std::vector<SubtitleRecord> BuildSubtitleRecords(
    const plan::Plan& plan, const std::vector<timeline::Segment>& segments);

// Same, with captions supplied positionally (captions[i] for segments[i]).
std::vector<SubtitleRecord> BuildSubtitleRecords(
    const std::vector<timeline::Segment>& segments,
    const std::vector<std::string>& captions);

// CR/LF -> space, then trim.
std::string FlattenCaption(const std::string& text);

// Seconds -> "HH:MM:SS,mmm". Milliseconds round half away from zero;
// hours widen past two digits instead of wrapping. Negative input clamps to 0.
std::string FormatTimestamp(double seconds);

// "HH:MM:SS,mmm" -> milliseconds. nullopt if malformed.
std::optional<int64_t> ParseTimestamp(const std::string& text);

// "idx\nSTART --> END\ntext\n" per record, blank line between records.
std::string RenderSrt(const std::vector<SubtitleRecord>& records);

// Inverse of RenderSrt. Accepts CRLF line endings. Times are millisecond
// precision. nullopt if any block is malformed.
std::optional<std::vector<SubtitleRecord>> ParseSrt(const std::string& document);

}  // namespace reelplan::subtitle

#endif  // REELPLAN_SUBTITLE_SUBTITLE_EMITTER_HPP_
