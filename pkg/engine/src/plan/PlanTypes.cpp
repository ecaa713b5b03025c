// Repository: ReelPlan
// Component: Plan Types Implementation
// Copyright (c) 2026 ReelPlan

#include "reelplan/plan/PlanTypes.hpp"

#include <cctype>
#include <sstream>

namespace reelplan::plan {

// New error codes may be added; existing codes must not change meaning
const char* PlanErrorToString(PlanError error) {
  switch (error) {
    case PlanError::kNone:
      return "NONE";
    case PlanError::kMalformedOutput:
      return "MALFORMED_OUTPUT";
    case PlanError::kSchemaViolation:
      return "SCHEMA_VIOLATION";
    case PlanError::kInvariantViolation:
      return "INVARIANT_VIOLATION";
    case PlanError::kMissingAsset:
      return "MISSING_ASSET";
    case PlanError::kSchemaLoadError:
      return "SCHEMA_LOAD_ERROR";
    case PlanError::kIoError:
      return "IO_ERROR";
  }
  return "UNKNOWN_ERROR";
}

const char* InvariantRuleToString(InvariantRule rule) {
  switch (rule) {
    case InvariantRule::kNone:
      return "NONE";
    case InvariantRule::kClipCount:
      return "CLIP_COUNT";
    case InvariantRule::kClipShape:
      return "CLIP_SHAPE";
    case InvariantRule::kIndexSequence:
      return "INDEX_SEQUENCE";
    case InvariantRule::kTimingOrder:
      return "TIMING_ORDER";
    case InvariantRule::kTimingOverlap:
      return "TIMING_OVERLAP";
    case InvariantRule::kFixedDuration:
      return "FIXED_DURATION";
    case InvariantRule::kModeFields:
      return "MODE_FIELDS";
  }
  return "UNKNOWN_RULE";
}

std::string PlanFailure::Describe() const {
  std::ostringstream out;
  out << PlanErrorToString(error);
  if (error == PlanError::kInvariantViolation) {
    out << " rule=" << InvariantRuleToString(rule);
  }
  if (clip_index >= 0) {
    out << " clip=" << clip_index;
  }
  if (!detail.empty()) {
    out << ": " << detail;
  }
  for (const auto& issue : issues) {
    out << " | " << issue.path << ": " << issue.message;
  }
  return out.str();
}

const char* ClipModeName(ClipMode mode) {
  switch (mode) {
    case ClipMode::kDialogue: return "dialogue";
    case ClipMode::kVerse:    return "verse";
    case ClipMode::kBoth:     return "both";
  }
  return "unknown";
}

std::optional<ClipMode> ClipModeFromString(const std::string& name) {
  if (name == "dialogue") return ClipMode::kDialogue;
  if (name == "verse") return ClipMode::kVerse;
  if (name == "both") return ClipMode::kBoth;
  return std::nullopt;
}

bool operator==(const Verse& a, const Verse& b) {
  return a.ref == b.ref && a.text == b.text;
}

bool operator==(const Clip& a, const Clip& b) {
  return a.index == b.index &&
         a.start_sec == b.start_sec &&
         a.end_sec == b.end_sec &&
         a.mode == b.mode &&
         a.spoken_text == b.spoken_text &&
         a.caption_text == b.caption_text &&
         a.image_prompt == b.image_prompt &&
         a.dialogue == b.dialogue &&
         a.verse_refs == b.verse_refs &&
         a.dialogue_text == b.dialogue_text &&
         a.verse == b.verse &&
         a.subtitle == b.subtitle;
}

bool operator==(const Plan& a, const Plan& b) {
  return a.title == b.title && a.version == b.version && a.clips == b.clips;
}

std::string NormalizeWhitespace(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(c);
  }
  return out;
}

}  // namespace reelplan::plan
