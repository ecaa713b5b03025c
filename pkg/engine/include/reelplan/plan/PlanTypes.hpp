// Repository: ReelPlan
// Component: Plan Types
// Purpose: Data structures for validated plans and their failure modes
// Copyright (c) 2026 ReelPlan

#ifndef REELPLAN_PLAN_TYPES_HPP_
#define REELPLAN_PLAN_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace reelplan::plan {

// =============================================================================
// Error Codes
// =============================================================================

enum class PlanError {
  // No error
  kNone = 0,

  // Raw model output is not well-formed JSON
  kMalformedOutput,

  // Parsed document does not match the declared schema
  kSchemaViolation,

  // Semantic rule broken (see InvariantRule)
  kInvariantViolation,

  // A clip has no image on disk
  kMissingAsset,

  // Schema document itself could not be loaded
  kSchemaLoadError,

  // Plan or output file could not be read/written
  kIoError,
};

// Convert error code to string for logging
const char* PlanErrorToString(PlanError error);

// =============================================================================
// Invariant Rules
// Checked in declaration order; the first broken rule is reported.
// =============================================================================

enum class InvariantRule {
  kNone = 0,

  // clips empty, or v1 count != fixed count
  kClipCount,

  // version-required field missing, half-specified timing, empty image prompt
  kClipShape,

  // clips[i].index != i + 1
  kIndexSequence,

  // end_sec <= start_sec
  kTimingOrder,

  // start_sec < previous end_sec
  kTimingOverlap,

  // v1 only: end_sec - start_sec != fixed duration
  kFixedDuration,

  // mode does not match the narration fields present
  kModeFields,
};

const char* InvariantRuleToString(InvariantRule rule);

// One structural mismatch reported by the schema validator.
struct SchemaIssue {
  std::string path;     // "clips/2/index", "(root)" for the top level
  std::string message;
};

// =============================================================================
// Failure Detail
// Carried by every result type; enough structure to render a precise
// diagnostic or let the upstream generator retry.
// =============================================================================

struct PlanFailure {
  PlanError error = PlanError::kNone;
  std::string detail;

  // kSchemaViolation: every mismatch, sorted by path
  std::vector<SchemaIssue> issues;

  // kInvariantViolation: first broken rule
  InvariantRule rule = InvariantRule::kNone;

  // kInvariantViolation / kMissingAsset: 1-based clip index (-1 = plan level)
  int32_t clip_index = -1;

  // Single-line rendering, e.g.
  //   INVARIANT_VIOLATION rule=CLIP_COUNT: v1 plan must have exactly 6 clips (got 5)
  std::string Describe() const;
};

// =============================================================================
// Plan Version
// Fixed once during normalization; never re-inferred downstream.
// =============================================================================

enum class PlanVersion : int32_t {
  kV1 = 1,  // fixed count, fixed duration, single 'dialogue' field
  kV2 = 2,  // variable count/duration, verse + dialogue_text, explicit mode
};

inline const char* PlanVersionName(PlanVersion v) {
  switch (v) {
    case PlanVersion::kV1: return "v1";
    case PlanVersion::kV2: return "v2";
  }
  return "unknown";
}

enum class ClipMode : int32_t {
  kDialogue = 0,
  kVerse    = 1,
  kBoth     = 2,
};

// Wire names: "dialogue", "verse", "both".
const char* ClipModeName(ClipMode mode);
std::optional<ClipMode> ClipModeFromString(const std::string& name);

struct Verse {
  std::string ref;   // citation, may be empty
  std::string text;  // quotation
};

// =============================================================================
// Clip Structure (normalized view)
// =============================================================================

struct Clip {
  int32_t index = 0;        // 1-based, contiguous
  double start_sec = 0.0;
  double end_sec = 0.0;
  ClipMode mode = ClipMode::kDialogue;

  std::string spoken_text;   // whitespace-normalized narration, non-empty
  std::string caption_text;  // subtitle override, else spoken_text
  std::string image_prompt;

  // Source fields, kept so the plan can be persisted and re-validated.
  std::string dialogue;                      // v1
  std::vector<std::string> verse_refs;       // v1
  std::optional<std::string> dialogue_text;  // v2
  std::optional<Verse> verse;                // v2
  std::optional<std::string> subtitle;

  double duration_sec() const { return end_sec - start_sec; }
};

// =============================================================================
// Plan Structure
// Immutable once validated.
// =============================================================================

struct Plan {
  std::string title;
  PlanVersion version = PlanVersion::kV1;
  std::vector<Clip> clips;

  // Declared span of the last clip (0 for an empty plan)
  double declared_end_sec() const {
    return clips.empty() ? 0.0 : clips.back().end_sec;
  }
};

bool operator==(const Verse& a, const Verse& b);
bool operator==(const Clip& a, const Clip& b);
bool operator==(const Plan& a, const Plan& b);

// Collapse whitespace runs to one space and trim both ends.
std::string NormalizeWhitespace(const std::string& text);

}  // namespace reelplan::plan

#endif  // REELPLAN_PLAN_TYPES_HPP_
