// Repository: ReelPlan
// Component: Invariant Validator
// Purpose: Version-aware semantic checks that turn a schema-valid document
//          into a normalized Plan.
// Copyright (c) 2026 ReelPlan

#ifndef REELPLAN_PLAN_INVARIANT_VALIDATOR_HPP_
#define REELPLAN_PLAN_INVARIANT_VALIDATOR_HPP_

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "reelplan/plan/PlanConfig.hpp"
#include "reelplan/plan/PlanTypes.hpp"

namespace reelplan::plan {

// =============================================================================
// Invariant Validator
// =============================================================================

class InvariantValidator {
 public:
  explicit InvariantValidator(ValidationConfig config = {});

  // Validate a schema-valid plan document.
  //
  // Rules run in this order, each across all clips, and the first failure
  // is returned:
  //   count/shape -> index sequencing -> timing order/overlap
  //   -> fixed duration (v1 only) -> mode/field consistency
  //
  // Returns:
  //   The normalized Plan on success, or an InvariantViolation naming the
  //   rule and the offending clip index.
  struct ValidationResult {
    bool valid;
    PlanFailure failure;
    Plan plan;

    static ValidationResult Success(Plan p) {
      return {true, {}, std::move(p)};
    }

    static ValidationResult Failure(InvariantRule rule,
                                    int32_t clip_index,
                                    const std::string& detail) {
      PlanFailure f;
      f.error = PlanError::kInvariantViolation;
      f.rule = rule;
      f.clip_index = clip_index;
      f.detail = detail;
      return {false, std::move(f), {}};
    }
  };

  ValidationResult Validate(const nlohmann::json& document) const;

  // v2 if any clip carries 'verse' or 'dialogue_text'; otherwise v1.
  static PlanVersion InferVersion(const nlohmann::json& document);

  // Narration for TTS: quotation (+ " (ref).") then dialogue, whitespace
  // normalized. v1 uses 'dialogue'.
  static std::string ComposeSpokenText(const Clip& clip, PlanVersion version);

  const ValidationConfig& config() const { return config_; }

 private:
  ValidationConfig config_;

  // Individual validation steps (fail fast on first error)

  // Clip count and version-required fields; fills clips on success.
  ValidationResult ExtractClips(const nlohmann::json& document,
                                PlanVersion version,
                                std::vector<Clip>& clips) const;

  // clips[i].index == i + 1
  ValidationResult ValidateIndexSequence(const std::vector<Clip>& clips) const;

  // end > start, start >= previous end
  ValidationResult ValidateTiming(const std::vector<Clip>& clips) const;

  // v1: every clip spans exactly fixed_clip_sec
  ValidationResult ValidateFixedDuration(const std::vector<Clip>& clips) const;

  // mode requires the matching narration fields
  ValidationResult ValidateModeFields(const std::vector<Clip>& clips,
                                      PlanVersion version) const;

  // Quality signal only; never fails.
  void WarnShortSpeech(const Plan& plan) const;
};

}  // namespace reelplan::plan

#endif  // REELPLAN_PLAN_INVARIANT_VALIDATOR_HPP_
