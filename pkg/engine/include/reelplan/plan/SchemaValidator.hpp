// Repository: ReelPlan
// Component: Schema Validator
// Purpose: Strict JSON parsing of model output and structural validation
//          against a declarative schema document.
// Copyright (c) 2026 ReelPlan

#ifndef REELPLAN_PLAN_SCHEMA_VALIDATOR_HPP_
#define REELPLAN_PLAN_SCHEMA_VALIDATOR_HPP_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>

#include "reelplan/plan/PlanTypes.hpp"

namespace reelplan::plan {

// =============================================================================
// Model Output Parsing
// =============================================================================

struct ParseResult {
  bool valid;
  PlanFailure failure;
  nlohmann::json document;

  static ParseResult Success(nlohmann::json doc) {
    return {true, {}, std::move(doc)};
  }

  static ParseResult Failure(PlanFailure f) {
    return {false, std::move(f), nullptr};
  }
};

// Trim surrounding whitespace and parse as strict JSON.
// Fails with kMalformedOutput (byte position + parser message in detail).
ParseResult ParseModelOutput(const std::string& raw_text);

// =============================================================================
// Schema Validator
// Draft-07 validation through nlohmann::json_schema. The schema document is
// itself checked against the draft-07 meta-schema when loaded.
// =============================================================================

struct SchemaLoadResult;

class SchemaValidator {
 public:
  // Load the schema document once per run.
  // Fails with kSchemaLoadError (unreadable, not JSON, malformed keyword).
  static SchemaLoadResult Load(const std::string& path);
  static SchemaLoadResult FromJson(const std::string& schema_text);

  struct ValidationResult {
    bool valid;
    PlanFailure failure;

    static ValidationResult Success() { return {true, {}}; }

    static ValidationResult Failure(std::vector<SchemaIssue> issues) {
      PlanFailure f;
      f.error = PlanError::kSchemaViolation;
      f.detail = std::to_string(issues.size()) + " schema issue(s)";
      f.issues = std::move(issues);
      return {false, std::move(f)};
    }
  };

  // Collect every mismatch (not just the first), sorted by path.
  ValidationResult Validate(const nlohmann::json& document) const;

 private:
  explicit SchemaValidator(
      std::shared_ptr<const nlohmann::json_schema::json_validator> validator);

  std::shared_ptr<const nlohmann::json_schema::json_validator> validator_;
};

struct SchemaLoadResult {
  bool valid;
  PlanFailure failure;
  std::optional<SchemaValidator> validator;
};

}  // namespace reelplan::plan

#endif  // REELPLAN_PLAN_SCHEMA_VALIDATOR_HPP_
