// Repository: ReelPlan
// Component: Plan Intake Implementation
// Copyright (c) 2026 ReelPlan

#include "reelplan/plan/PlanIntake.hpp"

#include <fstream>
#include <sstream>

#include "reelplan/util/Logger.hpp"

namespace reelplan::plan {

IntakeResult IntakeModelOutput(const std::string& raw_text,
                               const SchemaValidator& schema,
                               const InvariantValidator& invariants) {
  auto parsed = ParseModelOutput(raw_text);
  if (!parsed.valid) {
    util::Logger::Error("[PlanIntake] " + parsed.failure.Describe());
    return IntakeResult::Failure(std::move(parsed.failure));
  }

  auto structural = schema.Validate(parsed.document);
  if (!structural.valid) {
    util::Logger::Error("[PlanIntake] " + structural.failure.Describe());
    return IntakeResult::Failure(std::move(structural.failure));
  }

  auto semantic = invariants.Validate(parsed.document);
  if (!semantic.valid) {
    util::Logger::Error("[PlanIntake] " + semantic.failure.Describe());
    return IntakeResult::Failure(std::move(semantic.failure));
  }

  return IntakeResult::Success(std::move(semantic.plan));
}

IntakeResult ReadPlanFile(const std::string& path,
                          const SchemaValidator& schema,
                          const InvariantValidator& invariants) {
  std::ifstream file(path);
  if (!file.is_open()) {
    PlanFailure f;
    f.error = PlanError::kIoError;
    f.detail = "cannot read plan: " + path;
    util::Logger::Error("[PlanIntake] " + f.Describe());
    return IntakeResult::Failure(std::move(f));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return IntakeModelOutput(buffer.str(), schema, invariants);
}

}  // namespace reelplan::plan
