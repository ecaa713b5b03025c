// Repository: ReelPlan
// Component: Plan Intake
// Purpose: raw model output -> Schema Validator -> Invariant Validator -> Plan
// Copyright (c) 2026 ReelPlan

#ifndef REELPLAN_PLAN_PLAN_INTAKE_HPP_
#define REELPLAN_PLAN_PLAN_INTAKE_HPP_

#include <string>

#include "reelplan/plan/InvariantValidator.hpp"
#include "reelplan/plan/PlanTypes.hpp"
#include "reelplan/plan/SchemaValidator.hpp"

namespace reelplan::plan {

struct IntakeResult {
  bool valid;
  PlanFailure failure;
  Plan plan;

  static IntakeResult Success(Plan p) { return {true, {}, std::move(p)}; }
  static IntakeResult Failure(PlanFailure f) { return {false, std::move(f), {}}; }
};

// Runs every stage and stops at the first failing one. No partial plans.
IntakeResult IntakeModelOutput(const std::string& raw_text,
                               const SchemaValidator& schema,
                               const InvariantValidator& invariants);

// Reads a persisted plan file and re-runs full intake on it.
IntakeResult ReadPlanFile(const std::string& path,
                          const SchemaValidator& schema,
                          const InvariantValidator& invariants);

}  // namespace reelplan::plan

#endif  // REELPLAN_PLAN_PLAN_INTAKE_HPP_
