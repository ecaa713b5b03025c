// Repository: ReelPlan
// Component: Plan Persistence
// Purpose: Render a normalized Plan back to the plan document format so it
//          can be stored as the pipeline's canonical artifact.
// Copyright (c) 2026 ReelPlan

#ifndef REELPLAN_PLAN_PLAN_JSON_HPP_
#define REELPLAN_PLAN_PLAN_JSON_HPP_

#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "reelplan/plan/PlanTypes.hpp"

namespace reelplan::plan {

// Writes only source fields (the derived spoken/caption text is recomputed on
// load), so the output re-validates to an identical Plan.
nlohmann::json PlanToJson(const Plan& plan);

struct WriteResult {
  bool ok;
  PlanFailure failure;

  static WriteResult Success() { return {true, {}}; }

  static WriteResult Failure(const std::string& detail) {
    PlanFailure f;
    f.error = PlanError::kIoError;
    f.detail = detail;
    return {false, std::move(f)};
  }
};

// Pretty-printed (indent 2), creating parent directories as needed.
WriteResult WriteJsonFile(const nlohmann::json& document, const std::string& path);

// Writes (path, document) pairs in order and stops at the first failure.
// Files after the failing one are not touched.
WriteResult WriteJsonFiles(
    const std::vector<std::pair<std::string, nlohmann::json>>& files);

inline WriteResult WritePlanFile(const Plan& plan, const std::string& path) {
  return WriteJsonFile(PlanToJson(plan), path);
}

}  // namespace reelplan::plan

#endif  // REELPLAN_PLAN_PLAN_JSON_HPP_
