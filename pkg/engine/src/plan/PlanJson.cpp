// Repository: ReelPlan
// Component: Plan Persistence Implementation
// Copyright (c) 2026 ReelPlan

#include "reelplan/plan/PlanJson.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace reelplan::plan {

using nlohmann::json;

json PlanToJson(const Plan& plan) {
  json root;
  root["title"] = plan.title;
  root["clips"] = json::array();

  for (const auto& clip : plan.clips) {
    json c;
    c["index"] = clip.index;
    c["start_sec"] = clip.start_sec;
    c["end_sec"] = clip.end_sec;

    if (plan.version == PlanVersion::kV1) {
      c["dialogue"] = clip.dialogue;
      if (!clip.verse_refs.empty()) {
        c["verse_refs"] = clip.verse_refs;
      }
    } else {
      c["mode"] = ClipModeName(clip.mode);
      if (clip.dialogue_text) {
        c["dialogue_text"] = *clip.dialogue_text;
      }
      if (clip.verse) {
        json verse;
        if (!clip.verse->ref.empty()) verse["ref"] = clip.verse->ref;
        verse["text"] = clip.verse->text;
        c["verse"] = verse;
      }
    }

    c["image_prompt"] = clip.image_prompt;
    if (clip.subtitle) {
      c["subtitle"] = *clip.subtitle;
    }
    root["clips"].push_back(std::move(c));
  }
  return root;
}

WriteResult WriteJsonFile(const json& document, const std::string& path) {
  const std::filesystem::path target(path);
  if (target.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
      return WriteResult::Failure("cannot create " + target.parent_path().string() +
                                  ": " + ec.message());
    }
  }

  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out.is_open()) {
    return WriteResult::Failure("cannot open for writing: " + path);
  }
  out << document.dump(2) << '\n';
  out.flush();
  if (!out) {
    return WriteResult::Failure("write failed: " + path);
  }
  return WriteResult::Success();
}

WriteResult WriteJsonFiles(
    const std::vector<std::pair<std::string, json>>& files) {
  for (const auto& [path, document] : files) {
    auto result = WriteJsonFile(document, path);
    if (!result.ok) return result;
  }
  return WriteResult::Success();
}

}  // namespace reelplan::plan
