// Repository: ReelPlan
// Component: Invariant Validator Implementation
// Copyright (c) 2026 ReelPlan

#include "reelplan/plan/InvariantValidator.hpp"

#include <cmath>
#include <optional>
#include <sstream>

#include "reelplan/util/Logger.hpp"

namespace reelplan::plan {

using nlohmann::json;

namespace {

bool IsBlank(const std::string& text) {
  return NormalizeWhitespace(text).empty();
}

std::optional<std::string> OptionalString(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) return std::nullopt;
  return it->get<std::string>();
}

}  // namespace

InvariantValidator::InvariantValidator(ValidationConfig config)
    : config_(config) {}

PlanVersion InvariantValidator::InferVersion(const json& document) {
  if (!document.is_object()) return PlanVersion::kV1;
  auto clips = document.find("clips");
  if (clips == document.end() || !clips->is_array()) return PlanVersion::kV1;
  for (const auto& clip : *clips) {
    if (clip.is_object() &&
        (clip.contains("verse") || clip.contains("dialogue_text"))) {
      return PlanVersion::kV2;
    }
  }
  return PlanVersion::kV1;
}

std::string InvariantValidator::ComposeSpokenText(const Clip& clip,
                                                  PlanVersion version) {
  if (version == PlanVersion::kV1) {
    return NormalizeWhitespace(clip.dialogue);
  }

  std::string joined;
  if (clip.verse && !clip.verse->text.empty()) {
    const std::string ref = NormalizeWhitespace(clip.verse->ref);
    joined = ref.empty() ? clip.verse->text
                         : clip.verse->text + " (" + ref + ").";
  }
  if (clip.dialogue_text && !clip.dialogue_text->empty()) {
    if (!joined.empty()) joined += " ";
    joined += *clip.dialogue_text;
  }
  return NormalizeWhitespace(joined);
}

InvariantValidator::ValidationResult InvariantValidator::Validate(
    const json& document) const {
  // Version is decided once here and carried by the Plan from now on.
  const PlanVersion version = InferVersion(document);

  std::vector<Clip> clips;
  auto result = ExtractClips(document, version, clips);
  if (!result.valid) return result;

  result = ValidateIndexSequence(clips);
  if (!result.valid) return result;

  result = ValidateTiming(clips);
  if (!result.valid) return result;

  if (version == PlanVersion::kV1) {
    result = ValidateFixedDuration(clips);
    if (!result.valid) return result;
  }

  result = ValidateModeFields(clips, version);
  if (!result.valid) return result;

  Plan plan;
  plan.title = document["title"].get<std::string>();
  plan.version = version;
  plan.clips = std::move(clips);
  for (auto& clip : plan.clips) {
    clip.spoken_text = ComposeSpokenText(clip, version);
    const std::string override_text =
        clip.subtitle ? NormalizeWhitespace(*clip.subtitle) : std::string();
    clip.caption_text = override_text.empty() ? clip.spoken_text : override_text;
  }

  WarnShortSpeech(plan);

  std::ostringstream msg;
  msg << "[InvariantValidator] Plan accepted: version=" << PlanVersionName(version)
      << " clips=" << plan.clips.size() << " title=\"" << plan.title << "\"";
  util::Logger::Info(msg.str());

  return ValidationResult::Success(std::move(plan));
}

// Count/shape. Also the only place raw JSON is read.
InvariantValidator::ValidationResult InvariantValidator::ExtractClips(
    const json& document,
    PlanVersion version,
    std::vector<Clip>& clips) const {
  if (!document.is_object() || !document.contains("clips") ||
      !document["clips"].is_array() || !document.contains("title") ||
      !document["title"].is_string()) {
    return ValidationResult::Failure(
        InvariantRule::kClipShape, -1,
        "plan must be an object with a 'title' string and a 'clips' array");
  }

  const json& raw_clips = document["clips"];
  if (raw_clips.empty()) {
    return ValidationResult::Failure(
        InvariantRule::kClipCount, -1, "plan has no clips");
  }

  if (version == PlanVersion::kV1 &&
      static_cast<int64_t>(raw_clips.size()) != config_.fixed_clip_count) {
    std::ostringstream detail;
    detail << "v1 plan must have exactly " << config_.fixed_clip_count
           << " clips (got " << raw_clips.size() << ")";
    return ValidationResult::Failure(InvariantRule::kClipCount, -1, detail.str());
  }

  clips.clear();
  clips.reserve(raw_clips.size());
  double cursor = 0.0;

  for (size_t i = 0; i < raw_clips.size(); ++i) {
    const json& raw = raw_clips[i];
    // Position-based until the index itself has been checked.
    const auto position = static_cast<int32_t>(i + 1);

    if (!raw.is_object() || !raw.contains("index") || !raw["index"].is_number()) {
      return ValidationResult::Failure(
          InvariantRule::kClipShape, position, "clip must be an object with a numeric 'index'");
    }

    Clip clip;
    const double raw_index = raw["index"].get<double>();
    clip.index = (raw_index >= 1.0 && raw_index <= 2147483647.0 &&
                  std::floor(raw_index) == raw_index)
                     ? static_cast<int32_t>(raw_index) : 0;

    auto prompt = OptionalString(raw, "image_prompt");
    if (!prompt || IsBlank(*prompt)) {
      return ValidationResult::Failure(
          InvariantRule::kClipShape, position, "image_prompt must be non-empty");
    }
    clip.image_prompt = *prompt;

    const bool has_start = raw.contains("start_sec") && raw["start_sec"].is_number();
    const bool has_end = raw.contains("end_sec") && raw["end_sec"].is_number();

    if (version == PlanVersion::kV1) {
      if (!has_start || !has_end) {
        return ValidationResult::Failure(
            InvariantRule::kClipShape, position, "v1 clip requires start_sec and end_sec");
      }
      auto dialogue = OptionalString(raw, "dialogue");
      if (!dialogue) {
        return ValidationResult::Failure(
            InvariantRule::kClipShape, position, "v1 clip requires dialogue");
      }
      clip.dialogue = *dialogue;
      if (raw.contains("verse_refs") && raw["verse_refs"].is_array()) {
        for (const auto& ref : raw["verse_refs"]) {
          if (ref.is_string()) clip.verse_refs.push_back(ref.get<std::string>());
        }
      }
      clip.mode = ClipMode::kDialogue;
    } else {
      if (has_start != has_end) {
        return ValidationResult::Failure(
            InvariantRule::kClipShape, position,
            "start_sec and end_sec must be given together");
      }
      auto mode_name = OptionalString(raw, "mode");
      auto mode = mode_name ? ClipModeFromString(*mode_name) : std::nullopt;
      if (!mode) {
        return ValidationResult::Failure(
            InvariantRule::kClipShape, position,
            "v2 clip requires mode (dialogue, verse or both)");
      }
      clip.mode = *mode;
      clip.dialogue_text = OptionalString(raw, "dialogue_text");
      if (raw.contains("verse") && raw["verse"].is_object()) {
        Verse verse;
        verse.ref = OptionalString(raw["verse"], "ref").value_or("");
        verse.text = OptionalString(raw["verse"], "text").value_or("");
        clip.verse = verse;
      }
    }

    clip.subtitle = OptionalString(raw, "subtitle");

    if (has_start) {
      clip.start_sec = raw["start_sec"].get<double>();
      clip.end_sec = raw["end_sec"].get<double>();
    } else {
      // Derived: starts where the previous clip ended.
      clip.start_sec = cursor;
      clip.end_sec = cursor + config_.v2_default_clip_sec;
    }
    cursor = clip.end_sec;

    clips.push_back(std::move(clip));
  }

  return ValidationResult::Success({});
}

InvariantValidator::ValidationResult InvariantValidator::ValidateIndexSequence(
    const std::vector<Clip>& clips) const {
  for (size_t i = 0; i < clips.size(); ++i) {
    const auto expected = static_cast<int32_t>(i + 1);
    if (clips[i].index != expected) {
      std::ostringstream detail;
      detail << "clips[" << i << "].index must be " << expected
             << " (found " << clips[i].index << ")";
      return ValidationResult::Failure(
          InvariantRule::kIndexSequence, expected, detail.str());
    }
  }
  return ValidationResult::Success({});
}

// Adjacency allowed; overlap forbidden.
InvariantValidator::ValidationResult InvariantValidator::ValidateTiming(
    const std::vector<Clip>& clips) const {
  double prev_end = 0.0;
  for (size_t i = 0; i < clips.size(); ++i) {
    const Clip& clip = clips[i];
    if (!(clip.end_sec > clip.start_sec)) {
      std::ostringstream detail;
      detail << "end_sec (" << clip.end_sec << ") must be > start_sec ("
             << clip.start_sec << ")";
      return ValidationResult::Failure(
          InvariantRule::kTimingOrder, clip.index, detail.str());
    }
    if (i > 0 && clip.start_sec < prev_end) {
      std::ostringstream detail;
      detail << "start_sec (" << clip.start_sec
             << ") must be >= previous end_sec (" << prev_end << ")";
      return ValidationResult::Failure(
          InvariantRule::kTimingOverlap, clip.index, detail.str());
    }
    prev_end = clip.end_sec;
  }
  return ValidationResult::Success({});
}

InvariantValidator::ValidationResult InvariantValidator::ValidateFixedDuration(
    const std::vector<Clip>& clips) const {
  for (const auto& clip : clips) {
    const double duration = clip.duration_sec();
    if (std::fabs(duration - config_.fixed_clip_sec) > config_.duration_tolerance_sec) {
      std::ostringstream detail;
      detail << "clip must be " << config_.fixed_clip_sec
             << " seconds long (got " << duration << ")";
      return ValidationResult::Failure(
          InvariantRule::kFixedDuration, clip.index, detail.str());
    }
  }
  return ValidationResult::Success({});
}

InvariantValidator::ValidationResult InvariantValidator::ValidateModeFields(
    const std::vector<Clip>& clips,
    PlanVersion version) const {
  for (const auto& clip : clips) {
    if (version == PlanVersion::kV1) {
      if (IsBlank(clip.dialogue)) {
        return ValidationResult::Failure(
            InvariantRule::kModeFields, clip.index, "v1 clip requires non-empty dialogue");
      }
      continue;
    }

    const bool has_dialogue = clip.dialogue_text && !IsBlank(*clip.dialogue_text);
    const bool has_verse = clip.verse && !IsBlank(clip.verse->text);

    switch (clip.mode) {
      case ClipMode::kDialogue:
        if (!has_dialogue) {
          return ValidationResult::Failure(
              InvariantRule::kModeFields, clip.index, "mode=dialogue requires dialogue_text");
        }
        break;
      case ClipMode::kVerse:
        if (!has_verse) {
          return ValidationResult::Failure(
              InvariantRule::kModeFields, clip.index, "mode=verse requires verse");
        }
        break;
      case ClipMode::kBoth:
        if (!has_verse || !has_dialogue) {
          return ValidationResult::Failure(
              InvariantRule::kModeFields, clip.index,
              "mode=both requires verse and dialogue_text");
        }
        break;
    }
  }
  return ValidationResult::Success({});
}

void InvariantValidator::WarnShortSpeech(const Plan& plan) const {
  for (const auto& clip : plan.clips) {
    if (clip.spoken_text.size() < config_.min_speech_chars) {
      std::ostringstream msg;
      msg << "[InvariantValidator] WARNING: clip " << clip.index
          << " speech is short (" << clip.spoken_text.size()
          << " chars < " << config_.min_speech_chars << "), continuing";
      util::Logger::Warn(msg.str());
    }
  }
}

}  // namespace reelplan::plan
