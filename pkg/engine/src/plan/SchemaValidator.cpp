// Repository: ReelPlan
// Component: Schema Validator Implementation
// Copyright (c) 2026 ReelPlan

#include "reelplan/plan/SchemaValidator.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "reelplan/util/Logger.hpp"

namespace reelplan::plan {

using nlohmann::json;
namespace json_schema = nlohmann::json_schema;

namespace {

constexpr const char* kRootPath = "(root)";
constexpr size_t kMaxValueEcho = 60;

// "/clips/0/index" -> "clips/0/index"; the document root -> "(root)".
std::string DisplayPath(const json::json_pointer& ptr) {
  std::string path = ptr.to_string();
  if (!path.empty() && path.front() == '/') path.erase(0, 1);
  return path.empty() ? kRootPath : path;
}

// Short rendering of an offending value for messages.
std::string Echo(const json& value) {
  std::string text = value.dump();
  if (text.size() > kMaxValueEcho) {
    text = text.substr(0, kMaxValueEcho) + "...";
  }
  return text;
}

// Records every error the validator reports instead of stopping at the first.
class IssueCollector : public json_schema::basic_error_handler {
 public:
  void error(const json::json_pointer& ptr, const json& instance,
             const std::string& message) override {
    json_schema::basic_error_handler::error(ptr, instance, message);
    std::string text = message;
    if (!instance.is_structured()) {
      text += " (got " + Echo(instance) + ")";
    }
    issues.push_back({DisplayPath(ptr), std::move(text)});
  }

  std::vector<SchemaIssue> issues;
};

// Formats the library cannot check (uri, uri-reference, ...) are annotations
// only in draft-07. Known formats still fail on bad values.
void CheckFormat(const std::string& format, const std::string& value) {
  try {
    json_schema::default_string_format_check(format, value);
  } catch (const std::invalid_argument&) {
    throw;
  } catch (const std::logic_error&) {
    util::Logger::Debug("[SchemaValidator] Format not asserted: " + format);
  }
}

const json_schema::json_validator& MetaSchemaValidator() {
  static const json_schema::json_validator meta(
      json_schema::draft7_schema_builtin, nullptr, CheckFormat);
  return meta;
}

PlanFailure LoadFailure(std::string detail) {
  PlanFailure f;
  f.error = PlanError::kSchemaLoadError;
  f.detail = std::move(detail);
  return f;
}

}  // namespace

// =============================================================================
// Model Output Parsing
// =============================================================================

ParseResult ParseModelOutput(const std::string& raw_text) {
  const auto first = raw_text.find_first_not_of(" \t\r\n\f\v");
  if (first == std::string::npos) {
    PlanFailure f;
    f.error = PlanError::kMalformedOutput;
    f.detail = "model output is empty";
    return ParseResult::Failure(std::move(f));
  }
  const auto last = raw_text.find_last_not_of(" \t\r\n\f\v");
  const std::string trimmed = raw_text.substr(first, last - first + 1);

  try {
    return ParseResult::Success(json::parse(trimmed));
  } catch (const json::parse_error& e) {
    PlanFailure f;
    f.error = PlanError::kMalformedOutput;
    std::ostringstream detail;
    detail << "invalid JSON at byte " << e.byte << ": " << e.what();
    f.detail = detail.str();
    return ParseResult::Failure(std::move(f));
  }
}

// =============================================================================
// Schema Loading
// =============================================================================

SchemaValidator::SchemaValidator(
    std::shared_ptr<const json_schema::json_validator> validator)
    : validator_(std::move(validator)) {}

SchemaLoadResult SchemaValidator::Load(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    PlanFailure f;
    f.error = PlanError::kSchemaLoadError;
    f.detail = "cannot open schema: " + path;
    return {false, std::move(f), std::nullopt};
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  auto result = FromJson(buffer.str());
  if (result.valid) {
    util::Logger::Debug("[SchemaValidator] Loaded schema: " + path);
  } else {
    result.failure.detail = path + ": " + result.failure.detail;
  }
  return result;
}

SchemaLoadResult SchemaValidator::FromJson(const std::string& schema_text) {
  json root;
  try {
    root = json::parse(schema_text);
  } catch (const json::parse_error& e) {
    return {false, LoadFailure(std::string("schema is not valid JSON: ") + e.what()),
            std::nullopt};
  }
  if (!root.is_object()) {
    return {false, LoadFailure("schema document must be an object"), std::nullopt};
  }

  IssueCollector meta_issues;
  MetaSchemaValidator().validate(root, meta_issues);
  if (meta_issues) {
    const SchemaIssue& first = meta_issues.issues.front();
    return {false, LoadFailure("malformed schema at " + first.path + ": " + first.message),
            std::nullopt};
  }

  auto validator = std::make_shared<json_schema::json_validator>(
      nullptr, CheckFormat);
  try {
    validator->set_root_schema(root);
  } catch (const std::exception& e) {
    return {false, LoadFailure(std::string("schema rejected: ") + e.what()), std::nullopt};
  }

  return {true, {}, SchemaValidator(std::move(validator))};
}

// =============================================================================
// Validation
// =============================================================================

SchemaValidator::ValidationResult SchemaValidator::Validate(
    const json& document) const {
  IssueCollector collector;
  validator_->validate(document, collector);

  std::vector<SchemaIssue> issues = std::move(collector.issues);
  if (issues.empty()) {
    return ValidationResult::Success();
  }

  std::stable_sort(issues.begin(), issues.end(),
                   [](const SchemaIssue& a, const SchemaIssue& b) {
                     if (a.path == kRootPath) return b.path != kRootPath;
                     if (b.path == kRootPath) return false;
                     return a.path < b.path;
                   });

  util::Logger::Debug("[SchemaValidator] " + std::to_string(issues.size()) +
                      " issue(s), first: " + issues.front().path + ": " +
                      issues.front().message);
  return ValidationResult::Failure(std::move(issues));
}

}  // namespace reelplan::plan
