// Repository: ReelPlan
// Component: Schema Validator Contract Tests
// Purpose: Strict parsing of model output and structural validation
//          against the plan schema.
// Copyright (c) 2026 ReelPlan

#include <gtest/gtest.h>

#include <string>

#include "reelplan/plan/SchemaValidator.hpp"
#include "fixtures/PlanFixtures.h"

namespace reelplan::plan {
namespace {

using nlohmann::json;
using tests::fixtures::MakeV1Plan;
using tests::fixtures::MakeV2DialogueClip;
using tests::fixtures::MakeV2Plan;
using tests::fixtures::ProjectSchema;

// =============================================================================
// Model output parsing
// =============================================================================

TEST(ModelOutputParsing, EmptyOutputIsMalformed) {
  auto result = ParseModelOutput("   \n\t ");
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.failure.error, PlanError::kMalformedOutput);
  EXPECT_NE(result.failure.detail.find("empty"), std::string::npos);
}

TEST(ModelOutputParsing, TrailingProseIsMalformed) {
  auto result = ParseModelOutput(R"({"title": "x", "clips": []} Hope this helps!)");
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.failure.error, PlanError::kMalformedOutput);
  EXPECT_NE(result.failure.detail.find("byte"), std::string::npos)
      << result.failure.detail;
}

TEST(ModelOutputParsing, TruncatedOutputIsMalformed) {
  auto result = ParseModelOutput(R"({"title": "x", "clips": [ {"index": 1)");
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.failure.error, PlanError::kMalformedOutput);
}

TEST(ModelOutputParsing, SurroundingWhitespaceIsIgnored) {
  auto result = ParseModelOutput("\n\n  {\"title\": \"x\", \"clips\": []}\n  ");
  ASSERT_TRUE(result.valid) << result.failure.Describe();
  EXPECT_EQ(result.document["title"], "x");
}

// =============================================================================
// Schema loading
// =============================================================================

TEST(SchemaLoading, ProjectSchemaLoads) {
  auto loaded = SchemaValidator::Load(tests::fixtures::SchemaPath());
  ASSERT_TRUE(loaded.valid) << loaded.failure.Describe();
  ASSERT_TRUE(loaded.validator.has_value());
}

TEST(SchemaLoading, MissingFileIsLoadError) {
  auto loaded = SchemaValidator::Load("/nonexistent/reelplan/plan_schema.json");
  EXPECT_FALSE(loaded.valid);
  EXPECT_EQ(loaded.failure.error, PlanError::kSchemaLoadError);
  EXPECT_FALSE(loaded.validator.has_value());
}

TEST(SchemaLoading, NonJsonSchemaIsLoadError) {
  auto loaded = SchemaValidator::FromJson("type: object");
  EXPECT_FALSE(loaded.valid);
  EXPECT_EQ(loaded.failure.error, PlanError::kSchemaLoadError);
}

TEST(SchemaLoading, MalformedKeywordIsLoadError) {
  auto loaded = SchemaValidator::FromJson(
      R"({"type": "object", "properties": {"n": {"type": "decimal"}}})");
  EXPECT_FALSE(loaded.valid);
  EXPECT_EQ(loaded.failure.error, PlanError::kSchemaLoadError);
  EXPECT_NE(loaded.failure.detail.find("decimal"), std::string::npos);

  loaded = SchemaValidator::FromJson(R"({"type": "array", "minItems": -1})");
  EXPECT_FALSE(loaded.valid);
  EXPECT_NE(loaded.failure.detail.find("minItems"), std::string::npos)
      << loaded.failure.detail;
}

TEST(SchemaLoading, NonObjectSchemaIsLoadError) {
  auto loaded = SchemaValidator::FromJson("true");
  EXPECT_FALSE(loaded.valid);
  EXPECT_EQ(loaded.failure.error, PlanError::kSchemaLoadError);
}

TEST(SchemaLoading, UnresolvableReferenceIsLoadError) {
  auto loaded = SchemaValidator::FromJson(
      R"({"type": "object", "properties": {"n": {"$ref": "#/definitions/missing"}}})");
  EXPECT_FALSE(loaded.valid);
  EXPECT_EQ(loaded.failure.error, PlanError::kSchemaLoadError);
}

TEST(SchemaValidation, OffendingScalarEchoedInMessage) {
  json doc = MakeV1Plan();
  doc["clips"][0]["start_sec"] = -1.0;

  auto result = ProjectSchema().Validate(doc);
  ASSERT_FALSE(result.valid);
  EXPECT_NE(result.failure.issues[0].message.find("-1"), std::string::npos)
      << result.failure.issues[0].message;
}

// =============================================================================
// Structural validation
// =============================================================================

TEST(SchemaValidation, WellFormedV1PlanPasses) {
  auto result = ProjectSchema().Validate(MakeV1Plan());
  EXPECT_TRUE(result.valid) << result.failure.Describe();
}

TEST(SchemaValidation, WellFormedV2PlanWithoutTimingPasses) {
  auto result = ProjectSchema().Validate(
      MakeV2Plan({MakeV2DialogueClip(1), MakeV2DialogueClip(2)}));
  EXPECT_TRUE(result.valid) << result.failure.Describe();
}

TEST(SchemaValidation, MissingTitleReportedAtRoot) {
  json doc = MakeV1Plan();
  doc.erase("title");

  auto result = ProjectSchema().Validate(doc);
  ASSERT_FALSE(result.valid);
  EXPECT_EQ(result.failure.error, PlanError::kSchemaViolation);
  ASSERT_EQ(result.failure.issues.size(), 1u);
  EXPECT_EQ(result.failure.issues[0].path, "(root)");
  EXPECT_NE(result.failure.issues[0].message.find("'title'"), std::string::npos);
}

TEST(SchemaValidation, AllIssuesCollectedAndSortedByPath) {
  json doc = MakeV1Plan();
  doc.erase("title");
  doc["clips"][1]["camera"] = "dolly";
  doc["clips"][0]["index"] = "one";

  auto result = ProjectSchema().Validate(doc);
  ASSERT_FALSE(result.valid);
  const auto& issues = result.failure.issues;
  ASSERT_EQ(issues.size(), 3u);
  EXPECT_EQ(issues[0].path, "(root)");
  EXPECT_EQ(issues[1].path, "clips/0/index");
  EXPECT_EQ(issues[2].path, "clips/1");
  EXPECT_NE(issues[2].message.find("'camera'"), std::string::npos);
  EXPECT_EQ(result.failure.detail, "3 schema issue(s)");
}

TEST(SchemaValidation, FractionalIndexRejected) {
  json doc = MakeV1Plan();
  doc["clips"][0]["index"] = 1.5;

  auto result = ProjectSchema().Validate(doc);
  ASSERT_FALSE(result.valid);
  ASSERT_EQ(result.failure.issues.size(), 1u);
  EXPECT_EQ(result.failure.issues[0].path, "clips/0/index");
}

TEST(SchemaValidation, UnknownModeRejected) {
  json clip = MakeV2DialogueClip(1);
  clip["mode"] = "monologue";

  auto result = ProjectSchema().Validate(MakeV2Plan({clip}));
  ASSERT_FALSE(result.valid);
  ASSERT_EQ(result.failure.issues.size(), 1u);
  EXPECT_EQ(result.failure.issues[0].path, "clips/0/mode");
}

TEST(SchemaValidation, NegativeTimingRejected) {
  json doc = MakeV1Plan();
  doc["clips"][0]["start_sec"] = -1.0;

  auto result = ProjectSchema().Validate(doc);
  ASSERT_FALSE(result.valid);
  EXPECT_EQ(result.failure.issues[0].path, "clips/0/start_sec");
}

TEST(SchemaValidation, MinLengthCountsCodePoints) {
  auto loaded = SchemaValidator::FromJson(R"({"type": "string", "minLength": 3})");
  ASSERT_TRUE(loaded.valid);
  const auto& validator = *loaded.validator;

  // Three two-byte characters.
  EXPECT_TRUE(validator.Validate(json("\xC3\xA9\xC3\xA9\xC3\xA9")).valid);
  EXPECT_FALSE(validator.Validate(json("ab")).valid);
}

TEST(SchemaValidation, TypeMismatchStopsDescent) {
  json doc = MakeV1Plan();
  doc["clips"] = "six clips";

  auto result = ProjectSchema().Validate(doc);
  ASSERT_FALSE(result.valid);
  ASSERT_EQ(result.failure.issues.size(), 1u);
  EXPECT_EQ(result.failure.issues[0].path, "clips");
}

}  // namespace
}  // namespace reelplan::plan
