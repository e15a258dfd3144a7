#include <gtest/gtest.h>

#include "json_schema.hpp"

#include <cmath>
#include <limits>

using namespace deskbridge;

TEST(JsonSchemaTest, ValidSchemaIsByteEquivalentAfterSanitation) {
  const std::string text =
      R"({"type":"object","properties":{"path":{"type":"string","minLength":1},"depth":{"type":"integer","minimum":0,"maximum":8.5}},"required":["path"],"additionalProperties":false})";
  const auto schema = nlohmann::json::parse(text);
  std::string err;
  auto sanitized = SanitizeParameterSchema(schema, &err);
  ASSERT_TRUE(sanitized.has_value()) << err;
  EXPECT_EQ(sanitized->dump(), schema.dump());
}

TEST(JsonSchemaTest, NullSchemaBecomesEmptyObjectSchema) {
  std::string err;
  auto sanitized = SanitizeParameterSchema(nullptr, &err);
  ASSERT_TRUE(sanitized.has_value());
  EXPECT_EQ((*sanitized)["type"], "object");
  EXPECT_TRUE((*sanitized)["properties"].empty());
}

TEST(JsonSchemaTest, RejectsSchemasThatDoNotSurviveRoundTrip) {
  nlohmann::json schema = {{"type", "object"}, {"properties", {{"x", {{"maximum", std::nan("")}}}}}};
  std::string err;
  EXPECT_FALSE(SanitizeParameterSchema(schema, &err).has_value());
  EXPECT_FALSE(err.empty());

  nlohmann::json bad_utf8 = {{"type", "object"}, {"description", std::string("\xff\xfe")}};
  err.clear();
  EXPECT_FALSE(SanitizeParameterSchema(bad_utf8, &err).has_value());
}

TEST(JsonSchemaTest, RejectsNonObjectSchemas) {
  std::string err;
  EXPECT_FALSE(SanitizeParameterSchema(nlohmann::json::array(), &err).has_value());
  EXPECT_FALSE(SanitizeParameterSchema({{"type", "string"}}, &err).has_value());
  EXPECT_FALSE(SanitizeParameterSchema({{"type", "object"}, {"properties", nlohmann::json::array()}}, &err).has_value());
  EXPECT_FALSE(SanitizeParameterSchema({{"type", "object"}, {"required", "path"}}, &err).has_value());
  EXPECT_FALSE(
      SanitizeParameterSchema({{"type", "object"}, {"required", nlohmann::json::array({1})}}, &err).has_value());
}

TEST(JsonSchemaTest, ValidatesArguments) {
  const auto schema = nlohmann::json::parse(R"({
    "type": "object",
    "properties": {
      "path": {"type": "string", "minLength": 1},
      "mode": {"type": "string", "enum": ["read", "write"]},
      "depth": {"type": "integer", "minimum": 0, "maximum": 5},
      "tags": {"type": "array", "items": {"type": "string"}}
    },
    "required": ["path"],
    "additionalProperties": false
  })");

  std::vector<std::string> errors;
  EXPECT_TRUE(ValidateAgainstSchema(schema, {{"path", "/tmp"}, {"depth", 2}, {"tags", {"a", "b"}}}, &errors));
  EXPECT_TRUE(errors.empty());

  errors.clear();
  EXPECT_FALSE(ValidateAgainstSchema(
      schema, {{"path", ""}, {"mode", "append"}, {"depth", 9}, {"tags", {"a", 3}}, {"extra", true}}, &errors));
  ASSERT_EQ(errors.size(), 5u);
  auto has = [&](const std::string& prefix) {
    for (const auto& e : errors) {
      if (e.rfind(prefix, 0) == 0) return true;
    }
    return false;
  };
  EXPECT_TRUE(has("/path:"));
  EXPECT_TRUE(has("/mode:"));
  EXPECT_TRUE(has("/depth:"));
  EXPECT_TRUE(has("/tags/1:"));
  EXPECT_TRUE(has("/extra:"));
}

TEST(JsonSchemaTest, MissingRequiredAndWrongType) {
  const nlohmann::json schema = {
      {"type", "object"}, {"properties", {{"model", {{"type", "string"}}}}}, {"required", nlohmann::json::array({"model"})}};
  std::vector<std::string> errors;
  EXPECT_FALSE(ValidateAgainstSchema(schema, nlohmann::json::object(), &errors));
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_NE(errors[0].find("missing required property \"model\""), std::string::npos);

  errors.clear();
  EXPECT_FALSE(ValidateAgainstSchema(schema, {{"model", 4}}, &errors));
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0], "/model: expected string, got integer");
}

TEST(JsonSchemaTest, IntegerAcceptsOnlyWholeValuesInRange) {
  const nlohmann::json schema = {{"type", "object"}, {"properties", {{"n", {{"type", "integer"}}}}}};
  std::vector<std::string> errors;
  EXPECT_TRUE(ValidateAgainstSchema(schema, {{"n", 4.0}}, &errors));
  EXPECT_TRUE(ValidateAgainstSchema(schema, {{"n", -9.0e15}}, &errors));
  EXPECT_TRUE(errors.empty());

  for (double d : {1e300, -1e300, 9.3e18, 2.5, std::numeric_limits<double>::infinity(), std::nan("")}) {
    errors.clear();
    EXPECT_FALSE(ValidateAgainstSchema(schema, {{"n", d}}, &errors)) << d;
    ASSERT_EQ(errors.size(), 1u) << d;
    EXPECT_EQ(errors[0], "/n: expected integer, got number");
  }

  errors.clear();
  EXPECT_TRUE(ValidateAgainstSchema(schema, nlohmann::json::parse(R"({"n": 1e18})"), &errors));
  EXPECT_FALSE(ValidateAgainstSchema(schema, nlohmann::json::parse(R"({"n": 1e300})"), &errors));
}

TEST(JsonSchemaTest, CanonicalRoundTripFailsOnInvalidUtf8) {
  std::string err;
  EXPECT_FALSE(CanonicalRoundTrip(nlohmann::json(std::string("ok\xc3")), &err).has_value());
  auto ok = CanonicalRoundTrip({{"a", 1}}, &err);
  ASSERT_TRUE(ok.has_value());
  EXPECT_EQ((*ok)["a"], 1);
}
