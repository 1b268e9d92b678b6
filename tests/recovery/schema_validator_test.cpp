/**
 * @file schema_validator_test.cpp
 * @brief Unit tests for JSON Schema record validation
 */

#include "recovery/schema_validator.h"

#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace talentvault::recovery;
using talentvault::utils::ErrorCode;
using json = nlohmann::json;

namespace {

json CandidateSchema() {
  return json::parse(R"({
    "$schema": "http://json-schema.org/draft-07/schema#",
    "type": "object",
    "required": ["firstName", "email", "status"],
    "properties": {
      "firstName": {"type": "string", "minLength": 1},
      "email": {"type": "string", "pattern": "^[^@\\s]+@[^@\\s]+$"},
      "experience": {"type": "number", "minimum": 0},
      "status": {"type": "string"}
    }
  })");
}

std::string WriteTempFile(const std::string& content) {
  char temp_buffer[] = "/tmp/talentvault_schema_XXXXXX";  // NOLINT(modernize-avoid-c-arrays)
  int fd = mkstemp(temp_buffer);
  if (fd == -1) {
    throw std::runtime_error("Failed to create temporary file");
  }
  close(fd);

  std::ofstream ofs(temp_buffer);
  ofs << content;
  return temp_buffer;
}

}  // namespace

class JsonSchemaValidatorTest : public ::testing::Test {
 protected:
  void SetUp() override { ASSERT_TRUE(validator_.RegisterSchema("candidates", CandidateSchema())); }

  JsonSchemaValidator validator_;
};

TEST_F(JsonSchemaValidatorTest, ValidRecord) {
  json record = {{"firstName", "Ada"}, {"email", "ada@example.com"}, {"status", "active"}, {"experience", 12}};
  ValidationOutcome outcome = validator_.Validate("candidates", record);
  EXPECT_TRUE(outcome.success);
  EXPECT_TRUE(outcome.errors.empty());
}

TEST_F(JsonSchemaValidatorTest, CollectsEveryViolation) {
  json record = {{"firstName", ""}, {"email", "not-an-email"}, {"experience", -1}};
  ValidationOutcome outcome = validator_.Validate("candidates", record);
  EXPECT_FALSE(outcome.success);
  // minLength, pattern, minimum and the missing "status"
  EXPECT_GE(outcome.errors.size(), 4U);

  bool mentions_email = false;
  for (const auto& error : outcome.errors) {
    if (error.find("/email") != std::string::npos) {
      mentions_email = true;
    }
  }
  EXPECT_TRUE(mentions_email);
}

TEST_F(JsonSchemaValidatorTest, CollectionWithoutSchemaAcceptsAnything) {
  EXPECT_FALSE(validator_.HasSchema("jobs"));
  ValidationOutcome outcome = validator_.Validate("jobs", json{{"anything", nullptr}});
  EXPECT_TRUE(outcome.success);
}

TEST_F(JsonSchemaValidatorTest, RegisterReplacesSchema) {
  json record = {{"firstName", "Ada"}};
  EXPECT_FALSE(validator_.Validate("candidates", record).success);

  ASSERT_TRUE(validator_.RegisterSchema("candidates", json{{"type", "object"}}));
  EXPECT_TRUE(validator_.Validate("candidates", record).success);
}

TEST_F(JsonSchemaValidatorTest, InvalidSchemaRejected) {
  json broken = {{"$ref", "#/definitions/missing"}};
  auto result = validator_.RegisterSchema("jobs", broken);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kConfigSchemaError);
  EXPECT_FALSE(validator_.HasSchema("jobs"));
}

TEST_F(JsonSchemaValidatorTest, LoadSchemaFile) {
  std::string path = WriteTempFile(R"({"type": "object", "required": ["title"]})");
  auto loaded = validator_.LoadSchemaFile("jobs", path);
  std::filesystem::remove(path);
  ASSERT_TRUE(loaded) << loaded.error().to_string();

  EXPECT_TRUE(validator_.HasSchema("jobs"));
  EXPECT_TRUE(validator_.Validate("jobs", json{{"title", "Engineer"}}).success);
  EXPECT_FALSE(validator_.Validate("jobs", json{{"openings", 2}}).success);
}

TEST_F(JsonSchemaValidatorTest, LoadSchemaFileErrors) {
  auto missing = validator_.LoadSchemaFile("jobs", "/nonexistent/jobs.json");
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code(), ErrorCode::kConfigFileNotFound);

  std::string path = WriteTempFile("{\"type\": ");
  auto malformed = validator_.LoadSchemaFile("jobs", path);
  std::filesystem::remove(path);
  ASSERT_FALSE(malformed);
  EXPECT_EQ(malformed.error().code(), ErrorCode::kConfigJsonError);
}
