/**
 * @file schema_validator.h
 * @brief Per-collection record validation
 */

#pragma once

#include <nlohmann/json-schema.hpp>

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "store/collection_store.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace talentvault::recovery {

using utils::Error;
using utils::Expected;

/**
 * @brief Result of validating one record
 */
struct ValidationOutcome {
  bool success = true;
  std::vector<std::string> errors;
};

/**
 * @brief Record validator consulted by validated restores
 */
class SchemaValidator {
 public:
  virtual ~SchemaValidator() = default;

  SchemaValidator() = default;
  SchemaValidator(const SchemaValidator&) = delete;
  SchemaValidator& operator=(const SchemaValidator&) = delete;
  SchemaValidator(SchemaValidator&&) = delete;
  SchemaValidator& operator=(SchemaValidator&&) = delete;

  virtual ValidationOutcome Validate(const std::string& collection, const store::Record& record) const = 0;
};

/**
 * @brief JSON Schema (draft 7) validator, one schema per collection
 *
 * Collections without a registered schema accept every record.
 * Thread-safe.
 */
class JsonSchemaValidator : public SchemaValidator {
 public:
  JsonSchemaValidator() = default;
  ~JsonSchemaValidator() override = default;

  JsonSchemaValidator(const JsonSchemaValidator&) = delete;
  JsonSchemaValidator& operator=(const JsonSchemaValidator&) = delete;
  JsonSchemaValidator(JsonSchemaValidator&&) = delete;
  JsonSchemaValidator& operator=(JsonSchemaValidator&&) = delete;

  /**
   * @brief Register (or replace) the schema of a collection
   * @return kConfigSchemaError if the schema itself is invalid
   */
  Expected<void, Error> RegisterSchema(const std::string& collection, const nlohmann::json& schema);

  /**
   * @brief Load a JSON schema file and register it
   */
  Expected<void, Error> LoadSchemaFile(const std::string& collection, const std::string& path);

  [[nodiscard]] bool HasSchema(const std::string& collection) const;

  ValidationOutcome Validate(const std::string& collection, const store::Record& record) const override;

 private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, std::unique_ptr<nlohmann::json_schema::json_validator>> validators_;
};

}  // namespace talentvault::recovery
