/**
 * @file schema_validator.cpp
 * @brief JSON Schema record validation
 */

#include "recovery/schema_validator.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <mutex>

namespace talentvault::recovery {

using utils::MakeError;
using utils::MakeUnexpected;

namespace {

/**
 * @brief Collects every violation instead of stopping at the first one
 */
class CollectingErrorHandler : public nlohmann::json_schema::basic_error_handler {
 public:
  void error(const nlohmann::json::json_pointer& ptr, const nlohmann::json& instance,
             const std::string& message) override {
    nlohmann::json_schema::basic_error_handler::error(ptr, instance, message);
    std::string location = ptr.to_string();
    errors_.push_back((location.empty() ? std::string("/") : location) + ": " + message);
  }

  std::vector<std::string> TakeErrors() { return std::move(errors_); }

 private:
  std::vector<std::string> errors_;
};

}  // namespace

Expected<void, Error> JsonSchemaValidator::RegisterSchema(const std::string& collection, const nlohmann::json& schema) {
  auto validator = std::make_unique<nlohmann::json_schema::json_validator>();
  try {
    validator->set_root_schema(schema);
  } catch (const std::exception& e) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kConfigSchemaError,
                                    "Invalid JSON schema for collection " + collection, e.what()));
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  validators_[collection] = std::move(validator);
  spdlog::debug("Registered schema for collection {}", collection);
  return {};
}

Expected<void, Error> JsonSchemaValidator::LoadSchemaFile(const std::string& collection, const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kConfigFileNotFound, "Cannot open schema file", path));
  }

  nlohmann::json schema;
  try {
    file >> schema;
  } catch (const nlohmann::json::parse_error& e) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kConfigJsonError, "Schema file is not valid JSON",
                                    path + ": " + e.what()));
  }
  return RegisterSchema(collection, schema);
}

bool JsonSchemaValidator::HasSchema(const std::string& collection) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return validators_.count(collection) > 0;
}

ValidationOutcome JsonSchemaValidator::Validate(const std::string& collection, const store::Record& record) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto iter = validators_.find(collection);
  if (iter == validators_.end()) {
    return {};
  }

  CollectingErrorHandler handler;
  ValidationOutcome outcome;
  try {
    iter->second->validate(record, handler);
    outcome.errors = handler.TakeErrors();
  } catch (const std::exception& e) {
    // e.g. a "format" keyword without a format checker
    outcome.errors = handler.TakeErrors();
    outcome.errors.emplace_back(e.what());
  }
  outcome.success = outcome.errors.empty();
  return outcome;
}

}  // namespace talentvault::recovery
