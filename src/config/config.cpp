/**
 * @file config.cpp
 * @brief Configuration parser implementation with JSON Schema validation
 */

#include "config/config.h"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>
#include <sstream>

#include "config_schema_embedded.h"  // Generated from support/config_schema.json

namespace talentvault::config {

namespace {

using json = nlohmann::json;
using nlohmann::json_schema::json_validator;
using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

/**
 * @brief Convert YAML node to JSON object recursively
 *
 * Quoted scalars stay strings ("1.0" is a version, not a number); plain
 * scalars are parsed as JSON literals when possible.
 */
json YamlToJson(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      return {};
    case YAML::NodeType::Scalar: {
      if (node.Tag() == "!") {
        return node.as<std::string>();
      }
      try {
        return json::parse(node.as<std::string>());
      } catch (const json::parse_error&) {
        return node.as<std::string>();
      }
    }
    case YAML::NodeType::Sequence: {
      json result = json::array();
      for (const auto& item : node) {
        result.push_back(YamlToJson(item));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      json result = json::object();
      for (const auto& key_value : node) {
        result[key_value.first.as<std::string>()] = YamlToJson(key_value.second);
      }
      return result;
    }
    default:
      return {};
  }
}

/**
 * @brief Build Config from a schema-validated JSON document
 */
Config ParseConfigFromJson(const json& root) {
  Config config;

  if (root.contains("store")) {
    const auto& store = root["store"];
    if (store.contains("path")) {
      config.store.path = store["path"].get<std::string>();
    }
  }

  if (root.contains("recovery")) {
    const auto& recovery = root["recovery"];
    if (recovery.contains("schema_version")) {
      config.recovery.schema_version = recovery["schema_version"].get<std::string>();
    }
    if (recovery.contains("key_env")) {
      config.recovery.key_env = recovery["key_env"].get<std::string>();
    }
    if (recovery.contains("key_file")) {
      config.recovery.key_file = recovery["key_file"].get<std::string>();
    }
    if (recovery.contains("retain")) {
      config.recovery.retain = recovery["retain"].get<int>();
    }
  }

  if (root.contains("validation") && root["validation"].contains("schemas")) {
    for (const auto& item : root["validation"]["schemas"].items()) {
      config.validation.schemas[item.key()] = item.value().get<std::string>();
    }
  }

  if (root.contains("audit")) {
    const auto& audit = root["audit"];
    if (audit.contains("user_id")) {
      config.audit.user_id = audit["user_id"].get<std::string>();
    }
    if (audit.contains("ip")) {
      config.audit.ip = audit["ip"].get<std::string>();
    }
    if (audit.contains("user_agent")) {
      config.audit.user_agent = audit["user_agent"].get<std::string>();
    }
  }

  if (root.contains("logging")) {
    const auto& logging = root["logging"];
    if (logging.contains("level")) {
      config.logging.level = logging["level"].get<std::string>();
    }
    if (logging.contains("format")) {
      config.logging.format = logging["format"].get<std::string>();
    }
    if (logging.contains("file")) {
      config.logging.file = logging["file"].get<std::string>();
    }
  }

  return config;
}

/**
 * @brief Read file contents as string
 */
utils::Expected<std::string, utils::Error> ReadFileToString(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigFileNotFound,
                                    "Failed to open configuration file: " + path +
                                        " (check that the file exists and is readable; example: examples/config.yaml)",
                                    path));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  std::string content = buffer.str();
  if (content.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigParseError, "Configuration file is empty: " + path, path));
  }
  return content;
}

// NOLINTNEXTLINE(performance-enum-size)
enum class FileFormat { kYaml, kJson, kUnknown };

constexpr size_t kJsonExtLength = 5;  // ".json"
constexpr size_t kYamlExtLength = 5;  // ".yaml"
constexpr size_t kYmlExtLength = 4;   // ".yml"

FileFormat DetectFileFormat(const std::string& path) {
  if (path.size() >= kJsonExtLength && path.substr(path.size() - kJsonExtLength) == ".json") {
    return FileFormat::kJson;
  }
  if (path.size() >= kYamlExtLength && path.substr(path.size() - kYamlExtLength) == ".yaml") {
    return FileFormat::kYaml;
  }
  if (path.size() >= kYmlExtLength && path.substr(path.size() - kYmlExtLength) == ".yml") {
    return FileFormat::kYaml;
  }
  return FileFormat::kUnknown;
}

/**
 * @brief Validate, then convert to Config
 */
utils::Expected<Config, utils::Error> BuildConfig(const json& root, const std::string& path,
                                                  const std::string& schema_path) {
  std::string schema_str;
  if (!schema_path.empty()) {
    auto schema_content = ReadFileToString(schema_path);
    if (!schema_content) {
      return MakeUnexpected(schema_content.error());
    }
    schema_str = std::move(*schema_content);
  }

  auto validated = ValidateConfigJson(root.dump(), schema_str);
  if (!validated) {
    return MakeUnexpected(
        MakeError(validated.error().code(), validated.error().message(), path + ": " + validated.error().context()));
  }

  Config config;
  try {
    config = ParseConfigFromJson(root);
  } catch (const json::exception& e) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigInvalidValue, "Invalid configuration value", e.what()));
  }

  spdlog::info("Configuration loaded successfully from {}", path);
  spdlog::info("  Store: {}", config.store.path);
  spdlog::info("  Validation schemas: {}", config.validation.schemas.size());
  return config;
}

}  // namespace

utils::Expected<void, utils::Error> ValidateConfigJson(const std::string& config_json_str,
                                                       const std::string& schema_json_str) {
  json config_json;
  json schema_json;
  try {
    config_json = json::parse(config_json_str);
    schema_json = json::parse(schema_json_str.empty() ? std::string(kConfigSchemaJson) : schema_json_str);
  } catch (const json::parse_error& e) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigJsonError, "JSON parse error", e.what()));
  }

  json_validator validator;
  try {
    validator.set_root_schema(schema_json);
  } catch (const std::exception& e) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigSchemaError, "Invalid configuration schema", e.what()));
  }

  try {
    validator.validate(config_json);
  } catch (const std::exception& e) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigValidationError,
                                    std::string("Configuration validation failed: ") + e.what(),
                                    "check required sections, value types and enum values"));
  }

  spdlog::debug("Configuration validation passed");
  return {};
}

utils::Expected<Config, utils::Error> LoadConfigJson(const std::string& path, const std::string& schema_path) {
  auto content = ReadFileToString(path);
  if (!content) {
    return MakeUnexpected(content.error());
  }

  json root;
  try {
    root = json::parse(*content);
  } catch (const json::parse_error& e) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigJsonError,
                                    "JSON parse error in configuration file: " + path + " at byte " +
                                        std::to_string(e.byte),
                                    e.what()));
  }
  return BuildConfig(root, path, schema_path);
}

utils::Expected<Config, utils::Error> LoadConfigYaml(const std::string& path, const std::string& schema_path) {
  auto content = ReadFileToString(path);
  if (!content) {
    return MakeUnexpected(content.error());
  }

  json root;
  try {
    root = YamlToJson(YAML::Load(*content));
  } catch (const YAML::Exception& e) {
    std::string location;
    if (!e.mark.is_null()) {
      location = " at line " + std::to_string(e.mark.line + 1) + ", column " + std::to_string(e.mark.column + 1);
    }
    return MakeUnexpected(
        MakeError(ErrorCode::kConfigYamlError, "YAML parse error in configuration file: " + path + location, e.what()));
  }
  return BuildConfig(root, path, schema_path);
}

utils::Expected<Config, utils::Error> LoadConfig(const std::string& path, const std::string& schema_path) {
  switch (DetectFileFormat(path)) {
    case FileFormat::kJson:
      return LoadConfigJson(path, schema_path);
    case FileFormat::kYaml:
    case FileFormat::kUnknown:
      // YAML is a superset of JSON, so unknown extensions go through the YAML parser
      return LoadConfigYaml(path, schema_path);
  }
  return LoadConfigYaml(path, schema_path);
}

}  // namespace talentvault::config
