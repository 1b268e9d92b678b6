/**
 * @file config.h
 * @brief Configuration structures and YAML/JSON loader
 */

#pragma once

#include <map>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace talentvault::config {

// ============================================================================
// Default values
// ============================================================================
namespace defaults {

constexpr const char* kStorePath = "./data/talentvault.store";
constexpr const char* kSchemaVersion = "1.0";
constexpr const char* kKeyEnvVar = "TALENTVAULT_RECOVERY_KEY";
constexpr int kRetain = 0;  // 0 = keep every recovery point
constexpr const char* kAuditUserId = "system";
constexpr const char* kAuditIp = "internal";
constexpr const char* kAuditUserAgent = "system";

}  // namespace defaults

/**
 * @brief Collection store configuration
 */
struct StoreConfig {
  std::string path = defaults::kStorePath;
};

/**
 * @brief Recovery configuration
 *
 * The key is read from key_file when set, otherwise from the environment
 * variable named by key_env.
 */
struct RecoveryConfig {
  std::string schema_version = defaults::kSchemaVersion;
  std::string key_env = defaults::kKeyEnvVar;
  std::string key_file;
  int retain = defaults::kRetain;
};

/**
 * @brief Record validation configuration
 */
struct ValidationConfig {
  std::map<std::string, std::string> schemas;  ///< collection -> JSON Schema file
};

/**
 * @brief Audit attribution for operations run from this process
 */
struct AuditConfig {
  std::string user_id = defaults::kAuditUserId;
  std::string ip = defaults::kAuditIp;
  std::string user_agent = defaults::kAuditUserAgent;
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
  std::string level = "info";
  std::string format = "json";  ///< "json" or "text"
  std::string file;             ///< Log file path (empty = stdout)
};

/**
 * @brief Root configuration
 */
struct Config {
  StoreConfig store;
  RecoveryConfig recovery;
  ValidationConfig validation;
  AuditConfig audit;
  LoggingConfig logging;
};

/**
 * @brief Load configuration from YAML or JSON file
 *
 * Format is detected from the extension (.yaml, .yml, .json). The document
 * is validated against the embedded JSON Schema, or against schema_path
 * when given.
 *
 * @param path Path to configuration file (YAML or JSON)
 * @param schema_path Optional path to a JSON Schema file
 * @return Expected<Config, Error> with configuration or error
 */
utils::Expected<Config, utils::Error> LoadConfig(const std::string& path, const std::string& schema_path = "");

/**
 * @brief Load configuration from YAML file
 */
utils::Expected<Config, utils::Error> LoadConfigYaml(const std::string& path, const std::string& schema_path = "");

/**
 * @brief Load configuration from JSON file
 */
utils::Expected<Config, utils::Error> LoadConfigJson(const std::string& path, const std::string& schema_path = "");

/**
 * @brief Validate JSON configuration against schema
 *
 * @param config_json_str JSON configuration string
 * @param schema_json_str JSON Schema string (empty = embedded schema)
 * @return Expected<void, Error> with success or validation error
 */
utils::Expected<void, utils::Error> ValidateConfigJson(const std::string& config_json_str,
                                                       const std::string& schema_json_str = "");

}  // namespace talentvault::config
