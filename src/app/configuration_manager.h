/**
 * @file configuration_manager.h
 * @brief Configuration management
 */

#ifndef TALENTVAULT_APP_CONFIGURATION_MANAGER_H_
#define TALENTVAULT_APP_CONFIGURATION_MANAGER_H_

#include <memory>
#include <string>

#include "config/config.h"
#include "crypto/key_source.h"
#include "recovery/schema_validator.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace talentvault::app {

using utils::Error;
using utils::Expected;

/**
 * @brief Configuration manager
 *
 * Responsibilities:
 * - Load and validate the configuration file
 * - Apply logging configuration
 * - Resolve the recovery encryption key
 * - Load per-collection record schemas
 *
 * Usage:
 * @code
 * auto config_mgr = ConfigurationManager::Create("config.yaml");
 * if (!config_mgr) {
 *   return MakeUnexpected(config_mgr.error());
 * }
 * (*config_mgr)->ApplyLoggingConfig();
 * @endcode
 */
class ConfigurationManager {
 public:
  /**
   * @brief Create configuration manager
   * @param config_file Configuration file path (YAML or JSON)
   * @param schema_file Optional JSON Schema file path
   * @return Expected with ConfigurationManager or error
   */
  static Expected<std::unique_ptr<ConfigurationManager>, Error> Create(const std::string& config_file,
                                                                       const std::string& schema_file = "");

  ~ConfigurationManager() = default;

  // Non-copyable, non-movable
  ConfigurationManager(const ConfigurationManager&) = delete;
  ConfigurationManager& operator=(const ConfigurationManager&) = delete;
  ConfigurationManager(ConfigurationManager&&) = delete;
  ConfigurationManager& operator=(ConfigurationManager&&) = delete;

  /**
   * @brief Get current configuration
   */
  [[nodiscard]] const config::Config& GetConfig() const { return config_; }

  [[nodiscard]] const std::string& GetConfigFile() const { return config_file_; }

  /**
   * @brief Print configuration summary (for --config-test)
   * @return Exit code (0 = success)
   */
  int PrintConfigTest() const;

  /**
   * @brief Apply logging configuration
   *
   * Opens the log file when one is configured, then sets the level and the
   * structured log format.
   */
  Expected<void, Error> ApplyLoggingConfig();

  /**
   * @brief Resolve the encryption key
   *
   * recovery.key_file wins over recovery.key_env.
   */
  [[nodiscard]] Expected<crypto::EncryptionKey, Error> LoadEncryptionKey() const;

  /**
   * @brief Register every schema listed under validation.schemas
   */
  Expected<void, Error> LoadSchemas(recovery::JsonSchemaValidator& validator) const;

 private:
  ConfigurationManager(std::string config_file, std::string schema_file, config::Config initial_config);

  std::string config_file_;
  std::string schema_file_;
  config::Config config_;
};

}  // namespace talentvault::app

#endif  // TALENTVAULT_APP_CONFIGURATION_MANAGER_H_
