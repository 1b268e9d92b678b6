/**
 * @file configuration_manager.cpp
 * @brief Configuration manager implementation
 */

#include "app/configuration_manager.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "utils/structured_log.h"

namespace talentvault::app {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr const char* kLoggerName = "talentvault";

/**
 * @brief Resolve a schema path relative to the configuration file
 */
std::string ResolveRelative(const std::string& config_file, const std::string& path) {
  std::filesystem::path candidate(path);
  if (candidate.is_absolute()) {
    return path;
  }
  std::filesystem::path base = std::filesystem::path(config_file).parent_path();
  return (base / candidate).string();
}

}  // namespace

Expected<std::unique_ptr<ConfigurationManager>, Error> ConfigurationManager::Create(const std::string& config_file,
                                                                                      const std::string& schema_file) {
  auto config_result = config::LoadConfig(config_file, schema_file);
  if (!config_result) {
    return MakeUnexpected(config_result.error());
  }

  auto manager = std::unique_ptr<ConfigurationManager>(
      new ConfigurationManager(config_file, schema_file, std::move(*config_result)));
  return manager;
}

ConfigurationManager::ConfigurationManager(std::string config_file, std::string schema_file,
                                           config::Config initial_config)
    : config_file_(std::move(config_file)), schema_file_(std::move(schema_file)), config_(std::move(initial_config)) {}

int ConfigurationManager::PrintConfigTest() const {
  std::cout << "Configuration file syntax is OK\n";
  std::cout << "Configuration details:\n";
  std::cout << "  Store: " << config_.store.path << "\n";
  std::cout << "  Schema version: " << config_.recovery.schema_version << "\n";
  if (!config_.recovery.key_file.empty()) {
    std::cout << "  Key file: " << config_.recovery.key_file << "\n";
  } else {
    std::cout << "  Key environment variable: " << config_.recovery.key_env << "\n";
  }
  std::cout << "  Retain: " << (config_.recovery.retain == 0 ? std::string("all") : std::to_string(config_.recovery.retain))
            << "\n";
  std::cout << "  Validation schemas: " << config_.validation.schemas.size() << "\n";
  for (const auto& [collection, path] : config_.validation.schemas) {
    std::cout << "    - " << collection << ": " << path << "\n";
  }
  std::cout << "  Audit user: " << config_.audit.user_id << "\n";
  std::cout << "  Logging level: " << config_.logging.level << "\n";
  return 0;
}

Expected<void, Error> ConfigurationManager::ApplyLoggingConfig() {
  // Configure log output (file or stdout) BEFORE setting level
  if (!config_.logging.file.empty()) {
    try {
      std::filesystem::path log_path(config_.logging.file);
      std::filesystem::path log_dir = log_path.parent_path();
      if (!log_dir.empty() && !std::filesystem::exists(log_dir)) {
        std::filesystem::create_directories(log_dir);
      }

      spdlog::drop(kLoggerName);
      auto file_logger = spdlog::basic_logger_mt(kLoggerName, config_.logging.file);
      spdlog::set_default_logger(file_logger);
    } catch (const spdlog::spdlog_ex& ex) {
      return MakeUnexpected(MakeError(ErrorCode::kIOError, "Log file initialization failed: " + std::string(ex.what())));
    } catch (const std::exception& ex) {
      return MakeUnexpected(
          MakeError(ErrorCode::kIOError, "Failed to create log directory: " + std::string(ex.what())));
    }
  }

  // Apply logging level (must be AFTER setting default logger)
  spdlog::set_level(spdlog::level::from_str(config_.logging.level));

  utils::StructuredLog::SetFormat(utils::StructuredLog::ParseFormat(config_.logging.format));

  if (!config_.logging.file.empty()) {
    spdlog::info("Logging to file: {}", config_.logging.file);
  }
  return {};
}

Expected<crypto::EncryptionKey, Error> ConfigurationManager::LoadEncryptionKey() const {
  if (!config_.recovery.key_file.empty()) {
    return crypto::KeySource::FromFile(ResolveRelative(config_file_, config_.recovery.key_file));
  }
  return crypto::KeySource::FromEnvironment(config_.recovery.key_env);
}

Expected<void, Error> ConfigurationManager::LoadSchemas(recovery::JsonSchemaValidator& validator) const {
  for (const auto& [collection, path] : config_.validation.schemas) {
    auto loaded = validator.LoadSchemaFile(collection, ResolveRelative(config_file_, path));
    if (!loaded) {
      return loaded;
    }
  }
  if (!config_.validation.schemas.empty()) {
    spdlog::debug("Loaded {} record schemas", config_.validation.schemas.size());
  }
  return {};
}

}  // namespace talentvault::app
