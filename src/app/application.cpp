/**
 * @file application.cpp
 * @brief recoveryctl application implementation
 */

#include "app/application.h"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <iomanip>
#include <iostream>

#include "crypto/key_source.h"
#include "store/collection_id.h"
#include "utils/datetime_converter.h"
#include "utils/string_utils.h"
#include "utils/structured_log.h"
#include "version.h"

namespace talentvault::app {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

void LogApplicationError(const char* type, const char* phase, const Error& error) {
  utils::StructuredLog()
      .Event("application_error")
      .Field("type", type)
      .Field("phase", phase)
      .Field("error", error.to_string())
      .Error();
  std::cerr << "Error: " << error.message();
  if (!error.context().empty()) {
    std::cerr << " (" << error.context() << ")";
  }
  std::cerr << "\n";
}

void PrintPoint(const recovery::RecoveryPoint& point) {
  std::cout << std::left << std::setw(6) << point.id << std::setw(26) << utils::FormatIso8601(point.timestamp)
            << std::setw(11) << recovery::ToString(point.status) << std::setw(11) << recovery::ToString(point.trigger)
            << std::setw(10) << utils::FormatBytes(point.size_bytes) << point.description << "\n";
}

}  // namespace

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
Expected<std::unique_ptr<Application>, Error> Application::Create(int argc, char* argv[]) {
  auto args_result = CommandLineParser::Parse(argc, argv);
  if (!args_result) {
    return MakeUnexpected(args_result.error());
  }

  CommandLineArgs args = std::move(*args_result);

  // Help, version and keygen run without a configuration
  if (args.show_help) {
    CommandLineParser::PrintHelp(argv[0]);  // NOLINT
    return std::unique_ptr<Application>(new Application(std::move(args), nullptr));
  }
  if (args.show_version) {
    CommandLineParser::PrintVersion();
    return std::unique_ptr<Application>(new Application(std::move(args), nullptr));
  }
  if (args.command == Command::kKeygen && args.config_file.empty()) {
    return std::unique_ptr<Application>(new Application(std::move(args), nullptr));
  }

  auto config_mgr = ConfigurationManager::Create(args.config_file, args.schema_file);
  if (!config_mgr) {
    return MakeUnexpected(config_mgr.error());
  }

  return std::unique_ptr<Application>(new Application(std::move(args), std::move(*config_mgr)));
}

Application::Application(CommandLineArgs args, std::unique_ptr<ConfigurationManager> config_mgr)
    : args_(std::move(args)), config_manager_(std::move(config_mgr)) {}

int Application::Run() {
  int special_exit_code = HandleSpecialModes();
  if (special_exit_code >= 0) {
    return special_exit_code;
  }

  auto logging_result = config_manager_->ApplyLoggingConfig();
  if (!logging_result) {
    LogApplicationError("logging_config_failed", "startup", logging_result.error());
    return 1;
  }

  spdlog::debug("{} running command '{}'", Version::FullString(), CommandName(args_.command));

  auto store_dir_check = VerifyStoreDirectory();
  if (!store_dir_check) {
    LogApplicationError("store_directory_verification_failed", "startup", store_dir_check.error());
    return 1;
  }

  auto init_result = Initialize();
  if (!init_result) {
    LogApplicationError("initialization_failed", "startup", init_result.error());
    return 1;
  }

  auto command_result = RunCommand();

  // A failed restore may still have written its pre-restore point to the catalog
  if (IsMutating(args_.command)) {
    auto saved = SaveStore();
    if (!saved) {
      LogApplicationError("store_save_failed", "shutdown", saved.error());
      return 1;
    }
  }

  if (!command_result) {
    LogApplicationError("command_failed", CommandName(args_.command), command_result.error());
    return 1;
  }
  return 0;
}

int Application::HandleSpecialModes() {
  if (args_.show_help || args_.show_version) {
    return 0;
  }
  if (args_.command == Command::kKeygen) {
    return HandleKeygen();
  }
  if (args_.config_test_mode) {
    return config_manager_->PrintConfigTest();
  }
  return -1;
}

int Application::HandleKeygen() {  // static
  auto key = crypto::KeySource::Generate();
  if (!key) {
    std::cerr << "Error: " << key.error().to_string() << "\n";
    return 1;
  }
  std::cout << crypto::KeySource::ToHex(*key) << "\n";
  return 0;
}

Expected<void, Error> Application::VerifyStoreDirectory() const {
  const std::string& store_path = config_manager_->GetConfig().store.path;
  try {
    std::filesystem::path store_dir = std::filesystem::path(store_path).parent_path();
    if (store_dir.empty()) {
      return {};
    }
    if (!std::filesystem::exists(store_dir)) {
      spdlog::info("Creating store directory: {}", store_dir.string());
      std::filesystem::create_directories(store_dir);
    }
    if (!std::filesystem::is_directory(store_dir)) {
      return MakeUnexpected(
          MakeError(ErrorCode::kIOError, "Store directory is not a directory", store_dir.string()));
    }
  } catch (const std::exception& e) {
    return MakeUnexpected(
        MakeError(ErrorCode::kIOError, "Failed to verify store directory: " + std::string(e.what()), store_path));
  }
  return {};
}

Expected<void, Error> Application::Initialize() {
  const config::Config& config = config_manager_->GetConfig();

  auto key = config_manager_->LoadEncryptionKey();
  if (!key) {
    return MakeUnexpected(key.error());
  }
  codec_.emplace(std::move(*key));
  spdlog::debug("Using recovery key {}", codec_->KeyId());

  store_ = std::make_unique<store::MemoryCollectionStore>();
  if (std::filesystem::exists(config.store.path)) {
    auto loaded = store_->LoadFromFile(config.store.path);
    if (!loaded) {
      return loaded;
    }
  } else {
    spdlog::info("Store file {} does not exist, starting with an empty store", config.store.path);
  }
  for (const auto& info : store::kKnownCollections) {
    auto created = store_->CreateCollection(std::string(info.name));
    if (!created) {
      return created;
    }
  }

  validator_ = std::make_unique<recovery::JsonSchemaValidator>();
  auto schemas = config_manager_->LoadSchemas(*validator_);
  if (!schemas) {
    return schemas;
  }

  catalog_ = std::make_unique<recovery::RecoveryCatalog>(*store_);
  audit_sink_ = std::make_unique<recovery::CollectionAuditSink>(*store_);

  recovery::RecoveryManagerOptions options;
  options.schema_version = config.recovery.schema_version;
  options.audit_ip = config.audit.ip;
  options.audit_user_agent = config.audit.user_agent;
  manager_ = std::make_unique<recovery::RecoveryManager>(*store_, *catalog_, *codec_, *validator_, *audit_sink_,
                                                         std::move(options));

  manager_->AddRestoreListener([](const recovery::RestoreResult& result) {
    utils::StructuredLog()
        .Event("restore_notification")
        .Field("recovery_point_id", static_cast<uint64_t>(result.recovery_point_id))
        .Field("collections", utils::Join(result.restored_collections, ","))
        .Message("data was restored from a recovery point")
        .Warn();
  });
  return {};
}

Expected<void, Error> Application::RunCommand() {
  switch (args_.command) {
    case Command::kCreate:
      return RunCreate();
    case Command::kList:
      return RunList();
    case Command::kRestore:
      return RunRestore();
    case Command::kDelete:
      return RunDelete();
    case Command::kVerify:
      return RunVerify();
    case Command::kValidate:
      return RunValidate();
    case Command::kPrune:
      return RunPrune();
    case Command::kKeygen:
    case Command::kNone:
      break;
  }
  return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "No command given"));
}

bool Application::IsMutating(Command command) {  // static
  return command == Command::kCreate || command == Command::kRestore || command == Command::kDelete ||
         command == Command::kPrune;
}

const std::string& Application::Actor() const {
  return config_manager_->GetConfig().audit.user_id;
}

Expected<void, Error> Application::SaveStore() const {
  return store_->SaveToFile(config_manager_->GetConfig().store.path);
}

Expected<void, Error> Application::RunCreate() {
  auto point = manager_->CreateSnapshot(args_.description, recovery::RecoveryTrigger::kManual, Actor());
  if (!point) {
    return MakeUnexpected(point.error());
  }
  std::cout << "Created recovery point " << point->id << " (" << point->metadata.collections.size()
            << " collections, " << utils::FormatBytes(point->size_bytes) << ")\n";
  return {};
}

Expected<void, Error> Application::RunList() const {
  auto points = manager_->ListRecoveryPoints();
  if (!points) {
    return MakeUnexpected(points.error());
  }
  std::cout << std::left << std::setw(6) << "ID" << std::setw(26) << "TIMESTAMP" << std::setw(11) << "STATUS"
            << std::setw(11) << "TRIGGER" << std::setw(10) << "SIZE"
            << "DESCRIPTION\n";
  for (const auto& point : *points) {
    PrintPoint(point);
  }
  return {};
}

Expected<void, Error> Application::RunRestore() {
  recovery::RestoreOptions options;
  options.collections = args_.collections;
  options.validate = args_.validate;
  options.preserve_audit_trail = args_.preserve_audit_trail;
  options.notify_users = args_.notify_users;

  auto result = manager_->RestoreFromPoint(args_.point_id, options, Actor());
  if (!result) {
    return MakeUnexpected(result.error());
  }
  std::cout << "Restored " << utils::Join(result->restored_collections, ", ") << " from recovery point "
            << result->recovery_point_id << "\n";
  std::cout << "Pre-restore recovery point: " << result->pre_restore_point_id << "\n";
  return {};
}

Expected<void, Error> Application::RunDelete() {
  auto deleted = manager_->DeleteRecoveryPoint(args_.point_id, Actor());
  if (!deleted) {
    return deleted;
  }
  std::cout << "Deleted recovery point " << args_.point_id << "\n";
  return {};
}

Expected<void, Error> Application::RunVerify() const {
  auto point = manager_->VerifyRecoveryPoint(args_.point_id);
  if (!point) {
    return MakeUnexpected(point.error());
  }
  std::cout << "Recovery point " << point->id << " is intact (sha256 " << point->checksum << ")\n";
  return {};
}

Expected<void, Error> Application::RunValidate() const {
  auto results = manager_->ValidateRecoveryPoint(args_.point_id);
  if (!results) {
    return MakeUnexpected(results.error());
  }
  std::vector<std::string> invalid;
  for (const auto& result : *results) {
    std::cout << result.collection << ": " << (result.valid ? "valid" : "INVALID") << "\n";
    for (const auto& error : result.errors) {
      std::cout << "  " << error << "\n";
    }
    if (!result.valid) {
      invalid.push_back(result.collection);
    }
  }
  if (!invalid.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kRecoveryValidationError,
                                    "Data validation failed for collections: " + utils::Join(invalid, ", ")));
  }
  return {};
}

Expected<void, Error> Application::RunPrune() {
  size_t retain = args_.retain ? *args_.retain : static_cast<size_t>(config_manager_->GetConfig().recovery.retain);
  if (!args_.retain && retain == 0) {
    std::cout << "Retention is disabled (recovery.retain is 0); nothing to prune\n";
    return {};
  }
  auto deleted = manager_->PruneRecoveryPoints(retain, Actor());
  if (!deleted) {
    return MakeUnexpected(deleted.error());
  }
  std::vector<std::string> ids;
  ids.reserve(deleted->size());
  for (auto id : *deleted) {
    ids.push_back(std::to_string(id));
  }
  std::cout << "Pruned " << deleted->size() << " recovery points";
  if (!ids.empty()) {
    std::cout << ": " << utils::Join(ids, ", ");
  }
  std::cout << "\n";
  return {};
}

}  // namespace talentvault::app
