/**
 * @file application.h
 * @brief recoveryctl application class
 */

#ifndef TALENTVAULT_APP_APPLICATION_H_
#define TALENTVAULT_APP_APPLICATION_H_

#include <memory>
#include <optional>

#include "app/command_line_parser.h"
#include "app/configuration_manager.h"
#include "crypto/integrity_codec.h"
#include "recovery/audit_sink.h"
#include "recovery/recovery_catalog.h"
#include "recovery/recovery_manager.h"
#include "recovery/schema_validator.h"
#include "store/memory_collection_store.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace talentvault::app {

/**
 * @brief recoveryctl application
 *
 * Lifecycle of one invocation:
 * 1. Parse command-line arguments
 * 2. Load configuration
 * 3. Apply logging configuration
 * 4. Load the store file and wire the recovery components
 * 5. Run the command
 * 6. Save the store file when the command may have changed it
 *
 * Usage:
 * @code
 * auto app = Application::Create(argc, argv);
 * if (!app) {
 *   std::cerr << "Failed to create application: " << app.error().to_string() << "\n";
 *   return 1;
 * }
 * return (*app)->Run();
 * @endcode
 */
class Application {
 public:
  /**
   * @brief Create application from command-line arguments
   *
   * Help and version are printed here; the returned instance then exits
   * with 0 from Run().
   */
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
  static Expected<std::unique_ptr<Application>, Error> Create(int argc, char* argv[]);

  ~Application() = default;

  // Non-copyable, non-movable
  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;
  Application(Application&&) = delete;
  Application& operator=(Application&&) = delete;

  /**
   * @brief Run the application
   * @return Exit code (0 = success, non-zero = error)
   */
  int Run();

 private:
  Application(CommandLineArgs args, std::unique_ptr<ConfigurationManager> config_mgr);

  // Special modes (return exit code, -1 = not a special mode)
  int HandleSpecialModes();
  static int HandleKeygen();

  Expected<void, Error> VerifyStoreDirectory() const;
  Expected<void, Error> Initialize();
  Expected<void, Error> RunCommand();
  Expected<void, Error> SaveStore() const;

  Expected<void, Error> RunCreate();
  Expected<void, Error> RunList() const;
  Expected<void, Error> RunRestore();
  Expected<void, Error> RunDelete();
  Expected<void, Error> RunVerify() const;
  Expected<void, Error> RunValidate() const;
  Expected<void, Error> RunPrune();

  [[nodiscard]] static bool IsMutating(Command command);
  [[nodiscard]] const std::string& Actor() const;

  CommandLineArgs args_;
  std::unique_ptr<ConfigurationManager> config_manager_;

  // Components (initialization order)
  std::unique_ptr<store::MemoryCollectionStore> store_;
  std::unique_ptr<recovery::RecoveryCatalog> catalog_;
  std::optional<crypto::IntegrityCodec> codec_;
  std::unique_ptr<recovery::JsonSchemaValidator> validator_;
  std::unique_ptr<recovery::CollectionAuditSink> audit_sink_;
  std::unique_ptr<recovery::RecoveryManager> manager_;
};

}  // namespace talentvault::app

#endif  // TALENTVAULT_APP_APPLICATION_H_
