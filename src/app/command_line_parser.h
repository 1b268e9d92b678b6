/**
 * @file command_line_parser.h
 * @brief Command-line argument parser
 */

#ifndef TALENTVAULT_APP_COMMAND_LINE_PARSER_H_
#define TALENTVAULT_APP_COMMAND_LINE_PARSER_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace talentvault::app {

using utils::Error;
using utils::Expected;

/**
 * @brief recoveryctl commands
 */
enum class Command : uint8_t {
  kNone,
  kCreate,
  kList,
  kRestore,
  kDelete,
  kVerify,
  kValidate,
  kPrune,
  kKeygen,
};

const char* CommandName(Command command);

/**
 * @brief Parsed command-line arguments
 */
struct CommandLineArgs {
  std::string config_file;
  std::string schema_file;  ///< Optional JSON Schema file path
  bool config_test_mode = false;
  bool show_help = false;
  bool show_version = false;

  Command command = Command::kNone;
  uint64_t point_id = 0;       ///< restore, delete, verify, validate
  std::string description;     ///< create
  std::optional<size_t> retain;  ///< prune (unset = use configuration)

  // restore options
  std::optional<std::vector<std::string>> collections;
  bool validate = false;
  bool preserve_audit_trail = false;
  bool notify_users = false;
};

/**
 * @brief Command-line argument parser
 *
 * Options may appear before or after the command. Short (-c) and long
 * (--config) forms are accepted.
 */
class CommandLineParser {
 public:
  /**
   * @brief Parse command line arguments
   * @param argc Argument count
   * @param argv Argument values
   * @return Expected with parsed arguments or error
   *
   * Supported options:
   * - -c, --config <file>: Configuration file path
   * - -t, --config-test: Test configuration file and exit
   * - -s, --schema <file>: Use custom JSON Schema
   * - -h, --help: Show help message
   * - -v, --version: Show version information
   * - --collections a,b / --validate / --preserve-audit-trail / --notify-users: restore options
   *
   * @note Help and version flags take precedence (set show_help/show_version flags)
   */
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
  static Expected<CommandLineArgs, Error> Parse(int argc, char* argv[]);

  /**
   * @brief Print help message to stdout
   * @param program_name Program name (argv[0])
   */
  static void PrintHelp(const char* program_name);

  /**
   * @brief Print version information to stdout
   */
  static void PrintVersion();

 private:
  CommandLineParser() = default;
};

}  // namespace talentvault::app

#endif  // TALENTVAULT_APP_COMMAND_LINE_PARSER_H_
