/**
 * @file command_line_parser.cpp
 * @brief Command-line argument parser implementation
 */

#include "app/command_line_parser.h"

#include <charconv>
#include <iostream>

#include "utils/string_utils.h"
#include "version.h"

namespace talentvault::app {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

/**
 * @brief Check if argument matches short or long option
 * @param arg Command-line argument
 * @param short_opt Short option (e.g., "-c")
 * @param long_opt Long option (e.g., "--config")
 * @return True if argument matches either option
 */
bool MatchesOption(const std::string& arg, const char* short_opt, const char* long_opt) {
  return arg == short_opt || arg == long_opt;
}

std::optional<Command> ParseCommand(const std::string& name) {
  if (name == "create") {
    return Command::kCreate;
  }
  if (name == "list") {
    return Command::kList;
  }
  if (name == "restore") {
    return Command::kRestore;
  }
  if (name == "delete") {
    return Command::kDelete;
  }
  if (name == "verify") {
    return Command::kVerify;
  }
  if (name == "validate") {
    return Command::kValidate;
  }
  if (name == "prune") {
    return Command::kPrune;
  }
  if (name == "keygen") {
    return Command::kKeygen;
  }
  return std::nullopt;
}

Expected<uint64_t, Error> ParseUnsigned(const std::string& value, const char* what) {
  uint64_t result = 0;
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  if (ec != std::errc{} || ptr != value.data() + value.size()) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, std::string("Invalid ") + what + ": " + value));
  }
  return result;
}

/**
 * @brief Bind positional operands to the parsed command
 */
Expected<void, Error> ApplyOperands(CommandLineArgs& args, const std::vector<std::string>& operands) {
  const std::string name = CommandName(args.command);
  switch (args.command) {
    case Command::kCreate:
      if (operands.size() != 1) {
        return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "create requires exactly one description"));
      }
      args.description = operands[0];
      return {};
    case Command::kList:
    case Command::kKeygen:
      if (!operands.empty()) {
        return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, name + " takes no arguments"));
      }
      return {};
    case Command::kRestore:
    case Command::kDelete:
    case Command::kVerify:
    case Command::kValidate: {
      if (operands.size() != 1) {
        return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, name + " requires a recovery point id"));
      }
      auto id = ParseUnsigned(operands[0], "recovery point id");
      if (!id) {
        return MakeUnexpected(id.error());
      }
      args.point_id = *id;
      return {};
    }
    case Command::kPrune: {
      if (operands.size() > 1) {
        return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "prune takes at most one retain count"));
      }
      if (operands.size() == 1) {
        auto retain = ParseUnsigned(operands[0], "retain count");
        if (!retain) {
          return MakeUnexpected(retain.error());
        }
        args.retain = static_cast<size_t>(*retain);
      }
      return {};
    }
    case Command::kNone:
      break;
  }
  return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Command required. Use --help for usage."));
}

}  // namespace

const char* CommandName(Command command) {
  switch (command) {
    case Command::kCreate:
      return "create";
    case Command::kList:
      return "list";
    case Command::kRestore:
      return "restore";
    case Command::kDelete:
      return "delete";
    case Command::kVerify:
      return "verify";
    case Command::kValidate:
      return "validate";
    case Command::kPrune:
      return "prune";
    case Command::kKeygen:
      return "keygen";
    case Command::kNone:
      break;
  }
  return "none";
}

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
Expected<CommandLineArgs, Error> CommandLineParser::Parse(int argc, char* argv[]) {
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  CommandLineArgs args;

  if (argc < 1) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Invalid argument count (argc < 1)"));
  }

  // Handle help and version flags first (early exit)
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      args.show_help = true;
      return args;
    }
    if (arg == "-v" || arg == "--version") {
      args.show_version = true;
      return args;
    }
  }

  if (argc < 2) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "No arguments provided. Use --help for usage."));
  }

  std::vector<std::string> operands;
  bool restore_option_seen = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (MatchesOption(arg, "-c", "--config")) {
      if (i + 1 >= argc) {
        return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "--config requires a file path argument"));
      }
      args.config_file = argv[++i];
    } else if (MatchesOption(arg, "-t", "--config-test")) {
      args.config_test_mode = true;
    } else if (MatchesOption(arg, "-s", "--schema")) {
      if (i + 1 >= argc) {
        return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "--schema requires a file path argument"));
      }
      args.schema_file = argv[++i];
    } else if (arg == "--collections") {
      if (i + 1 >= argc) {
        return MakeUnexpected(
            MakeError(ErrorCode::kInvalidArgument, "--collections requires a comma-separated list"));
      }
      auto names = utils::SplitNonEmpty(argv[++i], ',');
      if (names.empty()) {
        return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "--collections list is empty"));
      }
      args.collections = std::move(names);
      restore_option_seen = true;
    } else if (arg == "--validate") {
      args.validate = true;
      restore_option_seen = true;
    } else if (arg == "--preserve-audit-trail") {
      args.preserve_audit_trail = true;
      restore_option_seen = true;
    } else if (arg == "--notify-users") {
      args.notify_users = true;
      restore_option_seen = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Unknown option: " + arg));
    } else if (args.command == Command::kNone && !args.config_test_mode) {
      auto command = ParseCommand(arg);
      if (!command) {
        return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Unknown command: " + arg));
      }
      args.command = *command;
    } else {
      operands.push_back(arg);
    }
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  if (args.config_test_mode) {
    if (args.command != Command::kNone || !operands.empty()) {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "--config-test does not take a command"));
    }
  } else {
    auto bound = ApplyOperands(args, operands);
    if (!bound) {
      return MakeUnexpected(bound.error());
    }
  }

  if (restore_option_seen && args.command != Command::kRestore) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Restore options are only valid with restore"));
  }

  // keygen is the only command that runs without a configuration
  if (args.config_file.empty() && args.command != Command::kKeygen) {
    return MakeUnexpected(
        MakeError(ErrorCode::kInvalidArgument, "Configuration file path required. Use --help for usage."));
  }

  return args;
}

void CommandLineParser::PrintHelp(const char* program_name) {
  std::cout << "Usage: " << program_name << " -c <config.yaml|config.json> <command> [args] [OPTIONS]\n";
  std::cout << "       " << program_name << " -c <config.yaml|config.json> --config-test\n";
  std::cout << "       " << program_name << " keygen\n";
  std::cout << "\n";
  std::cout << "Commands:\n";
  std::cout << "  create <description>           Create a recovery point of every collection\n";
  std::cout << "  list                           List recovery points, newest first\n";
  std::cout << "  restore <id>                   Restore collections from a recovery point\n";
  std::cout << "  delete <id>                    Delete a recovery point and its data\n";
  std::cout << "  verify <id>                    Decrypt and verify the checksum of a recovery point\n";
  std::cout << "  validate <id>                  Check recovery point records against the schemas\n";
  std::cout << "  prune [retain]                 Delete completed points beyond the newest <retain>\n";
  std::cout << "  keygen                         Print a new random encryption key (hex)\n";
  std::cout << "\n";
  std::cout << "Options:\n";
  std::cout << "  -c, --config <file>            Configuration file path\n";
  std::cout << "  -t, --config-test              Test configuration file and exit\n";
  std::cout << "  -s, --schema <schema.json>     Use custom JSON Schema for the configuration\n";
  std::cout << "  -h, --help                     Show this help message\n";
  std::cout << "  -v, --version                  Show version information\n";
  std::cout << "\n";
  std::cout << "Restore options:\n";
  std::cout << "  --collections <a,b,...>        Restore only these collections\n";
  std::cout << "  --validate                     Reject the restore if records fail schema validation\n";
  std::cout << "  --preserve-audit-trail         Keep the current audit log\n";
  std::cout << "  --notify-users                 Notify restore listeners after success\n";
  std::cout << "\n";
  std::cout << "The encryption key is read from the file named by recovery.key_file, or from\n";
  std::cout << "the environment variable named by recovery.key_env (default TALENTVAULT_RECOVERY_KEY).\n";
}

void CommandLineParser::PrintVersion() {
  std::cout << Version::FullString() << "\n";
}

}  // namespace talentvault::app
