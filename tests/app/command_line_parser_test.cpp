/**
 * @file command_line_parser_test.cpp
 * @brief Unit tests for CommandLineParser class
 *
 * Covers commands and their operands, restore options and error cases.
 */

#include "app/command_line_parser.h"

#include <gtest/gtest.h>

#include <initializer_list>
#include <string>
#include <vector>

using namespace talentvault::app;
using talentvault::utils::ErrorCode;

namespace {

/**
 * @brief Builds argc/argv for recoveryctl invocations
 */
class ArgvBuilder {
 public:
  ArgvBuilder(std::initializer_list<std::string> args) : args_{"recoveryctl"} {
    args_.insert(args_.end(), args.begin(), args.end());
  }

  int argc() const { return static_cast<int>(args_.size()); }

  // Valid as long as the builder exists
  char** argv() {
    ptrs_.clear();
    for (auto& arg : args_) {
      ptrs_.push_back(arg.data());
    }
    return ptrs_.data();
  }

 private:
  std::vector<std::string> args_;
  std::vector<char*> ptrs_;
};

Expected<CommandLineArgs, Error> ParseArgs(std::initializer_list<std::string> args) {
  ArgvBuilder builder(args);
  return CommandLineParser::Parse(builder.argc(), builder.argv());
}

void ExpectInvalid(std::initializer_list<std::string> args) {
  auto result = ParseArgs(args);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
}

}  // namespace

// ===========================================================================
// Help and version
// ===========================================================================

TEST(CommandLineParserTest, HelpTakesPrecedence) {
  auto result = ParseArgs({"restore", "--bogus", "-h"});
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->show_help);
  EXPECT_FALSE(result->show_version);
}

TEST(CommandLineParserTest, Version) {
  auto result = ParseArgs({"--version"});
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->show_version);
}

TEST(CommandLineParserTest, NoArguments) {
  ExpectInvalid({});
}

// ===========================================================================
// Commands
// ===========================================================================

TEST(CommandLineParserTest, CreateWithDescription) {
  auto result = ParseArgs({"-c", "config.yaml", "create", "nightly backup"});
  ASSERT_TRUE(result.has_value()) << result.error().to_string();
  EXPECT_EQ(result->config_file, "config.yaml");
  EXPECT_EQ(result->command, Command::kCreate);
  EXPECT_EQ(result->description, "nightly backup");
}

TEST(CommandLineParserTest, OptionsAfterCommand) {
  auto result = ParseArgs({"list", "--config", "/etc/talentvault/config.yaml"});
  ASSERT_TRUE(result.has_value()) << result.error().to_string();
  EXPECT_EQ(result->command, Command::kList);
  EXPECT_EQ(result->config_file, "/etc/talentvault/config.yaml");
}

TEST(CommandLineParserTest, IdCommands) {
  struct Case {
    const char* name;
    Command command;
  };
  for (const auto& entry : {Case{"restore", Command::kRestore}, Case{"delete", Command::kDelete},
                            Case{"verify", Command::kVerify}, Case{"validate", Command::kValidate}}) {
    auto result = ParseArgs({"-c", "c.yaml", entry.name, "42"});
    ASSERT_TRUE(result.has_value()) << entry.name;
    EXPECT_EQ(result->command, entry.command);
    EXPECT_EQ(result->point_id, 42U);
    EXPECT_STREQ(CommandName(entry.command), entry.name);
  }
}

TEST(CommandLineParserTest, InvalidPointIds) {
  ExpectInvalid({"-c", "c.yaml", "restore"});
  ExpectInvalid({"-c", "c.yaml", "restore", "abc"});
  ExpectInvalid({"-c", "c.yaml", "delete", "-1"});
  ExpectInvalid({"-c", "c.yaml", "verify", "12x"});
  ExpectInvalid({"-c", "c.yaml", "verify", "1", "2"});
  ExpectInvalid({"-c", "c.yaml", "restore", "99999999999999999999999"});
}

TEST(CommandLineParserTest, PruneRetain) {
  auto defaulted = ParseArgs({"-c", "c.yaml", "prune"});
  ASSERT_TRUE(defaulted.has_value());
  EXPECT_EQ(defaulted->command, Command::kPrune);
  EXPECT_FALSE(defaulted->retain.has_value());

  auto explicit_retain = ParseArgs({"-c", "c.yaml", "prune", "0"});
  ASSERT_TRUE(explicit_retain.has_value());
  ASSERT_TRUE(explicit_retain->retain.has_value());
  EXPECT_EQ(*explicit_retain->retain, 0U);

  ExpectInvalid({"-c", "c.yaml", "prune", "5", "6"});
  ExpectInvalid({"-c", "c.yaml", "prune", "many"});
}

TEST(CommandLineParserTest, CreateOperands) {
  ExpectInvalid({"-c", "c.yaml", "create"});
  ExpectInvalid({"-c", "c.yaml", "create", "a", "b"});
}

TEST(CommandLineParserTest, ListTakesNoOperands) {
  ExpectInvalid({"-c", "c.yaml", "list", "extra"});
}

TEST(CommandLineParserTest, KeygenNeedsNoConfig) {
  auto result = ParseArgs({"keygen"});
  ASSERT_TRUE(result.has_value()) << result.error().to_string();
  EXPECT_EQ(result->command, Command::kKeygen);
  EXPECT_TRUE(result->config_file.empty());
}

TEST(CommandLineParserTest, ConfigRequiredForOtherCommands) {
  auto result = ParseArgs({"list"});
  ASSERT_FALSE(result.has_value());
  EXPECT_NE(result.error().message().find("Configuration file"), std::string::npos);
}

TEST(CommandLineParserTest, UnknownCommandAndOption) {
  auto command = ParseArgs({"-c", "c.yaml", "backup"});
  ASSERT_FALSE(command.has_value());
  EXPECT_NE(command.error().message().find("Unknown command"), std::string::npos);

  auto option = ParseArgs({"-c", "c.yaml", "list", "--force"});
  ASSERT_FALSE(option.has_value());
  EXPECT_NE(option.error().message().find("Unknown option"), std::string::npos);
}

TEST(CommandLineParserTest, CommandRequired) {
  ExpectInvalid({"-c", "c.yaml"});
}

TEST(CommandLineParserTest, MissingOptionValues) {
  ExpectInvalid({"list", "-c"});
  ExpectInvalid({"-c", "c.yaml", "list", "--schema"});
  ExpectInvalid({"-c", "c.yaml", "restore", "1", "--collections"});
}

// ===========================================================================
// Restore options
// ===========================================================================

TEST(CommandLineParserTest, RestoreOptions) {
  auto result = ParseArgs({"-c", "c.yaml", "restore", "7", "--collections", "candidates,,jobs", "--validate",
                           "--preserve-audit-trail", "--notify-users"});
  ASSERT_TRUE(result.has_value()) << result.error().to_string();
  EXPECT_EQ(result->point_id, 7U);
  ASSERT_TRUE(result->collections.has_value());
  EXPECT_EQ(*result->collections, (std::vector<std::string>{"candidates", "jobs"}));
  EXPECT_TRUE(result->validate);
  EXPECT_TRUE(result->preserve_audit_trail);
  EXPECT_TRUE(result->notify_users);
}

TEST(CommandLineParserTest, RestoreDefaults) {
  auto result = ParseArgs({"-c", "c.yaml", "restore", "7"});
  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->collections.has_value());
  EXPECT_FALSE(result->validate);
  EXPECT_FALSE(result->preserve_audit_trail);
  EXPECT_FALSE(result->notify_users);
}

TEST(CommandLineParserTest, EmptyCollectionList) {
  ExpectInvalid({"-c", "c.yaml", "restore", "7", "--collections", ","});
}

TEST(CommandLineParserTest, RestoreOptionsRequireRestore) {
  auto result = ParseArgs({"-c", "c.yaml", "delete", "7", "--validate"});
  ASSERT_FALSE(result.has_value());
  EXPECT_NE(result.error().message().find("only valid with restore"), std::string::npos);
}

// ===========================================================================
// Config test mode
// ===========================================================================

TEST(CommandLineParserTest, ConfigTestMode) {
  auto result = ParseArgs({"-c", "c.yaml", "-t", "-s", "schema.json"});
  ASSERT_TRUE(result.has_value()) << result.error().to_string();
  EXPECT_TRUE(result->config_test_mode);
  EXPECT_EQ(result->schema_file, "schema.json");
  EXPECT_EQ(result->command, Command::kNone);
}

TEST(CommandLineParserTest, ConfigTestRejectsCommand) {
  ExpectInvalid({"-c", "c.yaml", "--config-test", "list"});
  ExpectInvalid({"-c", "c.yaml", "list", "--config-test"});
}
