/**
 * @file expected_test.cpp
 * @brief Unit tests for Expected<T, E> class
 */

#include "utils/expected.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "utils/error.h"

using namespace talentvault::utils;

namespace {

Expected<uint64_t, Error> ParsePointId(const std::string& text) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Invalid recovery point id", text));
  }
  return std::stoull(text);
}

Expected<std::string, Error> LookupDescription(uint64_t id) {
  if (id != 7) {
    return MakeUnexpected(MakeError(ErrorCode::kRecoveryPointNotFound, "Recovery point not found"));
  }
  return std::string("nightly");
}

Expected<void, Error> RequireCompleted(bool completed) {
  if (!completed) {
    return MakeUnexpected(MakeError(ErrorCode::kRecoveryInvalidState, "Recovery point is pending"));
  }
  return {};
}

}  // namespace

// ========== Test Expected<T, E> with value ==========

TEST(ExpectedTest, DefaultConstructor) {
  Expected<int, Error> result;
  EXPECT_TRUE(result.has_value());
  EXPECT_EQ(*result, 0);
}

TEST(ExpectedTest, ValueConstructor) {
  Expected<int, Error> result(42);
  EXPECT_TRUE(result.has_value());
  EXPECT_EQ(*result, 42);
  EXPECT_EQ(result.value(), 42);
}

TEST(ExpectedTest, ErrorConstructor) {
  Expected<int, Error> result(MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Test error")));
  EXPECT_FALSE(result.has_value());
  EXPECT_FALSE(static_cast<bool>(result));
  EXPECT_EQ(result.error().code(), ErrorCode::kInvalidArgument);
  EXPECT_EQ(result.error().message(), "Test error");
}

TEST(ExpectedTest, ConvertingConstructor) {
  // const char* converts to std::string
  Expected<std::string, Error> result("checksum");
  ASSERT_TRUE(result);
  EXPECT_EQ(result->size(), 8U);
}

TEST(ExpectedTest, ValueAccessThrows) {
  Expected<int, Error> result(MakeUnexpected(MakeError(ErrorCode::kNotFound)));
  EXPECT_THROW({ (void)result.value(); }, BadExpectedAccess<Error>);

  try {
    (void)result.value();
  } catch (const BadExpectedAccess<Error>& e) {
    EXPECT_EQ(e.error().code(), ErrorCode::kNotFound);
  }
}

TEST(ExpectedTest, ValueOr) {
  Expected<int, Error> success(42);
  Expected<int, Error> failure(MakeUnexpected(MakeError(ErrorCode::kUnknown)));

  EXPECT_EQ(success.value_or(0), 42);
  EXPECT_EQ(failure.value_or(99), 99);
  EXPECT_EQ(std::move(failure).value_or(7), 7);
}

TEST(ExpectedTest, MoveOnlyValue) {
  Expected<std::unique_ptr<int>, Error> result(std::make_unique<int>(5));
  ASSERT_TRUE(result);
  std::unique_ptr<int> owned = std::move(*result);
  EXPECT_EQ(*owned, 5);
}

// ========== Test Expected<void, E> ==========

TEST(ExpectedVoidTest, DefaultIsSuccess) {
  Expected<void, Error> result;
  EXPECT_TRUE(result.has_value());
  EXPECT_NO_THROW(result.value());
}

TEST(ExpectedVoidTest, ErrorConstructor) {
  Expected<void, Error> result = RequireCompleted(false);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kRecoveryInvalidState);
  EXPECT_THROW(result.value(), BadExpectedAccess<Error>);
}

TEST(ExpectedVoidTest, AssignmentBetweenSuccessAndError) {
  Expected<void, Error> result = RequireCompleted(true);
  EXPECT_TRUE(result);
  result = RequireCompleted(false);
  EXPECT_FALSE(result);
  result = RequireCompleted(true);
  EXPECT_TRUE(result);
}

TEST(ExpectedVoidTest, AndThen) {
  int calls = 0;
  auto next = [&calls]() -> Expected<void, Error> {
    ++calls;
    return {};
  };
  EXPECT_TRUE(RequireCompleted(true).and_then(next));
  EXPECT_FALSE(RequireCompleted(false).and_then(next));
  EXPECT_EQ(calls, 1);
}

// ========== Test monadic operations ==========

TEST(ExpectedTest, Transform) {
  auto doubled = ParsePointId("21").transform([](uint64_t id) { return id * 2; });
  ASSERT_TRUE(doubled);
  EXPECT_EQ(*doubled, 42U);

  auto failed = ParsePointId("abc").transform([](uint64_t id) { return id * 2; });
  ASSERT_FALSE(failed);
  EXPECT_EQ(failed.error().code(), ErrorCode::kInvalidArgument);
}

TEST(ExpectedTest, AndThenChainsLookups) {
  auto found = ParsePointId("7").and_then(LookupDescription);
  ASSERT_TRUE(found);
  EXPECT_EQ(*found, "nightly");

  auto missing = ParsePointId("8").and_then(LookupDescription);
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code(), ErrorCode::kRecoveryPointNotFound);

  // The first error short-circuits the chain
  auto invalid = ParsePointId("").and_then(LookupDescription);
  ASSERT_FALSE(invalid);
  EXPECT_EQ(invalid.error().code(), ErrorCode::kInvalidArgument);
}

TEST(ExpectedTest, OrElse) {
  auto recovered = ParsePointId("x").or_else([](const Error&) -> Expected<uint64_t, Error> { return 0U; });
  ASSERT_TRUE(recovered);
  EXPECT_EQ(*recovered, 0U);
}

TEST(ExpectedTest, TransformError) {
  auto result = LookupDescription(1).transform_error(
      [](const Error& error) { return MakeError(ErrorCode::kRecoveryRestoreFailed, "wrapped", error.message()); });
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kRecoveryRestoreFailed);
  EXPECT_EQ(result.error().context(), "Recovery point not found");
}

TEST(ExpectedTest, CollectErrorsFromBatch) {
  std::vector<std::string> inputs = {"1", "two", "3", ""};
  std::vector<uint64_t> ids;
  std::vector<Error> errors;
  for (const auto& input : inputs) {
    auto parsed = ParsePointId(input);
    if (parsed) {
      ids.push_back(*parsed);
    } else {
      errors.push_back(parsed.error());
    }
  }
  EXPECT_EQ(ids, (std::vector<uint64_t>{1, 3}));
  ASSERT_EQ(errors.size(), 2U);
  EXPECT_EQ(errors[0].context(), "two");
}
