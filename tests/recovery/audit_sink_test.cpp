/**
 * @file audit_sink_test.cpp
 * @brief Unit tests for audit detail sanitization and the collection audit sink
 */

#include "recovery/audit_sink.h"

#include <gtest/gtest.h>

#include "store/memory_collection_store.h"
#include "utils/datetime_converter.h"

using namespace talentvault::recovery;
using talentvault::store::MemoryCollectionStore;
using json = nlohmann::json;

TEST(SanitizeDetailsTest, RedactsCredentialKeys) {
  json details = {{"password", "hunter2"},
                  {"apiToken", "abc"},
                  {"clientSecret", "s3cr3t"},
                  {"encryptionKey", "00ff"},
                  {"description", "nightly"}};
  json sanitized = SanitizeDetails(details);

  EXPECT_EQ(sanitized["password"], kRedactedValue);
  EXPECT_EQ(sanitized["apiToken"], kRedactedValue);
  EXPECT_EQ(sanitized["clientSecret"], kRedactedValue);
  EXPECT_EQ(sanitized["encryptionKey"], kRedactedValue);
  EXPECT_EQ(sanitized["description"], "nightly");
}

TEST(SanitizeDetailsTest, IdentifiersAreNotRedacted) {
  json details = {{"recoveryPointId", 4}, {"key_id", "0123456789abcdef"}, {"tokenId", "t-1"}};
  json sanitized = SanitizeDetails(details);
  EXPECT_EQ(sanitized, details);
}

TEST(SanitizeDetailsTest, NestedValues) {
  json details = {{"options", {{"collections", json::array({"users"})}, {"PASSWORD", "x"}}},
                  {"accounts", json::array({{{"name", "a"}, {"secret", "b"}}})}};
  json sanitized = SanitizeDetails(details);

  EXPECT_EQ(sanitized["options"]["collections"], json::array({"users"}));
  EXPECT_EQ(sanitized["options"]["PASSWORD"], kRedactedValue);
  EXPECT_EQ(sanitized["accounts"][0]["name"], "a");
  EXPECT_EQ(sanitized["accounts"][0]["secret"], kRedactedValue);
}

TEST(SanitizeDetailsTest, ScalarsPassThrough) {
  EXPECT_EQ(SanitizeDetails(json(5)), json(5));
  EXPECT_EQ(SanitizeDetails(json("text")), json("text"));
  EXPECT_TRUE(SanitizeDetails(json(nullptr)).is_null());
}

TEST(CollectionAuditSinkTest, AppendsRow) {
  MemoryCollectionStore store;
  CollectionAuditSink sink(store);

  AuditEvent event;
  event.user_id = "ops-admin";
  event.action = "restore_from_point";
  event.resource = "recovery";
  event.details = {{"recoveryPointId", 3}, {"token", "leak"}};
  event.ip = "10.0.0.5";
  event.user_agent = "recoveryctl";

  auto logged = sink.LogAudit(event);
  ASSERT_TRUE(logged) << logged.error().to_string();

  auto rows = store.ReadAll("auditLogs");
  ASSERT_TRUE(rows);
  ASSERT_EQ(rows->size(), 1U);
  const json& row = (*rows)[0];

  EXPECT_EQ(row["id"].get<std::string>().size(), 32U);
  EXPECT_TRUE(talentvault::utils::ParseIso8601(row["timestamp"].get<std::string>()).has_value());
  EXPECT_EQ(row["user_id"], "ops-admin");
  EXPECT_EQ(row["action"], "restore_from_point");
  EXPECT_EQ(row["resource"], "recovery");
  EXPECT_EQ(row["details"]["recoveryPointId"], 3);
  EXPECT_EQ(row["details"]["token"], kRedactedValue);
  EXPECT_EQ(row["ip"], "10.0.0.5");
  EXPECT_EQ(row["user_agent"], "recoveryctl");
}

TEST(CollectionAuditSinkTest, RowsAccumulateWithDistinctIds) {
  MemoryCollectionStore store;
  CollectionAuditSink sink(store);

  AuditEvent event;
  event.action = "delete_recovery_point";
  ASSERT_TRUE(sink.LogAudit(event));
  ASSERT_TRUE(sink.LogAudit(event));

  auto rows = store.ReadAll("auditLogs");
  ASSERT_TRUE(rows);
  ASSERT_EQ(rows->size(), 2U);
  EXPECT_NE((*rows)[0]["id"], (*rows)[1]["id"]);
}
