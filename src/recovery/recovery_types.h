/**
 * @file recovery_types.h
 * @brief Recovery point, recovery data and restore option types
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "utils/datetime_converter.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace talentvault::recovery {

using utils::Error;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;
using utils::Timestamp;

using RecoveryPointId = uint64_t;

constexpr const char* kDefaultSchemaVersion = "1.0";

/**
 * @brief Snapshot kind
 *
 * Only kFull is produced. kIncremental is reserved and refused on restore.
 */
enum class RecoveryKind : uint8_t { kFull, kIncremental };

/**
 * @brief Who initiated a snapshot
 */
enum class RecoveryTrigger : uint8_t { kManual, kAutomatic };

/**
 * @brief Recovery point lifecycle
 *
 * pending -> completed | failed. Terminal states never change.
 */
enum class RecoveryStatus : uint8_t { kPending, kCompleted, kFailed };

const char* ToString(RecoveryKind kind);
const char* ToString(RecoveryTrigger trigger);
const char* ToString(RecoveryStatus status);

std::optional<RecoveryKind> ParseRecoveryKind(std::string_view text);
std::optional<RecoveryTrigger> ParseRecoveryTrigger(std::string_view text);
std::optional<RecoveryStatus> ParseRecoveryStatus(std::string_view text);

struct RecoveryMetadata {
  std::string schema_version = kDefaultSchemaVersion;
  std::vector<std::string> collections;         // Enumeration order
  std::map<std::string, uint64_t> record_counts;

  bool operator==(const RecoveryMetadata& other) const {
    return schema_version == other.schema_version && collections == other.collections &&
           record_counts == other.record_counts;
  }
};

/**
 * @brief Metadata of one snapshot
 */
struct RecoveryPoint {
  RecoveryPointId id = 0;
  Timestamp timestamp;
  RecoveryKind kind = RecoveryKind::kFull;
  RecoveryTrigger trigger = RecoveryTrigger::kManual;
  std::string description;
  uint64_t size_bytes = 0;  // Canonical serialization, before encryption
  std::string checksum;     // SHA-256 hex of the canonical serialization
  std::string key_id;       // Fingerprint of the encrypting key
  RecoveryStatus status = RecoveryStatus::kPending;
  RecoveryMetadata metadata;
};

/**
 * @brief Encrypted snapshot contents, one per recovery point
 */
struct RecoveryData {
  RecoveryPointId recovery_point_id = 0;
  std::string payload;  // Binary ciphertext envelope
  Timestamp timestamp;
};

struct RestoreOptions {
  std::optional<std::vector<std::string>> collections;  // Default: every collection in the payload
  bool validate = false;
  bool preserve_audit_trail = false;
  bool notify_users = false;
};

struct RestoreResult {
  std::vector<std::string> restored_collections;
  RecoveryPointId recovery_point_id = 0;
  RecoveryPointId pre_restore_point_id = 0;
  Timestamp timestamp;
};

/**
 * @brief Schema validation outcome of one collection
 */
struct CollectionValidation {
  std::string collection;
  bool valid = true;
  std::vector<std::string> errors;
};

/**
 * @brief Listener invoked after a successful restore with notify_users set
 */
using RestoreListener = std::function<void(const RestoreResult&)>;

// Catalog row mapping. Parse failures are kStorageCorrupted.
nlohmann::json ToJson(const RecoveryPoint& point);
Expected<RecoveryPoint, Error> RecoveryPointFromJson(const nlohmann::json& row);

nlohmann::json ToJson(const RecoveryData& data);
// A payload string that does not decode is kRecoveryPayloadMalformed
Expected<RecoveryData, Error> RecoveryDataFromJson(const nlohmann::json& row);

/**
 * @brief Option set as recorded in audit details
 */
nlohmann::json ToJson(const RestoreOptions& options);

}  // namespace talentvault::recovery
