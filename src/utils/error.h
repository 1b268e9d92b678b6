/**
 * @file error.h
 * @brief Error codes and Error class shared by all TalentVault modules
 *
 * Error codes are grouped by module in numeric ranges:
 * - 0-999:     General errors
 * - 1000-1999: Configuration errors
 * - 5000-5999: Storage errors
 * - 9000-9999: Crypto errors
 * - 10000+:    Recovery errors
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace talentvault::utils {

/**
 * @brief Error codes
 */
// NOLINTNEXTLINE(performance-enum-size) - Values exceed uint16_t ranges
enum class ErrorCode : int32_t {
  // General (0-999)
  kSuccess = 0,
  kUnknown = 1,
  kInvalidArgument = 2,
  kOutOfRange = 3,
  kNotImplemented = 4,
  kInternalError = 5,
  kIOError = 6,
  kPermissionDenied = 7,
  kNotFound = 8,
  kAlreadyExists = 9,
  kTimeout = 10,
  kCancelled = 11,

  // Configuration (1000-1999)
  kConfigFileNotFound = 1000,
  kConfigParseError = 1001,
  kConfigValidationError = 1002,
  kConfigMissingRequired = 1003,
  kConfigInvalidValue = 1004,
  kConfigSchemaError = 1005,
  kConfigYamlError = 1006,
  kConfigJsonError = 1007,

  // Storage (5000-5999)
  kStorageFileNotFound = 5000,
  kStorageReadError = 5001,
  kStorageWriteError = 5002,
  kStorageCorrupted = 5003,
  kStorageCRCMismatch = 5004,
  kStorageVersionMismatch = 5005,
  kStorageInvalidFormat = 5006,
  kStorageCollectionNotFound = 5007,
  kStorageTransactionFailed = 5008,
  kStorageCollectionNotLocked = 5009,

  // Crypto (9000-9999)
  kCryptoInvalidKey = 9000,
  kCryptoKeyNotFound = 9001,
  kCryptoEncryptionFailed = 9002,
  kCryptoAuthenticationFailed = 9003,
  kCryptoHashFailed = 9004,
  kCryptoRandomFailed = 9005,

  // Recovery (10000+)
  kRecoveryPointNotFound = 10000,
  kRecoveryDataNotFound = 10001,
  kRecoveryInvalidState = 10002,
  kRecoveryIntegrityError = 10003,
  kRecoveryDecryptionError = 10004,
  kRecoveryValidationError = 10005,
  kRecoveryRestoreFailed = 10006,
  kRecoverySnapshotFailed = 10007,
  kRecoveryPayloadMalformed = 10008,
};

/**
 * @brief Convert error code to human-readable string
 */
inline const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kUnknown:
      return "Unknown error";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kOutOfRange:
      return "Out of range";
    case ErrorCode::kNotImplemented:
      return "Not implemented";
    case ErrorCode::kInternalError:
      return "Internal error";
    case ErrorCode::kIOError:
      return "I/O error";
    case ErrorCode::kPermissionDenied:
      return "Permission denied";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kAlreadyExists:
      return "Already exists";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kCancelled:
      return "Cancelled";

    case ErrorCode::kConfigFileNotFound:
      return "Configuration file not found";
    case ErrorCode::kConfigParseError:
      return "Configuration parse error";
    case ErrorCode::kConfigValidationError:
      return "Configuration validation error";
    case ErrorCode::kConfigMissingRequired:
      return "Missing required configuration";
    case ErrorCode::kConfigInvalidValue:
      return "Invalid configuration value";
    case ErrorCode::kConfigSchemaError:
      return "JSON schema error";
    case ErrorCode::kConfigYamlError:
      return "YAML parsing error";
    case ErrorCode::kConfigJsonError:
      return "JSON parsing error";

    case ErrorCode::kStorageFileNotFound:
      return "Storage file not found";
    case ErrorCode::kStorageReadError:
      return "Storage read error";
    case ErrorCode::kStorageWriteError:
      return "Storage write error";
    case ErrorCode::kStorageCorrupted:
      return "Storage corrupted";
    case ErrorCode::kStorageCRCMismatch:
      return "CRC mismatch";
    case ErrorCode::kStorageVersionMismatch:
      return "Version mismatch";
    case ErrorCode::kStorageInvalidFormat:
      return "Invalid format";
    case ErrorCode::kStorageCollectionNotFound:
      return "Collection not found";
    case ErrorCode::kStorageTransactionFailed:
      return "Transaction failed";
    case ErrorCode::kStorageCollectionNotLocked:
      return "Collection not part of transaction";

    case ErrorCode::kCryptoInvalidKey:
      return "Invalid encryption key";
    case ErrorCode::kCryptoKeyNotFound:
      return "Encryption key not found";
    case ErrorCode::kCryptoEncryptionFailed:
      return "Encryption failed";
    case ErrorCode::kCryptoAuthenticationFailed:
      return "Authentication tag mismatch";
    case ErrorCode::kCryptoHashFailed:
      return "Hash computation failed";
    case ErrorCode::kCryptoRandomFailed:
      return "Random generation failed";

    case ErrorCode::kRecoveryPointNotFound:
      return "Recovery point not found";
    case ErrorCode::kRecoveryDataNotFound:
      return "Recovery data not found";
    case ErrorCode::kRecoveryInvalidState:
      return "Invalid recovery point state";
    case ErrorCode::kRecoveryIntegrityError:
      return "Data integrity check failed";
    case ErrorCode::kRecoveryDecryptionError:
      return "Decryption failed";
    case ErrorCode::kRecoveryValidationError:
      return "Data validation failed";
    case ErrorCode::kRecoveryRestoreFailed:
      return "Restore failed";
    case ErrorCode::kRecoverySnapshotFailed:
      return "Snapshot creation failed";
    case ErrorCode::kRecoveryPayloadMalformed:
      return "Recovery payload is not decodable";

    default:
      return "Unknown error code";
  }
}

/**
 * @brief Error with code, message and optional context
 *
 * The context carries where the error happened (file:line, a collection name,
 * a recovery point id) or the message of an underlying cause.
 */
class Error {
 public:
  Error() = default;

  explicit Error(ErrorCode code) : code_(code), message_(ErrorCodeToString(code)) {}

  Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

  Error(ErrorCode code, std::string message, std::string context)
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string& message() const { return message_; }
  [[nodiscard]] const std::string& context() const { return context_; }
  [[nodiscard]] bool is_error() const { return code_ != ErrorCode::kSuccess; }

  /**
   * @brief Format as "[<code string> (<code>)] <message> (context: <context>)"
   */
  [[nodiscard]] std::string to_string() const {
    std::string result = "[";
    result += ErrorCodeToString(code_);
    result += " (";
    result += std::to_string(static_cast<int32_t>(code_));
    result += ")] ";
    result += message_;
    if (!context_.empty()) {
      result += " (context: ";
      result += context_;
      result += ")";
    }
    return result;
  }

  // NOLINTNEXTLINE(google-explicit-constructor) - Allows implicit conversion for logging
  operator std::string() const { return to_string(); }

  [[nodiscard]] const char* what() const { return message_.c_str(); }

 private:
  ErrorCode code_ = ErrorCode::kSuccess;
  std::string message_;
  std::string context_;
};

inline Error MakeError(ErrorCode code) {
  return Error(code);
}

inline Error MakeError(ErrorCode code, std::string message) {
  return {code, std::move(message)};
}

inline Error MakeError(ErrorCode code, std::string message, std::string context) {
  return {code, std::move(message), std::move(context)};
}

}  // namespace talentvault::utils

/**
 * @brief Create an Error whose context is the current file:line
 */
#define TALENTVAULT_ERROR(code, message) \
  ::talentvault::utils::MakeError((code), (message), std::string(__FILE__) + ":" + std::to_string(__LINE__))
