/**
 * @file key_source.h
 * @brief Process-wide symmetric key for recovery data encryption
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "utils/error.h"
#include "utils/expected.h"

namespace talentvault::crypto {

using utils::Error;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

constexpr size_t kKeySize = 32;    // AES-256
constexpr size_t kKeyIdSize = 8;   // Truncated SHA-256 fingerprint
constexpr const char* kDefaultKeyEnvVar = "TALENTVAULT_RECOVERY_KEY";

/**
 * @brief 256-bit encryption key
 *
 * The key material is wiped on destruction. There is intentionally no
 * stream operator and no accessor returning a printable form; only the
 * key id (a one-way fingerprint) may appear in logs or records.
 */
class EncryptionKey {
 public:
  /**
   * @brief Wrap raw key bytes
   * @param bytes Exactly kKeySize bytes
   */
  static Expected<EncryptionKey, Error> FromBytes(std::string bytes);

  EncryptionKey(const EncryptionKey& other) = default;
  EncryptionKey& operator=(const EncryptionKey& other) = default;
  EncryptionKey(EncryptionKey&& other) noexcept = default;
  EncryptionKey& operator=(EncryptionKey&& other) noexcept = default;
  ~EncryptionKey();

  [[nodiscard]] const unsigned char* data() const { return reinterpret_cast<const unsigned char*>(bytes_.data()); }
  [[nodiscard]] size_t size() const { return bytes_.size(); }

  /**
   * @brief Hex fingerprint identifying this key (kKeyIdSize bytes)
   */
  [[nodiscard]] const std::string& KeyId() const { return key_id_; }

  /**
   * @brief Raw key id bytes as embedded in ciphertext envelopes
   */
  [[nodiscard]] const std::string& RawKeyId() const { return raw_key_id_; }

 private:
  EncryptionKey(std::string bytes, std::string raw_key_id, std::string key_id);

  std::string bytes_;
  std::string raw_key_id_;
  std::string key_id_;
};

/**
 * @brief Encryption key loaders
 *
 * There is no fallback key: a missing or malformed key is an error.
 */
class KeySource {
 public:
  /**
   * @brief Parse 64 hex characters
   */
  static Expected<EncryptionKey, Error> FromHex(std::string_view hex);

  /**
   * @brief Read hex key from an environment variable
   */
  static Expected<EncryptionKey, Error> FromEnvironment(const std::string& variable = kDefaultKeyEnvVar);

  /**
   * @brief Read hex key from a file (surrounding whitespace ignored)
   */
  static Expected<EncryptionKey, Error> FromFile(const std::string& path);

  /**
   * @brief Generate a random key
   */
  static Expected<EncryptionKey, Error> Generate();

  /**
   * @brief Hex encoding of a key, for provisioning tools only
   */
  static std::string ToHex(const EncryptionKey& key);

 private:
  KeySource() = default;
};

}  // namespace talentvault::crypto
