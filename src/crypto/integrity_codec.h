/**
 * @file integrity_codec.h
 * @brief Canonical serialization, checksums and authenticated encryption of recovery payloads
 *
 * Ciphertext envelope layout (binary):
 *
 *   | magic "TVE1" (4) | key id (8) | nonce (12) | tag (16) | ciphertext (n) |
 *
 * Magic and key id are authenticated as additional data. The envelope is
 * stored base64-encoded inside JSON records.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>

#include "crypto/key_source.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace talentvault::crypto {

constexpr const char* kEnvelopeMagic = "TVE1";
constexpr size_t kEnvelopeMagicSize = 4;
constexpr size_t kNonceSize = 12;
constexpr size_t kTagSize = 16;
constexpr size_t kEnvelopeHeaderSize = kEnvelopeMagicSize + kKeyIdSize + kNonceSize + kTagSize;

/**
 * @brief Integrity codec bound to the process-wide encryption key
 *
 * Stateless apart from the key; safe to share between threads.
 */
class IntegrityCodec {
 public:
  explicit IntegrityCodec(EncryptionKey key) : key_(std::move(key)) {}

  /**
   * @brief Deterministic serialization of a JSON document
   *
   * Object keys are emitted in sorted order without whitespace, so
   * structurally equal documents produce identical bytes.
   *
   * @return Serialized text, or kInvalidArgument if a string is not valid UTF-8
   */
  static Expected<std::string, Error> CanonicalSerialize(const nlohmann::json& payload);

  /**
   * @brief Parse text produced by CanonicalSerialize()
   */
  static Expected<nlohmann::json, Error> ParsePayload(std::string_view serialized);

  /**
   * @brief Lowercase hex SHA-256 of the canonical serialization
   */
  static Expected<std::string, Error> Checksum(const nlohmann::json& payload);

  /**
   * @brief Lowercase hex SHA-256 of raw bytes
   */
  static Expected<std::string, Error> ChecksumBytes(std::string_view data);

  /**
   * @brief Encrypt with an explicit key (fresh random nonce per call)
   * @return Binary envelope
   */
  static Expected<std::string, Error> Encrypt(std::string_view plaintext, const EncryptionKey& key);

  /**
   * @brief Decrypt and authenticate an envelope
   *
   * Errors:
   * - kRecoveryDecryptionError: truncated envelope, unknown magic, or the
   *   envelope was produced with a different key
   * - kCryptoAuthenticationFailed: key matches but the tag does not verify
   *   (ciphertext, nonce or tag were modified)
   */
  static Expected<std::string, Error> Decrypt(std::string_view envelope, const EncryptionKey& key);

  Expected<std::string, Error> Encrypt(std::string_view plaintext) const { return Encrypt(plaintext, key_); }
  Expected<std::string, Error> Decrypt(std::string_view envelope) const { return Decrypt(envelope, key_); }

  /**
   * @brief Hex fingerprint of the bound key
   */
  [[nodiscard]] const std::string& KeyId() const { return key_.KeyId(); }

 private:
  EncryptionKey key_;
};

/**
 * @brief Standard base64 with padding
 */
std::string Base64Encode(std::string_view data);

/**
 * @brief Decode standard base64
 * @return Bytes, or kInvalidArgument on malformed input
 */
Expected<std::string, Error> Base64Decode(std::string_view encoded);

}  // namespace talentvault::crypto
