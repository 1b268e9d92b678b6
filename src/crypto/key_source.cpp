/**
 * @file key_source.cpp
 * @brief Encryption key loading implementation
 */

#include "crypto/key_source.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "utils/string_utils.h"

namespace talentvault::crypto {

namespace {

constexpr const char* kKeyIdDomain = "talentvault.recovery.key-id.v1";

Expected<std::string, Error> Fingerprint(const std::string& key_bytes) {
  std::string input = kKeyIdDomain;
  input += key_bytes;

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;
  int result = EVP_Digest(input.data(), input.size(), digest.data(), &digest_len, EVP_sha256(), nullptr);
  OPENSSL_cleanse(input.data(), input.size());
  if (result != 1 || digest_len < kKeyIdSize) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kCryptoHashFailed, "Failed to fingerprint encryption key"));
  }
  return std::string(reinterpret_cast<const char*>(digest.data()), kKeyIdSize);
}

}  // namespace

EncryptionKey::EncryptionKey(std::string bytes, std::string raw_key_id, std::string key_id)
    : bytes_(std::move(bytes)), raw_key_id_(std::move(raw_key_id)), key_id_(std::move(key_id)) {}

EncryptionKey::~EncryptionKey() {
  if (!bytes_.empty()) {
    OPENSSL_cleanse(bytes_.data(), bytes_.size());
  }
}

Expected<EncryptionKey, Error> EncryptionKey::FromBytes(std::string bytes) {
  if (bytes.size() != kKeySize) {
    size_t actual = bytes.size();
    OPENSSL_cleanse(bytes.data(), bytes.size());
    return MakeUnexpected(MakeError(utils::ErrorCode::kCryptoInvalidKey,
                                    "Encryption key must be " + std::to_string(kKeySize) + " bytes, got " +
                                        std::to_string(actual)));
  }

  auto raw_id = Fingerprint(bytes);
  if (!raw_id) {
    OPENSSL_cleanse(bytes.data(), bytes.size());
    return MakeUnexpected(raw_id.error());
  }
  std::string key_id = utils::ToHex(*raw_id);
  return EncryptionKey(std::move(bytes), std::move(*raw_id), std::move(key_id));
}

Expected<EncryptionKey, Error> KeySource::FromHex(std::string_view hex) {
  std::string trimmed = utils::Trim(hex);
  if (trimmed.size() != kKeySize * 2) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kCryptoInvalidKey,
                                    "Encryption key must be " + std::to_string(kKeySize * 2) + " hex characters"));
  }

  auto bytes = utils::FromHex(trimmed);
  OPENSSL_cleanse(trimmed.data(), trimmed.size());
  if (!bytes) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kCryptoInvalidKey, "Encryption key is not valid hex"));
  }
  return EncryptionKey::FromBytes(std::move(*bytes));
}

Expected<EncryptionKey, Error> KeySource::FromEnvironment(const std::string& variable) {
  const char* value = std::getenv(variable.c_str());  // NOLINT(concurrency-mt-unsafe)
  if (value == nullptr || *value == '\0') {
    return MakeUnexpected(
        MakeError(utils::ErrorCode::kCryptoKeyNotFound, "Encryption key environment variable is not set", variable));
  }
  auto key = FromHex(value);
  if (!key) {
    return MakeUnexpected(MakeError(key.error().code(), key.error().message(), variable));
  }
  return key;
}

Expected<EncryptionKey, Error> KeySource::FromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kCryptoKeyNotFound, "Cannot open encryption key file", path));
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  std::string content = buffer.str();
  auto key = FromHex(content);
  OPENSSL_cleanse(content.data(), content.size());
  if (!key) {
    return MakeUnexpected(MakeError(key.error().code(), key.error().message(), path));
  }
  return key;
}

Expected<EncryptionKey, Error> KeySource::Generate() {
  std::string bytes(kKeySize, '\0');
  if (RAND_bytes(reinterpret_cast<unsigned char*>(bytes.data()), static_cast<int>(bytes.size())) != 1) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kCryptoRandomFailed, "Failed to generate encryption key"));
  }
  return EncryptionKey::FromBytes(std::move(bytes));
}

std::string KeySource::ToHex(const EncryptionKey& key) {
  return utils::ToHex(std::string_view(reinterpret_cast<const char*>(key.data()), key.size()));
}

}  // namespace talentvault::crypto
