/**
 * @file integrity_codec.cpp
 * @brief Integrity codec implementation (OpenSSL EVP)
 */

#include "crypto/integrity_codec.h"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <memory>

#include "utils/string_utils.h"

namespace talentvault::crypto {

namespace {

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

const unsigned char* AsBytes(std::string_view data) {
  return reinterpret_cast<const unsigned char*>(data.data());
}

unsigned char* AsBytes(std::string& data) {
  return reinterpret_cast<unsigned char*>(data.data());
}

Error EncryptionFailure(const std::string& step) {
  return MakeError(utils::ErrorCode::kCryptoEncryptionFailed, "AES-256-GCM operation failed", step);
}

}  // namespace

Expected<std::string, Error> IntegrityCodec::CanonicalSerialize(const nlohmann::json& payload) {
  try {
    return payload.dump();
  } catch (const nlohmann::json::type_error& e) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kInvalidArgument, "Payload is not serializable", e.what()));
  }
}

Expected<nlohmann::json, Error> IntegrityCodec::ParsePayload(std::string_view serialized) {
  try {
    return nlohmann::json::parse(serialized.begin(), serialized.end());
  } catch (const nlohmann::json::parse_error& e) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kStorageInvalidFormat, "Payload is not valid JSON", e.what()));
  }
}

Expected<std::string, Error> IntegrityCodec::Checksum(const nlohmann::json& payload) {
  auto serialized = CanonicalSerialize(payload);
  if (!serialized) {
    return MakeUnexpected(serialized.error());
  }
  return ChecksumBytes(*serialized);
}

Expected<std::string, Error> IntegrityCodec::ChecksumBytes(std::string_view data) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;
  if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, EVP_sha256(), nullptr) != 1) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kCryptoHashFailed, "SHA-256 computation failed"));
  }
  return utils::ToHex(std::string_view(reinterpret_cast<const char*>(digest.data()), digest_len));
}

Expected<std::string, Error> IntegrityCodec::Encrypt(std::string_view plaintext, const EncryptionKey& key) {
  std::string envelope(kEnvelopeHeaderSize + plaintext.size(), '\0');
  envelope.replace(0, kEnvelopeMagicSize, kEnvelopeMagic);
  envelope.replace(kEnvelopeMagicSize, kKeyIdSize, key.RawKeyId());

  unsigned char* nonce = AsBytes(envelope) + kEnvelopeMagicSize + kKeyIdSize;
  unsigned char* tag = nonce + kNonceSize;
  unsigned char* body = tag + kTagSize;

  if (RAND_bytes(nonce, static_cast<int>(kNonceSize)) != 1) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kCryptoRandomFailed, "Failed to generate nonce"));
  }

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    return MakeUnexpected(EncryptionFailure("context allocation"));
  }
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
    return MakeUnexpected(EncryptionFailure("init"));
  }

  int len = 0;
  // Authenticated header: magic + key id
  if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, AsBytes(envelope), static_cast<int>(kEnvelopeMagicSize + kKeyIdSize)) !=
      1) {
    return MakeUnexpected(EncryptionFailure("aad"));
  }
  len = 0;
  if (!plaintext.empty() &&
      EVP_EncryptUpdate(ctx.get(), body, &len, AsBytes(plaintext), static_cast<int>(plaintext.size())) != 1) {
    return MakeUnexpected(EncryptionFailure("update"));
  }
  int final_len = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), body + len, &final_len) != 1) {
    return MakeUnexpected(EncryptionFailure("final"));
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize), tag) != 1) {
    return MakeUnexpected(EncryptionFailure("tag"));
  }
  return envelope;
}

Expected<std::string, Error> IntegrityCodec::Decrypt(std::string_view envelope, const EncryptionKey& key) {
  if (envelope.size() < kEnvelopeHeaderSize) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kRecoveryDecryptionError, "Ciphertext envelope is truncated"));
  }
  if (envelope.substr(0, kEnvelopeMagicSize) != kEnvelopeMagic) {
    return MakeUnexpected(
        MakeError(utils::ErrorCode::kRecoveryDecryptionError, "Unknown ciphertext envelope format"));
  }
  if (envelope.substr(kEnvelopeMagicSize, kKeyIdSize) != key.RawKeyId()) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kRecoveryDecryptionError,
                                    "Ciphertext was produced with a different encryption key",
                                    "key_id=" + key.KeyId()));
  }

  const unsigned char* nonce = AsBytes(envelope) + kEnvelopeMagicSize + kKeyIdSize;
  const unsigned char* tag = nonce + kNonceSize;
  const unsigned char* body = tag + kTagSize;
  size_t body_size = envelope.size() - kEnvelopeHeaderSize;

  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    return MakeUnexpected(EncryptionFailure("context allocation"));
  }
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce) != 1) {
    return MakeUnexpected(EncryptionFailure("init"));
  }

  int len = 0;
  if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, AsBytes(envelope), static_cast<int>(kEnvelopeMagicSize + kKeyIdSize)) !=
      1) {
    return MakeUnexpected(EncryptionFailure("aad"));
  }
  len = 0;

  std::string plaintext(body_size, '\0');
  if (body_size > 0 &&
      EVP_DecryptUpdate(ctx.get(), AsBytes(plaintext), &len, body, static_cast<int>(body_size)) != 1) {
    return MakeUnexpected(EncryptionFailure("update"));
  }

  // OpenSSL takes a non-const pointer for SET_TAG but only reads from it
  std::array<unsigned char, kTagSize> expected_tag{};
  std::copy(tag, tag + kTagSize, expected_tag.begin());
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize), expected_tag.data()) != 1) {
    return MakeUnexpected(EncryptionFailure("tag"));
  }

  int final_len = 0;
  if (EVP_DecryptFinal_ex(ctx.get(), AsBytes(plaintext) + len, &final_len) <= 0) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kCryptoAuthenticationFailed,
                                    "Ciphertext failed authentication", "key_id=" + key.KeyId()));
  }
  return plaintext;
}

std::string Base64Encode(std::string_view data) {
  if (data.empty()) {
    return {};
  }
  std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
  int written = EVP_EncodeBlock(AsBytes(encoded), AsBytes(data), static_cast<int>(data.size()));
  encoded.resize(static_cast<size_t>(written));
  return encoded;
}

Expected<std::string, Error> Base64Decode(std::string_view encoded) {
  if (encoded.empty()) {
    return std::string();
  }
  if (encoded.size() % 4 != 0) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kInvalidArgument, "Base64 input length is not a multiple of 4"));
  }

  std::string decoded(3 * (encoded.size() / 4) + 1, '\0');
  int written = EVP_DecodeBlock(AsBytes(decoded), AsBytes(encoded), static_cast<int>(encoded.size()));
  if (written < 0) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kInvalidArgument, "Invalid base64 input"));
  }

  // EVP_DecodeBlock counts padding as zero bytes
  size_t padding = 0;
  if (encoded.back() == '=') {
    ++padding;
    if (encoded[encoded.size() - 2] == '=') {
      ++padding;
    }
  }
  decoded.resize(static_cast<size_t>(written) - padding);
  return decoded;
}

}  // namespace talentvault::crypto
