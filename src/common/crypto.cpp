#include "common/crypto.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <stdexcept>

namespace localnet {
namespace common {

namespace {

Hash digest_chunks(const std::vector<const std::vector<uint8_t> *> &chunks) {
  Hash hash(SHA256_DIGEST_LENGTH);

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw std::runtime_error("Failed to create EVP context");
  }

  if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("Failed to initialize SHA-256 digest");
  }

  for (const auto *chunk : chunks) {
    if (!chunk->empty() &&
        EVP_DigestUpdate(ctx, chunk->data(), chunk->size()) != 1) {
      EVP_MD_CTX_free(ctx);
      throw std::runtime_error("Failed to update SHA-256 digest");
    }
  }

  unsigned int len = SHA256_DIGEST_LENGTH;
  if (EVP_DigestFinal_ex(ctx, hash.data(), &len) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("Failed to finalize SHA-256 digest");
  }

  EVP_MD_CTX_free(ctx);
  return hash;
}

} // namespace

Hash CryptoUtils::sha256(const std::vector<uint8_t> &data) {
  return digest_chunks({&data});
}

Hash CryptoUtils::sha256_multi(
    const std::vector<std::vector<uint8_t>> &data_chunks) {
  std::vector<const std::vector<uint8_t> *> chunks;
  chunks.reserve(data_chunks.size());
  for (const auto &chunk : data_chunks) {
    chunks.push_back(&chunk);
  }
  return digest_chunks(chunks);
}

bool CryptoUtils::verify_ed25519(const std::vector<uint8_t> &message,
                                 const Signature &signature,
                                 const PublicKey &public_key) {
  if (signature.size() != SIGNATURE_BYTES || public_key.size() != PUBKEY_BYTES) {
    return false;
  }

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    return false;
  }

  EVP_PKEY *pkey = EVP_PKEY_new_raw_public_key(
      EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size());
  if (!pkey) {
    EVP_MD_CTX_free(ctx);
    return false;
  }

  if (EVP_DigestVerifyInit(ctx, nullptr, nullptr, nullptr, pkey) != 1) {
    EVP_PKEY_free(pkey);
    EVP_MD_CTX_free(ctx);
    return false;
  }

  int result = EVP_DigestVerify(ctx, signature.data(), signature.size(),
                                message.data(), message.size());

  EVP_PKEY_free(pkey);
  EVP_MD_CTX_free(ctx);

  return result == 1;
}

Signature CryptoUtils::sign_ed25519(const std::vector<uint8_t> &message,
                                    const std::vector<uint8_t> &private_key) {
  if (private_key.size() != 32) {
    return Signature();
  }

  Signature signature(SIGNATURE_BYTES);

  EVP_PKEY *pkey = EVP_PKEY_new_raw_private_key(
      EVP_PKEY_ED25519, nullptr, private_key.data(), private_key.size());
  if (!pkey) {
    return Signature();
  }

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    EVP_PKEY_free(pkey);
    return Signature();
  }

  if (EVP_DigestSignInit(ctx, nullptr, nullptr, nullptr, pkey) != 1) {
    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);
    return Signature();
  }

  size_t sig_len = signature.size();
  if (EVP_DigestSign(ctx, signature.data(), &sig_len, message.data(),
                     message.size()) != 1) {
    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);
    return Signature();
  }

  EVP_MD_CTX_free(ctx);
  EVP_PKEY_free(pkey);

  return signature;
}

PublicKey
CryptoUtils::derive_public_key(const std::vector<uint8_t> &private_key) {
  if (private_key.size() != 32) {
    return PublicKey();
  }

  EVP_PKEY *pkey = EVP_PKEY_new_raw_private_key(
      EVP_PKEY_ED25519, nullptr, private_key.data(), private_key.size());
  if (!pkey) {
    return PublicKey();
  }

  PublicKey public_key(PUBKEY_BYTES);
  size_t len = public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey, public_key.data(), &len) != 1 ||
      len != PUBKEY_BYTES) {
    EVP_PKEY_free(pkey);
    return PublicKey();
  }

  EVP_PKEY_free(pkey);
  return public_key;
}

std::vector<uint8_t> CryptoUtils::random_bytes(size_t size) {
  std::vector<uint8_t> bytes(size);
  if (size > 0 && RAND_bytes(bytes.data(), static_cast<int>(size)) != 1) {
    throw std::runtime_error("OpenSSL RAND_bytes failed");
  }
  return bytes;
}

Keypair Keypair::generate() {
  // RAND output is always a valid Ed25519 seed
  auto result = from_seed(CryptoUtils::random_bytes(32));
  if (!result.is_ok()) {
    throw std::runtime_error("Keypair generation failed: " + result.error());
  }
  return std::move(result).value();
}

Result<Keypair> Keypair::from_seed(const std::vector<uint8_t> &seed) {
  if (seed.size() != 32) {
    return Result<Keypair>(ErrorKind::INVALID_ARGUMENT,
                           "Ed25519 seed must be 32 bytes, got " +
                               std::to_string(seed.size()));
  }

  Keypair keypair;
  keypair.seed_ = seed;
  keypair.public_key_ = CryptoUtils::derive_public_key(seed);
  if (keypair.public_key_.empty()) {
    return Result<Keypair>(ErrorKind::GENERIC,
                           "OpenSSL rejected the Ed25519 seed");
  }
  return Result<Keypair>(std::move(keypair));
}

Keypair Keypair::from_label(const std::string &label) {
  auto result = from_seed(
      CryptoUtils::sha256(std::vector<uint8_t>(label.begin(), label.end())));
  if (!result.is_ok()) {
    throw std::runtime_error("Keypair derivation failed: " + result.error());
  }
  return std::move(result).value();
}

Signature Keypair::sign(const std::vector<uint8_t> &message) const {
  return CryptoUtils::sign_ed25519(message, seed_);
}

} // namespace common
} // namespace localnet
