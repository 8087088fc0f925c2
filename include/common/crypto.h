#pragma once

#include "common/types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace localnet {
namespace common {

/**
 * SHA-256 and Ed25519 primitives backed by OpenSSL EVP.
 */
class CryptoUtils {
public:
  /**
   * Compute SHA256 hash of data
   * @throws std::runtime_error if OpenSSL fails to produce a digest
   */
  static Hash sha256(const std::vector<uint8_t> &data);

  /**
   * Compute SHA256 hash over the concatenation of several chunks
   * @throws std::runtime_error if OpenSSL fails to produce a digest
   */
  static Hash sha256_multi(const std::vector<std::vector<uint8_t>> &data_chunks);

  /**
   * Verify Ed25519 signature
   * @param message The message that was signed
   * @param signature The 64-byte signature
   * @param public_key The 32-byte public key
   * @return true if signature is valid
   */
  static bool verify_ed25519(const std::vector<uint8_t> &message,
                             const Signature &signature,
                             const PublicKey &public_key);

  /**
   * Sign message with Ed25519
   * @param private_key 32-byte seed
   * @return 64-byte signature, or an empty vector if the key is unusable
   */
  static Signature sign_ed25519(const std::vector<uint8_t> &message,
                                const std::vector<uint8_t> &private_key);

  /**
   * Derive the Ed25519 public key for a 32-byte seed
   * @return empty vector if the seed is unusable
   */
  static PublicKey derive_public_key(const std::vector<uint8_t> &private_key);

  /**
   * Fill @p size bytes from the OpenSSL CSPRNG
   */
  static std::vector<uint8_t> random_bytes(size_t size);
};

/**
 * Ed25519 keypair (seed + public key)
 */
class Keypair {
public:
  Keypair() = default;

  /// Fresh random keypair
  static Keypair generate();

  /// Deterministic keypair from a 32-byte seed
  static Result<Keypair> from_seed(const std::vector<uint8_t> &seed);

  /// Deterministic keypair derived from SHA-256(label); handy for tests and tooling
  static Keypair from_label(const std::string &label);

  const PublicKey &pubkey() const { return public_key_; }
  const std::vector<uint8_t> &seed() const { return seed_; }

  Signature sign(const std::vector<uint8_t> &message) const;

private:
  std::vector<uint8_t> seed_;
  PublicKey public_key_;
};

} // namespace common
} // namespace localnet
