#pragma once

#include "common/crypto.h"
#include "common/types.h"
#include <cstdint>
#include <vector>

namespace localnet {
namespace ledger {

using namespace localnet::common;

/// Largest serialized transaction accepted (one network packet)
constexpr size_t PACKET_DATA_SIZE = 1232;

/**
 * @brief Account reference inside an uncompiled instruction
 */
struct AccountMeta {
  PublicKey pubkey;
  bool is_signer = false;
  bool is_writable = false;

  static AccountMeta writable(const PublicKey &key, bool signer) {
    return AccountMeta{key, signer, true};
  }
  static AccountMeta readonly(const PublicKey &key, bool signer) {
    return AccountMeta{key, signer, false};
  }
};

/**
 * @brief Instruction as written by a client, before compilation into a message
 */
struct Instruction {
  PublicKey program_id;
  std::vector<AccountMeta> accounts;
  std::vector<uint8_t> data;
};

/**
 * @brief Message header describing which account keys sign and which are read-only
 *
 * Keys are ordered: signed-writable, signed-readonly, unsigned-writable,
 * unsigned-readonly.
 */
struct MessageHeader {
  uint8_t num_required_signatures = 0;
  uint8_t num_readonly_signed_accounts = 0;
  uint8_t num_readonly_unsigned_accounts = 0;
};

/**
 * @brief Instruction with program and accounts referenced by key index
 */
struct CompiledInstruction {
  uint8_t program_id_index = 0;
  std::vector<uint8_t> accounts;
  std::vector<uint8_t> data;
};

/**
 * @brief Legacy transaction message
 */
struct Message {
  MessageHeader header;
  std::vector<PublicKey> account_keys;
  Hash recent_blockhash;
  std::vector<CompiledInstruction> instructions;

  /**
   * @brief Compile instructions into a message paid for by @p payer
   *
   * Keys are deduplicated, their signer and writable flags merged, and
   * the payer always lands at index 0.
   */
  static Message compile(const std::vector<Instruction> &instructions,
                         const PublicKey &payer, const Hash &recent_blockhash);

  /// Wire format: header, compact-u16 prefixed keys, blockhash, instructions
  std::vector<uint8_t> serialize() const;
  static Result<Message> deserialize(const std::vector<uint8_t> &data,
                                     size_t &offset);

  bool is_signer(size_t index) const;
  bool is_writable(size_t index) const;

  /// True when the key at @p index is invoked as a program by some instruction
  bool is_invoked(size_t index) const;

  const PublicKey &fee_payer() const { return account_keys.front(); }
  std::vector<PublicKey> program_ids() const;
};

/**
 * @brief Signed transaction: one signature per required signer, then the message
 */
struct Transaction {
  std::vector<Signature> signatures;
  Message message;

  Transaction() = default;
  explicit Transaction(Message msg);

  /**
   * @brief Compile, then sign with @p signers (the payer must be among them)
   */
  static Result<Transaction>
  create_signed(const std::vector<Instruction> &instructions,
                const Keypair &payer, const std::vector<const Keypair *> &signers,
                const Hash &recent_blockhash);

  /**
   * @brief Produce every required signature from the given keypairs
   * @return TRANSACTION error (SIGNATURE_FAILURE) if a required signer is missing
   */
  Result<bool> sign(const std::vector<const Keypair *> &signers);

  /**
   * @brief Structural validation (no signature check)
   * @return TRANSACTION error with SANITIZE_FAILURE, ACCOUNT_LOADED_TWICE or
   *         INVALID_ACCOUNT_INDEX on failure
   */
  Result<bool> sanitize() const;

  /// Check every signature against the serialized message
  bool verify_signatures() const;

  /// The first signature identifies the transaction
  const Signature &signature() const { return signatures.front(); }

  std::vector<uint8_t> serialize() const;
  static Result<Transaction> deserialize(const std::vector<uint8_t> &data);
};

} // namespace ledger
} // namespace localnet
