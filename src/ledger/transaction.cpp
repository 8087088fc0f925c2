/**
 * @file transaction.cpp
 * @brief Legacy message compilation, wire encoding and signature handling
 */
#include "ledger/transaction.h"
#include "svm/transaction_error.h"
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace localnet {
namespace ledger {

namespace {

void write_compact_u16(std::vector<uint8_t> &out, size_t value) {
  uint16_t rem = static_cast<uint16_t>(value);
  while (true) {
    uint8_t elem = rem & 0x7f;
    rem >>= 7;
    if (rem == 0) {
      out.push_back(elem);
      break;
    }
    out.push_back(elem | 0x80);
  }
}

bool read_compact_u16(const std::vector<uint8_t> &data, size_t &offset,
                      size_t &value) {
  value = 0;
  for (int i = 0; i < 3; ++i) {
    if (offset >= data.size()) {
      return false;
    }
    uint8_t byte = data[offset++];
    value |= static_cast<size_t>(byte & 0x7f) << (i * 7);
    if ((byte & 0x80) == 0) {
      return value <= 0xffff;
    }
  }
  return false;
}

bool read_bytes(const std::vector<uint8_t> &data, size_t &offset, size_t len,
                std::vector<uint8_t> &out) {
  if (offset + len > data.size()) {
    return false;
  }
  out.assign(data.begin() + offset, data.begin() + offset + len);
  offset += len;
  return true;
}

common::Error sanitize_error(svm::TransactionError error,
                             const std::string &detail) {
  return svm::make_transaction_error(error, detail);
}

struct KeyFlags {
  bool is_signer = false;
  bool is_writable = false;
};

} // namespace

// Message

Message Message::compile(const std::vector<Instruction> &instructions,
                         const PublicKey &payer,
                         const Hash &recent_blockhash) {
  std::vector<PublicKey> order;
  std::unordered_map<PublicKey, KeyFlags> flags;

  auto add_key = [&](const PublicKey &key, bool signer, bool writable) {
    auto it = flags.find(key);
    if (it == flags.end()) {
      order.push_back(key);
      flags[key] = KeyFlags{signer, writable};
    } else {
      it->second.is_signer = it->second.is_signer || signer;
      it->second.is_writable = it->second.is_writable || writable;
    }
  };

  add_key(payer, true, true);
  for (const auto &ix : instructions) {
    for (const auto &meta : ix.accounts) {
      add_key(meta.pubkey, meta.is_signer, meta.is_writable);
    }
    add_key(ix.program_id, false, false);
  }

  Message message;
  message.recent_blockhash = recent_blockhash;

  // stable_partition keeps first-seen order within each group
  auto group = [&](const PublicKey &key) {
    const auto &f = flags[key];
    if (f.is_signer) {
      return f.is_writable ? 0 : 1;
    }
    return f.is_writable ? 2 : 3;
  };
  std::stable_sort(order.begin(), order.end(),
                   [&](const PublicKey &a, const PublicKey &b) {
                     return group(a) < group(b);
                   });

  for (const auto &key : order) {
    const auto &f = flags[key];
    if (f.is_signer) {
      message.header.num_required_signatures++;
      if (!f.is_writable) {
        message.header.num_readonly_signed_accounts++;
      }
    } else if (!f.is_writable) {
      message.header.num_readonly_unsigned_accounts++;
    }
  }
  message.account_keys = order;

  auto index_of = [&](const PublicKey &key) {
    auto it = std::find(order.begin(), order.end(), key);
    return static_cast<uint8_t>(std::distance(order.begin(), it));
  };

  for (const auto &ix : instructions) {
    CompiledInstruction compiled;
    compiled.program_id_index = index_of(ix.program_id);
    for (const auto &meta : ix.accounts) {
      compiled.accounts.push_back(index_of(meta.pubkey));
    }
    compiled.data = ix.data;
    message.instructions.push_back(std::move(compiled));
  }

  return message;
}

std::vector<uint8_t> Message::serialize() const {
  std::vector<uint8_t> out;
  out.push_back(header.num_required_signatures);
  out.push_back(header.num_readonly_signed_accounts);
  out.push_back(header.num_readonly_unsigned_accounts);

  write_compact_u16(out, account_keys.size());
  for (const auto &key : account_keys) {
    out.insert(out.end(), key.begin(), key.end());
  }
  out.insert(out.end(), recent_blockhash.begin(), recent_blockhash.end());

  write_compact_u16(out, instructions.size());
  for (const auto &ix : instructions) {
    out.push_back(ix.program_id_index);
    write_compact_u16(out, ix.accounts.size());
    out.insert(out.end(), ix.accounts.begin(), ix.accounts.end());
    write_compact_u16(out, ix.data.size());
    out.insert(out.end(), ix.data.begin(), ix.data.end());
  }
  return out;
}

Result<Message> Message::deserialize(const std::vector<uint8_t> &data,
                                     size_t &offset) {
  auto fail = [](const std::string &what) {
    return Result<Message>(
        sanitize_error(svm::TransactionError::SANITIZE_FAILURE, what));
  };

  Message message;
  if (offset + 3 > data.size()) {
    return fail("truncated message header");
  }
  message.header.num_required_signatures = data[offset++];
  message.header.num_readonly_signed_accounts = data[offset++];
  message.header.num_readonly_unsigned_accounts = data[offset++];

  size_t key_count = 0;
  if (!read_compact_u16(data, offset, key_count)) {
    return fail("bad account key count");
  }
  for (size_t i = 0; i < key_count; ++i) {
    PublicKey key;
    if (!read_bytes(data, offset, PUBKEY_BYTES, key)) {
      return fail("truncated account keys");
    }
    message.account_keys.push_back(std::move(key));
  }

  if (!read_bytes(data, offset, HASH_BYTES, message.recent_blockhash)) {
    return fail("truncated recent blockhash");
  }

  size_t ix_count = 0;
  if (!read_compact_u16(data, offset, ix_count)) {
    return fail("bad instruction count");
  }
  for (size_t i = 0; i < ix_count; ++i) {
    CompiledInstruction ix;
    if (offset >= data.size()) {
      return fail("truncated instruction");
    }
    ix.program_id_index = data[offset++];

    size_t len = 0;
    if (!read_compact_u16(data, offset, len) ||
        !read_bytes(data, offset, len, ix.accounts)) {
      return fail("truncated instruction accounts");
    }
    if (!read_compact_u16(data, offset, len) ||
        !read_bytes(data, offset, len, ix.data)) {
      return fail("truncated instruction data");
    }
    message.instructions.push_back(std::move(ix));
  }

  return Result<Message>(std::move(message));
}

bool Message::is_signer(size_t index) const {
  return index < header.num_required_signatures;
}

bool Message::is_writable(size_t index) const {
  if (index >= account_keys.size()) {
    return false;
  }
  size_t num_signed = header.num_required_signatures;
  if (index < num_signed) {
    return index < num_signed - header.num_readonly_signed_accounts;
  }
  size_t num_unsigned = account_keys.size() - num_signed;
  return index - num_signed < num_unsigned - header.num_readonly_unsigned_accounts;
}

bool Message::is_invoked(size_t index) const {
  for (const auto &ix : instructions) {
    if (ix.program_id_index == index) {
      return true;
    }
  }
  return false;
}

std::vector<PublicKey> Message::program_ids() const {
  std::vector<PublicKey> ids;
  for (const auto &ix : instructions) {
    if (ix.program_id_index < account_keys.size()) {
      const auto &id = account_keys[ix.program_id_index];
      if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
        ids.push_back(id);
      }
    }
  }
  return ids;
}

// Transaction

Transaction::Transaction(Message msg) : message(std::move(msg)) {}

Result<Transaction>
Transaction::create_signed(const std::vector<Instruction> &instructions,
                           const Keypair &payer,
                           const std::vector<const Keypair *> &signers,
                           const Hash &recent_blockhash) {
  Transaction tx(Message::compile(instructions, payer.pubkey(), recent_blockhash));

  std::vector<const Keypair *> all_signers = signers;
  all_signers.push_back(&payer);

  auto sign_result = tx.sign(all_signers);
  if (!sign_result.is_ok()) {
    return Result<Transaction>(sign_result.error_info());
  }
  return Result<Transaction>(std::move(tx));
}

Result<bool> Transaction::sign(const std::vector<const Keypair *> &signers) {
  auto payload = message.serialize();
  size_t required = message.header.num_required_signatures;
  if (required > message.account_keys.size()) {
    return Result<bool>(sanitize_error(svm::TransactionError::SANITIZE_FAILURE,
                                       "more signers than account keys"));
  }

  signatures.assign(required, Signature(SIGNATURE_BYTES, 0));
  for (size_t i = 0; i < required; ++i) {
    const Keypair *match = nullptr;
    for (const auto *kp : signers) {
      if (kp && kp->pubkey() == message.account_keys[i]) {
        match = kp;
        break;
      }
    }
    if (!match) {
      return Result<bool>(
          sanitize_error(svm::TransactionError::SIGNATURE_FAILURE,
                         "no keypair for required signer " + std::to_string(i)));
    }
    signatures[i] = match->sign(payload);
    if (signatures[i].size() != SIGNATURE_BYTES) {
      return Result<bool>(sanitize_error(
          svm::TransactionError::SIGNATURE_FAILURE, "signing failed"));
    }
  }
  return Result<bool>(true);
}

Result<bool> Transaction::sanitize() const {
  using svm::TransactionError;
  const auto &hdr = message.header;
  const size_t key_count = message.account_keys.size();

  if (hdr.num_required_signatures == 0) {
    return Result<bool>(sanitize_error(TransactionError::SANITIZE_FAILURE,
                                       "transaction has no fee payer signature"));
  }
  if (signatures.size() != hdr.num_required_signatures) {
    return Result<bool>(sanitize_error(
        TransactionError::SANITIZE_FAILURE,
        "expected " + std::to_string(hdr.num_required_signatures) +
            " signatures, got " + std::to_string(signatures.size())));
  }
  if (static_cast<size_t>(hdr.num_required_signatures) +
          hdr.num_readonly_unsigned_accounts > key_count) {
    return Result<bool>(sanitize_error(TransactionError::SANITIZE_FAILURE,
                                       "header references more keys than present"));
  }
  if (hdr.num_readonly_signed_accounts >= hdr.num_required_signatures) {
    return Result<bool>(sanitize_error(TransactionError::SANITIZE_FAILURE,
                                       "fee payer must be writable"));
  }
  for (const auto &sig : signatures) {
    if (sig.size() != SIGNATURE_BYTES) {
      return Result<bool>(sanitize_error(TransactionError::SANITIZE_FAILURE,
                                         "malformed signature"));
    }
  }
  if (message.recent_blockhash.size() != HASH_BYTES) {
    return Result<bool>(sanitize_error(TransactionError::SANITIZE_FAILURE,
                                       "malformed recent blockhash"));
  }
  if (message.instructions.empty()) {
    return Result<bool>(sanitize_error(TransactionError::SANITIZE_FAILURE,
                                       "transaction has no instructions"));
  }

  std::unordered_set<PublicKey> seen;
  for (const auto &key : message.account_keys) {
    if (key.size() != PUBKEY_BYTES) {
      return Result<bool>(sanitize_error(TransactionError::SANITIZE_FAILURE,
                                         "malformed account key"));
    }
    if (!seen.insert(key).second) {
      return Result<bool>(sanitize_error(TransactionError::ACCOUNT_LOADED_TWICE, ""));
    }
  }

  for (size_t i = 0; i < message.instructions.size(); ++i) {
    const auto &ix = message.instructions[i];
    // Index 0 is the fee payer, which can never be a program
    if (ix.program_id_index == 0 || ix.program_id_index >= key_count) {
      return Result<bool>(sanitize_error(
          TransactionError::INVALID_ACCOUNT_INDEX,
          "instruction " + std::to_string(i) + " program index"));
    }
    for (uint8_t account_index : ix.accounts) {
      if (account_index >= key_count) {
        return Result<bool>(sanitize_error(
            TransactionError::INVALID_ACCOUNT_INDEX,
            "instruction " + std::to_string(i) + " account index"));
      }
    }
  }

  if (serialize().size() > PACKET_DATA_SIZE) {
    return Result<bool>(sanitize_error(TransactionError::SANITIZE_FAILURE,
                                       "transaction exceeds packet size"));
  }

  return Result<bool>(true);
}

bool Transaction::verify_signatures() const {
  if (signatures.size() > message.account_keys.size()) {
    return false;
  }
  auto payload = message.serialize();
  for (size_t i = 0; i < signatures.size(); ++i) {
    if (!CryptoUtils::verify_ed25519(payload, signatures[i],
                                     message.account_keys[i])) {
      return false;
    }
  }
  return true;
}

std::vector<uint8_t> Transaction::serialize() const {
  std::vector<uint8_t> out;
  write_compact_u16(out, signatures.size());
  for (const auto &sig : signatures) {
    out.insert(out.end(), sig.begin(), sig.end());
  }
  auto body = message.serialize();
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

Result<Transaction> Transaction::deserialize(const std::vector<uint8_t> &data) {
  size_t offset = 0;
  size_t sig_count = 0;
  if (!read_compact_u16(data, offset, sig_count)) {
    return Result<Transaction>(sanitize_error(
        svm::TransactionError::SANITIZE_FAILURE, "bad signature count"));
  }

  Transaction tx;
  for (size_t i = 0; i < sig_count; ++i) {
    Signature sig;
    if (!read_bytes(data, offset, SIGNATURE_BYTES, sig)) {
      return Result<Transaction>(sanitize_error(
          svm::TransactionError::SANITIZE_FAILURE, "truncated signatures"));
    }
    tx.signatures.push_back(std::move(sig));
  }

  auto message = Message::deserialize(data, offset);
  if (!message.is_ok()) {
    return Result<Transaction>(message.error_info());
  }
  if (offset != data.size()) {
    return Result<Transaction>(sanitize_error(
        svm::TransactionError::SANITIZE_FAILURE, "trailing bytes"));
  }
  tx.message = std::move(message).value();
  return Result<Transaction>(std::move(tx));
}

} // namespace ledger
} // namespace localnet
