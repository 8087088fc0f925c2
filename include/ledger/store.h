#pragma once

#include "banking/bank.h"
#include "common/types.h"
#include "ledger/transaction.h"
#include <memory>
#include <optional>
#include <vector>

namespace localnet {
namespace ledger {

using namespace localnet::common;

/**
 * Block record derived from a frozen bank
 */
struct LedgerEntry {
  Slot slot = 0;
  std::optional<Slot> parent_slot;
  Hash blockhash;
  Hash parent_blockhash;
  Hash state_root;
  int64_t unix_timestamp = 0;
  std::vector<Transaction> transactions;
  std::vector<banking::TransactionReceipt> receipts;

  static LedgerEntry from_bank(const banking::Bank &bank);
};

/**
 * Transaction found in the ledger
 */
struct TransactionRecord {
  Slot slot = 0;
  Transaction transaction;
  banking::TransactionReceipt receipt;
};

using FrozenBank = std::shared_ptr<const banking::Bank>;

/**
 * In-memory, gapless, append-only chain of frozen banks
 */
class LedgerStore {
public:
  LedgerStore();
  ~LedgerStore();

  LedgerStore(const LedgerStore &) = delete;
  LedgerStore &operator=(const LedgerStore &) = delete;

  /**
   * Append the next frozen bank
   * @return SEQUENCE unless the slot is max slot + 1 (0 when empty), after
   *         which the store is halted and refuses appends until reset();
   *         STATE for an open bank
   */
  common::Result<bool> append(FrozenBank bank);

  FrozenBank get(Slot slot) const;
  FrozenBank latest() const;
  std::optional<LedgerEntry> get_entry(Slot slot) const;
  std::optional<TransactionRecord> get_transaction(const Signature &signature) const;

  /// Slots in [start, end] that hold an entry
  std::vector<Slot> get_blocks(Slot start, Slot end) const;

  std::optional<Slot> latest_slot() const;
  size_t size() const;
  bool is_halted() const;
  uint64_t transaction_count() const;

  /// Drop every entry and clear the halt
  void reset();

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace ledger
} // namespace localnet
