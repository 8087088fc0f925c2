#include "ledger/store.h"
#include "common/encoding.h"
#include "common/logging.h"
#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace localnet {
namespace ledger {

/**
 * @brief Builds the block record of a frozen bank.
 */
LedgerEntry LedgerEntry::from_bank(const banking::Bank &bank) {
  LedgerEntry entry;
  entry.slot = bank.slot();
  entry.parent_slot = bank.parent_slot();
  entry.blockhash = bank.blockhash();
  entry.parent_blockhash = bank.parent_blockhash();
  entry.state_root = bank.state_root();
  entry.unix_timestamp = bank.unix_timestamp();
  entry.transactions = bank.transactions();
  entry.receipts = bank.receipts();
  return entry;
}

/**
 * @brief Private implementation (PIMPL) for the LedgerStore class.
 * @details Banks are indexed by slot; a signature index maps each recorded
 * transaction to its slot and position.
 */
class LedgerStore::Impl {
public:
  struct Location {
    Slot slot;
    size_t index;
  };

  mutable std::shared_mutex mutex_;
  std::vector<FrozenBank> banks_;
  std::unordered_map<Signature, Location> signature_index_;
  bool halted_ = false;
};

LedgerStore::LedgerStore() : impl_(std::make_unique<Impl>()) {}

LedgerStore::~LedgerStore() = default;

/**
 * @brief Appends a frozen bank at the next slot.
 * @param bank The frozen bank to record.
 * @return A Result indicating success or the reason for refusal.
 */
common::Result<bool> LedgerStore::append(FrozenBank bank) {
  if (!bank) {
    return common::Result<bool>(ErrorKind::INVALID_ARGUMENT, "null bank");
  }
  std::unique_lock<std::shared_mutex> lock(impl_->mutex_);
  if (impl_->halted_) {
    return common::Result<bool>(ErrorKind::SEQUENCE,
                                "ledger is halted after a sequence violation");
  }
  if (!bank->is_frozen()) {
    return common::Result<bool>(ErrorKind::STATE,
                                "bank for slot " + std::to_string(bank->slot()) +
                                    " is not frozen");
  }

  Slot expected = impl_->banks_.size();
  if (bank->slot() != expected) {
    impl_->halted_ = true;
    std::string message = "append of slot " + std::to_string(bank->slot()) +
                          " but next slot is " + std::to_string(expected);
    LOG_LEDGER_ERROR(message, "LEDGER_SEQUENCE_VIOLATION",
                     {{"slot", std::to_string(bank->slot())},
                      {"expected", std::to_string(expected)}});
    return common::Result<bool>(ErrorKind::SEQUENCE, message);
  }

  auto receipts = bank->receipts();
  for (size_t i = 0; i < receipts.size(); ++i) {
    impl_->signature_index_[receipts[i].signature] = Impl::Location{bank->slot(), i};
  }
  impl_->banks_.push_back(std::move(bank));

  LOG_DEBUG("Ledger appended slot ", expected, " (", receipts.size(), " transactions)");
  return common::Result<bool>(true);
}

/**
 * @brief Retrieves the frozen bank at a slot.
 * @return The bank, or nullptr if the slot has not been produced.
 */
FrozenBank LedgerStore::get(Slot slot) const {
  std::shared_lock<std::shared_mutex> lock(impl_->mutex_);
  if (slot >= impl_->banks_.size()) {
    return nullptr;
  }
  return impl_->banks_[slot];
}

/**
 * @brief Gets the most recently appended bank (nullptr when empty).
 */
FrozenBank LedgerStore::latest() const {
  std::shared_lock<std::shared_mutex> lock(impl_->mutex_);
  if (impl_->banks_.empty()) {
    return nullptr;
  }
  return impl_->banks_.back();
}

std::optional<LedgerEntry> LedgerStore::get_entry(Slot slot) const {
  auto bank = get(slot);
  if (!bank) {
    return std::nullopt;
  }
  return LedgerEntry::from_bank(*bank);
}

std::optional<TransactionRecord> LedgerStore::get_transaction(const Signature &signature) const {
  FrozenBank bank;
  size_t index = 0;
  {
    std::shared_lock<std::shared_mutex> lock(impl_->mutex_);
    auto it = impl_->signature_index_.find(signature);
    if (it == impl_->signature_index_.end()) {
      return std::nullopt;
    }
    bank = impl_->banks_[it->second.slot];
    index = it->second.index;
  }

  auto transactions = bank->transactions();
  auto receipts = bank->receipts();
  TransactionRecord record;
  record.slot = bank->slot();
  record.transaction = transactions[index];
  record.receipt = receipts[index];
  return record;
}

std::vector<Slot> LedgerStore::get_blocks(Slot start, Slot end) const {
  std::shared_lock<std::shared_mutex> lock(impl_->mutex_);
  std::vector<Slot> slots;
  if (impl_->banks_.empty() || start > end) {
    return slots;
  }
  Slot last = std::min<Slot>(end, impl_->banks_.size() - 1);
  for (Slot slot = start; slot <= last; ++slot) {
    slots.push_back(slot);
  }
  return slots;
}

std::optional<Slot> LedgerStore::latest_slot() const {
  std::shared_lock<std::shared_mutex> lock(impl_->mutex_);
  if (impl_->banks_.empty()) {
    return std::nullopt;
  }
  return impl_->banks_.size() - 1;
}

size_t LedgerStore::size() const {
  std::shared_lock<std::shared_mutex> lock(impl_->mutex_);
  return impl_->banks_.size();
}

bool LedgerStore::is_halted() const {
  std::shared_lock<std::shared_mutex> lock(impl_->mutex_);
  return impl_->halted_;
}

uint64_t LedgerStore::transaction_count() const {
  auto bank = latest();
  return bank ? bank->transaction_count() : 0;
}

void LedgerStore::reset() {
  std::unique_lock<std::shared_mutex> lock(impl_->mutex_);
  impl_->banks_.clear();
  impl_->signature_index_.clear();
  impl_->halted_ = false;
}

} // namespace ledger
} // namespace localnet
