#include "validator/core.h"
#include "common/encoding.h"
#include "common/logging.h"
#include "genesis/builder.h"

namespace localnet {
namespace validator {

ValidatorCore::ValidatorCore(genesis::GenesisConfig genesis_config,
                             std::shared_ptr<const svm::ExecutionEngine> engine)
    : genesis_config_(std::move(genesis_config)), engine_(std::move(engine)) {}

ValidatorCore::~ValidatorCore() = default;

Result<bool> ValidatorCore::boot() {
  std::lock_guard<std::mutex> lock(mutation_mutex_);
  return boot_locked();
}

Result<bool> ValidatorCore::boot_locked() {
  auto genesis = genesis::GenesisBuilder::build(genesis_config_, engine_);
  if (!genesis.is_ok()) {
    return Result<bool>(genesis.error_info());
  }

  auto frozen = genesis.value()->freeze();
  auto appended = ledger_.append(frozen);
  if (!appended.is_ok()) {
    return appended;
  }

  auto child = frozen->child_at(1);
  if (!child.is_ok()) {
    return Result<bool>(child.error_info());
  }
  queue_.publish_window(child.value()->blockhash_queue(), child.value()->status_cache(),
                        child.value()->slot());
  set_open_bank(child.value());

  LOG_INFO("Booted at slot 0, genesis hash ", encode_base58(frozen->context().genesis_hash),
           ", slot 0 blockhash ", encode_base58(frozen->blockhash()));
  return Result<bool>(true);
}

Result<Slot> ValidatorCore::produce_slot() {
  // notify_mutex_ before mutation_mutex_, never the reverse: subscribers run
  // under notify_mutex_ alone and may take mutation_mutex_ themselves
  std::lock_guard<std::mutex> notify_lock(notify_mutex_);
  ledger::LedgerEntry entry;
  {
    std::lock_guard<std::mutex> lock(mutation_mutex_);
    auto produced = produce_locked(true);
    if (!produced.is_ok()) {
      return Result<Slot>(produced.error_info());
    }
    entry = std::move(produced).value();
  }
  notify({entry});
  return Result<Slot>(entry.slot);
}

Result<ledger::LedgerEntry> ValidatorCore::produce_locked(bool drain) {
  auto bank = open_bank();
  if (!bank) {
    return Result<ledger::LedgerEntry>(ErrorKind::STATE, "validator is not booted");
  }
  if (ledger_.is_halted()) {
    return Result<ledger::LedgerEntry>(ErrorKind::SEQUENCE,
                                       "ledger is halted after a sequence violation");
  }

  if (drain) {
    for (const auto &transaction : queue_.drain()) {
      auto applied = bank->apply(transaction);
      if (!applied.is_ok()) {
        ++transactions_dropped_;
        record_error(svm::transaction_error_of(applied));
        LOG_DEBUG("Dropped queued transaction ", encode_base58(transaction.signature()),
                  ": ", applied.error_info().to_string());
        continue;
      }
      ++transactions_applied_;
      if (!applied.value().is_success()) {
        ++transactions_failed_;
        record_error(applied.value().status);
      }
    }
  }

  banking::BusyScope busy(queue_);
  auto frozen = bank->freeze();
  auto appended = ledger_.append(frozen);
  if (!appended.is_ok()) {
    LOG_VALIDATOR_ERROR("Ledger refused slot " + std::to_string(frozen->slot()) + ": " +
                            appended.error(),
                        "VALIDATOR_APPEND_FAILED");
    return Result<ledger::LedgerEntry>(appended.error_info());
  }

  auto child = frozen->child_at(frozen->slot() + 1);
  if (!child.is_ok()) {
    return Result<ledger::LedgerEntry>(child.error_info());
  }
  queue_.publish_window(child.value()->blockhash_queue(), child.value()->status_cache(),
                        child.value()->slot());
  set_open_bank(child.value());
  ++slots_produced_;

  return Result<ledger::LedgerEntry>(ledger::LedgerEntry::from_bank(*frozen));
}

Result<Slot> ValidatorCore::warp_to_slot(Slot target) {
  std::lock_guard<std::mutex> notify_lock(notify_mutex_);
  std::vector<ledger::LedgerEntry> entries;
  Result<Slot> outcome(ErrorKind::STATE, "warp did not run");
  {
    std::lock_guard<std::mutex> lock(mutation_mutex_);
    auto latest = ledger_.latest_slot();
    if (!latest) {
      return Result<Slot>(ErrorKind::STATE, "validator is not booted");
    }
    if (target <= *latest) {
      return Result<Slot>(ErrorKind::STATE, "warp target " + std::to_string(target) +
                                                " is not after latest slot " +
                                                std::to_string(*latest));
    }

    LOG_INFO("Warping from slot ", *latest, " to ", target);
    outcome = Result<Slot>(target);
    for (Slot slot = *latest + 1; slot <= target; ++slot) {
      auto produced = produce_locked(slot == target);
      if (!produced.is_ok()) {
        outcome = Result<Slot>(produced.error_info());
        break;
      }
      entries.push_back(std::move(produced).value());
    }
  }
  notify(entries);
  return outcome;
}

Result<bool> ValidatorCore::reset() {
  std::lock_guard<std::mutex> lock(mutation_mutex_);
  queue_.clear();
  ledger_.reset();
  {
    std::lock_guard<std::mutex> metrics_lock(metrics_mutex_);
    error_metrics_.reset();
  }
  set_open_bank(nullptr);
  LOG_INFO("Resetting ledger to genesis");
  return boot_locked();
}

Result<Lamports> ValidatorCore::airdrop(const PublicKey &address, Lamports amount) {
  if (address.size() != PUBKEY_BYTES) {
    return Result<Lamports>(ErrorKind::INVALID_ARGUMENT, "address must be 32 bytes");
  }
  if (amount == 0) {
    return Result<Lamports>(ErrorKind::INVALID_ARGUMENT, "airdrop amount must be positive");
  }
  std::lock_guard<std::mutex> lock(mutation_mutex_);
  auto bank = open_bank();
  if (!bank) {
    return Result<Lamports>(ErrorKind::STATE, "validator is not booted");
  }
  auto credited = bank->credit(address, amount);
  if (credited.is_ok()) {
    LOG_DEBUG("Airdropped ", amount, " lamports to ", encode_base58(address));
  }
  return credited;
}

Result<bool> ValidatorCore::set_account(const PublicKey &address, const svm::Account &account) {
  if (address.size() != PUBKEY_BYTES) {
    return Result<bool>(ErrorKind::INVALID_ARGUMENT, "address must be 32 bytes");
  }
  if (account.exists() && account.owner.size() != PUBKEY_BYTES) {
    return Result<bool>(ErrorKind::INVALID_ARGUMENT, "owner must be 32 bytes");
  }
  std::lock_guard<std::mutex> lock(mutation_mutex_);
  auto bank = open_bank();
  if (!bank) {
    return Result<bool>(ErrorKind::STATE, "validator is not booted");
  }
  return bank->store_account(address, account);
}

void ValidatorCore::shutdown() {
  queue_.close();
  std::lock_guard<std::mutex> lock(mutation_mutex_);
}

std::shared_ptr<banking::Bank> ValidatorCore::open_bank() const {
  std::lock_guard<std::mutex> lock(bank_ptr_mutex_);
  return open_bank_;
}

void ValidatorCore::set_open_bank(std::shared_ptr<banking::Bank> bank) {
  std::lock_guard<std::mutex> lock(bank_ptr_mutex_);
  open_bank_ = std::move(bank);
}

ledger::FrozenBank ValidatorCore::latest_frozen() const {
  return ledger_.latest();
}

Hash ValidatorCore::latest_blockhash() const {
  auto frozen = latest_frozen();
  return frozen ? frozen->blockhash() : Hash{};
}

Hash ValidatorCore::genesis_hash() const {
  auto genesis = ledger_.get(0);
  return genesis ? genesis->context().genesis_hash : Hash{};
}

size_t ValidatorCore::subscribe_slots(SlotCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  size_t id = next_callback_id_++;
  callbacks_.emplace_back(id, std::move(callback));
  return id;
}

void ValidatorCore::unsubscribe_slots(size_t id) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  for (auto it = callbacks_.begin(); it != callbacks_.end(); ++it) {
    if (it->first == id) {
      callbacks_.erase(it);
      return;
    }
  }
}

void ValidatorCore::notify(const std::vector<ledger::LedgerEntry> &entries) {
  std::vector<SlotCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    for (const auto &entry : callbacks_) {
      callbacks.push_back(entry.second);
    }
  }
  for (const auto &entry : entries) {
    for (const auto &callback : callbacks) {
      try {
        callback(entry);
      } catch (const std::exception &e) {
        LOG_WARN("Slot subscriber threw at slot ", entry.slot, ": ", e.what());
      }
    }
  }
}

void ValidatorCore::record_error(svm::TransactionError error) {
  std::lock_guard<std::mutex> lock(metrics_mutex_);
  error_metrics_.record(error);
}

svm::TransactionErrorMetrics ValidatorCore::error_metrics() const {
  std::lock_guard<std::mutex> lock(metrics_mutex_);
  return error_metrics_;
}

ValidatorCore::Stats ValidatorCore::get_stats() const {
  Stats stats;
  stats.slots_produced = slots_produced_.load();
  stats.transactions_applied = transactions_applied_.load();
  stats.transactions_failed = transactions_failed_.load();
  stats.transactions_dropped = transactions_dropped_.load();
  return stats;
}

} // namespace validator
} // namespace localnet
