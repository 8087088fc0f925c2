#pragma once

#include "banking/bank.h"
#include "banking/intake_queue.h"
#include "common/types.h"
#include "genesis/config.h"
#include "ledger/store.h"
#include "svm/engine.h"
#include "svm/transaction_error_metrics.h"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace localnet {
namespace validator {

using namespace localnet::common;

/**
 * @file core.h
 * @brief Slot production for the single-node chain
 *
 * ValidatorCore owns the open bank, the ledger store and the intake queue.
 * One mutation mutex serializes every state change: production steps, warp,
 * airdrop, set_account and reset. Readers only copy bank pointers.
 */

/**
 * @brief Callback invoked once per produced slot, in slot order
 * @warning Runs on the producing thread after the mutation lock is released.
 *          It may call airdrop(), set_account(), reset() and the readers, but
 *          not produce_slot() or warp_to_slot(): notifications are delivered
 *          in order, so those would wait on their own delivery.
 */
using SlotCallback = std::function<void(const ledger::LedgerEntry &)>;

class ValidatorCore {
public:
  /**
   * @brief Production counters
   */
  struct Stats {
    uint64_t slots_produced = 0;        ///< Entries appended after boot
    uint64_t transactions_applied = 0;  ///< Recorded, successful or failed
    uint64_t transactions_failed = 0;   ///< Recorded with an error status
    uint64_t transactions_dropped = 0;  ///< Queued but rejected by the bank
  };

  /**
   * @param genesis_config retained for reset()
   * @param engine executor shared by every bank
   */
  ValidatorCore(genesis::GenesisConfig genesis_config,
                std::shared_ptr<const svm::ExecutionEngine> engine);
  ~ValidatorCore();

  ValidatorCore(const ValidatorCore &) = delete;
  ValidatorCore &operator=(const ValidatorCore &) = delete;

  /**
   * @brief Build genesis, record slot 0 and open slot 1
   * @return CONFIG error if genesis is invalid
   */
  Result<bool> boot();

  /**
   * @brief One production step: drain the queue into the open bank, freeze,
   *        append, open the child and notify subscribers
   * @return the slot just recorded; SEQUENCE if the ledger refused it
   */
  Result<Slot> produce_slot();

  /**
   * @brief Produce entries up to and including @p target
   * @return STATE if @p target is not beyond the latest recorded slot
   */
  Result<Slot> warp_to_slot(Slot target);

  /// Clear ledger and queue, then boot again from the retained genesis config
  Result<bool> reset();

  Result<Lamports> airdrop(const PublicKey &address, Lamports amount);
  Result<bool> set_account(const PublicKey &address, const svm::Account &account);

  /// Close the queue and wait for any in-flight mutation
  void shutdown();

  // Readers
  std::shared_ptr<banking::Bank> open_bank() const;
  ledger::FrozenBank latest_frozen() const;
  Hash latest_blockhash() const;

  banking::IntakeQueue &intake_queue() { return queue_; }
  const banking::IntakeQueue &intake_queue() const { return queue_; }
  ledger::LedgerStore &ledger() { return ledger_; }
  const ledger::LedgerStore &ledger() const { return ledger_; }
  const genesis::GenesisConfig &genesis_config() const { return genesis_config_; }
  Hash genesis_hash() const;

  size_t subscribe_slots(SlotCallback callback);
  void unsubscribe_slots(size_t id);

  Stats get_stats() const;

  /// Causes of dropped and failed transactions since boot
  svm::TransactionErrorMetrics error_metrics() const;

private:
  Result<bool> boot_locked();
  Result<ledger::LedgerEntry> produce_locked(bool drain);
  void set_open_bank(std::shared_ptr<banking::Bank> bank);
  void notify(const std::vector<ledger::LedgerEntry> &entries);
  void record_error(svm::TransactionError error);

  genesis::GenesisConfig genesis_config_;
  std::shared_ptr<const svm::ExecutionEngine> engine_;

  // Lock order: notify_mutex_, then mutation_mutex_. Producers hold
  // notify_mutex_ for a whole step including delivery; control calls take
  // only mutation_mutex_.
  std::mutex notify_mutex_;
  std::mutex mutation_mutex_;

  mutable std::mutex bank_ptr_mutex_;
  std::shared_ptr<banking::Bank> open_bank_;

  ledger::LedgerStore ledger_;
  banking::IntakeQueue queue_;

  std::mutex callback_mutex_;
  std::vector<std::pair<size_t, SlotCallback>> callbacks_;
  size_t next_callback_id_ = 1;

  mutable std::mutex metrics_mutex_;
  svm::TransactionErrorMetrics error_metrics_;

  std::atomic<uint64_t> slots_produced_{0};
  std::atomic<uint64_t> transactions_applied_{0};
  std::atomic<uint64_t> transactions_failed_{0};
  std::atomic<uint64_t> transactions_dropped_{0};
};

} // namespace validator
} // namespace localnet
