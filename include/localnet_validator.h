/**
 * @file localnet_validator.h
 * @brief Main header for the TestValidator class, the orchestrator of the local chain.
 */
#pragma once

#include "common/types.h"
#include "genesis/config.h"
#include "ledger/store.h"
#include "svm/engine.h"
#include "validator/block_production.h"
#include "validator/control_surface.h"
#include "validator/core.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace localnet {

using namespace localnet::common;

/**
 * @brief Which bank a read observes
 */
enum class Commitment {
  PROCESSED,  ///< The open bank, including transactions not yet frozen
  CONFIRMED,  ///< The latest frozen bank
  FINALIZED   ///< Same as CONFIRMED on a single node
};

/**
 * @brief Single-node test validator.
 * @details Wires the execution engine, genesis, ledger store, intake queue,
 * block production loop and control surface together, and exposes the
 * facade that clients and tests call.
 */
class TestValidator {
public:
  /**
   * @brief Constructs a new TestValidator.
   * @param config How the process runs (tick interval, logging).
   * @param genesis_config The chain to build; retained for reset().
   */
  TestValidator(const ValidatorConfig &config, const genesis::GenesisConfig &genesis_config);

  /**
   * @brief Destructor. Ensures a graceful shutdown.
   */
  ~TestValidator();

  TestValidator(const TestValidator &) = delete;
  TestValidator &operator=(const TestValidator &) = delete;

  /**
   * @brief Registers the builtins, builds genesis and records slot 0.
   * @return CONFIG error for an invalid genesis, STATE if already initialized.
   */
  Result<bool> initialize();

  /**
   * @brief Starts the block production timer, initializing first if needed.
   */
  Result<bool> start();

  /**
   * @brief Stops the block production timer. Manual advance() still works.
   */
  void stop();

  /**
   * @brief Closes the intake queue, stops production and waits for any
   * in-flight control call.
   */
  void shutdown();

  bool is_running() const;
  bool is_initialized() const;

  /**
   * @brief Queues a transaction for the next slot.
   * @return The transaction signature, or TRANSACTION, BUSY or STATE errors.
   */
  Result<Signature> submit(const ledger::Transaction &transaction);

  /**
   * @brief Reads an account. The default sees airdrops and set_account
   * writes at once; CONFIRMED waits for the next recorded slot.
   */
  std::optional<svm::Account> get_account(const PublicKey &address,
                                          Commitment commitment = Commitment::PROCESSED) const;
  Lamports get_balance(const PublicKey &address,
                       Commitment commitment = Commitment::PROCESSED) const;

  /// @brief The frozen bank recorded at @p slot, or nullptr.
  ledger::FrozenBank get(Slot slot) const;
  std::optional<ledger::LedgerEntry> get_entry(Slot slot) const;

  /// @brief The most recently recorded frozen bank.
  ledger::FrozenBank latest() const;

  /// @brief Blockhash of the latest frozen bank, for signing new transactions.
  Hash latest_blockhash() const;

  std::optional<ledger::TransactionRecord> get_transaction(const Signature &signature) const;

  /// @return A subscription id, or 0 before initialize().
  size_t subscribe_slots(validator::SlotCallback callback);
  void unsubscribe_slots(size_t id);

  /**
   * @brief Test controls (airdrop, set_account, warp, reset, advance).
   * @throws std::runtime_error before initialize().
   */
  validator::ControlSurface &control();

  Hash genesis_hash() const;

  /**
   * @brief A collection of status metrics for the validator.
   */
  struct ValidatorStats {
    /// @brief Slot of the open bank.
    Slot current_slot = 0;
    /// @brief Slot of the latest frozen bank.
    Slot latest_frozen_slot = 0;
    /// @brief Blockhash of the latest frozen bank.
    Hash latest_blockhash;
    /// @brief Transactions recorded in the ledger.
    uint64_t transaction_count = 0;
    uint64_t transactions_failed = 0;
    uint64_t transactions_dropped = 0;
    uint64_t submissions_accepted = 0;
    uint64_t submissions_rejected = 0;
    uint64_t submissions_busy = 0;
    size_t pending_transactions = 0;
    Lamports capitalization = 0;
    /// @brief Non-zero error counters of dropped and failed transactions.
    std::string error_summary;
    uint64_t critical_failures = 0;
    bool production_halted = false;
    uint64_t uptime_seconds = 0;
  };

  ValidatorStats get_stats() const;

  const ValidatorConfig &get_config() const { return config_; }
  const genesis::GenesisConfig &get_genesis_config() const { return genesis_config_; }

  /// @throws std::runtime_error before initialize().
  validator::ValidatorCore &core();

private:
  void setup_logging();

  ValidatorConfig config_;
  genesis::GenesisConfig genesis_config_;

  std::shared_ptr<svm::ExecutionEngine> execution_engine_;
  std::unique_ptr<validator::ValidatorCore> core_;
  std::unique_ptr<validator::BlockProductionLoop> production_loop_;
  std::unique_ptr<validator::ControlSurface> control_surface_;

  std::atomic<bool> initialized_{false};
  std::atomic<bool> running_{false};
  std::atomic<bool> shut_down_{false};
  std::atomic<uint64_t> critical_failures_{0};
  size_t failure_hook_id_ = 0;
  std::chrono::steady_clock::time_point start_time_;
};

} // namespace localnet
