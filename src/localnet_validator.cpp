#include "localnet_validator.h"
#include "common/encoding.h"
#include "common/logging.h"
#include "genesis/builder.h"
#include <stdexcept>

namespace localnet {

/**
 * @brief Constructs the validator; nothing is built until initialize().
 */
TestValidator::TestValidator(const ValidatorConfig &config,
                             const genesis::GenesisConfig &genesis_config)
    : config_(config), genesis_config_(genesis_config) {
  setup_logging();
}

/**
 * @brief Destructor for the TestValidator.
 * @details Ensures a graceful shutdown of the validator and its components.
 */
TestValidator::~TestValidator() { shutdown(); }

void TestValidator::setup_logging() {
  Logger &logger = Logger::instance();
  LogLevel level = LogLevel::INFO;
  if (!parse_log_level(config_.log_level, level)) {
    LOG_WARN("Unknown log level '", config_.log_level, "', using info");
  }
  logger.set_level(level);
  logger.set_json_format(config_.log_json);
  logger.set_async_logging(config_.async_logging);
}

/**
 * @brief Initializes the execution engine, genesis and ledger.
 * @return A Result indicating success or failure.
 */
Result<bool> TestValidator::initialize() {
  if (initialized_.load()) {
    return Result<bool>(ErrorKind::STATE, "Validator already initialized");
  }
  if (shut_down_.load()) {
    return Result<bool>(ErrorKind::STATE, "Validator has been shut down");
  }
  LOG_INFO("Initializing local validator for cluster '", genesis_config_.cluster_id, "'");

  execution_engine_ = std::make_shared<svm::ExecutionEngine>();
  execution_engine_->register_builtins();

  core_ = std::make_unique<validator::ValidatorCore>(genesis_config_, execution_engine_);
  Result<bool> boot_result(ErrorKind::GENERIC, "boot did not run");
  try {
    boot_result = core_->boot();
  } catch (const std::exception &e) {
    // Hashing and key derivation throw only when OpenSSL itself fails
    boot_result = Result<bool>(ErrorKind::GENERIC, std::string("boot failed: ") + e.what());
  }
  if (!boot_result.is_ok()) {
    LOG_VALIDATOR_ERROR("Failed to boot ledger", "VAL_INIT_001",
                        {{"error", boot_result.error()}});
    core_.reset();
    return boot_result;
  }

  production_loop_ =
      std::make_unique<validator::BlockProductionLoop>(*core_, config_.tick_interval_ms);
  control_surface_ = std::make_unique<validator::ControlSurface>(*core_, *production_loop_);

  failure_hook_id_ = Logger::instance().add_failure_hook(
      [this](const LogEntry &) { ++critical_failures_; });

  if (config_.warp_slot > 0) {
    auto warp_result = control_surface_->warp_to_slot(config_.warp_slot);
    if (!warp_result.is_ok()) {
      LOG_VALIDATOR_ERROR("Failed to warp at startup", "VAL_INIT_002",
                          {{"error", warp_result.error()}});
      return Result<bool>(warp_result.error_info());
    }
  }

  initialized_.store(true);
  start_time_ = std::chrono::steady_clock::now();
  LOG_INFO("Validator initialization complete, genesis hash ",
           encode_base58(core_->genesis_hash()));
  return Result<bool>(true);
}

/**
 * @brief Starts block production.
 * @details Initializes the validator if not already done.
 */
Result<bool> TestValidator::start() {
  if (!initialized_.load()) {
    auto init_result = initialize();
    if (!init_result.is_ok()) {
      return init_result;
    }
  }
  // The timer thread exits by itself on a sequence halt, so running_ alone
  // can be stale after control().reset() clears the halt
  if (running_.load() && (production_loop_->is_manual() || production_loop_->is_running())) {
    return Result<bool>(true);
  }
  auto start_result = production_loop_->start();
  if (!start_result.is_ok()) {
    running_.store(false);
    return start_result;
  }
  running_.store(true);
  return Result<bool>(true);
}

void TestValidator::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  production_loop_->stop();
  LOG_INFO("Block production stopped, latest slot ",
           core_->ledger().latest_slot().value_or(0));
}

void TestValidator::shutdown() {
  if (shut_down_.exchange(true)) {
    return;
  }
  if (core_) {
    core_->intake_queue().close();
  }
  stop();
  if (core_) {
    core_->shutdown();
  }
  if (failure_hook_id_ != 0) {
    Logger::instance().remove_failure_hook(failure_hook_id_);
    failure_hook_id_ = 0;
  }
  if (initialized_.load()) {
    LOG_INFO("Validator shut down");
  }
}

bool TestValidator::is_running() const { return running_.load() && production_loop_->is_running(); }

bool TestValidator::is_initialized() const { return initialized_.load(); }

Result<Signature> TestValidator::submit(const ledger::Transaction &transaction) {
  if (!initialized_.load()) {
    return Result<Signature>(ErrorKind::STATE, "Validator is not initialized");
  }
  return core_->intake_queue().submit(transaction);
}

std::optional<svm::Account> TestValidator::get_account(const PublicKey &address,
                                                       Commitment commitment) const {
  if (!initialized_.load()) {
    return std::nullopt;
  }
  std::shared_ptr<const banking::Bank> bank;
  if (commitment == Commitment::PROCESSED) {
    bank = core_->open_bank();
  } else {
    bank = core_->latest_frozen();
  }
  if (!bank) {
    return std::nullopt;
  }
  return bank->get_account(address);
}

Lamports TestValidator::get_balance(const PublicKey &address, Commitment commitment) const {
  auto account = get_account(address, commitment);
  return account ? account->lamports : 0;
}

ledger::FrozenBank TestValidator::get(Slot slot) const {
  return initialized_.load() ? core_->ledger().get(slot) : nullptr;
}

std::optional<ledger::LedgerEntry> TestValidator::get_entry(Slot slot) const {
  if (!initialized_.load()) {
    return std::nullopt;
  }
  return core_->ledger().get_entry(slot);
}

ledger::FrozenBank TestValidator::latest() const {
  return initialized_.load() ? core_->latest_frozen() : nullptr;
}

Hash TestValidator::latest_blockhash() const {
  return initialized_.load() ? core_->latest_blockhash() : Hash{};
}

std::optional<ledger::TransactionRecord>
TestValidator::get_transaction(const Signature &signature) const {
  if (!initialized_.load()) {
    return std::nullopt;
  }
  return core_->ledger().get_transaction(signature);
}

size_t TestValidator::subscribe_slots(validator::SlotCallback callback) {
  if (!initialized_.load()) {
    LOG_WARN("Slot subscription refused: validator is not initialized");
    return 0;
  }
  return core_->subscribe_slots(std::move(callback));
}

void TestValidator::unsubscribe_slots(size_t id) {
  if (initialized_.load()) {
    core_->unsubscribe_slots(id);
  }
}

validator::ControlSurface &TestValidator::control() {
  if (!initialized_.load()) {
    throw std::runtime_error("Validator is not initialized");
  }
  return *control_surface_;
}

validator::ValidatorCore &TestValidator::core() {
  if (!initialized_.load()) {
    throw std::runtime_error("Validator is not initialized");
  }
  return *core_;
}

Hash TestValidator::genesis_hash() const {
  return initialized_.load() ? core_->genesis_hash() : Hash{};
}

/**
 * @brief Retrieves the current statistics for the validator.
 */
TestValidator::ValidatorStats TestValidator::get_stats() const {
  ValidatorStats stats;
  stats.critical_failures = critical_failures_.load();
  if (!initialized_.load()) {
    return stats;
  }

  auto open = core_->open_bank();
  if (open) {
    stats.current_slot = open->slot();
  }
  auto frozen = core_->latest_frozen();
  if (frozen) {
    stats.latest_frozen_slot = frozen->slot();
    stats.latest_blockhash = frozen->blockhash();
    stats.transaction_count = frozen->transaction_count();
    stats.capitalization = frozen->capitalization();
  }

  auto core_stats = core_->get_stats();
  stats.transactions_failed = core_stats.transactions_failed;
  stats.transactions_dropped = core_stats.transactions_dropped;
  auto error_metrics = core_->error_metrics();
  if (error_metrics.total_errors() > 0) {
    stats.error_summary = error_metrics.format();
  }

  auto queue_stats = core_->intake_queue().get_stats();
  stats.submissions_accepted = queue_stats.accepted;
  stats.submissions_rejected = queue_stats.rejected;
  stats.submissions_busy = queue_stats.busy;
  stats.pending_transactions = queue_stats.pending;

  stats.production_halted = production_loop_->is_halted();
  stats.uptime_seconds = std::chrono::duration_cast<std::chrono::seconds>(
                             std::chrono::steady_clock::now() - start_time_)
                             .count();
  return stats;
}

} // namespace localnet
