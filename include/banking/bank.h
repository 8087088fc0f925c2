#pragma once

#include "banking/account_locks.h"
#include "banking/blockhash_queue.h"
#include "banking/status_cache.h"
#include "common/types.h"
#include "genesis/config.h"
#include "ledger/transaction.h"
#include "svm/account.h"
#include "svm/engine.h"
#include "svm/rent_calculator.h"
#include "svm/transaction_error.h"
#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace localnet {
namespace banking {

using namespace localnet::common;

/**
 * Parameters shared by every bank of one chain
 */
struct BankContext {
    genesis::GenesisConfig config;
    Hash genesis_hash;
    std::unordered_set<PublicKey> program_allowlist;
    svm::RentCalculator rent;
    std::shared_ptr<const svm::ExecutionEngine> engine;
};

/**
 * Result of an executed transaction
 *
 * Rejected transactions never get a receipt; they fail apply() instead.
 */
struct TransactionReceipt {
    Signature signature;
    svm::TransactionError status = svm::TransactionError::NONE;
    std::optional<uint8_t> failed_instruction;
    svm::InstructionError instruction_error = svm::InstructionError::NONE;
    Lamports fee = 0;
    uint64_t compute_units_consumed = 0;
    std::vector<std::string> logs;

    bool is_success() const { return status == svm::TransactionError::NONE; }
    std::string status_string() const;
};

using AccountMap = std::unordered_map<PublicKey, svm::Account>;

/**
 * Account state for one slot
 *
 * A bank is open until freeze(); while open it applies transactions and
 * administrative writes to its own delta. Reads fall through the parent
 * chain, which is flattened into a shared base map every SQUASH_DEPTH slots.
 * Banks are always owned by shared_ptr.
 */
class Bank : public std::enable_shared_from_this<Bank> {
public:
    /// Deltas kept above the flattened base before a child squashes them
    static constexpr size_t SQUASH_DEPTH = 32;

    /// Empty open bank at slot 0
    static std::shared_ptr<Bank> create_genesis(std::shared_ptr<const BankContext> context);

    ~Bank();

    Bank(const Bank&) = delete;
    Bank& operator=(const Bank&) = delete;

    /**
     * Validate, execute and commit one transaction
     * @return the receipt (possibly describing an instruction failure), a
     *         TRANSACTION error for rejections, or STATE if frozen
     */
    Result<TransactionReceipt> apply(const ledger::Transaction& transaction);

    /**
     * Seal the bank: wait for in-flight applies, distribute fees, compute
     * the final blockhash and state root. Idempotent.
     */
    std::shared_ptr<const Bank> freeze();

    /**
     * Open the next bank on top of this frozen one
     * @return STATE error unless frozen and @p next_slot == slot() + 1
     */
    Result<std::shared_ptr<Bank>> child_at(Slot next_slot) const;

    std::optional<svm::Account> get_account(const PublicKey& address) const;
    Lamports get_balance(const PublicKey& address) const;

    /// Overwrite an account (zero lamports removes it); STATE if frozen, SUPPLY over the cap
    Result<bool> store_account(const PublicKey& address, const svm::Account& account);

    /// Add lamports to an account, creating a system account if needed
    Result<Lamports> credit(const PublicKey& address, Lamports amount);

    Lamports calculate_fee(const ledger::Message& message) const;

    // Identity
    Slot slot() const { return slot_; }
    std::optional<Slot> parent_slot() const { return parent_slot_; }
    Epoch epoch() const;
    int64_t unix_timestamp() const;
    bool is_frozen() const;

    // Hashes
    Hash blockhash() const;
    const Hash& parent_blockhash() const { return parent_blockhash_; }
    Hash state_root() const;
    Hash accounts_delta_hash() const;

    // Economics
    Lamports capitalization() const;
    Lamports collected_fees() const;
    Lamports collected_rent() const;

    // Transactions recorded in this slot, in apply order
    std::vector<ledger::Transaction> transactions() const;
    std::vector<TransactionReceipt> receipts() const;
    std::optional<TransactionReceipt> get_receipt(const Signature& signature) const;
    uint64_t signature_count() const;

    /// Transactions recorded from genesis through this slot
    uint64_t transaction_count() const;

    std::shared_ptr<const BlockhashQueue> blockhash_queue() const { return blockhash_queue_; }
    /// Signatures committed on this chain, shared with every other bank of it
    std::shared_ptr<const StatusCache> status_cache() const { return status_cache_; }
    const BankContext& context() const { return *context_; }

    /// Every live account visible from this bank, sorted by address
    std::vector<std::pair<PublicKey, svm::Account>> accounts() const;

private:
    Bank(std::shared_ptr<const BankContext> context, Slot slot);

    struct LoadedTransaction {
        std::vector<svm::Account> accounts;
        std::vector<Lamports> rent_collected;
    };

    Result<LoadedTransaction> load_accounts(const ledger::Message& message, Lamports fee) const;
    svm::TransactionError check_programs(const ledger::Message& message) const;
    svm::TransactionError check_rent_states(const ledger::Message& message,
                                            const std::vector<svm::Account>& pre,
                                            const std::vector<svm::Account>& post,
                                            size_t& failing_index) const;

    /// Own delta first, then ancestors; takes the state lock
    std::optional<svm::Account> lookup(const PublicKey& address) const;
    /// Caller holds state_mutex_
    std::optional<svm::Account> lookup_locked(const PublicKey& address) const;
    std::optional<svm::Account> lookup_ancestors(const PublicKey& address) const;
    void write_locked(const PublicKey& address, const svm::Account& account);
    Result<bool> check_supply_locked(Lamports old_lamports, Lamports new_lamports) const;
    void update_clock_sysvar();
    void distribute_fees_locked();
    Hash compute_delta_hash_locked() const;
    std::shared_ptr<const AccountMap> flatten() const;

    std::shared_ptr<const BankContext> context_;
    std::shared_ptr<StatusCache> status_cache_;

    Slot slot_;
    std::optional<Slot> parent_slot_;
    std::shared_ptr<const Bank> parent_;
    std::shared_ptr<const AccountMap> base_;
    size_t depth_ = 0;

    Hash parent_blockhash_;
    Hash parent_state_root_;
    std::shared_ptr<const BlockhashQueue> blockhash_queue_;

    // Guards the frozen flag: apply() holds it shared, freeze() exclusive
    mutable std::shared_mutex freeze_mutex_;
    std::atomic<bool> frozen_{false};

    // Guards everything below
    mutable std::shared_mutex state_mutex_;
    AccountMap delta_;
    Lamports capitalization_ = 0;
    Lamports collected_fees_ = 0;
    Lamports collected_rent_ = 0;
    uint64_t parent_transaction_count_ = 0;
    std::vector<ledger::Transaction> transactions_;
    std::vector<TransactionReceipt> receipts_;
    Hash blockhash_;
    Hash accounts_delta_hash_;
    Hash state_root_;

    AccountLocks account_locks_;
};

} // namespace banking
} // namespace localnet
