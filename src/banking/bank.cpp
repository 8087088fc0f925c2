/**
 * @file bank.cpp
 * @brief Per-slot account state: transaction application, freezing and
 *        copy-on-write child creation.
 */
#include "banking/bank.h"
#include "common/crypto.h"
#include "common/encoding.h"
#include "common/logging.h"
#include "svm/program_ids.h"
#include "svm/sysvar.h"
#include <algorithm>
#include <mutex>

namespace localnet {
namespace banking {

namespace {

std::vector<uint8_t> u64_le(uint64_t value) {
    std::vector<uint8_t> out(8);
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<uint8_t>((value >> (i * 8)) & 0xFF);
    }
    return out;
}

Result<TransactionReceipt> reject(svm::TransactionError error, const std::string& detail = "") {
    return Result<TransactionReceipt>(svm::make_transaction_error(error, detail));
}

} // namespace

std::string TransactionReceipt::status_string() const {
    if (is_success()) {
        return "ok";
    }
    std::string text = svm::transaction_error_to_string(status);
    if (status == svm::TransactionError::INSTRUCTION_ERROR && failed_instruction) {
        text += " at instruction " + std::to_string(*failed_instruction) + ": " +
                svm::instruction_error_to_string(instruction_error);
    } else if (status == svm::TransactionError::INSUFFICIENT_FUNDS_FOR_RENT && failed_instruction) {
        text += " for account " + std::to_string(*failed_instruction);
    }
    return text;
}

// Construction

Bank::Bank(std::shared_ptr<const BankContext> context, Slot slot)
    : context_(std::move(context)), slot_(slot) {}

Bank::~Bank() = default;

std::shared_ptr<Bank> Bank::create_genesis(std::shared_ptr<const BankContext> context) {
    std::shared_ptr<Bank> bank(new Bank(context, 0));
    const Hash& genesis_hash = context->genesis_hash;

    bank->status_cache_ = std::make_shared<StatusCache>(context->config.max_recent_blockhashes);
    bank->base_ = std::make_shared<AccountMap>();
    bank->parent_blockhash_ = genesis_hash;
    bank->parent_state_root_ = genesis_hash;
    bank->blockhash_ = genesis_hash;

    auto queue = std::make_shared<BlockhashQueue>(context->config.max_recent_blockhashes);
    queue->register_hash(genesis_hash, 0);
    bank->blockhash_queue_ = queue;

    return bank;
}

Result<std::shared_ptr<Bank>> Bank::child_at(Slot next_slot) const {
    if (!is_frozen()) {
        return Result<std::shared_ptr<Bank>>(
            ErrorKind::STATE, "bank for slot " + std::to_string(slot_) + " is not frozen");
    }
    if (next_slot != slot_ + 1) {
        std::string message = "child of slot " + std::to_string(slot_) + " must be slot " +
                              std::to_string(slot_ + 1) + ", requested " +
                              std::to_string(next_slot);
        LOG_BANK_ERROR(message, "BANK_CHILD_SLOT");
        return Result<std::shared_ptr<Bank>>(ErrorKind::STATE, message);
    }

    std::shared_ptr<Bank> child(new Bank(context_, next_slot));
    child->status_cache_ = status_cache_;
    child->parent_slot_ = slot_;
    child->parent_blockhash_ = blockhash();
    child->parent_state_root_ = state_root();
    child->capitalization_ = capitalization();
    child->parent_transaction_count_ = transaction_count();

    if (depth_ + 1 > SQUASH_DEPTH) {
        child->base_ = flatten();
        child->depth_ = 0;
    } else {
        child->parent_ = shared_from_this();
        child->base_ = base_;
        child->depth_ = depth_ + 1;
    }

    auto queue = std::make_shared<BlockhashQueue>(*blockhash_queue_);
    queue->register_hash(child->parent_blockhash_, slot_);
    child->blockhash_queue_ = queue;

    child->blockhash_ = CryptoUtils::sha256_multi({child->parent_blockhash_, u64_le(next_slot)});
    child->update_clock_sysvar();

    status_cache_->purge(next_slot);
    return Result<std::shared_ptr<Bank>>(child);
}

// Transaction processing

Result<TransactionReceipt> Bank::apply(const ledger::Transaction& transaction) {
    std::shared_lock<std::shared_mutex> freeze_guard(freeze_mutex_);
    if (frozen_.load()) {
        return Result<TransactionReceipt>(
            ErrorKind::STATE, "bank for slot " + std::to_string(slot_) + " is frozen");
    }

    auto sanitized = transaction.sanitize();
    if (!sanitized.is_ok()) {
        return Result<TransactionReceipt>(sanitized.error_info());
    }
    if (!transaction.verify_signatures()) {
        return reject(svm::TransactionError::SIGNATURE_FAILURE);
    }

    const auto& message = transaction.message;
    const Signature& signature = transaction.signature();

    if (!blockhash_queue_->is_valid(message.recent_blockhash)) {
        return reject(svm::TransactionError::BLOCKHASH_NOT_FOUND,
                      encode_base58(message.recent_blockhash));
    }
    if (status_cache_->contains(signature, slot_)) {
        return reject(svm::TransactionError::ALREADY_PROCESSED);
    }
    if (message.account_keys.size() > MAX_TX_ACCOUNT_LOCKS) {
        return reject(svm::TransactionError::TOO_MANY_ACCOUNT_LOCKS);
    }

    std::vector<PublicKey> writable;
    std::vector<PublicKey> readonly;
    for (size_t i = 0; i < message.account_keys.size(); ++i) {
        if (message.is_writable(i)) {
            writable.push_back(message.account_keys[i]);
        } else {
            readonly.push_back(message.account_keys[i]);
        }
    }
    AccountLocksGuard locks(account_locks_, writable, readonly);
    if (!locks.locked()) {
        return reject(svm::TransactionError::ACCOUNT_IN_USE);
    }

    svm::TransactionError program_error = check_programs(message);
    if (program_error != svm::TransactionError::NONE) {
        return reject(program_error);
    }

    const Lamports fee = calculate_fee(message);
    auto loaded = load_accounts(message, fee);
    if (!loaded.is_ok()) {
        return Result<TransactionReceipt>(loaded.error_info());
    }
    LoadedTransaction tx_accounts = std::move(loaded).value();

    // Execute on a private copy; the loaded accounts stay as the fee-only state
    std::vector<svm::Account> executed = tx_accounts.accounts;
    svm::ExecutionOutcome outcome = context_->engine->execute_message(
        message, executed, context_->config.compute_unit_limit);

    TransactionReceipt receipt;
    receipt.signature = signature;
    receipt.status = outcome.status;
    receipt.failed_instruction = outcome.failed_instruction;
    receipt.instruction_error = outcome.instruction_error;
    receipt.compute_units_consumed = outcome.compute_units_consumed;
    receipt.logs = std::move(outcome.logs);

    if (receipt.is_success()) {
        size_t failing_index = 0;
        svm::TransactionError rent_error =
            check_rent_states(message, tx_accounts.accounts, executed, failing_index);
        if (rent_error != svm::TransactionError::NONE) {
            receipt.status = rent_error;
            receipt.failed_instruction = static_cast<uint8_t>(failing_index);
        }
    }

    const bool charge = receipt.is_success() || context_->config.fee_schedule.charge_fee_on_failure;
    receipt.fee = charge ? fee : 0;

    {
        std::unique_lock<std::shared_mutex> state_lock(state_mutex_);
        if (status_cache_->contains(signature, slot_)) {
            return reject(svm::TransactionError::ALREADY_PROCESSED);
        }

        Lamports rent_burned = 0;
        if (receipt.is_success()) {
            for (size_t i = 0; i < message.account_keys.size(); ++i) {
                if (!message.is_writable(i)) {
                    continue;
                }
                write_locked(message.account_keys[i], executed[i]);
                rent_burned += tx_accounts.rent_collected[i];
            }
        } else if (charge) {
            write_locked(message.fee_payer(), tx_accounts.accounts[0]);
            rent_burned += tx_accounts.rent_collected[0];
        }

        if (charge) {
            collected_fees_ += fee;
        }
        collected_rent_ += rent_burned;
        capitalization_ -= rent_burned;

        transactions_.push_back(transaction);
        receipts_.push_back(receipt);
        status_cache_->insert(signature, slot_);
    }

    LOG_DEBUG("Slot ", slot_, " applied ", encode_base58(signature), ": ",
              receipt.status_string(), " (fee ", receipt.fee, ", cu ",
              receipt.compute_units_consumed, ")");
    return Result<TransactionReceipt>(std::move(receipt));
}

svm::TransactionError Bank::check_programs(const ledger::Message& message) const {
    for (const auto& program_id : message.program_ids()) {
        if (!context_->program_allowlist.count(program_id)) {
            return svm::TransactionError::INVALID_PROGRAM_FOR_EXECUTION;
        }
        auto account = lookup(program_id);
        if (!account) {
            return svm::TransactionError::PROGRAM_ACCOUNT_NOT_FOUND;
        }
        if (!account->executable) {
            return svm::TransactionError::INVALID_PROGRAM_FOR_EXECUTION;
        }
    }
    return svm::TransactionError::NONE;
}

Result<Bank::LoadedTransaction> Bank::load_accounts(const ledger::Message& message,
                                                    Lamports fee) const {
    auto fail = [](svm::TransactionError error) {
        return Result<LoadedTransaction>(svm::make_transaction_error(error));
    };

    auto payer = lookup(message.fee_payer());
    if (!payer) {
        return fail(svm::TransactionError::ACCOUNT_NOT_FOUND);
    }
    if (payer->owner != svm::program_ids::system_program()) {
        return fail(svm::TransactionError::INVALID_ACCOUNT_FOR_FEE);
    }

    const auto& rent = context_->rent;
    const Epoch current_epoch = epoch();

    LoadedTransaction loaded;
    loaded.accounts.reserve(message.account_keys.size());
    loaded.rent_collected.assign(message.account_keys.size(), 0);

    for (size_t i = 0; i < message.account_keys.size(); ++i) {
        auto existing = lookup(message.account_keys[i]);
        svm::Account account = existing ? *existing : svm::Account::system_owned(0);
        if (!existing) {
            account.rent_epoch = current_epoch;
        }

        if (message.is_writable(i) && !account.executable && account.lamports > 0 &&
            !rent.is_rent_exempt(account.lamports, account.data.size())) {
            auto collection = rent.collect_rent(account.lamports, account.data.size(),
                                                current_epoch, account.rent_epoch);
            if (collection.collected_rent > 0) {
                LOG_TRACE("Rent from ", encode_base58(message.account_keys[i]), ": ",
                          svm::rent_utils::format_rent_collection(collection));
            }
            loaded.rent_collected[i] = collection.collected_rent;
            if (collection.account_destroyed) {
                account = svm::Account::system_owned(0);
            } else {
                account.lamports = collection.new_balance;
            }
            account.rent_epoch = current_epoch;
        }

        loaded.accounts.push_back(std::move(account));
    }

    svm::Account& fee_payer = loaded.accounts[0];
    if (fee_payer.lamports == 0) {
        return fail(svm::TransactionError::ACCOUNT_NOT_FOUND);
    }
    if (fee_payer.lamports < fee) {
        return fail(svm::TransactionError::INSUFFICIENT_FUNDS_FOR_FEE);
    }
    fee_payer.lamports -= fee;

    return Result<LoadedTransaction>(std::move(loaded));
}

svm::TransactionError Bank::check_rent_states(const ledger::Message& message,
                                              const std::vector<svm::Account>& pre,
                                              const std::vector<svm::Account>& post,
                                              size_t& failing_index) const {
    const auto& rent = context_->rent;
    for (size_t i = 0; i < message.account_keys.size(); ++i) {
        if (!message.is_writable(i)) {
            continue;
        }
        auto pre_state = rent.rent_state(pre[i]);
        auto post_state = rent.rent_state(post[i]);
        if (!svm::RentCalculator::transition_allowed(pre_state, post_state)) {
            failing_index = i;
            return svm::TransactionError::INSUFFICIENT_FUNDS_FOR_RENT;
        }
    }
    return svm::TransactionError::NONE;
}

Lamports Bank::calculate_fee(const ledger::Message& message) const {
    return context_->config.fee_schedule.lamports_per_signature *
           message.header.num_required_signatures;
}

// Freezing

std::shared_ptr<const Bank> Bank::freeze() {
    std::unique_lock<std::shared_mutex> freeze_guard(freeze_mutex_);
    if (!frozen_.load()) {
        std::unique_lock<std::shared_mutex> state_lock(state_mutex_);
        distribute_fees_locked();

        accounts_delta_hash_ = compute_delta_hash_locked();

        std::vector<std::vector<uint8_t>> chunks{parent_blockhash_, u64_le(slot_)};
        for (const auto& tx : transactions_) {
            chunks.push_back(tx.signature());
        }
        blockhash_ = CryptoUtils::sha256_multi(chunks);

        state_root_ = CryptoUtils::sha256_multi({parent_state_root_, accounts_delta_hash_,
                                                 u64_le(transactions_.size()), blockhash_});
        frozen_.store(true);

        LOG_DEBUG("Froze slot ", slot_, " with ", transactions_.size(),
                  " transactions, blockhash ", encode_base58(blockhash_));
    }
    return shared_from_this();
}

void Bank::distribute_fees_locked() {
    if (collected_fees_ == 0) {
        return;
    }
    const auto& schedule = context_->config.fee_schedule;
    Lamports burned = collected_fees_ * schedule.burn_percent / 100;
    Lamports deposit = collected_fees_ - burned;

    const PublicKey& collector = context_->config.fee_collector;
    if (deposit > 0 && !collector.empty()) {
        auto account = lookup_locked(collector);
        svm::Account updated = account ? *account : svm::Account::system_owned(0);
        if (updated.lamports <= UINT64_MAX - deposit) {
            updated.lamports += deposit;
            write_locked(collector, updated);
            deposit = 0;
        }
    }
    burned += deposit;
    capitalization_ -= burned;
}

Hash Bank::compute_delta_hash_locked() const {
    std::vector<PublicKey> keys;
    keys.reserve(delta_.size());
    for (const auto& entry : delta_) {
        keys.push_back(entry.first);
    }
    std::sort(keys.begin(), keys.end());

    std::vector<std::vector<uint8_t>> chunks;
    chunks.reserve(keys.size());
    for (const auto& key : keys) {
        const svm::Account& account = delta_.at(key);
        std::vector<uint8_t> chunk = key;
        auto lamports = u64_le(account.lamports);
        chunk.insert(chunk.end(), lamports.begin(), lamports.end());
        chunk.insert(chunk.end(), account.owner.begin(), account.owner.end());
        chunk.push_back(account.executable ? 1 : 0);
        auto rent_epoch = u64_le(account.rent_epoch);
        chunk.insert(chunk.end(), rent_epoch.begin(), rent_epoch.end());
        auto data_len = u64_le(account.data.size());
        chunk.insert(chunk.end(), data_len.begin(), data_len.end());
        chunk.insert(chunk.end(), account.data.begin(), account.data.end());
        chunks.push_back(std::move(chunk));
    }
    return CryptoUtils::sha256_multi(chunks);
}

// Account access

std::optional<svm::Account> Bank::get_account(const PublicKey& address) const {
    return lookup(address);
}

Lamports Bank::get_balance(const PublicKey& address) const {
    auto account = lookup(address);
    return account ? account->lamports : 0;
}

std::optional<svm::Account> Bank::lookup(const PublicKey& address) const {
    {
        std::shared_lock<std::shared_mutex> lock(state_mutex_);
        auto it = delta_.find(address);
        if (it != delta_.end()) {
            if (!it->second.exists()) {
                return std::nullopt;
            }
            return it->second;
        }
    }
    return lookup_ancestors(address);
}

std::optional<svm::Account> Bank::lookup_locked(const PublicKey& address) const {
    auto it = delta_.find(address);
    if (it != delta_.end()) {
        if (!it->second.exists()) {
            return std::nullopt;
        }
        return it->second;
    }
    return lookup_ancestors(address);
}

std::optional<svm::Account> Bank::lookup_ancestors(const PublicKey& address) const {
    for (const Bank* bank = parent_.get(); bank; bank = bank->parent_.get()) {
        std::shared_lock<std::shared_mutex> lock(bank->state_mutex_);
        auto it = bank->delta_.find(address);
        if (it != bank->delta_.end()) {
            if (!it->second.exists()) {
                return std::nullopt;
            }
            return it->second;
        }
    }
    auto it = base_->find(address);
    if (it != base_->end() && it->second.exists()) {
        return it->second;
    }
    return std::nullopt;
}

void Bank::write_locked(const PublicKey& address, const svm::Account& account) {
    if (account.exists()) {
        delta_[address] = account;
    } else {
        delta_[address] = svm::Account();
    }
}

Result<bool> Bank::check_supply_locked(Lamports old_lamports, Lamports new_lamports) const {
    if (new_lamports > old_lamports) {
        Lamports increase = new_lamports - old_lamports;
        if (capitalization_ > UINT64_MAX - increase) {
            return Result<bool>(ErrorKind::SUPPLY, "capitalization would overflow");
        }
        Lamports max_supply = context_->config.max_supply;
        if (max_supply > 0 && capitalization_ + increase > max_supply) {
            std::string message = "capitalization " + std::to_string(capitalization_ + increase) +
                                  " would exceed max supply " + std::to_string(max_supply);
            LOG_BANK_ERROR(message, "BANK_SUPPLY_CAP",
                           {{"slot", std::to_string(slot_)},
                            {"increase", std::to_string(increase)}});
            return Result<bool>(ErrorKind::SUPPLY, message);
        }
    }
    return Result<bool>(true);
}

Result<bool> Bank::store_account(const PublicKey& address, const svm::Account& account) {
    std::shared_lock<std::shared_mutex> freeze_guard(freeze_mutex_);
    if (frozen_.load()) {
        return Result<bool>(ErrorKind::STATE,
                            "bank for slot " + std::to_string(slot_) + " is frozen");
    }
    if (address.size() != PUBKEY_BYTES) {
        return Result<bool>(ErrorKind::INVALID_ARGUMENT, "address must be 32 bytes");
    }
    if (account.data.size() > svm::MAX_PERMITTED_DATA_LENGTH) {
        return Result<bool>(ErrorKind::INVALID_ARGUMENT,
                            "account data exceeds " +
                                std::to_string(svm::MAX_PERMITTED_DATA_LENGTH) + " bytes");
    }

    std::unique_lock<std::shared_mutex> state_lock(state_mutex_);
    auto existing = lookup_locked(address);
    Lamports old_lamports = existing ? existing->lamports : 0;

    auto supply = check_supply_locked(old_lamports, account.lamports);
    if (!supply.is_ok()) {
        return supply;
    }

    write_locked(address, account);
    capitalization_ = capitalization_ - old_lamports + account.lamports;
    return Result<bool>(true);
}

Result<Lamports> Bank::credit(const PublicKey& address, Lamports amount) {
    std::shared_lock<std::shared_mutex> freeze_guard(freeze_mutex_);
    if (frozen_.load()) {
        return Result<Lamports>(ErrorKind::STATE,
                                "bank for slot " + std::to_string(slot_) + " is frozen");
    }
    if (address.size() != PUBKEY_BYTES) {
        return Result<Lamports>(ErrorKind::INVALID_ARGUMENT, "address must be 32 bytes");
    }

    std::unique_lock<std::shared_mutex> state_lock(state_mutex_);
    auto existing = lookup_locked(address);
    svm::Account account = existing ? *existing : svm::Account::system_owned(0);
    if (!existing) {
        account.rent_epoch = epoch();
    }
    if (account.lamports > UINT64_MAX - amount) {
        return Result<Lamports>(ErrorKind::SUPPLY, "balance would overflow");
    }

    auto supply = check_supply_locked(account.lamports, account.lamports + amount);
    if (!supply.is_ok()) {
        return Result<Lamports>(supply.error_info());
    }

    account.lamports += amount;
    write_locked(address, account);
    capitalization_ += amount;
    return Result<Lamports>(account.lamports);
}

void Bank::update_clock_sysvar() {
    const auto& config = context_->config;
    const Slot slots_per_epoch = config.epoch_schedule.slots_per_epoch;

    svm::ClockSysvar clock;
    clock.slot = slot_;
    clock.epoch = epoch();
    clock.leader_schedule_epoch = clock.epoch + 1;
    clock.unix_timestamp = unix_timestamp();
    Slot epoch_start = clock.epoch * slots_per_epoch;
    clock.epoch_start_timestamp = static_cast<int64_t>(
        config.creation_time + epoch_start * config.ns_per_slot / 1000000000ULL);

    std::unique_lock<std::shared_mutex> state_lock(state_mutex_);
    const PublicKey& id = svm::program_ids::sysvar_clock();
    auto existing = lookup_locked(id);
    Lamports old_lamports = existing ? existing->lamports : 0;

    svm::Account account(old_lamports, clock.serialize(), svm::program_ids::sysvar_owner());
    if (!existing) {
        account.lamports = std::max<Lamports>(1, context_->rent.minimum_balance(svm::ClockSysvar::SIZE));
        capitalization_ += account.lamports;
    }
    account.rent_epoch = existing ? existing->rent_epoch : 0;
    write_locked(id, account);
}

std::shared_ptr<const AccountMap> Bank::flatten() const {
    std::vector<const Bank*> chain;
    for (const Bank* bank = this; bank; bank = bank->parent_.get()) {
        chain.push_back(bank);
    }

    auto merged = std::make_shared<AccountMap>(*base_);
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        std::shared_lock<std::shared_mutex> lock((*it)->state_mutex_);
        for (const auto& entry : (*it)->delta_) {
            if (entry.second.exists()) {
                (*merged)[entry.first] = entry.second;
            } else {
                merged->erase(entry.first);
            }
        }
    }
    return merged;
}

std::vector<std::pair<PublicKey, svm::Account>> Bank::accounts() const {
    auto merged = flatten();
    std::vector<std::pair<PublicKey, svm::Account>> result(merged->begin(), merged->end());
    std::sort(result.begin(), result.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return result;
}

// Accessors

bool Bank::is_frozen() const {
    return frozen_.load();
}

Epoch Bank::epoch() const {
    return svm::rent_utils::calculate_rent_epoch(slot_, context_->config.epoch_schedule.slots_per_epoch);
}

int64_t Bank::unix_timestamp() const {
    const auto& config = context_->config;
    return static_cast<int64_t>(config.creation_time + slot_ * config.ns_per_slot / 1000000000ULL);
}

Hash Bank::blockhash() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return blockhash_;
}

Hash Bank::state_root() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return state_root_;
}

Hash Bank::accounts_delta_hash() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return accounts_delta_hash_;
}

Lamports Bank::capitalization() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return capitalization_;
}

Lamports Bank::collected_fees() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return collected_fees_;
}

Lamports Bank::collected_rent() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return collected_rent_;
}

std::vector<ledger::Transaction> Bank::transactions() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return transactions_;
}

std::vector<TransactionReceipt> Bank::receipts() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return receipts_;
}

std::optional<TransactionReceipt> Bank::get_receipt(const Signature& signature) const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    for (const auto& receipt : receipts_) {
        if (receipt.signature == signature) {
            return receipt;
        }
    }
    return std::nullopt;
}

uint64_t Bank::signature_count() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return transactions_.size();
}

uint64_t Bank::transaction_count() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return parent_transaction_count_ + transactions_.size();
}

} // namespace banking
} // namespace localnet
