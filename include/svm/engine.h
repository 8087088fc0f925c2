#pragma once

#include "common/types.h"
#include "ledger/transaction.h"
#include "svm/account.h"
#include "svm/transaction_error.h"
#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace localnet {
namespace svm {

using namespace localnet::common;

/// Default per-transaction compute limit
constexpr uint64_t DEFAULT_COMPUTE_UNIT_LIMIT = 200000;

/**
 * Account as seen by one instruction: a position in the transaction's
 * account list plus the privileges the message grants it.
 */
struct InstructionAccount {
    size_t index;
    bool is_signer;
    bool is_writable;
};

/**
 * Everything a program may touch while processing one instruction
 */
class InstructionContext {
public:
    InstructionContext(const PublicKey& program_id,
                       const std::vector<uint8_t>& data,
                       std::vector<InstructionAccount> accounts,
                       const std::vector<PublicKey>& keys,
                       std::vector<Account>& state,
                       uint64_t compute_limit,
                       uint64_t& compute_consumed,
                       std::vector<std::string>& logs);

    const PublicKey& program_id() const { return program_id_; }
    const std::vector<uint8_t>& data() const { return data_; }

    size_t account_count() const { return accounts_.size(); }
    const PublicKey& key(size_t i) const { return keys_[accounts_[i].index]; }
    Account& account(size_t i) { return state_[accounts_[i].index]; }
    const Account& account(size_t i) const { return state_[accounts_[i].index]; }
    bool is_signer(size_t i) const { return accounts_[i].is_signer; }
    bool is_writable(size_t i) const { return accounts_[i].is_writable; }

    /**
     * Charge compute units against the transaction budget
     * @return false once the budget is exhausted
     */
    bool consume(uint64_t units);

    uint64_t remaining_compute() const;

    /// Append a "Program log: ..." line
    void log(const std::string& message);

private:
    const PublicKey& program_id_;
    const std::vector<uint8_t>& data_;
    std::vector<InstructionAccount> accounts_;
    const std::vector<PublicKey>& keys_;
    std::vector<Account>& state_;
    uint64_t compute_limit_;
    uint64_t& compute_consumed_;
    std::vector<std::string>& logs_;
};

/**
 * Built-in program interface
 *
 * Programs other than the builtins (preloaded ELF programs) run through an
 * executor registered with the same interface.
 */
class BuiltinProgram {
public:
    virtual ~BuiltinProgram() = default;
    virtual PublicKey get_program_id() const = 0;
    virtual std::string name() const = 0;
    virtual InstructionError process(InstructionContext& context) const = 0;
};

/**
 * System program: account creation, assignment, allocation and transfers
 *
 * Instruction data is bincode: a u32 little-endian tag followed by fields.
 */
class SystemProgram : public BuiltinProgram {
public:
    static constexpr uint64_t COMPUTE_UNITS = 150;

    enum class InstructionTag : uint32_t {
        CREATE_ACCOUNT = 0,
        ASSIGN = 1,
        TRANSFER = 2,
        ALLOCATE = 8
    };

    PublicKey get_program_id() const override;
    std::string name() const override { return "system"; }
    InstructionError process(InstructionContext& context) const override;

private:
    InstructionError create_account(InstructionContext& context, Lamports lamports,
                                    uint64_t space, const PublicKey& owner) const;
    InstructionError assign(InstructionContext& context, const PublicKey& owner) const;
    InstructionError transfer(InstructionContext& context, Lamports lamports) const;
    InstructionError allocate(InstructionContext& context, size_t target, uint64_t space) const;
};

/**
 * Memo program: logs a UTF-8 memo; every passed account must sign
 */
class MemoProgram : public BuiltinProgram {
public:
    static constexpr uint64_t COMPUTE_UNITS = 100;

    PublicKey get_program_id() const override;
    std::string name() const override { return "memo"; }
    InstructionError process(InstructionContext& context) const override;
};

/// Program ids of the builtins every genesis carries
std::vector<PublicKey> builtin_program_ids();

/**
 * Outcome of executing a message's instructions
 */
struct ExecutionOutcome {
    TransactionError status = TransactionError::NONE;
    InstructionError instruction_error = InstructionError::NONE;
    std::optional<uint8_t> failed_instruction;
    uint64_t compute_units_consumed = 0;
    std::vector<std::string> logs;

    bool is_success() const { return status == TransactionError::NONE; }
};

/**
 * SVM execution engine
 *
 * Dispatches each instruction to the program registered for its program id
 * and checks the runtime invariants after every instruction. Thread safe:
 * banks execute concurrently against one shared engine.
 */
class ExecutionEngine {
public:
    ExecutionEngine();
    ~ExecutionEngine();

    /// Register the system and memo programs
    void register_builtins();

    /// Register (or replace) the executor for a program id
    void register_builtin_program(std::unique_ptr<BuiltinProgram> program);
    bool is_program_registered(const PublicKey& program_id) const;
    std::vector<PublicKey> registered_program_ids() const;

    /**
     * Run every instruction of @p message against @p accounts (one entry per
     * account key). On failure @p accounts is left partially modified; the
     * caller owns the copy and discards it.
     */
    ExecutionOutcome execute_message(const ledger::Message& message,
                                     std::vector<Account>& accounts,
                                     uint64_t compute_limit) const;

    // Statistics
    uint64_t get_total_instructions_executed() const;
    uint64_t get_total_compute_units_consumed() const;

private:
    std::shared_ptr<const BuiltinProgram> find_program(const PublicKey& program_id) const;

    InstructionError verify_instruction(const PublicKey& program_id,
                                        const std::vector<InstructionAccount>& accounts,
                                        const std::vector<Account>& pre,
                                        const std::vector<Account>& post) const;

    mutable std::shared_mutex programs_mutex_;
    std::unordered_map<PublicKey, std::shared_ptr<const BuiltinProgram>> programs_;

    mutable std::atomic<uint64_t> total_instructions_{0};
    mutable std::atomic<uint64_t> total_compute_units_{0};
};

} // namespace svm
} // namespace localnet
