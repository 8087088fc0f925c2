#include "svm/engine.h"
#include "common/encoding.h"
#include "common/logging.h"
#include "svm/program_ids.h"
#include <algorithm>
#include <mutex>
#include <unordered_set>

namespace localnet {
namespace svm {

namespace {

bool read_u32(const std::vector<uint8_t>& data, size_t offset, uint32_t& value) {
    if (offset + 4 > data.size()) {
        return false;
    }
    value = 0;
    for (int i = 0; i < 4; ++i) {
        value |= static_cast<uint32_t>(data[offset + i]) << (i * 8);
    }
    return true;
}

bool read_u64(const std::vector<uint8_t>& data, size_t offset, uint64_t& value) {
    if (offset + 8 > data.size()) {
        return false;
    }
    value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(data[offset + i]) << (i * 8);
    }
    return true;
}

bool read_pubkey(const std::vector<uint8_t>& data, size_t offset, PublicKey& key) {
    if (offset + PUBKEY_BYTES > data.size()) {
        return false;
    }
    key.assign(data.begin() + offset, data.begin() + offset + PUBKEY_BYTES);
    return true;
}

bool is_valid_utf8(const std::vector<uint8_t>& bytes) {
    size_t i = 0;
    while (i < bytes.size()) {
        uint8_t c = bytes[i];
        size_t extra;
        uint32_t min_code;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            min_code = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            min_code = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            min_code = 0x10000;
        } else {
            return false;
        }
        if (i + extra >= bytes.size()) {
            return false;
        }
        uint32_t code = c & (0x3F >> extra);
        for (size_t k = 1; k <= extra; ++k) {
            uint8_t cc = bytes[i + k];
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            code = (code << 6) | (cc & 0x3F);
        }
        if (code < min_code || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

bool is_zeroed(const std::vector<uint8_t>& data) {
    return std::all_of(data.begin(), data.end(), [](uint8_t b) { return b == 0; });
}

} // namespace

// InstructionContext

InstructionContext::InstructionContext(const PublicKey& program_id,
                                       const std::vector<uint8_t>& data,
                                       std::vector<InstructionAccount> accounts,
                                       const std::vector<PublicKey>& keys,
                                       std::vector<Account>& state,
                                       uint64_t compute_limit,
                                       uint64_t& compute_consumed,
                                       std::vector<std::string>& logs)
    : program_id_(program_id), data_(data), accounts_(std::move(accounts)),
      keys_(keys), state_(state), compute_limit_(compute_limit),
      compute_consumed_(compute_consumed), logs_(logs) {}

bool InstructionContext::consume(uint64_t units) {
    if (units > remaining_compute()) {
        compute_consumed_ = compute_limit_;
        return false;
    }
    compute_consumed_ += units;
    return true;
}

uint64_t InstructionContext::remaining_compute() const {
    return compute_consumed_ >= compute_limit_ ? 0 : compute_limit_ - compute_consumed_;
}

void InstructionContext::log(const std::string& message) {
    logs_.push_back("Program log: " + message);
}

// SystemProgram implementation

PublicKey SystemProgram::get_program_id() const {
    return program_ids::system_program();
}

InstructionError SystemProgram::process(InstructionContext& context) const {
    if (!context.consume(COMPUTE_UNITS)) {
        return InstructionError::COMPUTATIONAL_BUDGET_EXCEEDED;
    }

    const auto& data = context.data();
    uint32_t tag = 0;
    if (!read_u32(data, 0, tag)) {
        return InstructionError::INVALID_INSTRUCTION_DATA;
    }

    switch (static_cast<InstructionTag>(tag)) {
        case InstructionTag::CREATE_ACCOUNT: {
            uint64_t lamports = 0;
            uint64_t space = 0;
            PublicKey owner;
            if (data.size() != 52 || !read_u64(data, 4, lamports) ||
                !read_u64(data, 12, space) || !read_pubkey(data, 20, owner)) {
                return InstructionError::INVALID_INSTRUCTION_DATA;
            }
            return create_account(context, lamports, space, owner);
        }
        case InstructionTag::ASSIGN: {
            PublicKey owner;
            if (data.size() != 36 || !read_pubkey(data, 4, owner)) {
                return InstructionError::INVALID_INSTRUCTION_DATA;
            }
            return assign(context, owner);
        }
        case InstructionTag::TRANSFER: {
            uint64_t lamports = 0;
            if (data.size() != 12 || !read_u64(data, 4, lamports)) {
                return InstructionError::INVALID_INSTRUCTION_DATA;
            }
            return transfer(context, lamports);
        }
        case InstructionTag::ALLOCATE: {
            uint64_t space = 0;
            if (data.size() != 12 || !read_u64(data, 4, space)) {
                return InstructionError::INVALID_INSTRUCTION_DATA;
            }
            return allocate(context, 0, space);
        }
        default:
            context.log("unsupported system instruction " + std::to_string(tag));
            return InstructionError::INVALID_INSTRUCTION_DATA;
    }
}

InstructionError SystemProgram::create_account(InstructionContext& context, Lamports lamports,
                                               uint64_t space, const PublicKey& owner) const {
    if (context.account_count() < 2) {
        return InstructionError::NOT_ENOUGH_ACCOUNT_KEYS;
    }
    if (!context.is_signer(0) || !context.is_signer(1)) {
        return InstructionError::MISSING_REQUIRED_SIGNATURE;
    }

    Account& to = context.account(1);
    if (to.lamports > 0) {
        context.log("Create Account: account " + encode_base58(context.key(1)) + " already in use");
        return InstructionError::ACCOUNT_ALREADY_IN_USE;
    }

    InstructionError result = allocate(context, 1, space);
    if (result != InstructionError::NONE) {
        return result;
    }
    to.owner = owner;

    return transfer(context, lamports);
}

InstructionError SystemProgram::assign(InstructionContext& context, const PublicKey& owner) const {
    if (context.account_count() < 1) {
        return InstructionError::NOT_ENOUGH_ACCOUNT_KEYS;
    }
    Account& account = context.account(0);
    if (account.owner == owner) {
        return InstructionError::NONE;
    }
    if (!context.is_signer(0)) {
        context.log("Assign: account " + encode_base58(context.key(0)) + " must sign");
        return InstructionError::MISSING_REQUIRED_SIGNATURE;
    }
    account.owner = owner;
    return InstructionError::NONE;
}

InstructionError SystemProgram::transfer(InstructionContext& context, Lamports lamports) const {
    if (context.account_count() < 2) {
        return InstructionError::NOT_ENOUGH_ACCOUNT_KEYS;
    }
    if (!context.is_signer(0)) {
        context.log("Transfer: `from` account " + encode_base58(context.key(0)) + " must sign");
        return InstructionError::MISSING_REQUIRED_SIGNATURE;
    }

    Account& from = context.account(0);
    if (!from.data.empty()) {
        context.log("Transfer: `from` must not carry data");
        return InstructionError::INVALID_ARGUMENT;
    }
    if (lamports > from.lamports) {
        context.log("Transfer: insufficient lamports " + std::to_string(from.lamports) +
                    ", need " + std::to_string(lamports));
        return InstructionError::INSUFFICIENT_FUNDS;
    }

    from.lamports -= lamports;
    Account& to = context.account(1);
    if (to.lamports > UINT64_MAX - lamports) {
        return InstructionError::INVALID_ARGUMENT;
    }
    to.lamports += lamports;
    return InstructionError::NONE;
}

InstructionError SystemProgram::allocate(InstructionContext& context, size_t target,
                                         uint64_t space) const {
    if (context.account_count() <= target) {
        return InstructionError::NOT_ENOUGH_ACCOUNT_KEYS;
    }
    if (!context.is_signer(target)) {
        context.log("Allocate: account " + encode_base58(context.key(target)) + " must sign");
        return InstructionError::MISSING_REQUIRED_SIGNATURE;
    }

    Account& account = context.account(target);
    if (!account.data.empty() || account.owner != program_ids::system_program()) {
        context.log("Allocate: account " + encode_base58(context.key(target)) + " already in use");
        return InstructionError::ACCOUNT_ALREADY_IN_USE;
    }
    if (space > MAX_PERMITTED_DATA_LENGTH) {
        context.log("Allocate: requested " + std::to_string(space) + ", max allowed " +
                    std::to_string(MAX_PERMITTED_DATA_LENGTH));
        return InstructionError::INVALID_REALLOC;
    }

    account.data.assign(static_cast<size_t>(space), 0);
    return InstructionError::NONE;
}

// MemoProgram implementation

PublicKey MemoProgram::get_program_id() const {
    return program_ids::memo_program();
}

InstructionError MemoProgram::process(InstructionContext& context) const {
    if (!context.consume(COMPUTE_UNITS)) {
        return InstructionError::COMPUTATIONAL_BUDGET_EXCEEDED;
    }

    for (size_t i = 0; i < context.account_count(); ++i) {
        if (!context.is_signer(i)) {
            context.log("Missing required signature for " + encode_base58(context.key(i)));
            return InstructionError::MISSING_REQUIRED_SIGNATURE;
        }
    }

    const auto& data = context.data();
    if (!is_valid_utf8(data)) {
        context.log("Invalid UTF-8");
        return InstructionError::INVALID_INSTRUCTION_DATA;
    }

    context.log("Memo (len " + std::to_string(data.size()) + "): \"" +
                std::string(data.begin(), data.end()) + "\"");
    return InstructionError::NONE;
}

std::vector<PublicKey> builtin_program_ids() {
    return {program_ids::system_program(), program_ids::memo_program()};
}

// ExecutionEngine implementation

ExecutionEngine::ExecutionEngine() = default;
ExecutionEngine::~ExecutionEngine() = default;

void ExecutionEngine::register_builtins() {
    register_builtin_program(std::make_unique<SystemProgram>());
    register_builtin_program(std::make_unique<MemoProgram>());
}

void ExecutionEngine::register_builtin_program(std::unique_ptr<BuiltinProgram> program) {
    if (!program) {
        return;
    }
    PublicKey id = program->get_program_id();
    LOG_DEBUG("Registered program ", program->name(), " at ", encode_base58(id));
    std::unique_lock<std::shared_mutex> lock(programs_mutex_);
    programs_[id] = std::shared_ptr<const BuiltinProgram>(std::move(program));
}

bool ExecutionEngine::is_program_registered(const PublicKey& program_id) const {
    std::shared_lock<std::shared_mutex> lock(programs_mutex_);
    return programs_.count(program_id) > 0;
}

std::vector<PublicKey> ExecutionEngine::registered_program_ids() const {
    std::shared_lock<std::shared_mutex> lock(programs_mutex_);
    std::vector<PublicKey> ids;
    ids.reserve(programs_.size());
    for (const auto& entry : programs_) {
        ids.push_back(entry.first);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::shared_ptr<const BuiltinProgram>
ExecutionEngine::find_program(const PublicKey& program_id) const {
    std::shared_lock<std::shared_mutex> lock(programs_mutex_);
    auto it = programs_.find(program_id);
    return it == programs_.end() ? nullptr : it->second;
}

ExecutionOutcome ExecutionEngine::execute_message(const ledger::Message& message,
                                                  std::vector<Account>& accounts,
                                                  uint64_t compute_limit) const {
    ExecutionOutcome outcome;

    for (size_t ix_index = 0; ix_index < message.instructions.size(); ++ix_index) {
        const auto& ix = message.instructions[ix_index];
        const PublicKey& program_id = message.account_keys[ix.program_id_index];
        const std::string program_name = encode_base58(program_id);

        outcome.logs.push_back("Program " + program_name + " invoke [1]");

        auto fail = [&](InstructionError error) {
            outcome.status = TransactionError::INSTRUCTION_ERROR;
            outcome.instruction_error = error;
            outcome.failed_instruction = static_cast<uint8_t>(ix_index);
            outcome.logs.push_back("Program " + program_name + " failed: " +
                                   instruction_error_to_string(error));
            total_compute_units_ += outcome.compute_units_consumed;
        };

        auto program = find_program(program_id);
        if (!program) {
            fail(InstructionError::UNSUPPORTED_PROGRAM_ID);
            return outcome;
        }

        std::vector<InstructionAccount> ix_accounts;
        ix_accounts.reserve(ix.accounts.size());
        for (uint8_t index : ix.accounts) {
            ix_accounts.push_back(InstructionAccount{index, message.is_signer(index),
                                                     message.is_writable(index)});
        }

        std::vector<Account> pre = accounts;
        uint64_t consumed_before = outcome.compute_units_consumed;

        InstructionContext context(program_id, ix.data, ix_accounts, message.account_keys,
                                   accounts, compute_limit, outcome.compute_units_consumed,
                                   outcome.logs);
        InstructionError result = program->process(context);
        ++total_instructions_;

        if (result == InstructionError::NONE) {
            result = verify_instruction(program_id, ix_accounts, pre, accounts);
        }

        outcome.logs.push_back("Program " + program_name + " consumed " +
                               std::to_string(outcome.compute_units_consumed - consumed_before) +
                               " of " + std::to_string(compute_limit - consumed_before) +
                               " compute units");

        if (result != InstructionError::NONE) {
            fail(result);
            return outcome;
        }
        outcome.logs.push_back("Program " + program_name + " success");
    }

    total_compute_units_ += outcome.compute_units_consumed;
    return outcome;
}

InstructionError ExecutionEngine::verify_instruction(const PublicKey& program_id,
                                                     const std::vector<InstructionAccount>& accounts,
                                                     const std::vector<Account>& pre,
                                                     const std::vector<Account>& post) const {
    std::unordered_set<size_t> seen;
    Lamports pre_total = 0;
    Lamports post_total = 0;

    for (const auto& ia : accounts) {
        if (!seen.insert(ia.index).second) {
            continue;
        }
        const Account& before = pre[ia.index];
        const Account& after = post[ia.index];
        // A key appearing twice is writable if any occurrence is
        bool writable = ia.is_writable;
        for (const auto& other : accounts) {
            if (other.index == ia.index && other.is_writable) {
                writable = true;
            }
        }

        if (after.executable != before.executable) {
            return InstructionError::EXECUTABLE_MODIFIED;
        }

        if (!writable) {
            if (after.lamports != before.lamports) {
                return InstructionError::READONLY_LAMPORT_CHANGE;
            }
            if (after.data != before.data) {
                return InstructionError::READONLY_DATA_MODIFIED;
            }
            if (after.owner != before.owner) {
                return InstructionError::MODIFIED_PROGRAM_ID;
            }
        } else {
            if (after.owner != before.owner &&
                (before.owner != program_id || before.executable || !is_zeroed(after.data))) {
                return InstructionError::MODIFIED_PROGRAM_ID;
            }
            if (after.lamports < before.lamports && before.owner != program_id) {
                return InstructionError::EXTERNAL_ACCOUNT_LAMPORT_SPEND;
            }
            if (after.data != before.data && before.owner != program_id) {
                return InstructionError::EXTERNAL_ACCOUNT_DATA_MODIFIED;
            }
            if (after.data.size() > MAX_PERMITTED_DATA_LENGTH) {
                return InstructionError::INVALID_REALLOC;
            }
        }

        pre_total += before.lamports;
        post_total += after.lamports;
    }

    if (pre_total != post_total) {
        return InstructionError::UNBALANCED_INSTRUCTION;
    }
    return InstructionError::NONE;
}

uint64_t ExecutionEngine::get_total_instructions_executed() const {
    return total_instructions_.load();
}

uint64_t ExecutionEngine::get_total_compute_units_consumed() const {
    return total_compute_units_.load();
}

} // namespace svm
} // namespace localnet
