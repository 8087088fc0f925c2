#include "svm/system_instruction.h"
#include "svm/engine.h"
#include "svm/program_ids.h"

namespace localnet {
namespace svm {

namespace {

void put_u32(std::vector<uint8_t>& out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

void put_u64(std::vector<uint8_t>& out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

std::vector<uint8_t> tagged(SystemProgram::InstructionTag tag) {
    std::vector<uint8_t> data;
    put_u32(data, static_cast<uint32_t>(tag));
    return data;
}

} // namespace

namespace system_instruction {

ledger::Instruction create_account(const PublicKey& from, const PublicKey& to,
                                   Lamports lamports, uint64_t space,
                                   const PublicKey& owner) {
    ledger::Instruction ix;
    ix.program_id = program_ids::system_program();
    ix.accounts = {ledger::AccountMeta::writable(from, true),
                   ledger::AccountMeta::writable(to, true)};
    ix.data = tagged(SystemProgram::InstructionTag::CREATE_ACCOUNT);
    put_u64(ix.data, lamports);
    put_u64(ix.data, space);
    ix.data.insert(ix.data.end(), owner.begin(), owner.end());
    return ix;
}

ledger::Instruction assign(const PublicKey& account, const PublicKey& owner) {
    ledger::Instruction ix;
    ix.program_id = program_ids::system_program();
    ix.accounts = {ledger::AccountMeta::writable(account, true)};
    ix.data = tagged(SystemProgram::InstructionTag::ASSIGN);
    ix.data.insert(ix.data.end(), owner.begin(), owner.end());
    return ix;
}

ledger::Instruction transfer(const PublicKey& from, const PublicKey& to,
                             Lamports lamports) {
    ledger::Instruction ix;
    ix.program_id = program_ids::system_program();
    ix.accounts = {ledger::AccountMeta::writable(from, true),
                   ledger::AccountMeta::writable(to, false)};
    ix.data = tagged(SystemProgram::InstructionTag::TRANSFER);
    put_u64(ix.data, lamports);
    return ix;
}

ledger::Instruction allocate(const PublicKey& account, uint64_t space) {
    ledger::Instruction ix;
    ix.program_id = program_ids::system_program();
    ix.accounts = {ledger::AccountMeta::writable(account, true)};
    ix.data = tagged(SystemProgram::InstructionTag::ALLOCATE);
    put_u64(ix.data, space);
    return ix;
}

} // namespace system_instruction

namespace memo_instruction {

ledger::Instruction build(const std::string& memo,
                          const std::vector<PublicKey>& signers) {
    ledger::Instruction ix;
    ix.program_id = program_ids::memo_program();
    for (const auto& signer : signers) {
        ix.accounts.push_back(ledger::AccountMeta::readonly(signer, true));
    }
    ix.data.assign(memo.begin(), memo.end());
    return ix;
}

} // namespace memo_instruction

} // namespace svm
} // namespace localnet
