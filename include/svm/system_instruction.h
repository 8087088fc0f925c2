#pragma once

#include "common/types.h"
#include "ledger/transaction.h"
#include <string>
#include <vector>

namespace localnet {
namespace svm {

using namespace localnet::common;

/**
 * Instruction builders for the system program
 */
namespace system_instruction {

ledger::Instruction create_account(const PublicKey& from, const PublicKey& to,
                                   Lamports lamports, uint64_t space,
                                   const PublicKey& owner);
ledger::Instruction assign(const PublicKey& account, const PublicKey& owner);
ledger::Instruction transfer(const PublicKey& from, const PublicKey& to,
                             Lamports lamports);
ledger::Instruction allocate(const PublicKey& account, uint64_t space);

} // namespace system_instruction

namespace memo_instruction {

/// Memo signed by every key in @p signers
ledger::Instruction build(const std::string& memo,
                          const std::vector<PublicKey>& signers = {});

} // namespace memo_instruction

} // namespace svm
} // namespace localnet
