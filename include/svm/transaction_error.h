#pragma once

#include "common/types.h"
#include <cstdint>
#include <string>

namespace localnet {
namespace svm {

/**
 * Reasons a transaction is rejected or fails.
 *
 * Values mirror the cluster's TransactionError so that test authors can
 * assert on the exact cause. INSTRUCTION_ERROR and
 * INSUFFICIENT_FUNDS_FOR_RENT only appear in receipts (the transaction was
 * executed and recorded); every other value is a rejection.
 */
enum class TransactionError : uint32_t {
    NONE = 0,
    ACCOUNT_IN_USE,
    ACCOUNT_LOADED_TWICE,
    ACCOUNT_NOT_FOUND,
    PROGRAM_ACCOUNT_NOT_FOUND,
    INSUFFICIENT_FUNDS_FOR_FEE,
    INVALID_ACCOUNT_FOR_FEE,
    ALREADY_PROCESSED,
    BLOCKHASH_NOT_FOUND,
    INSTRUCTION_ERROR,
    INVALID_ACCOUNT_INDEX,
    SIGNATURE_FAILURE,
    INVALID_PROGRAM_FOR_EXECUTION,
    SANITIZE_FAILURE,
    TOO_MANY_ACCOUNT_LOCKS,
    INSUFFICIENT_FUNDS_FOR_RENT
};

/**
 * Failure of a single instruction inside an executed transaction.
 */
enum class InstructionError : uint32_t {
    NONE = 0,
    GENERIC_ERROR,
    INVALID_ARGUMENT,
    INVALID_INSTRUCTION_DATA,
    INVALID_ACCOUNT_DATA,
    INSUFFICIENT_FUNDS,
    INCORRECT_PROGRAM_ID,
    MISSING_REQUIRED_SIGNATURE,
    ACCOUNT_ALREADY_IN_USE,
    UNBALANCED_INSTRUCTION,
    EXTERNAL_ACCOUNT_LAMPORT_SPEND,
    READONLY_LAMPORT_CHANGE,
    READONLY_DATA_MODIFIED,
    EXTERNAL_ACCOUNT_DATA_MODIFIED,
    EXECUTABLE_MODIFIED,
    MODIFIED_PROGRAM_ID,
    NOT_ENOUGH_ACCOUNT_KEYS,
    INVALID_REALLOC,
    COMPUTATIONAL_BUDGET_EXCEEDED,
    UNSUPPORTED_PROGRAM_ID
};

const char* transaction_error_to_string(TransactionError error);
const char* instruction_error_to_string(InstructionError error);

/**
 * Build the Error carried by a rejected transaction.
 * kind = TRANSACTION, code = the TransactionError value.
 */
common::Error make_transaction_error(TransactionError error, const std::string& detail = "");

/**
 * Recover the TransactionError from a failed Result.
 * Returns NONE for successes and for non-transaction errors.
 */
template <typename T>
TransactionError transaction_error_of(const common::Result<T>& result) {
    if (result.is_ok() || result.error_kind() != common::ErrorKind::TRANSACTION) {
        return TransactionError::NONE;
    }
    return static_cast<TransactionError>(result.error_code());
}

} // namespace svm
} // namespace localnet
