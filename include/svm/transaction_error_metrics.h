#pragma once

#include "common/types.h"
#include "svm/transaction_error.h"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace localnet {
namespace svm {

/**
 * Per-cause counters for rejected and failed transactions
 */
struct TransactionErrorMetrics {
    // Account-related errors
    uint64_t account_not_found = 0;
    uint64_t invalid_account_for_fee = 0;
    uint64_t invalid_account_index = 0;
    uint64_t account_in_use = 0;
    uint64_t account_loaded_twice = 0;
    uint64_t too_many_account_locks = 0;

    // Fund-related errors
    uint64_t insufficient_funds_for_fee = 0;
    uint64_t insufficient_funds_for_rent = 0;

    // Instruction and program errors
    uint64_t instruction_error = 0;
    uint64_t program_account_not_found = 0;
    uint64_t invalid_program_for_execution = 0;

    // Replay protection
    uint64_t blockhash_not_found = 0;
    uint64_t already_processed = 0;

    // Signature and format errors
    uint64_t signature_failure = 0;
    uint64_t sanitize_failure = 0;

    /// Bump the counter matching @p error (NONE is ignored)
    void record(TransactionError error);

    uint64_t total_errors() const;
    void reset();
    void add(const TransactionErrorMetrics& other);

    /// Name of the largest counter, "none" when everything is zero
    std::string get_most_common_error() const;

    /// "TransactionErrorMetrics{total=N, name=count, ...}" over non-zero counters
    std::string format() const;

    std::vector<std::pair<std::string, uint64_t>> export_metrics() const;
};

} // namespace svm
} // namespace localnet
