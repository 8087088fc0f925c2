#include "svm/transaction_error_metrics.h"
#include <sstream>

namespace localnet {
namespace svm {

void TransactionErrorMetrics::record(TransactionError error) {
    switch (error) {
    case TransactionError::NONE:
        break;
    case TransactionError::ACCOUNT_IN_USE:
        ++account_in_use;
        break;
    case TransactionError::ACCOUNT_LOADED_TWICE:
        ++account_loaded_twice;
        break;
    case TransactionError::ACCOUNT_NOT_FOUND:
        ++account_not_found;
        break;
    case TransactionError::PROGRAM_ACCOUNT_NOT_FOUND:
        ++program_account_not_found;
        break;
    case TransactionError::INSUFFICIENT_FUNDS_FOR_FEE:
        ++insufficient_funds_for_fee;
        break;
    case TransactionError::INVALID_ACCOUNT_FOR_FEE:
        ++invalid_account_for_fee;
        break;
    case TransactionError::ALREADY_PROCESSED:
        ++already_processed;
        break;
    case TransactionError::BLOCKHASH_NOT_FOUND:
        ++blockhash_not_found;
        break;
    case TransactionError::INSTRUCTION_ERROR:
        ++instruction_error;
        break;
    case TransactionError::INVALID_ACCOUNT_INDEX:
        ++invalid_account_index;
        break;
    case TransactionError::SIGNATURE_FAILURE:
        ++signature_failure;
        break;
    case TransactionError::INVALID_PROGRAM_FOR_EXECUTION:
        ++invalid_program_for_execution;
        break;
    case TransactionError::SANITIZE_FAILURE:
        ++sanitize_failure;
        break;
    case TransactionError::TOO_MANY_ACCOUNT_LOCKS:
        ++too_many_account_locks;
        break;
    case TransactionError::INSUFFICIENT_FUNDS_FOR_RENT:
        ++insufficient_funds_for_rent;
        break;
    }
}

uint64_t TransactionErrorMetrics::total_errors() const {
    uint64_t total = 0;
    for (const auto& metric : export_metrics()) {
        total += metric.second;
    }
    return total;
}

void TransactionErrorMetrics::reset() {
    *this = TransactionErrorMetrics{};
}

void TransactionErrorMetrics::add(const TransactionErrorMetrics& other) {
    account_not_found += other.account_not_found;
    invalid_account_for_fee += other.invalid_account_for_fee;
    invalid_account_index += other.invalid_account_index;
    account_in_use += other.account_in_use;
    account_loaded_twice += other.account_loaded_twice;
    too_many_account_locks += other.too_many_account_locks;

    insufficient_funds_for_fee += other.insufficient_funds_for_fee;
    insufficient_funds_for_rent += other.insufficient_funds_for_rent;

    instruction_error += other.instruction_error;
    program_account_not_found += other.program_account_not_found;
    invalid_program_for_execution += other.invalid_program_for_execution;

    blockhash_not_found += other.blockhash_not_found;
    already_processed += other.already_processed;

    signature_failure += other.signature_failure;
    sanitize_failure += other.sanitize_failure;
}

std::string TransactionErrorMetrics::get_most_common_error() const {
    std::string name = "none";
    uint64_t best = 0;
    for (const auto& metric : export_metrics()) {
        if (metric.second > best) {
            best = metric.second;
            name = metric.first;
        }
    }
    return name;
}

std::string TransactionErrorMetrics::format() const {
    std::ostringstream ss;
    ss << "TransactionErrorMetrics{total=" << total_errors();
    for (const auto& metric : export_metrics()) {
        if (metric.second > 0) {
            ss << ", " << metric.first << "=" << metric.second;
        }
    }
    ss << "}";
    return ss.str();
}

std::vector<std::pair<std::string, uint64_t>> TransactionErrorMetrics::export_metrics() const {
    return {
        {"account_not_found", account_not_found},
        {"invalid_account_for_fee", invalid_account_for_fee},
        {"invalid_account_index", invalid_account_index},
        {"account_in_use", account_in_use},
        {"account_loaded_twice", account_loaded_twice},
        {"too_many_account_locks", too_many_account_locks},
        {"insufficient_funds_for_fee", insufficient_funds_for_fee},
        {"insufficient_funds_for_rent", insufficient_funds_for_rent},
        {"instruction_error", instruction_error},
        {"program_account_not_found", program_account_not_found},
        {"invalid_program_for_execution", invalid_program_for_execution},
        {"blockhash_not_found", blockhash_not_found},
        {"already_processed", already_processed},
        {"signature_failure", signature_failure},
        {"sanitize_failure", sanitize_failure},
    };
}

} // namespace svm
} // namespace localnet
