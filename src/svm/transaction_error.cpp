#include "svm/transaction_error.h"

namespace localnet {
namespace svm {

const char *transaction_error_to_string(TransactionError error) {
  switch (error) {
  case TransactionError::NONE:
    return "ok";
  case TransactionError::ACCOUNT_IN_USE:
    return "account in use";
  case TransactionError::ACCOUNT_LOADED_TWICE:
    return "account loaded twice";
  case TransactionError::ACCOUNT_NOT_FOUND:
    return "account not found";
  case TransactionError::PROGRAM_ACCOUNT_NOT_FOUND:
    return "program account not found";
  case TransactionError::INSUFFICIENT_FUNDS_FOR_FEE:
    return "insufficient funds for fee";
  case TransactionError::INVALID_ACCOUNT_FOR_FEE:
    return "invalid account for fee";
  case TransactionError::ALREADY_PROCESSED:
    return "already processed";
  case TransactionError::BLOCKHASH_NOT_FOUND:
    return "blockhash not found";
  case TransactionError::INSTRUCTION_ERROR:
    return "instruction error";
  case TransactionError::INVALID_ACCOUNT_INDEX:
    return "invalid account index";
  case TransactionError::SIGNATURE_FAILURE:
    return "signature failure";
  case TransactionError::INVALID_PROGRAM_FOR_EXECUTION:
    return "invalid program for execution";
  case TransactionError::SANITIZE_FAILURE:
    return "sanitize failure";
  case TransactionError::TOO_MANY_ACCOUNT_LOCKS:
    return "too many account locks";
  case TransactionError::INSUFFICIENT_FUNDS_FOR_RENT:
    return "insufficient funds for rent";
  default:
    return "unknown transaction error";
  }
}

const char *instruction_error_to_string(InstructionError error) {
  switch (error) {
  case InstructionError::NONE:
    return "ok";
  case InstructionError::GENERIC_ERROR:
    return "generic instruction error";
  case InstructionError::INVALID_ARGUMENT:
    return "invalid program argument";
  case InstructionError::INVALID_INSTRUCTION_DATA:
    return "invalid instruction data";
  case InstructionError::INVALID_ACCOUNT_DATA:
    return "invalid account data for instruction";
  case InstructionError::INSUFFICIENT_FUNDS:
    return "insufficient funds for instruction";
  case InstructionError::INCORRECT_PROGRAM_ID:
    return "incorrect program id for instruction";
  case InstructionError::MISSING_REQUIRED_SIGNATURE:
    return "missing required signature for instruction";
  case InstructionError::ACCOUNT_ALREADY_IN_USE:
    return "account already in use";
  case InstructionError::UNBALANCED_INSTRUCTION:
    return "sum of account balances before and after instruction do not match";
  case InstructionError::EXTERNAL_ACCOUNT_LAMPORT_SPEND:
    return "instruction spent from the balance of an account it does not own";
  case InstructionError::READONLY_LAMPORT_CHANGE:
    return "instruction changed the balance of a read-only account";
  case InstructionError::READONLY_DATA_MODIFIED:
    return "instruction modified data of a read-only account";
  case InstructionError::EXTERNAL_ACCOUNT_DATA_MODIFIED:
    return "instruction modified data of an account it does not own";
  case InstructionError::EXECUTABLE_MODIFIED:
    return "instruction changed executable bit of an account";
  case InstructionError::MODIFIED_PROGRAM_ID:
    return "instruction illegally modified the program id of an account";
  case InstructionError::NOT_ENOUGH_ACCOUNT_KEYS:
    return "insufficient account keys for instruction";
  case InstructionError::INVALID_REALLOC:
    return "failed to reallocate account data";
  case InstructionError::COMPUTATIONAL_BUDGET_EXCEEDED:
    return "computational budget exceeded";
  case InstructionError::UNSUPPORTED_PROGRAM_ID:
    return "unsupported program id";
  default:
    return "unknown instruction error";
  }
}

common::Error make_transaction_error(TransactionError error,
                                     const std::string &detail) {
  std::string message = transaction_error_to_string(error);
  if (!detail.empty()) {
    message += " (" + detail + ")";
  }
  return common::Error(common::ErrorKind::TRANSACTION, message,
                       static_cast<uint32_t>(error));
}

} // namespace svm
} // namespace localnet
