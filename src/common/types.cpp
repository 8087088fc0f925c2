#include "common/types.h"

namespace localnet {
namespace common {

const char *error_kind_to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::GENERIC:
    return "Error";
  case ErrorKind::CONFIG:
    return "ConfigError";
  case ErrorKind::TRANSACTION:
    return "TxError";
  case ErrorKind::SEQUENCE:
    return "SequenceError";
  case ErrorKind::STATE:
    return "StateError";
  case ErrorKind::SUPPLY:
    return "SupplyError";
  case ErrorKind::BUSY:
    return "Busy";
  case ErrorKind::INVALID_ARGUMENT:
    return "InvalidArgument";
  case ErrorKind::IO:
    return "IoError";
  default:
    return "Unknown";
  }
}

std::string Error::to_string() const {
  return std::string(error_kind_to_string(kind)) + ": " + message;
}

// Explicit template instantiations for frequently used Result types
template class Result<bool>;
template class Result<uint64_t>;
template class Result<int>;

} // namespace common
} // namespace localnet
