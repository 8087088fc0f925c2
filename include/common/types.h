#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace localnet {
namespace common {

/**
 * @file types.h
 * @brief Fundamental types and utilities used throughout the local validator
 *
 * This header defines core data types, the runtime configuration structure
 * and the Result<T> type that every fallible operation returns.
 */

/// @brief Cryptographic hash representation (SHA-256, 32 bytes)
using Hash = std::vector<uint8_t>;

/// @brief Ed25519 public key representation (32 bytes)
using PublicKey = std::vector<uint8_t>;

/// @brief Ed25519 signature representation (64 bytes)
using Signature = std::vector<uint8_t>;

/// @brief Slot number representing the position of a block in the chain
using Slot = uint64_t;

/// @brief Epoch number (a fixed number of slots)
using Epoch = uint64_t;

/// @brief Native token amount in smallest unit (1 SOL = 1,000,000,000 lamports)
using Lamports = uint64_t;

constexpr size_t PUBKEY_BYTES = 32;
constexpr size_t HASH_BYTES = 32;
constexpr size_t SIGNATURE_BYTES = 64;

/**
 * @brief Runtime configuration of the local validator process
 *
 * Genesis parameters (balances, fees, rent) live in genesis::GenesisConfig;
 * this structure only carries how the process runs.
 */
struct ValidatorConfig {
  uint32_t tick_interval_ms = 400;     ///< Production cadence, 0 for manual-only
  std::string genesis_config_path;     ///< JSON file with genesis options (optional)
  std::string log_level = "info";      ///< trace/debug/info/warn/error/critical
  bool log_json = false;               ///< Emit JSON log lines instead of text
  bool async_logging = false;          ///< Hand log lines to a background writer
  uint32_t stats_interval_ms = 30000;  ///< CLI stats print interval
  Slot warp_slot = 0;                  ///< Warp to this slot right after boot (0 = off)
};

/**
 * @brief Error categories reported through Result<T>
 *
 * CONFIG, TRANSACTION, SEQUENCE, STATE, SUPPLY and BUSY form the validator's
 * error taxonomy. SEQUENCE is an invariant violation and halts the ledger.
 */
enum class ErrorKind {
  GENERIC = 0,
  CONFIG,
  TRANSACTION,
  SEQUENCE,
  STATE,
  SUPPLY,
  BUSY,
  INVALID_ARGUMENT,
  IO
};

/// @brief Human readable name of an error kind ("ConfigError", "TxError", ...)
const char *error_kind_to_string(ErrorKind kind);

/**
 * @brief Error payload carried by a failed Result
 *
 * For ErrorKind::TRANSACTION, @p code holds the svm::TransactionError value.
 */
struct Error {
  ErrorKind kind = ErrorKind::GENERIC;
  uint32_t code = 0;
  std::string message;

  Error() = default;
  Error(ErrorKind k, std::string msg, uint32_t c = 0)
      : kind(k), code(c), message(std::move(msg)) {}

  /// "TxError: blockhash not found (...)" style rendering for logs
  std::string to_string() const;
};

/**
 * @brief Type-safe result wrapper for operations that can fail
 *
 * Implements a Result<T> pattern similar to Rust's Result type. A failed
 * result carries an Error with a kind from the validator's taxonomy so
 * callers can react to specific failure classes.
 *
 * @tparam T The type of the success value
 *
 * Example usage:
 * @code
 * auto result = bank->apply(tx);
 * if (result.is_ok()) {
 *     auto receipt = result.value();
 * } else if (result.error_kind() == ErrorKind::TRANSACTION) {
 *     std::cerr << "Rejected: " << result.error() << std::endl;
 * }
 * @endcode
 */
template <typename T>
class Result {
private:
  bool success_;
  T value_;
  Error error_;

public:
  /**
   * @brief Construct a successful result with a value
   * @param value The success value to store
   */
  explicit Result(T value) : success_(true), value_(std::move(value)) {}

  /**
   * @brief Construct a failed result with a generic error message
   * @param error C-string describing the error
   */
  explicit Result(const char *error)
      : success_(false), value_(), error_(ErrorKind::GENERIC, error) {}

  /**
   * @brief Construct a failed result with a generic error message
   * @param error String describing the error
   */
  explicit Result(const std::string &error)
      : success_(false), value_(), error_(ErrorKind::GENERIC, error) {}

  /**
   * @brief Construct a failed result from a classified error
   * @param error The error kind, code and message
   */
  explicit Result(Error error)
      : success_(false), value_(), error_(std::move(error)) {}

  /**
   * @brief Construct a failed result of a given kind
   */
  Result(ErrorKind kind, const std::string &message, uint32_t code = 0)
      : success_(false), value_(), error_(kind, message, code) {}

  Result(const Result &other) = default;
  Result(Result &&other) noexcept = default;
  Result &operator=(const Result &other) = default;
  Result &operator=(Result &&other) noexcept = default;

  /// @brief true if the operation succeeded
  bool is_ok() const noexcept { return success_; }

  /// @brief true if the operation failed
  bool is_err() const noexcept { return !success_; }

  /**
   * @brief Get the success value (lvalue reference)
   * @warning Only call this if is_ok() returns true
   */
  const T &value() const & { return value_; }

  /**
   * @brief Get the success value (rvalue reference)
   * @warning Only call this if is_ok() returns true
   */
  T &&value() && { return std::move(value_); }

  /// @brief The error message (empty on success)
  const std::string &error() const noexcept { return error_.message; }

  /// @brief The error category (GENERIC on success)
  ErrorKind error_kind() const noexcept { return error_.kind; }

  /// @brief Kind-specific error code, e.g. the svm::TransactionError
  uint32_t error_code() const noexcept { return error_.code; }

  /// @brief The full error, used to forward a failure into another Result
  const Error &error_info() const noexcept { return error_; }

  explicit operator bool() const noexcept { return success_; }

  /**
   * @brief Get value or return default on error
   */
  T value_or(const T &default_value) const {
    return success_ ? value_ : default_value;
  }
};

} // namespace common
} // namespace localnet

/**
 * @brief Standard library hash specialization for byte vectors
 *
 * Enables use of Hash, PublicKey, and Signature types as keys in
 * std::unordered_map and std::unordered_set containers.
 */
namespace std {
template <>
struct hash<std::vector<uint8_t>> {
  std::size_t operator()(const std::vector<uint8_t> &v) const noexcept {
    std::size_t seed = v.size();
    for (const auto &byte : v) {
      // Boost-style hash combine
      seed ^= byte + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
  }
};
} // namespace std
