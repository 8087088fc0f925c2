#pragma once

#include "common/types.h"
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace localnet {
namespace banking {

using namespace localnet::common;

/// Most account keys a single transaction may lock
constexpr size_t MAX_TX_ACCOUNT_LOCKS = 64;

/**
 * Read/write locks on account addresses held by in-flight transactions
 *
 * A write lock excludes every other lock on the address; read locks share.
 * Acquisition is all-or-nothing and never blocks.
 */
class AccountLocks {
public:
    /// @return false (and lock nothing) if any address conflicts
    bool try_lock(const std::vector<PublicKey>& writable,
                  const std::vector<PublicKey>& readonly);

    void unlock(const std::vector<PublicKey>& writable,
                const std::vector<PublicKey>& readonly);

    bool is_locked(const PublicKey& key) const;

private:
    mutable std::mutex mutex_;
    std::unordered_set<PublicKey> write_locks_;
    std::unordered_map<PublicKey, uint32_t> read_locks_;
};

/**
 * RAII holder releasing its locks on destruction
 */
class AccountLocksGuard {
public:
    AccountLocksGuard(AccountLocks& locks, std::vector<PublicKey> writable,
                      std::vector<PublicKey> readonly)
        : locks_(locks), writable_(std::move(writable)), readonly_(std::move(readonly)),
          locked_(locks_.try_lock(writable_, readonly_)) {}

    ~AccountLocksGuard() {
        if (locked_) {
            locks_.unlock(writable_, readonly_);
        }
    }

    AccountLocksGuard(const AccountLocksGuard&) = delete;
    AccountLocksGuard& operator=(const AccountLocksGuard&) = delete;

    bool locked() const { return locked_; }

private:
    AccountLocks& locks_;
    std::vector<PublicKey> writable_;
    std::vector<PublicKey> readonly_;
    bool locked_;
};

} // namespace banking
} // namespace localnet
