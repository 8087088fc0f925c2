#include "banking/account_locks.h"

namespace localnet {
namespace banking {

bool AccountLocks::try_lock(const std::vector<PublicKey>& writable,
                            const std::vector<PublicKey>& readonly) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& key : writable) {
        if (write_locks_.count(key) || read_locks_.count(key)) {
            return false;
        }
    }
    for (const auto& key : readonly) {
        if (write_locks_.count(key)) {
            return false;
        }
    }

    for (const auto& key : writable) {
        write_locks_.insert(key);
    }
    for (const auto& key : readonly) {
        ++read_locks_[key];
    }
    return true;
}

void AccountLocks::unlock(const std::vector<PublicKey>& writable,
                          const std::vector<PublicKey>& readonly) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& key : writable) {
        write_locks_.erase(key);
    }
    for (const auto& key : readonly) {
        auto it = read_locks_.find(key);
        if (it != read_locks_.end() && --it->second == 0) {
            read_locks_.erase(it);
        }
    }
}

bool AccountLocks::is_locked(const PublicKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_locks_.count(key) > 0 || read_locks_.count(key) > 0;
}

} // namespace banking
} // namespace localnet
