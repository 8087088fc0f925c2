#pragma once

#include "common/types.h"
#include <mutex>
#include <unordered_map>

namespace localnet {
namespace banking {

using namespace localnet::common;

/**
 * Signatures committed on the chain, keyed to the slot that holds them
 *
 * The chain has no forks, so one cache is shared by every bank built from
 * the same genesis. Entries older than the replay window are purged: a
 * transaction that old already fails the blockhash check.
 */
class StatusCache {
public:
    explicit StatusCache(size_t window) : window_(window) {}

    void insert(const Signature& signature, Slot slot) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[signature] = slot;
    }

    /// True when @p signature was committed at or within the window before @p slot
    bool contains(const Signature& signature, Slot slot) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(signature);
        return it != entries_.end() && it->second <= slot && slot - it->second <= window_;
    }

    /// Drop entries committed more than the window before @p slot
    void purge(Slot slot) {
        if (slot <= window_) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->second < slot - window_) {
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    size_t window_;
    mutable std::mutex mutex_;
    std::unordered_map<Signature, Slot> entries_;
};

} // namespace banking
} // namespace localnet
