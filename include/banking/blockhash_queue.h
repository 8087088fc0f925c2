#pragma once

#include "common/types.h"
#include <deque>
#include <optional>
#include <unordered_map>
#include <vector>

namespace localnet {
namespace banking {

using namespace localnet::common;

/**
 * Window of recent blockhashes a transaction may reference
 *
 * Holds at most max_age hashes; registering one more evicts the oldest.
 * Each bank owns an immutable copy, extended by one entry per child.
 */
class BlockhashQueue {
public:
    explicit BlockhashQueue(size_t max_age);

    /// Append @p hash produced at @p slot, evicting beyond the window
    void register_hash(const Hash& hash, Slot slot);

    bool is_valid(const Hash& hash) const;

    /// Slot at which @p hash was registered, if still in the window
    std::optional<Slot> slot_of(const Hash& hash) const;

    /// Most recently registered hash (empty before the first registration)
    Hash last_hash() const;

    /// Hashes newest first
    std::vector<Hash> hashes() const;

    size_t size() const { return entries_.size(); }
    size_t max_age() const { return max_age_; }

private:
    size_t max_age_;
    std::deque<std::pair<Hash, Slot>> entries_;
    std::unordered_map<Hash, Slot> index_;
};

} // namespace banking
} // namespace localnet
