#include "banking/blockhash_queue.h"

namespace localnet {
namespace banking {

BlockhashQueue::BlockhashQueue(size_t max_age) : max_age_(max_age) {}

void BlockhashQueue::register_hash(const Hash& hash, Slot slot) {
    if (index_.count(hash)) {
        return;
    }
    entries_.emplace_back(hash, slot);
    index_[hash] = slot;

    while (entries_.size() > max_age_) {
        index_.erase(entries_.front().first);
        entries_.pop_front();
    }
}

bool BlockhashQueue::is_valid(const Hash& hash) const {
    return index_.count(hash) > 0;
}

std::optional<Slot> BlockhashQueue::slot_of(const Hash& hash) const {
    auto it = index_.find(hash);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Hash BlockhashQueue::last_hash() const {
    return entries_.empty() ? Hash{} : entries_.back().first;
}

std::vector<Hash> BlockhashQueue::hashes() const {
    std::vector<Hash> result;
    result.reserve(entries_.size());
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        result.push_back(it->first);
    }
    return result;
}

} // namespace banking
} // namespace localnet
