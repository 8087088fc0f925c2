#pragma once

#include "banking/blockhash_queue.h"
#include "banking/status_cache.h"
#include "common/types.h"
#include "ledger/transaction.h"
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <unordered_set>
#include <vector>

namespace localnet {
namespace banking {

using namespace localnet::common;

/**
 * Transaction Intake Queue
 *
 * FIFO of validated transactions waiting for the next production step.
 * Submitters only take the queue mutex; the block production loop is the
 * single consumer.
 */
class IntakeQueue {
public:
    struct Stats {
        uint64_t accepted = 0;
        uint64_t rejected = 0;
        uint64_t busy = 0;
        size_t pending = 0;
    };

    IntakeQueue() = default;
    ~IntakeQueue() = default;

    IntakeQueue(const IntakeQueue&) = delete;
    IntakeQueue& operator=(const IntakeQueue&) = delete;

    /**
     * Validate and enqueue a transaction
     * @return the transaction signature, a TRANSACTION error, BUSY during a
     *         freeze, or STATE after close()
     */
    Result<Signature> submit(const ledger::Transaction& transaction);

    /// Remove and return every queued transaction in arrival order
    std::vector<ledger::Transaction> drain();

    /**
     * Publish what submit() checks against: the blockhash window and,
     * optionally, the chain's status cache as seen from the open @p slot
     */
    void publish_window(std::shared_ptr<const BlockhashQueue> window,
                        std::shared_ptr<const StatusCache> status_cache = nullptr,
                        Slot slot = 0);

    /// Busy window, entered by the production loop around freeze/append/child
    void begin_busy();
    void end_busy();
    bool is_busy() const { return busy_.load(); }

    /// Refuse further submits; queued transactions are kept until clear()
    void close();
    void reopen();
    bool is_closed() const;

    void clear();
    size_t size() const;
    Stats get_stats() const;

private:
    mutable std::mutex mutex_;
    std::deque<ledger::Transaction> queue_;
    std::unordered_set<Signature> pending_signatures_;
    std::shared_ptr<const BlockhashQueue> window_;
    std::shared_ptr<const StatusCache> status_cache_;
    Slot window_slot_ = 0;
    bool closed_ = false;
    std::atomic<bool> busy_{false};

    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> busy_rejections_{0};
};

/**
 * RAII busy window
 */
class BusyScope {
public:
    explicit BusyScope(IntakeQueue& queue) : queue_(queue) { queue_.begin_busy(); }
    ~BusyScope() { queue_.end_busy(); }

    BusyScope(const BusyScope&) = delete;
    BusyScope& operator=(const BusyScope&) = delete;

private:
    IntakeQueue& queue_;
};

} // namespace banking
} // namespace localnet
