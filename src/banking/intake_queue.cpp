#include "banking/intake_queue.h"
#include "common/encoding.h"
#include "common/logging.h"
#include "svm/transaction_error.h"

namespace localnet {
namespace banking {

Result<Signature> IntakeQueue::submit(const ledger::Transaction& transaction) {
    auto reject = [this](svm::TransactionError error, const std::string& detail = "") {
        ++rejected_;
        return Result<Signature>(svm::make_transaction_error(error, detail));
    };

    // Shape and signatures are checked outside the lock
    auto sanitized = transaction.sanitize();
    if (!sanitized.is_ok()) {
        ++rejected_;
        return Result<Signature>(sanitized.error_info());
    }
    if (!transaction.verify_signatures()) {
        return reject(svm::TransactionError::SIGNATURE_FAILURE);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return Result<Signature>(ErrorKind::STATE, "intake queue is closed");
    }
    if (busy_.load()) {
        ++busy_rejections_;
        return Result<Signature>(ErrorKind::BUSY, "slot is being frozen, retry");
    }
    if (window_ && !window_->is_valid(transaction.message.recent_blockhash)) {
        return reject(svm::TransactionError::BLOCKHASH_NOT_FOUND,
                      encode_base58(transaction.message.recent_blockhash));
    }

    const Signature& signature = transaction.signature();
    if (pending_signatures_.count(signature)) {
        return reject(svm::TransactionError::ALREADY_PROCESSED, "already queued");
    }
    if (status_cache_ && status_cache_->contains(signature, window_slot_)) {
        return reject(svm::TransactionError::ALREADY_PROCESSED, "already committed");
    }

    pending_signatures_.insert(signature);
    queue_.push_back(transaction);
    ++accepted_;

    LOG_TRACE("Queued transaction ", encode_base58(signature), " (", queue_.size(), " pending)");
    return Result<Signature>(signature);
}

std::vector<ledger::Transaction> IntakeQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ledger::Transaction> drained(std::make_move_iterator(queue_.begin()),
                                             std::make_move_iterator(queue_.end()));
    queue_.clear();
    pending_signatures_.clear();
    return drained;
}

void IntakeQueue::publish_window(std::shared_ptr<const BlockhashQueue> window,
                                 std::shared_ptr<const StatusCache> status_cache,
                                 Slot slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    window_ = std::move(window);
    status_cache_ = std::move(status_cache);
    window_slot_ = slot;
}

void IntakeQueue::begin_busy() {
    std::lock_guard<std::mutex> lock(mutex_);
    busy_.store(true);
}

void IntakeQueue::end_busy() {
    std::lock_guard<std::mutex> lock(mutex_);
    busy_.store(false);
}

void IntakeQueue::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

void IntakeQueue::reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = false;
}

bool IntakeQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void IntakeQueue::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
    pending_signatures_.clear();
    window_.reset();
    status_cache_.reset();
    window_slot_ = 0;
}

size_t IntakeQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

IntakeQueue::Stats IntakeQueue::get_stats() const {
    Stats stats;
    stats.accepted = accepted_.load();
    stats.rejected = rejected_.load();
    stats.busy = busy_rejections_.load();
    stats.pending = size();
    return stats;
}

} // namespace banking
} // namespace localnet
