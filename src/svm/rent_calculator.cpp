#include "svm/rent_calculator.h"
#include <sstream>

namespace localnet {
namespace svm {

RentCalculator::RentCalculator(const RentConfig& config) : config_(config) {
}

RentCalculator::RentCalculator() : config_(RentConfig()) {
}

Lamports RentCalculator::rent_per_epoch(size_t data_size) const {
    if (data_size == 0 || config_.slots_per_year <= 0.0) {
        return 0;
    }

    double yearly_rent = static_cast<double>(ACCOUNT_STORAGE_OVERHEAD + data_size) *
                         static_cast<double>(config_.lamports_per_byte_year);
    double epochs_per_year = config_.slots_per_year / static_cast<double>(config_.slots_per_epoch);
    return static_cast<Lamports>(yearly_rent / epochs_per_year);
}

Lamports RentCalculator::minimum_balance(size_t data_size) const {
    Lamports yearly_rent = static_cast<Lamports>(ACCOUNT_STORAGE_OVERHEAD + data_size) *
                           config_.lamports_per_byte_year;

    // Apply exemption threshold (typically 2 years worth of rent)
    return static_cast<Lamports>(static_cast<double>(yearly_rent) * config_.exemption_threshold);
}

bool RentCalculator::is_rent_exempt(Lamports balance, size_t data_size) const {
    if (data_size == 0) {
        return true; // Zero-sized accounts are always rent exempt
    }
    return balance >= minimum_balance(data_size);
}

Lamports RentCalculator::calculate_rent_due(
    Lamports current_balance,
    size_t data_size,
    Epoch current_epoch,
    Epoch rent_epoch
) const {
    if (is_rent_exempt(current_balance, data_size)) {
        return 0; // Rent exempt accounts don't owe rent
    }

    if (current_epoch <= rent_epoch) {
        return 0; // Already paid for this epoch
    }

    return rent_per_epoch(data_size) * (current_epoch - rent_epoch);
}

RentCalculator::RentCollection RentCalculator::collect_rent(
    Lamports current_balance,
    size_t data_size,
    Epoch current_epoch,
    Epoch rent_epoch
) const {
    RentCollection result;
    result.new_balance = current_balance;

    Lamports rent_due = calculate_rent_due(current_balance, data_size, current_epoch, rent_epoch);
    if (rent_due == 0) {
        return result;
    }

    if (current_balance > rent_due) {
        result.collected_rent = rent_due;
        result.new_balance = current_balance - rent_due;
    } else {
        // Insufficient balance - collect all remaining and mark for destruction
        result.collected_rent = current_balance;
        result.new_balance = 0;
        result.account_destroyed = true;
    }

    return result;
}

RentCalculator::RentState RentCalculator::rent_state(const Account& account) const {
    RentState state;
    state.lamports = account.lamports;
    state.data_size = account.data.size();
    if (account.lamports == 0) {
        state.kind = RentState::Kind::UNINITIALIZED;
    } else if (is_rent_exempt(account.lamports, account.data.size())) {
        state.kind = RentState::Kind::RENT_EXEMPT;
    } else {
        state.kind = RentState::Kind::RENT_PAYING;
    }
    return state;
}

bool RentCalculator::transition_allowed(const RentState& pre, const RentState& post) {
    if (post.kind != RentState::Kind::RENT_PAYING) {
        return true;
    }
    if (pre.kind != RentState::Kind::RENT_PAYING) {
        return false;
    }
    return post.data_size == pre.data_size && post.lamports <= pre.lamports;
}

// Utility functions
namespace rent_utils {

RentExemptStatus get_rent_status(
    const RentCalculator& calculator,
    Lamports balance,
    size_t data_size
) {
    return calculator.is_rent_exempt(balance, data_size)
        ? RentExemptStatus::EXEMPT
        : RentExemptStatus::NOT_EXEMPT;
}

std::string format_rent_collection(const RentCalculator::RentCollection& collection) {
    std::stringstream ss;
    ss << "RentCollection{";
    ss << "collected=" << collection.collected_rent;
    ss << ", new_balance=" << collection.new_balance;
    ss << ", destroyed=" << (collection.account_destroyed ? "true" : "false");
    ss << "}";
    return ss.str();
}

Epoch calculate_rent_epoch(Slot slot, Slot slots_per_epoch) {
    if (slots_per_epoch == 0) {
        return 0;
    }
    return slot / slots_per_epoch;
}

} // namespace rent_utils

} // namespace svm
} // namespace localnet
