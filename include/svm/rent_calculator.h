#pragma once

#include "common/types.h"
#include "svm/account.h"
#include <string>

namespace localnet {
namespace svm {

using namespace localnet::common;

/**
 * Rent calculation and validation
 *
 * Rent is charged per epoch on the account's storage footprint: its data
 * length plus a fixed 128-byte overhead. An account holding at least
 * `exemption_threshold` years of rent is exempt. Accounts without data are
 * treated as exempt so that plain wallets never decay.
 */
class RentCalculator {
public:
    // Default rent configuration based on the live cluster
    static constexpr Lamports DEFAULT_LAMPORTS_PER_BYTE_YEAR = 3480;
    static constexpr double DEFAULT_EXEMPTION_THRESHOLD = 2.0;
    static constexpr Slot DEFAULT_SLOTS_PER_EPOCH = 432000;
    static constexpr size_t ACCOUNT_STORAGE_OVERHEAD = 128;

    /// Slots per year at a 400ms slot
    static constexpr double DEFAULT_SLOTS_PER_YEAR = 365.25 * 24.0 * 60.0 * 60.0 / 0.4;

    struct RentConfig {
        Lamports lamports_per_byte_year = DEFAULT_LAMPORTS_PER_BYTE_YEAR;
        double exemption_threshold = DEFAULT_EXEMPTION_THRESHOLD;
        Slot slots_per_epoch = DEFAULT_SLOTS_PER_EPOCH;
        double slots_per_year = DEFAULT_SLOTS_PER_YEAR;

        RentConfig() = default;
        RentConfig(Lamports per_byte, double threshold, Slot slots)
            : lamports_per_byte_year(per_byte), exemption_threshold(threshold), slots_per_epoch(slots) {}
    };

    explicit RentCalculator(const RentConfig& config);
    RentCalculator();
    ~RentCalculator() = default;

    /**
     * Rent owed for one epoch by an account of @p data_size bytes
     */
    Lamports rent_per_epoch(size_t data_size) const;

    /**
     * Calculate minimum balance for rent exemption
     */
    Lamports minimum_balance(size_t data_size) const;

    /**
     * Check if account is rent exempt
     */
    bool is_rent_exempt(Lamports balance, size_t data_size) const;

    /**
     * Rent due for every epoch in (rent_epoch, current_epoch]
     */
    Lamports calculate_rent_due(
        Lamports current_balance,
        size_t data_size,
        Epoch current_epoch,
        Epoch rent_epoch
    ) const;

    struct RentCollection {
        Lamports collected_rent = 0;
        Lamports new_balance = 0;
        bool account_destroyed = false;
    };

    /**
     * Collect rent from account
     */
    RentCollection collect_rent(
        Lamports current_balance,
        size_t data_size,
        Epoch current_epoch,
        Epoch rent_epoch
    ) const;

    /**
     * Rent state of an account, compared before and after a transaction
     */
    struct RentState {
        enum class Kind { UNINITIALIZED, RENT_PAYING, RENT_EXEMPT };
        Kind kind = Kind::UNINITIALIZED;
        Lamports lamports = 0;
        size_t data_size = 0;
    };

    RentState rent_state(const Account& account) const;

    /**
     * A transaction may not leave a writable account rent-paying unless it
     * already was, with the same size and no more lamports than before.
     */
    static bool transition_allowed(const RentState& pre, const RentState& post);

    const RentConfig& get_config() const { return config_; }

    void update_config(const RentConfig& config) { config_ = config; }

private:
    RentConfig config_;
};

/**
 * Rent exempt status for accounts
 */
enum class RentExemptStatus {
    EXEMPT,
    NOT_EXEMPT
};

/**
 * Helper functions for rent operations
 */
namespace rent_utils {
    RentExemptStatus get_rent_status(
        const RentCalculator& calculator,
        Lamports balance,
        size_t data_size
    );

    /**
     * Format rent collection result for logging
     */
    std::string format_rent_collection(const RentCalculator::RentCollection& collection);

    /**
     * Calculate rent epoch from slot
     */
    Epoch calculate_rent_epoch(Slot slot, Slot slots_per_epoch);
}

} // namespace svm
} // namespace localnet
