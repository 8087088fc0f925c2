#pragma once

#include "common/types.h"
#include "svm/program_ids.h"
#include <cstdint>
#include <vector>

namespace localnet {
namespace svm {

using namespace localnet::common;

/// Largest account data size a program may allocate (10 MiB)
constexpr size_t MAX_PERMITTED_DATA_LENGTH = 10 * 1024 * 1024;

/**
 * On-chain account state.
 *
 * An account holding zero lamports does not exist: the bank treats such an
 * entry as deleted.
 */
struct Account {
    Lamports lamports = 0;
    std::vector<uint8_t> data;
    PublicKey owner;
    bool executable = false;
    Epoch rent_epoch = 0;

    Account() = default;
    Account(Lamports lamports_, std::vector<uint8_t> data_, PublicKey owner_,
            bool executable_ = false, Epoch rent_epoch_ = 0)
        : lamports(lamports_), data(std::move(data_)), owner(std::move(owner_)),
          executable(executable_), rent_epoch(rent_epoch_) {}

    /// Plain wallet account owned by the system program
    static Account system_owned(Lamports lamports) {
        return Account(lamports, {}, program_ids::system_program());
    }

    bool exists() const { return lamports > 0; }

    bool operator==(const Account& other) const {
        return lamports == other.lamports && data == other.data &&
               owner == other.owner && executable == other.executable &&
               rent_epoch == other.rent_epoch;
    }
    bool operator!=(const Account& other) const { return !(*this == other); }
};

} // namespace svm
} // namespace localnet
