#pragma once

#include "common/types.h"
#include <cstdint>
#include <vector>

namespace localnet {
namespace svm {

using namespace localnet::common;

/**
 * Clock sysvar, bincode layout (40 bytes)
 */
struct ClockSysvar {
    Slot slot = 0;
    int64_t epoch_start_timestamp = 0;
    Epoch epoch = 0;
    Epoch leader_schedule_epoch = 0;
    int64_t unix_timestamp = 0;

    static constexpr size_t SIZE = 40;

    std::vector<uint8_t> serialize() const;
    static Result<ClockSysvar> deserialize(const std::vector<uint8_t>& data);
};

/**
 * Rent sysvar, bincode layout (17 bytes)
 */
struct RentSysvar {
    Lamports lamports_per_byte_year = 0;
    double exemption_threshold = 0.0;
    uint8_t burn_percent = 0;

    static constexpr size_t SIZE = 17;

    std::vector<uint8_t> serialize() const;
    static Result<RentSysvar> deserialize(const std::vector<uint8_t>& data);
};

} // namespace svm
} // namespace localnet
