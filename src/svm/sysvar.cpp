#include "svm/sysvar.h"
#include <cstring>

namespace localnet {
namespace svm {

namespace {

void put_u64(std::vector<uint8_t>& out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

uint64_t get_u64(const std::vector<uint8_t>& data, size_t offset) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(data[offset + i]) << (i * 8);
    }
    return value;
}

} // namespace

std::vector<uint8_t> ClockSysvar::serialize() const {
    std::vector<uint8_t> out;
    out.reserve(SIZE);
    put_u64(out, slot);
    put_u64(out, static_cast<uint64_t>(epoch_start_timestamp));
    put_u64(out, epoch);
    put_u64(out, leader_schedule_epoch);
    put_u64(out, static_cast<uint64_t>(unix_timestamp));
    return out;
}

Result<ClockSysvar> ClockSysvar::deserialize(const std::vector<uint8_t>& data) {
    if (data.size() != SIZE) {
        return Result<ClockSysvar>(ErrorKind::INVALID_ARGUMENT,
                                   "clock sysvar must be 40 bytes");
    }
    ClockSysvar clock;
    clock.slot = get_u64(data, 0);
    clock.epoch_start_timestamp = static_cast<int64_t>(get_u64(data, 8));
    clock.epoch = get_u64(data, 16);
    clock.leader_schedule_epoch = get_u64(data, 24);
    clock.unix_timestamp = static_cast<int64_t>(get_u64(data, 32));
    return Result<ClockSysvar>(clock);
}

std::vector<uint8_t> RentSysvar::serialize() const {
    std::vector<uint8_t> out;
    out.reserve(SIZE);
    put_u64(out, lamports_per_byte_year);
    uint64_t threshold_bits = 0;
    std::memcpy(&threshold_bits, &exemption_threshold, sizeof(threshold_bits));
    put_u64(out, threshold_bits);
    out.push_back(burn_percent);
    return out;
}

Result<RentSysvar> RentSysvar::deserialize(const std::vector<uint8_t>& data) {
    if (data.size() != SIZE) {
        return Result<RentSysvar>(ErrorKind::INVALID_ARGUMENT,
                                  "rent sysvar must be 17 bytes");
    }
    RentSysvar rent;
    rent.lamports_per_byte_year = get_u64(data, 0);
    uint64_t threshold_bits = get_u64(data, 8);
    std::memcpy(&rent.exemption_threshold, &threshold_bits, sizeof(threshold_bits));
    rent.burn_percent = data[16];
    return Result<RentSysvar>(rent);
}

} // namespace svm
} // namespace localnet
