#pragma once

#include "common/types.h"
#include "svm/account.h"
#include <map>
#include <string>
#include <vector>

namespace localnet {
namespace genesis {

/**
 * Cluster the local genesis imitates; selects default parameters
 */
enum class ClusterType {
    DEVELOPMENT,
    DEVNET,
    TESTNET,
    MAINNET_BETA
};

/**
 * Fee parameters
 */
struct FeeSchedule {
    common::Lamports lamports_per_signature = 5000;
    uint32_t burn_percent = 50;          ///< Share of collected fees destroyed at freeze
    bool charge_fee_on_failure = true;   ///< Failed transactions still pay their fee
};

/**
 * Rent parameters
 */
struct RentSchedule {
    common::Lamports lamports_per_byte_year = 3480;
    double exemption_threshold = 2.0;    ///< Years of rent that make an account exempt
};

struct EpochSchedule {
    common::Slot slots_per_epoch = 432000;
};

/**
 * Program account preloaded at genesis
 *
 * The payload is an SBF/BPF ELF. It comes from `path` or from inline
 * base64 in the config file; after loading, `elf` always holds the bytes.
 */
struct GenesisProgram {
    common::PublicKey program_id;
    common::PublicKey loader;            ///< Defaults to the upgradeable BPF loader
    std::string path;
    std::vector<uint8_t> elf;
};

/**
 * Genesis configuration
 *
 * Immutable once the validator starts; reset() rebuilds from the same value.
 */
struct GenesisConfig {
    // Cluster identification
    ClusterType cluster_type = ClusterType::DEVELOPMENT;
    std::string cluster_id = "localnet";
    uint64_t creation_time = 0;          ///< Unix seconds of slot 0

    // Initial state
    std::map<common::PublicKey, common::Lamports> initial_balances;
    std::map<common::PublicKey, svm::Account> initial_accounts;
    std::vector<GenesisProgram> programs;
    std::vector<common::PublicKey> program_allowlist;  ///< Builtins and preloaded programs are added

    // Economics
    FeeSchedule fee_schedule;
    RentSchedule rent_schedule;
    EpochSchedule epoch_schedule;
    common::Lamports max_supply = 0;     ///< 0 = uncapped
    common::PublicKey fee_collector;     ///< Empty = burn the non-burned share too

    // Runtime limits
    uint64_t max_recent_blockhashes = 150;
    uint64_t compute_unit_limit = 200000;
    uint64_t ns_per_slot = 400000000;
};

} // namespace genesis
} // namespace localnet
