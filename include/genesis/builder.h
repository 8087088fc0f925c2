#pragma once

#include "banking/bank.h"
#include "common/types.h"
#include "genesis/config.h"
#include "svm/engine.h"
#include <memory>
#include <string>

namespace localnet {
namespace genesis {

/**
 * Genesis block creation and configuration utilities
 *
 * Every failure is reported as ErrorKind::CONFIG (ErrorKind::IO for file
 * access) so the CLI can exit with status 1.
 */
class GenesisBuilder {
public:
    /**
     * Create the default configuration for a cluster type
     */
    static GenesisConfig create_default_config(ClusterType cluster_type);

    /**
     * Validate the configuration, then build the open slot-0 bank
     * @param engine executor shared by every bank of the chain
     */
    static common::Result<std::shared_ptr<banking::Bank>> build(
        const GenesisConfig& config, std::shared_ptr<const svm::ExecutionEngine> engine);

    /**
     * Validate a genesis configuration
     */
    static common::Result<bool> validate_config(const GenesisConfig& config);

    /**
     * Check that a program payload is a 64-bit little-endian BPF/SBF ELF object
     */
    static common::Result<bool> validate_program_elf(const std::vector<uint8_t>& elf);

    /**
     * Compute the genesis hash: SHA-256 of the canonical JSON serialization
     */
    static common::Hash compute_genesis_hash(const GenesisConfig& config);

    /**
     * Load genesis configuration from a JSON file
     */
    static common::Result<GenesisConfig> load_config(const std::string& filepath);

    /**
     * Parse genesis configuration from JSON text
     * Program payloads given by path are read relative to @p base_dir.
     */
    static common::Result<GenesisConfig> parse_config(const std::string& text,
                                                      const std::string& base_dir = "");

    /**
     * Save genesis configuration to a JSON file
     */
    static common::Result<bool> save_config(const GenesisConfig& config,
                                            const std::string& filepath);

    static std::string serialize_config(const GenesisConfig& config, int indent = 2);

    /**
     * Read the runtime options (tick_interval_ms, log_level) that share the
     * genesis config file
     */
    static common::Result<bool> apply_runtime_options(const std::string& text,
                                                      common::ValidatorConfig& validator_config);

    /**
     * Read a program payload from disk and check it
     */
    static common::Result<std::vector<uint8_t>> load_program_file(const std::string& path);

    /**
     * Read an account file in the Solana CLI JSON layout
     */
    static common::Result<std::pair<common::PublicKey, svm::Account>> load_account_file(
        const std::string& path);

    /**
     * Cluster type helpers
     */
    static std::string cluster_type_to_string(ClusterType type);
    static common::Result<ClusterType> string_to_cluster_type(const std::string& str);

    /**
     * Total lamports genesis creates, or CONFIG on overflow
     */
    static common::Result<common::Lamports> total_supply(const GenesisConfig& config);

private:
    static common::Result<bool> validate_schedules(const GenesisConfig& config);
};

} // namespace genesis
} // namespace localnet
