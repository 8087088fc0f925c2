#include "genesis/builder.h"
#include "common/crypto.h"
#include "common/encoding.h"
#include "common/logging.h"
#include "svm/program_ids.h"
#include "svm/sysvar.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <fstream>
#include <iterator>

namespace localnet {
namespace genesis {

using json = nlohmann::json;
using common::ErrorKind;
using common::Lamports;
using common::PublicKey;
using common::Result;

namespace {

constexpr uint16_t EM_BPF = 247;
constexpr uint16_t EM_SBF = 263;
constexpr size_t ELF_HEADER_SIZE = 64;

Result<GenesisConfig> config_error(const std::string& message) {
    return Result<GenesisConfig>(ErrorKind::CONFIG, message);
}

Result<PublicKey> parse_address(const json& value, const std::string& field) {
    if (!value.is_string()) {
        return Result<PublicKey>(ErrorKind::CONFIG, field + " must be a base58 string");
    }
    auto key = common::parse_pubkey(value.get<std::string>());
    if (!key.is_ok()) {
        return Result<PublicKey>(ErrorKind::CONFIG, field + ": " + key.error());
    }
    return key;
}

Result<std::vector<uint8_t>> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Result<std::vector<uint8_t>>(ErrorKind::IO, "Failed to open file: " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    return Result<std::vector<uint8_t>>(std::move(bytes));
}

std::string as_text(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

std::string join_path(const std::string& base_dir, const std::string& path) {
    if (base_dir.empty() || path.empty() || path.front() == '/') {
        return path;
    }
    return base_dir + "/" + path;
}

json account_to_json(const PublicKey& address, const svm::Account& account) {
    json j;
    j["pubkey"] = common::encode_base58(address);
    j["account"]["lamports"] = account.lamports;
    j["account"]["data"] = json::array({common::encode_base64(account.data), "base64"});
    j["account"]["owner"] = common::encode_base58(account.owner);
    j["account"]["executable"] = account.executable;
    j["account"]["rentEpoch"] = account.rent_epoch;
    return j;
}

Result<std::pair<PublicKey, svm::Account>> account_from_json(const json& j) {
    using Entry = std::pair<PublicKey, svm::Account>;
    if (!j.is_object() || !j.contains("pubkey") || !j.contains("account")) {
        return Result<Entry>(ErrorKind::CONFIG, "account entry needs pubkey and account");
    }
    auto address = parse_address(j["pubkey"], "pubkey");
    if (!address.is_ok()) {
        return Result<Entry>(address.error_info());
    }

    const json& body = j["account"];
    svm::Account account;
    account.lamports = body.value("lamports", static_cast<Lamports>(0));
    account.executable = body.value("executable", false);
    account.rent_epoch = body.value("rentEpoch", static_cast<uint64_t>(0));

    account.owner = svm::program_ids::system_program();
    if (body.contains("owner")) {
        auto owner = parse_address(body["owner"], "owner");
        if (!owner.is_ok()) {
            return Result<Entry>(owner.error_info());
        }
        account.owner = std::move(owner).value();
    }

    if (body.contains("data")) {
        const json& data = body["data"];
        if (!data.is_array() || data.size() != 2 || data[1] != "base64") {
            return Result<Entry>(ErrorKind::CONFIG,
                                 "account data must be [\"<base64>\", \"base64\"]");
        }
        auto decoded = common::decode_base64(data[0].get<std::string>());
        if (!decoded.is_ok()) {
            return Result<Entry>(ErrorKind::CONFIG, "account data: " + decoded.error());
        }
        account.data = std::move(decoded).value();
    }
    return Result<Entry>(Entry(std::move(address).value(), std::move(account)));
}

} // namespace

GenesisConfig GenesisBuilder::create_default_config(ClusterType cluster_type) {
    GenesisConfig config;
    config.cluster_type = cluster_type;
    config.creation_time = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    switch (cluster_type) {
        case ClusterType::MAINNET_BETA:
            config.cluster_id = "mainnet-beta";
            config.max_supply = 600000000ULL * 1000000000ULL; // 600M SOL
            break;

        case ClusterType::TESTNET:
            config.cluster_id = "testnet";
            break;

        case ClusterType::DEVNET:
            config.cluster_id = "devnet";
            break;

        case ClusterType::DEVELOPMENT:
        default:
            config.cluster_id = "localnet";
            break;
    }

    return config;
}

std::string GenesisBuilder::cluster_type_to_string(ClusterType type) {
    switch (type) {
        case ClusterType::DEVELOPMENT: return "development";
        case ClusterType::DEVNET: return "devnet";
        case ClusterType::TESTNET: return "testnet";
        case ClusterType::MAINNET_BETA: return "mainnet-beta";
    }
    return "development";
}

Result<ClusterType> GenesisBuilder::string_to_cluster_type(const std::string& str) {
    if (str == "development") return Result<ClusterType>(ClusterType::DEVELOPMENT);
    if (str == "devnet") return Result<ClusterType>(ClusterType::DEVNET);
    if (str == "testnet") return Result<ClusterType>(ClusterType::TESTNET);
    if (str == "mainnet-beta") return Result<ClusterType>(ClusterType::MAINNET_BETA);
    return Result<ClusterType>(ErrorKind::CONFIG, "Unknown cluster type: " + str);
}

// Validation

Result<bool> GenesisBuilder::validate_program_elf(const std::vector<uint8_t>& elf) {
    if (elf.size() < ELF_HEADER_SIZE) {
        return Result<bool>(ErrorKind::CONFIG, "program payload is shorter than an ELF header");
    }
    if (elf[0] != 0x7f || elf[1] != 'E' || elf[2] != 'L' || elf[3] != 'F') {
        return Result<bool>(ErrorKind::CONFIG, "program payload is missing the ELF magic");
    }
    if (elf[4] != 2) {
        return Result<bool>(ErrorKind::CONFIG, "program ELF is not 64-bit");
    }
    if (elf[5] != 1) {
        return Result<bool>(ErrorKind::CONFIG, "program ELF is not little-endian");
    }
    uint16_t machine = static_cast<uint16_t>(elf[18] | (elf[19] << 8));
    if (machine != EM_BPF && machine != EM_SBF) {
        return Result<bool>(ErrorKind::CONFIG,
                            "program ELF machine " + std::to_string(machine) + " is not BPF/SBF");
    }
    return Result<bool>(true);
}

Result<bool> GenesisBuilder::validate_schedules(const GenesisConfig& config) {
    if (config.cluster_id.empty()) {
        return Result<bool>(ErrorKind::CONFIG, "cluster_id cannot be empty");
    }
    if (config.fee_schedule.burn_percent > 100) {
        return Result<bool>(ErrorKind::CONFIG, "fee_schedule.burn_percent must be at most 100");
    }
    if (config.rent_schedule.exemption_threshold < 0.0) {
        return Result<bool>(ErrorKind::CONFIG, "rent_schedule.exemption_threshold cannot be negative");
    }
    if (config.epoch_schedule.slots_per_epoch == 0) {
        return Result<bool>(ErrorKind::CONFIG, "epoch_schedule.slots_per_epoch must be positive");
    }
    if (config.max_recent_blockhashes == 0) {
        return Result<bool>(ErrorKind::CONFIG, "max_recent_blockhashes must be positive");
    }
    if (config.compute_unit_limit == 0) {
        return Result<bool>(ErrorKind::CONFIG, "compute_unit_limit must be positive");
    }
    if (config.ns_per_slot == 0) {
        return Result<bool>(ErrorKind::CONFIG, "ns_per_slot must be positive");
    }
    return Result<bool>(true);
}

Result<Lamports> GenesisBuilder::total_supply(const GenesisConfig& config) {
    svm::RentCalculator rent(svm::RentCalculator::RentConfig(
        config.rent_schedule.lamports_per_byte_year, config.rent_schedule.exemption_threshold,
        config.epoch_schedule.slots_per_epoch));

    Lamports total = 0;
    auto add = [&total](Lamports amount) {
        if (total > UINT64_MAX - amount) {
            return false;
        }
        total += amount;
        return true;
    };
    auto overflow = []() {
        return Result<Lamports>(ErrorKind::CONFIG, "total genesis lamports overflow 64 bits");
    };

    for (const auto& entry : config.initial_balances) {
        if (!add(entry.second)) return overflow();
    }
    for (const auto& entry : config.initial_accounts) {
        if (!add(entry.second.lamports)) return overflow();
    }
    for (const auto& program : config.programs) {
        if (!add(std::max<Lamports>(1, rent.minimum_balance(program.elf.size())))) return overflow();
    }
    for (size_t i = 0; i < svm::builtin_program_ids().size(); ++i) {
        if (!add(1)) return overflow();
    }
    if (!add(std::max<Lamports>(1, rent.minimum_balance(svm::ClockSysvar::SIZE)))) return overflow();
    if (!add(std::max<Lamports>(1, rent.minimum_balance(svm::RentSysvar::SIZE)))) return overflow();

    return Result<Lamports>(total);
}

Result<bool> GenesisBuilder::validate_config(const GenesisConfig& config) {
    auto schedules = validate_schedules(config);
    if (!schedules.is_ok()) {
        return schedules;
    }

    for (const auto& entry : config.initial_balances) {
        if (entry.first.size() != common::PUBKEY_BYTES) {
            return Result<bool>(ErrorKind::CONFIG, "initial balance address must be 32 bytes");
        }
    }
    for (const auto& entry : config.initial_accounts) {
        if (entry.first.size() != common::PUBKEY_BYTES ||
            entry.second.owner.size() != common::PUBKEY_BYTES) {
            return Result<bool>(ErrorKind::CONFIG,
                                "initial account address and owner must be 32 bytes");
        }
        if (entry.second.data.size() > svm::MAX_PERMITTED_DATA_LENGTH) {
            return Result<bool>(ErrorKind::CONFIG, "initial account " +
                                                       common::encode_base58(entry.first) +
                                                       " has too much data");
        }
    }
    for (const auto& program : config.programs) {
        if (program.program_id.size() != common::PUBKEY_BYTES) {
            return Result<bool>(ErrorKind::CONFIG, "program id must be 32 bytes");
        }
        if (!program.loader.empty() && !svm::program_ids::is_bpf_loader(program.loader)) {
            return Result<bool>(ErrorKind::CONFIG, "program " +
                                                       common::encode_base58(program.program_id) +
                                                       " has an unknown loader");
        }
        auto elf = validate_program_elf(program.elf);
        if (!elf.is_ok()) {
            return Result<bool>(ErrorKind::CONFIG,
                                common::encode_base58(program.program_id) + ": " + elf.error());
        }
    }
    for (const auto& id : config.program_allowlist) {
        if (id.size() != common::PUBKEY_BYTES) {
            return Result<bool>(ErrorKind::CONFIG, "program_allowlist entries must be 32 bytes");
        }
    }
    if (!config.fee_collector.empty() && config.fee_collector.size() != common::PUBKEY_BYTES) {
        return Result<bool>(ErrorKind::CONFIG, "fee_collector must be 32 bytes");
    }

    auto supply = total_supply(config);
    if (!supply.is_ok()) {
        return Result<bool>(supply.error_info());
    }
    if (config.max_supply > 0 && supply.value() > config.max_supply) {
        return Result<bool>(ErrorKind::CONFIG,
                            "genesis supply " + std::to_string(supply.value()) +
                                " exceeds max_supply " + std::to_string(config.max_supply));
    }
    return Result<bool>(true);
}

// Serialization

std::string GenesisBuilder::serialize_config(const GenesisConfig& config, int indent) {
    json j;
    j["cluster_type"] = cluster_type_to_string(config.cluster_type);
    j["cluster_id"] = config.cluster_id;
    j["creation_time"] = config.creation_time;

    json balances = json::object();
    for (const auto& entry : config.initial_balances) {
        balances[common::encode_base58(entry.first)] = entry.second;
    }
    j["initial_balances"] = balances;

    json accounts = json::array();
    for (const auto& entry : config.initial_accounts) {
        accounts.push_back(account_to_json(entry.first, entry.second));
    }
    j["accounts"] = accounts;

    // Payloads are always written inline so the hash covers the bytes
    json programs = json::array();
    for (const auto& program : config.programs) {
        json p;
        p["program_id"] = common::encode_base58(program.program_id);
        p["loader"] = common::encode_base58(
            program.loader.empty() ? svm::program_ids::bpf_loader_upgradeable() : program.loader);
        p["elf_base64"] = common::encode_base64(program.elf);
        programs.push_back(p);
    }
    j["programs"] = programs;

    json allowlist = json::array();
    for (const auto& id : config.program_allowlist) {
        allowlist.push_back(common::encode_base58(id));
    }
    j["program_allowlist"] = allowlist;

    j["fee_schedule"]["lamports_per_signature"] = config.fee_schedule.lamports_per_signature;
    j["fee_schedule"]["burn_percent"] = config.fee_schedule.burn_percent;
    j["fee_schedule"]["charge_fee_on_failure"] = config.fee_schedule.charge_fee_on_failure;
    j["rent_schedule"]["lamports_per_byte_year"] = config.rent_schedule.lamports_per_byte_year;
    j["rent_schedule"]["exemption_threshold"] = config.rent_schedule.exemption_threshold;
    j["epoch_schedule"]["slots_per_epoch"] = config.epoch_schedule.slots_per_epoch;

    j["max_supply"] = config.max_supply;
    if (!config.fee_collector.empty()) {
        j["fee_collector"] = common::encode_base58(config.fee_collector);
    }
    j["max_recent_blockhashes"] = config.max_recent_blockhashes;
    j["compute_unit_limit"] = config.compute_unit_limit;
    j["ns_per_slot"] = config.ns_per_slot;

    return j.dump(indent);
}

Result<GenesisConfig> GenesisBuilder::parse_config(const std::string& text,
                                                   const std::string& base_dir) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            return config_error("Invalid JSON format: must be a valid object");
        }

        ClusterType cluster_type = ClusterType::DEVELOPMENT;
        if (j.contains("cluster_type")) {
            auto parsed = string_to_cluster_type(j["cluster_type"].get<std::string>());
            if (!parsed.is_ok()) {
                return Result<GenesisConfig>(parsed.error_info());
            }
            cluster_type = parsed.value();
        }
        GenesisConfig config = create_default_config(cluster_type);

        config.cluster_id = j.value("cluster_id", config.cluster_id);
        config.creation_time = j.value("creation_time", config.creation_time);

        if (j.contains("initial_balances")) {
            for (auto it = j["initial_balances"].begin(); it != j["initial_balances"].end(); ++it) {
                auto address = common::parse_pubkey(it.key());
                if (!address.is_ok()) {
                    return config_error("initial_balances: " + address.error());
                }
                config.initial_balances[address.value()] = it.value().get<Lamports>();
            }
        }

        if (j.contains("accounts")) {
            for (const auto& entry : j["accounts"]) {
                auto account = account_from_json(entry);
                if (!account.is_ok()) {
                    return Result<GenesisConfig>(account.error_info());
                }
                config.initial_accounts[account.value().first] = account.value().second;
            }
        }

        if (j.contains("programs")) {
            for (const auto& entry : j["programs"]) {
                GenesisProgram program;
                auto id = parse_address(entry.value("program_id", json()), "program_id");
                if (!id.is_ok()) {
                    return Result<GenesisConfig>(id.error_info());
                }
                program.program_id = std::move(id).value();

                if (entry.contains("loader")) {
                    auto loader = parse_address(entry["loader"], "loader");
                    if (!loader.is_ok()) {
                        return Result<GenesisConfig>(loader.error_info());
                    }
                    program.loader = std::move(loader).value();
                }

                if (entry.contains("elf_base64")) {
                    auto elf = common::decode_base64(entry["elf_base64"].get<std::string>());
                    if (!elf.is_ok()) {
                        return config_error("elf_base64: " + elf.error());
                    }
                    program.elf = std::move(elf).value();
                } else if (entry.contains("path")) {
                    program.path = entry["path"].get<std::string>();
                    auto elf = load_program_file(join_path(base_dir, program.path));
                    if (!elf.is_ok()) {
                        return Result<GenesisConfig>(elf.error_info());
                    }
                    program.elf = std::move(elf).value();
                } else {
                    return config_error("program " + common::encode_base58(program.program_id) +
                                        " needs path or elf_base64");
                }
                config.programs.push_back(std::move(program));
            }
        }

        if (j.contains("program_allowlist")) {
            for (const auto& entry : j["program_allowlist"]) {
                auto id = parse_address(entry, "program_allowlist");
                if (!id.is_ok()) {
                    return Result<GenesisConfig>(id.error_info());
                }
                config.program_allowlist.push_back(std::move(id).value());
            }
        }

        if (j.contains("fee_schedule")) {
            const json& fees = j["fee_schedule"];
            config.fee_schedule.lamports_per_signature =
                fees.value("lamports_per_signature", config.fee_schedule.lamports_per_signature);
            config.fee_schedule.burn_percent =
                fees.value("burn_percent", config.fee_schedule.burn_percent);
            config.fee_schedule.charge_fee_on_failure =
                fees.value("charge_fee_on_failure", config.fee_schedule.charge_fee_on_failure);
        }
        if (j.contains("rent_schedule")) {
            const json& rent = j["rent_schedule"];
            config.rent_schedule.lamports_per_byte_year =
                rent.value("lamports_per_byte_year", config.rent_schedule.lamports_per_byte_year);
            config.rent_schedule.exemption_threshold =
                rent.value("exemption_threshold", config.rent_schedule.exemption_threshold);
        }
        if (j.contains("epoch_schedule")) {
            config.epoch_schedule.slots_per_epoch = j["epoch_schedule"].value(
                "slots_per_epoch", config.epoch_schedule.slots_per_epoch);
        }

        config.max_supply = j.value("max_supply", config.max_supply);
        if (j.contains("fee_collector")) {
            auto collector = parse_address(j["fee_collector"], "fee_collector");
            if (!collector.is_ok()) {
                return Result<GenesisConfig>(collector.error_info());
            }
            config.fee_collector = std::move(collector).value();
        }
        config.max_recent_blockhashes =
            j.value("max_recent_blockhashes", config.max_recent_blockhashes);
        config.compute_unit_limit = j.value("compute_unit_limit", config.compute_unit_limit);
        config.ns_per_slot = j.value("ns_per_slot", config.ns_per_slot);

        return Result<GenesisConfig>(std::move(config));
    } catch (const json::exception& e) {
        return config_error(std::string("Invalid genesis JSON: ") + e.what());
    }
}

Result<bool> GenesisBuilder::apply_runtime_options(const std::string& text,
                                                   common::ValidatorConfig& validator_config) {
    try {
        json j = json::parse(text);
        validator_config.tick_interval_ms =
            j.value("tick_interval_ms", validator_config.tick_interval_ms);
        validator_config.log_level = j.value("log_level", validator_config.log_level);
        return Result<bool>(true);
    } catch (const json::exception& e) {
        return Result<bool>(ErrorKind::CONFIG, std::string("Invalid config JSON: ") + e.what());
    }
}

Result<GenesisConfig> GenesisBuilder::load_config(const std::string& filepath) {
    auto text = read_file(filepath);
    if (!text.is_ok()) {
        return config_error("Failed to open genesis config file: " + filepath);
    }
    std::string base_dir;
    auto slash = filepath.find_last_of('/');
    if (slash != std::string::npos) {
        base_dir = filepath.substr(0, slash);
    }
    return parse_config(as_text(text.value()), base_dir);
}

Result<bool> GenesisBuilder::save_config(const GenesisConfig& config, const std::string& filepath) {
    auto validation_result = validate_config(config);
    if (!validation_result.is_ok()) {
        return Result<bool>(ErrorKind::CONFIG,
                            "Invalid genesis configuration: " + validation_result.error());
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        return Result<bool>(ErrorKind::IO, "Failed to open file for writing: " + filepath);
    }
    file << serialize_config(config);
    return Result<bool>(true);
}

Result<std::vector<uint8_t>> GenesisBuilder::load_program_file(const std::string& path) {
    auto text = read_file(path);
    if (!text.is_ok()) {
        return Result<std::vector<uint8_t>>(ErrorKind::CONFIG, text.error());
    }
    std::vector<uint8_t> elf = std::move(text).value();
    auto valid = validate_program_elf(elf);
    if (!valid.is_ok()) {
        return Result<std::vector<uint8_t>>(ErrorKind::CONFIG, path + ": " + valid.error());
    }
    return Result<std::vector<uint8_t>>(std::move(elf));
}

Result<std::pair<PublicKey, svm::Account>> GenesisBuilder::load_account_file(
    const std::string& path) {
    using Entry = std::pair<PublicKey, svm::Account>;
    auto text = read_file(path);
    if (!text.is_ok()) {
        return Result<Entry>(ErrorKind::CONFIG, text.error());
    }
    try {
        return account_from_json(json::parse(as_text(text.value())));
    } catch (const json::exception& e) {
        return Result<Entry>(ErrorKind::CONFIG, path + ": " + e.what());
    }
}

common::Hash GenesisBuilder::compute_genesis_hash(const GenesisConfig& config) {
    std::string canonical = serialize_config(config, -1);
    return common::CryptoUtils::sha256(std::vector<uint8_t>(canonical.begin(), canonical.end()));
}

// Construction

Result<std::shared_ptr<banking::Bank>> GenesisBuilder::build(
    const GenesisConfig& config, std::shared_ptr<const svm::ExecutionEngine> engine) {
    using BankResult = Result<std::shared_ptr<banking::Bank>>;

    auto validation_result = validate_config(config);
    if (!validation_result.is_ok()) {
        LOG_GENESIS_ERROR("Invalid genesis configuration: " + validation_result.error(),
                          "GENESIS_INVALID_CONFIG");
        return BankResult(validation_result.error_info());
    }
    if (!engine) {
        return BankResult(ErrorKind::CONFIG, "no execution engine supplied");
    }

    auto context = std::make_shared<banking::BankContext>();
    context->config = config;
    context->genesis_hash = compute_genesis_hash(config);
    context->rent = svm::RentCalculator(svm::RentCalculator::RentConfig(
        config.rent_schedule.lamports_per_byte_year, config.rent_schedule.exemption_threshold,
        config.epoch_schedule.slots_per_epoch));
    context->engine = engine;

    for (const auto& id : config.program_allowlist) {
        context->program_allowlist.insert(id);
    }
    for (const auto& id : svm::builtin_program_ids()) {
        context->program_allowlist.insert(id);
    }
    for (const auto& program : config.programs) {
        context->program_allowlist.insert(program.program_id);
    }

    auto bank = banking::Bank::create_genesis(context);
    const auto& rent = context->rent;

    auto store = [&bank](const PublicKey& address, const svm::Account& account) {
        auto result = bank->store_account(address, account);
        if (!result.is_ok()) {
            return Result<bool>(ErrorKind::CONFIG, result.error());
        }
        return result;
    };

    for (const auto& id : svm::builtin_program_ids()) {
        auto stored = store(id, svm::Account(1, {}, svm::program_ids::native_loader(), true));
        if (!stored.is_ok()) return BankResult(stored.error_info());
    }

    svm::ClockSysvar clock;
    clock.slot = 0;
    clock.epoch_start_timestamp = static_cast<int64_t>(config.creation_time);
    clock.leader_schedule_epoch = 1;
    clock.unix_timestamp = static_cast<int64_t>(config.creation_time);
    auto stored = store(svm::program_ids::sysvar_clock(),
                        svm::Account(std::max<Lamports>(1, rent.minimum_balance(svm::ClockSysvar::SIZE)),
                                     clock.serialize(), svm::program_ids::sysvar_owner()));
    if (!stored.is_ok()) return BankResult(stored.error_info());

    svm::RentSysvar rent_sysvar;
    rent_sysvar.lamports_per_byte_year = config.rent_schedule.lamports_per_byte_year;
    rent_sysvar.exemption_threshold = config.rent_schedule.exemption_threshold;
    rent_sysvar.burn_percent = static_cast<uint8_t>(config.fee_schedule.burn_percent);
    stored = store(svm::program_ids::sysvar_rent(),
                   svm::Account(std::max<Lamports>(1, rent.minimum_balance(svm::RentSysvar::SIZE)),
                                rent_sysvar.serialize(), svm::program_ids::sysvar_owner()));
    if (!stored.is_ok()) return BankResult(stored.error_info());

    for (const auto& entry : config.initial_accounts) {
        stored = store(entry.first, entry.second);
        if (!stored.is_ok()) return BankResult(stored.error_info());
    }
    for (const auto& entry : config.initial_balances) {
        auto credited = bank->credit(entry.first, entry.second);
        if (!credited.is_ok()) {
            return BankResult(ErrorKind::CONFIG, credited.error());
        }
    }
    for (const auto& program : config.programs) {
        const PublicKey& loader =
            program.loader.empty() ? svm::program_ids::bpf_loader_upgradeable() : program.loader;
        stored = store(program.program_id,
                       svm::Account(std::max<Lamports>(1, rent.minimum_balance(program.elf.size())),
                                    program.elf, loader, true));
        if (!stored.is_ok()) return BankResult(stored.error_info());
    }

    LOG_INFO("Genesis built for cluster '", config.cluster_id, "' (",
             cluster_type_to_string(config.cluster_type), "), hash ",
             common::encode_base58(context->genesis_hash), ", capitalization ",
             bank->capitalization());
    return BankResult(bank);
}

} // namespace genesis
} // namespace localnet
