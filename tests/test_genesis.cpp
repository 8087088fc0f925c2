#include "common/encoding.h"
#include "common/logging.h"
#include "genesis/builder.h"
#include "svm/program_ids.h"
#include "svm/sysvar.h"
#include "test_framework.h"
#include "test_helpers.h"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace localnet;
using namespace localnet::genesis;
using namespace test_helpers;

namespace {

std::filesystem::path scratch_dir(const std::string &name) {
  auto dir = std::filesystem::temp_directory_path() / ("localnet_genesis_test_" + name);
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

void write_bytes(const std::filesystem::path &path, const std::vector<uint8_t> &bytes) {
  std::ofstream file(path, std::ios::binary);
  file.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

void write_text(const std::filesystem::path &path, const std::string &text) {
  std::ofstream file(path);
  file << text;
}

} // namespace

void test_genesis_default_configs() {
  auto dev = GenesisBuilder::create_default_config(ClusterType::DEVELOPMENT);
  ASSERT_EQ(std::string("localnet"), dev.cluster_id);
  ASSERT_EQ(static_cast<common::Lamports>(0), dev.max_supply);
  ASSERT_GT(dev.creation_time, static_cast<uint64_t>(0));

  auto mainnet = GenesisBuilder::create_default_config(ClusterType::MAINNET_BETA);
  ASSERT_EQ(std::string("mainnet-beta"), mainnet.cluster_id);
  ASSERT_EQ(600000000ULL * 1000000000ULL, mainnet.max_supply);

  ASSERT_OK(GenesisBuilder::validate_config(dev));
  ASSERT_OK(GenesisBuilder::validate_config(mainnet));
}

void test_cluster_type_strings() {
  ASSERT_EQ(std::string("devnet"), GenesisBuilder::cluster_type_to_string(ClusterType::DEVNET));
  auto parsed = GenesisBuilder::string_to_cluster_type("testnet");
  ASSERT_OK(parsed);
  ASSERT_TRUE(parsed.value() == ClusterType::TESTNET);

  auto unknown = GenesisBuilder::string_to_cluster_type("moonnet");
  ASSERT_ERROR_KIND(unknown, common::ErrorKind::CONFIG);
}

void test_genesis_validation_errors() {
  auto config = make_genesis_config();
  config.epoch_schedule.slots_per_epoch = 0;
  auto result = GenesisBuilder::validate_config(config);
  ASSERT_ERROR_KIND(result, common::ErrorKind::CONFIG);

  config = make_genesis_config();
  config.fee_schedule.burn_percent = 101;
  ASSERT_TRUE(GenesisBuilder::validate_config(config).is_err());

  config = make_genesis_config();
  config.initial_balances[common::PublicKey(5, 1)] = 10;
  ASSERT_TRUE(GenesisBuilder::validate_config(config).is_err());

  config = make_genesis_config();
  config.cluster_id = "";
  ASSERT_TRUE(GenesisBuilder::validate_config(config).is_err());
}

void test_genesis_supply_limits() {
  auto config = make_genesis_config();
  config.initial_balances[bob().pubkey()] = UINT64_MAX;
  auto overflow = GenesisBuilder::total_supply(config);
  ASSERT_ERROR_KIND(overflow, common::ErrorKind::CONFIG);

  config = make_genesis_config();
  config.max_supply = 500;
  auto capped = GenesisBuilder::validate_config(config);
  ASSERT_TRUE(capped.is_err());
  ASSERT_CONTAINS(capped.error(), "max_supply");
}

void test_program_elf_validation() {
  ASSERT_OK(GenesisBuilder::validate_program_elf(make_test_elf(247)));
  ASSERT_OK(GenesisBuilder::validate_program_elf(make_test_elf(263)));

  // x86-64
  ASSERT_TRUE(GenesisBuilder::validate_program_elf(make_test_elf(62)).is_err());
  // Truncated header
  ASSERT_TRUE(GenesisBuilder::validate_program_elf(make_test_elf(247, 32)).is_err());

  auto bad_magic = make_test_elf();
  bad_magic[1] = 'X';
  ASSERT_TRUE(GenesisBuilder::validate_program_elf(bad_magic).is_err());

  auto elf32 = make_test_elf();
  elf32[4] = 1;
  ASSERT_TRUE(GenesisBuilder::validate_program_elf(elf32).is_err());

  auto big_endian = make_test_elf();
  big_endian[5] = 2;
  ASSERT_TRUE(GenesisBuilder::validate_program_elf(big_endian).is_err());
}

void test_genesis_hash_determinism() {
  auto config = make_genesis_config();
  auto first = GenesisBuilder::compute_genesis_hash(config);
  auto second = GenesisBuilder::compute_genesis_hash(make_genesis_config());
  ASSERT_EQ(first, second);
  ASSERT_EQ(common::HASH_BYTES, first.size());

  config.initial_balances[alice().pubkey()] = 1001;
  ASSERT_NE(first, GenesisBuilder::compute_genesis_hash(config));

  config = make_genesis_config();
  config.creation_time += 1;
  ASSERT_NE(first, GenesisBuilder::compute_genesis_hash(config));
}

void test_genesis_json_round_trip() {
  auto config = make_genesis_config();
  config.fee_collector = carol().pubkey();
  config.initial_accounts[bob().pubkey()] =
      svm::Account(42, {1, 2, 3}, svm::program_ids::memo_program(), false, 0);
  GenesisProgram program;
  program.program_id = common::Keypair::from_label("program").pubkey();
  program.elf = make_test_elf();
  config.programs.push_back(program);

  auto parsed = GenesisBuilder::parse_config(GenesisBuilder::serialize_config(config));
  ASSERT_OK(parsed);
  const auto &restored = parsed.value();
  ASSERT_EQ(config.creation_time, restored.creation_time);
  ASSERT_EQ(config.fee_collector, restored.fee_collector);
  ASSERT_EQ(static_cast<common::Lamports>(1000), restored.initial_balances.at(alice().pubkey()));
  ASSERT_TRUE(restored.initial_accounts.at(bob().pubkey()) ==
              config.initial_accounts.at(bob().pubkey()));
  ASSERT_EQ(static_cast<size_t>(1), restored.programs.size());
  ASSERT_EQ(program.elf, restored.programs[0].elf);
  ASSERT_EQ(svm::program_ids::bpf_loader_upgradeable(), restored.programs[0].loader);

  // Only the defaulted loader differs, and it is serialized the same way
  ASSERT_EQ(GenesisBuilder::compute_genesis_hash(config),
            GenesisBuilder::compute_genesis_hash(restored));
}

void test_genesis_parse_errors() {
  ASSERT_TRUE(GenesisBuilder::parse_config("{not json").is_err());
  ASSERT_TRUE(GenesisBuilder::parse_config("[1, 2]").is_err());

  auto bad_address = GenesisBuilder::parse_config(R"({"initial_balances": {"0OIl": 5}})");
  ASSERT_ERROR_KIND(bad_address, common::ErrorKind::CONFIG);

  std::string program_without_payload =
      R"({"programs": [{"program_id": ")" +
      common::encode_base58(common::Keypair::from_label("p").pubkey()) + R"("}]})";
  ASSERT_TRUE(GenesisBuilder::parse_config(program_without_payload).is_err());
}

void test_genesis_presets_from_json() {
  auto parsed = GenesisBuilder::parse_config(R"({"cluster_type": "mainnet-beta"})");
  ASSERT_OK(parsed);
  ASSERT_EQ(std::string("mainnet-beta"), parsed.value().cluster_id);
  ASSERT_EQ(600000000ULL * 1000000000ULL, parsed.value().max_supply);

  auto overridden =
      GenesisBuilder::parse_config(R"({"cluster_type": "devnet", "fee_schedule": {"burn_percent": 0}})");
  ASSERT_OK(overridden);
  ASSERT_EQ(0u, overridden.value().fee_schedule.burn_percent);
  ASSERT_EQ(static_cast<common::Lamports>(5000),
            overridden.value().fee_schedule.lamports_per_signature);
}

void test_genesis_load_config_with_program_path() {
  auto dir = scratch_dir("load");
  write_bytes(dir / "program.so", make_test_elf(263));
  auto program_id = common::Keypair::from_label("loaded program").pubkey();

  nlohmann::json j;
  j["creation_time"] = 1700000000;
  j["initial_balances"][common::encode_base58(alice().pubkey())] = 250;
  j["programs"] = nlohmann::json::array(
      {{{"program_id", common::encode_base58(program_id)}, {"path", "program.so"}}});
  j["tick_interval_ms"] = 100;
  j["log_level"] = "debug";
  write_text(dir / "genesis.json", j.dump());

  auto loaded = GenesisBuilder::load_config((dir / "genesis.json").string());
  ASSERT_OK(loaded);
  ASSERT_EQ(static_cast<size_t>(1), loaded.value().programs.size());
  ASSERT_EQ(make_test_elf(263), loaded.value().programs[0].elf);

  common::ValidatorConfig runtime;
  ASSERT_OK(GenesisBuilder::apply_runtime_options(j.dump(), runtime));
  ASSERT_EQ(100u, runtime.tick_interval_ms);
  ASSERT_EQ(std::string("debug"), runtime.log_level);

  auto missing = GenesisBuilder::load_config((dir / "absent.json").string());
  ASSERT_ERROR_KIND(missing, common::ErrorKind::CONFIG);

  std::filesystem::remove_all(dir);
}

void test_genesis_save_config() {
  auto dir = scratch_dir("save");
  auto config = make_genesis_config();
  auto path = (dir / "saved.json").string();
  ASSERT_OK(GenesisBuilder::save_config(config, path));

  auto loaded = GenesisBuilder::load_config(path);
  ASSERT_OK(loaded);
  ASSERT_EQ(GenesisBuilder::compute_genesis_hash(config),
            GenesisBuilder::compute_genesis_hash(loaded.value()));

  config.epoch_schedule.slots_per_epoch = 0;
  ASSERT_TRUE(GenesisBuilder::save_config(config, (dir / "invalid.json").string()).is_err());
  std::filesystem::remove_all(dir);
}

void test_cli_account_file() {
  auto dir = scratch_dir("account");
  auto address = common::Keypair::from_label("token account").pubkey();
  nlohmann::json j;
  j["pubkey"] = common::encode_base58(address);
  j["account"]["lamports"] = 2039280;
  j["account"]["data"] = nlohmann::json::array({common::encode_base64({9, 8, 7}), "base64"});
  j["account"]["owner"] = common::encode_base58(svm::program_ids::memo_program());
  j["account"]["executable"] = false;
  j["account"]["rentEpoch"] = 0;
  write_text(dir / "account.json", j.dump());

  auto loaded = GenesisBuilder::load_account_file((dir / "account.json").string());
  ASSERT_OK(loaded);
  ASSERT_EQ(address, loaded.value().first);
  ASSERT_EQ(static_cast<common::Lamports>(2039280), loaded.value().second.lamports);
  ASSERT_EQ(std::vector<uint8_t>({9, 8, 7}), loaded.value().second.data);
  ASSERT_EQ(svm::program_ids::memo_program(), loaded.value().second.owner);

  j["account"]["data"] = nlohmann::json::array({"AAAA", "base58"});
  write_text(dir / "bad.json", j.dump());
  ASSERT_TRUE(GenesisBuilder::load_account_file((dir / "bad.json").string()).is_err());
  std::filesystem::remove_all(dir);
}

void test_genesis_build_contents() {
  auto config = make_genesis_config();
  GenesisProgram program;
  program.program_id = common::Keypair::from_label("bpf program").pubkey();
  program.elf = make_test_elf();
  config.programs.push_back(program);

  auto bank = make_genesis_bank(config);
  ASSERT_EQ(static_cast<common::Slot>(0), bank->slot());
  ASSERT_EQ(static_cast<common::Lamports>(1000), bank->get_balance(alice().pubkey()));

  auto system = bank->get_account(svm::program_ids::system_program());
  ASSERT_TRUE(system.has_value());
  ASSERT_TRUE(system->executable);
  ASSERT_EQ(svm::program_ids::native_loader(), system->owner);

  auto clock_account = bank->get_account(svm::program_ids::sysvar_clock());
  ASSERT_TRUE(clock_account.has_value());
  auto clock = svm::ClockSysvar::deserialize(clock_account->data);
  ASSERT_OK(clock);
  ASSERT_EQ(static_cast<int64_t>(1700000000), clock.value().unix_timestamp);

  auto loaded_program = bank->get_account(program.program_id);
  ASSERT_TRUE(loaded_program.has_value());
  ASSERT_TRUE(loaded_program->executable);
  ASSERT_EQ(svm::program_ids::bpf_loader_upgradeable(), loaded_program->owner);
  ASSERT_TRUE(bank->context().rent.is_rent_exempt(loaded_program->lamports,
                                                  loaded_program->data.size()));

  auto supply = GenesisBuilder::total_supply(config);
  ASSERT_OK(supply);
  ASSERT_EQ(supply.value(), bank->capitalization());
}

void test_genesis_build_rejects_invalid() {
  auto config = make_genesis_config();
  GenesisProgram program;
  program.program_id = common::Keypair::from_label("not elf").pubkey();
  program.elf = std::vector<uint8_t>(100, 0);
  config.programs.push_back(program);

  auto built = GenesisBuilder::build(config, make_engine());
  ASSERT_ERROR_KIND(built, common::ErrorKind::CONFIG);

  auto no_engine = GenesisBuilder::build(make_genesis_config(), nullptr);
  ASSERT_TRUE(no_engine.is_err());
}

void run_genesis_tests(TestRunner &runner) {
  std::cout << "\n=== Genesis Tests ===" << std::endl;

  runner.run_test("Genesis Default Configs", test_genesis_default_configs);
  runner.run_test("Cluster Type Strings", test_cluster_type_strings);
  runner.run_test("Genesis Validation Errors", test_genesis_validation_errors);
  runner.run_test("Genesis Supply Limits", test_genesis_supply_limits);
  runner.run_test("Program ELF Validation", test_program_elf_validation);
  runner.run_test("Genesis Hash Determinism", test_genesis_hash_determinism);
  runner.run_test("Genesis JSON Round Trip", test_genesis_json_round_trip);
  runner.run_test("Genesis Parse Errors", test_genesis_parse_errors);
  runner.run_test("Genesis Presets From JSON", test_genesis_presets_from_json);
  runner.run_test("Genesis Load Config With Program Path",
                  test_genesis_load_config_with_program_path);
  runner.run_test("Genesis Save Config", test_genesis_save_config);
  runner.run_test("CLI Account File", test_cli_account_file);
  runner.run_test("Genesis Build Contents", test_genesis_build_contents);
  runner.run_test("Genesis Build Rejects Invalid", test_genesis_build_rejects_invalid);
}

#ifndef COMPREHENSIVE_TESTS
int main() {
  std::cout << "=== Genesis Test Suite ===" << std::endl;
  common::Logger::instance().set_level(common::LogLevel::WARN);
  TestRunner runner;
  run_genesis_tests(runner);
  runner.print_summary();
  return runner.all_passed() ? 0 : 1;
}
#endif
