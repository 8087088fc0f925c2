#include "common/encoding.h"
#include "common/logging.h"
#include "genesis/builder.h"
#include "localnet_validator.h"
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <signal.h>
#include <sstream>
#include <thread>

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdown_requested.store(true);
  }
}

void print_usage(const char *program_name) {
  std::cout << "Usage: " << program_name << " [options]" << std::endl;
  std::cout << std::endl;
  std::cout << "Options:" << std::endl;
  std::cout << "  --config FILE              Genesis and runtime options (JSON)" << std::endl;
  std::cout << "  --tick-ms N                Slot production interval, 0 for manual "
               "(default: 400)"
            << std::endl;
  std::cout << "  --log-level LEVEL          trace, debug, info, warn, error, critical"
            << std::endl;
  std::cout << "  --log-json                 Emit JSON log lines" << std::endl;
  std::cout << "  --warp-slot N              Warp to slot N right after boot" << std::endl;
  std::cout << "  --account ADDRESS FILE     Preload an account from a Solana CLI JSON file"
            << std::endl;
  std::cout << "  --bpf-program ADDRESS FILE Preload an SBF/BPF program ELF" << std::endl;
  std::cout << "  --slots-per-epoch N        Override the epoch schedule" << std::endl;
  std::cout << "  --stats-interval-ms N      Stats print interval (default: 30000)"
            << std::endl;
  std::cout << "  --help                     Show this help message" << std::endl;
}

struct CliOptions {
  localnet::common::ValidatorConfig config;
  bool tick_set = false;
  bool log_level_set = false;
  std::vector<std::pair<std::string, std::string>> accounts;
  std::vector<std::pair<std::string, std::string>> programs;
  uint64_t slots_per_epoch = 0;
};

localnet::common::Result<CliOptions> parse_arguments(int argc, char *argv[]) {
  using localnet::common::ErrorKind;
  using localnet::common::Result;
  CliOptions options;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        print_usage(argv[0]);
        exit(0);
      } else if (arg == "--config" && i + 1 < argc) {
        options.config.genesis_config_path = argv[++i];
      } else if (arg == "--tick-ms" && i + 1 < argc) {
        options.config.tick_interval_ms = static_cast<uint32_t>(std::stoul(argv[++i]));
        options.tick_set = true;
      } else if (arg == "--log-level" && i + 1 < argc) {
        options.config.log_level = argv[++i];
        options.log_level_set = true;
      } else if (arg == "--log-json") {
        options.config.log_json = true;
      } else if (arg == "--warp-slot" && i + 1 < argc) {
        options.config.warp_slot = std::stoull(argv[++i]);
      } else if (arg == "--account" && i + 2 < argc) {
        options.accounts.emplace_back(argv[i + 1], argv[i + 2]);
        i += 2;
      } else if (arg == "--bpf-program" && i + 2 < argc) {
        options.programs.emplace_back(argv[i + 1], argv[i + 2]);
        i += 2;
      } else if (arg == "--slots-per-epoch" && i + 1 < argc) {
        options.slots_per_epoch = std::stoull(argv[++i]);
      } else if (arg == "--stats-interval-ms" && i + 1 < argc) {
        options.config.stats_interval_ms = static_cast<uint32_t>(std::stoul(argv[++i]));
      } else {
        return Result<CliOptions>(ErrorKind::CONFIG, "Unknown or incomplete option: " + arg);
      }
    }
  } catch (const std::exception &e) {
    return Result<CliOptions>(ErrorKind::CONFIG, std::string("Invalid number: ") + e.what());
  }
  return Result<CliOptions>(std::move(options));
}

localnet::common::Result<localnet::genesis::GenesisConfig> build_genesis_config(CliOptions &options) {
  using localnet::common::ErrorKind;
  using localnet::common::Result;
  using localnet::genesis::GenesisBuilder;
  using localnet::genesis::GenesisConfig;

  GenesisConfig genesis =
      GenesisBuilder::create_default_config(localnet::genesis::ClusterType::DEVELOPMENT);

  const std::string &path = options.config.genesis_config_path;
  if (!path.empty()) {
    auto loaded = GenesisBuilder::load_config(path);
    if (!loaded.is_ok()) {
      return loaded;
    }
    genesis = loaded.value();

    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    localnet::common::ValidatorConfig from_file = options.config;
    auto runtime = GenesisBuilder::apply_runtime_options(buffer.str(), from_file);
    if (!runtime.is_ok()) {
      return Result<GenesisConfig>(runtime.error_info());
    }
    if (!options.tick_set) {
      options.config.tick_interval_ms = from_file.tick_interval_ms;
    }
    if (!options.log_level_set) {
      options.config.log_level = from_file.log_level;
    }
  }

  for (const auto &entry : options.accounts) {
    auto address = localnet::common::parse_pubkey(entry.first);
    if (!address.is_ok()) {
      return Result<GenesisConfig>(ErrorKind::CONFIG, "--account " + entry.first + ": " +
                                                          address.error());
    }
    auto account = GenesisBuilder::load_account_file(entry.second);
    if (!account.is_ok()) {
      return Result<GenesisConfig>(account.error_info());
    }
    genesis.initial_accounts[address.value()] = account.value().second;
  }

  for (const auto &entry : options.programs) {
    auto address = localnet::common::parse_pubkey(entry.first);
    if (!address.is_ok()) {
      return Result<GenesisConfig>(ErrorKind::CONFIG, "--bpf-program " + entry.first + ": " +
                                                          address.error());
    }
    auto elf = GenesisBuilder::load_program_file(entry.second);
    if (!elf.is_ok()) {
      return Result<GenesisConfig>(elf.error_info());
    }
    localnet::genesis::GenesisProgram program;
    program.program_id = address.value();
    program.path = entry.second;
    program.elf = elf.value();
    genesis.programs.push_back(std::move(program));
  }

  if (options.slots_per_epoch > 0) {
    genesis.epoch_schedule.slots_per_epoch = options.slots_per_epoch;
  }
  return Result<GenesisConfig>(std::move(genesis));
}

void print_validator_stats(const localnet::TestValidator &validator) {
  auto stats = validator.get_stats();

  std::cout << "\n=== Validator Statistics ===" << std::endl;
  std::cout << "Status: " << (validator.is_running() ? "RUNNING" : "STOPPED")
            << (stats.production_halted ? " (HALTED)" : "") << std::endl;
  std::cout << "Current Slot: " << stats.current_slot << std::endl;
  std::cout << "Latest Frozen Slot: " << stats.latest_frozen_slot << std::endl;
  std::cout << "Latest Blockhash: " << localnet::common::encode_base58(stats.latest_blockhash)
            << std::endl;
  std::cout << "Transactions: " << stats.transaction_count << " (" << stats.transactions_failed
            << " failed, " << stats.transactions_dropped << " dropped)" << std::endl;
  if (!stats.error_summary.empty()) {
    std::cout << "Transaction errors: " << stats.error_summary << std::endl;
  }
  std::cout << "Submissions: " << stats.submissions_accepted << " accepted, "
            << stats.submissions_rejected << " rejected, " << stats.submissions_busy << " busy"
            << std::endl;
  std::cout << "Capitalization: " << stats.capitalization << " lamports" << std::endl;
  std::cout << "Uptime: " << stats.uptime_seconds << " seconds" << std::endl;
  std::cout << "=============================" << std::endl;
}

int main(int argc, char *argv[]) {
  signal(SIGINT, signal_handler);
  signal(SIGTERM, signal_handler);

  auto parsed = parse_arguments(argc, argv);
  if (!parsed.is_ok()) {
    std::cerr << parsed.error_info().to_string() << std::endl;
    print_usage(argv[0]);
    return 1;
  }
  CliOptions options = parsed.value();

  auto genesis = build_genesis_config(options);
  if (!genesis.is_ok()) {
    std::cerr << genesis.error_info().to_string() << std::endl;
    return 1;
  }

  try {
    localnet::TestValidator validator(options.config, genesis.value());

    auto init_result = validator.initialize();
    if (!init_result.is_ok()) {
      std::cerr << "Failed to initialize validator: " << init_result.error_info().to_string()
                << std::endl;
      return 1;
    }

    auto start_result = validator.start();
    if (!start_result.is_ok()) {
      std::cerr << "Failed to start validator: " << start_result.error_info().to_string()
                << std::endl;
      return 1;
    }

    std::cout << "Local validator running" << std::endl;
    std::cout << "Genesis hash: " << localnet::common::encode_base58(validator.genesis_hash())
              << std::endl;
    std::cout << "Press Ctrl+C to stop" << std::endl;

    auto stats_interval = std::chrono::milliseconds(options.config.stats_interval_ms);
    auto last_stats_time = std::chrono::steady_clock::now();
    while (!g_shutdown_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));

      auto now = std::chrono::steady_clock::now();
      if (stats_interval.count() > 0 && now - last_stats_time >= stats_interval) {
        print_validator_stats(validator);
        last_stats_time = now;
      }
    }

    std::cout << "\nShutting down validator..." << std::endl;
    validator.shutdown();
    print_validator_stats(validator);
    std::cout << "Validator shutdown complete." << std::endl;
    return 0;

  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
