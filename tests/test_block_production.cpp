#include "common/encoding.h"
#include "common/logging.h"
#include "svm/program_ids.h"
#include "test_framework.h"
#include "test_helpers.h"
#include "validator/block_production.h"
#include "validator/core.h"
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace localnet;
using namespace localnet::validator;
using namespace test_helpers;

namespace {

std::unique_ptr<ValidatorCore> booted_core(const genesis::GenesisConfig &config = make_genesis_config()) {
  auto core = std::make_unique<ValidatorCore>(config, make_engine());
  auto booted = core->boot();
  if (!booted.is_ok()) {
    throw std::runtime_error("boot failed: " + booted.error());
  }
  return core;
}

bool wait_for_slot(const ValidatorCore &core, common::Slot slot,
                   std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (core.ledger().latest_slot().value_or(0) >= slot) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return false;
}

} // namespace

void test_core_boot() {
  auto core = std::make_unique<ValidatorCore>(make_genesis_config(), make_engine());
  std::string boot_log;
  {
    LogCapture capture(common::LogLevel::INFO);
    ASSERT_OK(core->boot());
    boot_log = capture.text();
  }
  // The boot line names the genesis hash, distinct from the slot 0 blockhash
  ASSERT_CONTAINS(boot_log, "genesis hash " + common::encode_base58(core->genesis_hash()));
  ASSERT_CONTAINS(boot_log, "slot 0 blockhash " + common::encode_base58(core->latest_blockhash()));

  ASSERT_EQ(static_cast<size_t>(1), core->ledger().size());
  ASSERT_TRUE(core->ledger().latest_slot() == std::optional<common::Slot>(0));
  ASSERT_EQ(static_cast<common::Slot>(1), core->open_bank()->slot());
  ASSERT_EQ(static_cast<size_t>(32), core->genesis_hash().size());
  ASSERT_EQ(core->latest_frozen()->blockhash(), core->latest_blockhash());
  ASSERT_EQ(static_cast<Lamports>(1000), core->open_bank()->get_balance(alice().pubkey()));
}

void test_core_produce_slot() {
  auto core = booted_core();
  auto tx = make_transfer(alice(), bob().pubkey(), 100, core->latest_blockhash());
  ASSERT_OK(core->intake_queue().submit(tx));

  auto produced = core->produce_slot();
  ASSERT_OK(produced);
  ASSERT_EQ(static_cast<common::Slot>(1), produced.value());

  auto entry = core->ledger().get_entry(1);
  ASSERT_TRUE(entry.has_value());
  ASSERT_EQ(static_cast<size_t>(1), entry->transactions.size());
  ASSERT_TRUE(entry->parent_slot == std::optional<common::Slot>(0));
  ASSERT_EQ(core->ledger().get(0)->blockhash(), entry->parent_blockhash);

  ASSERT_EQ(static_cast<Lamports>(895), core->latest_frozen()->get_balance(alice().pubkey()));
  ASSERT_EQ(static_cast<Lamports>(100), core->latest_frozen()->get_balance(bob().pubkey()));
  ASSERT_EQ(static_cast<common::Slot>(2), core->open_bank()->slot());
  ASSERT_EQ(static_cast<size_t>(0), core->intake_queue().size());

  auto stats = core->get_stats();
  ASSERT_EQ(static_cast<uint64_t>(1), stats.slots_produced);
  ASSERT_EQ(static_cast<uint64_t>(1), stats.transactions_applied);
}

void test_core_counts_dropped_and_failed() {
  auto core = booted_core();
  Hash blockhash = core->latest_blockhash();

  // Carol has no account: queued, then dropped by the bank
  ASSERT_OK(core->intake_queue().submit(make_transfer(carol(), bob().pubkey(), 1, blockhash)));
  // Alice cannot cover it: recorded as failed
  ASSERT_OK(core->intake_queue().submit(make_transfer(alice(), bob().pubkey(), 5000, blockhash)));
  ASSERT_OK(core->produce_slot());

  auto stats = core->get_stats();
  ASSERT_EQ(static_cast<uint64_t>(1), stats.transactions_dropped);
  ASSERT_EQ(static_cast<uint64_t>(1), stats.transactions_failed);
  ASSERT_EQ(static_cast<uint64_t>(1), stats.transactions_applied);

  auto metrics = core->error_metrics();
  ASSERT_EQ(static_cast<uint64_t>(2), metrics.total_errors());
  ASSERT_EQ(static_cast<uint64_t>(1), metrics.account_not_found);
  ASSERT_CONTAINS(metrics.format(), "account_not_found=1");

  auto entry = core->ledger().get_entry(1);
  ASSERT_EQ(static_cast<size_t>(1), entry->transactions.size());
  ASSERT_FALSE(entry->receipts[0].is_success());
}

void test_core_warp_to_slot() {
  auto core = booted_core();
  auto tx = make_transfer(alice(), bob().pubkey(), 100, core->latest_blockhash());
  ASSERT_OK(core->intake_queue().submit(tx));

  auto warped = core->warp_to_slot(5);
  ASSERT_OK(warped);
  ASSERT_EQ(static_cast<common::Slot>(5), warped.value());
  ASSERT_EQ(static_cast<size_t>(6), core->ledger().size());

  // Only the final slot drains the queue
  for (common::Slot slot = 1; slot < 5; ++slot) {
    ASSERT_TRUE(core->ledger().get_entry(slot)->transactions.empty());
  }
  ASSERT_EQ(static_cast<size_t>(1), core->ledger().get_entry(5)->transactions.size());
  ASSERT_EQ(static_cast<common::Slot>(6), core->open_bank()->slot());

  auto backwards = core->warp_to_slot(5);
  ASSERT_ERROR_KIND(backwards, common::ErrorKind::STATE);
  ASSERT_TRUE(core->warp_to_slot(2).is_err());
}

void test_core_reset() {
  auto core = booted_core();
  Hash genesis_hash = core->genesis_hash();
  auto tx = make_transfer(alice(), bob().pubkey(), 100, core->latest_blockhash());
  ASSERT_OK(core->intake_queue().submit(tx));
  ASSERT_OK(core->warp_to_slot(3));
  ASSERT_OK(core->intake_queue()
                  .submit(make_transfer(alice(), bob().pubkey(), 1, core->latest_blockhash()))
                  );

  ASSERT_OK(core->reset());
  ASSERT_EQ(static_cast<size_t>(1), core->ledger().size());
  ASSERT_EQ(static_cast<size_t>(0), core->intake_queue().size());
  ASSERT_EQ(genesis_hash, core->genesis_hash());
  ASSERT_EQ(static_cast<Lamports>(1000), core->open_bank()->get_balance(alice().pubkey()));
  ASSERT_EQ(static_cast<Lamports>(0), core->open_bank()->get_balance(bob().pubkey()));
  ASSERT_EQ(static_cast<uint64_t>(0), core->error_metrics().total_errors());

  // The original transfer may be replayed on the fresh chain
  auto replay = make_transfer(alice(), bob().pubkey(), 100, core->latest_blockhash());
  ASSERT_OK(core->intake_queue().submit(replay));
  ASSERT_OK(core->produce_slot());
  ASSERT_EQ(static_cast<Lamports>(100), core->latest_frozen()->get_balance(bob().pubkey()));
}

void test_core_airdrop_and_set_account() {
  auto core = booted_core();

  auto credited = core->airdrop(carol().pubkey(), 500);
  ASSERT_OK(credited);
  ASSERT_EQ(static_cast<Lamports>(500), credited.value());
  ASSERT_ERROR_KIND(core->airdrop(carol().pubkey(), 0), common::ErrorKind::INVALID_ARGUMENT);
  ASSERT_ERROR_KIND(core->airdrop(PublicKey(5, 1), 10), common::ErrorKind::INVALID_ARGUMENT);

  svm::Account data_account(2039280, std::vector<uint8_t>(165, 0),
                            svm::program_ids::system_program());
  ASSERT_OK(core->set_account(bob().pubkey(), data_account));
  svm::Account ownerless(1, {}, PublicKey(3, 0));
  ASSERT_ERROR_KIND(core->set_account(bob().pubkey(), ownerless), common::ErrorKind::INVALID_ARGUMENT);

  ASSERT_OK(core->produce_slot());
  auto frozen = core->latest_frozen();
  ASSERT_EQ(static_cast<Lamports>(500), frozen->get_balance(carol().pubkey()));
  ASSERT_EQ(static_cast<size_t>(165), frozen->get_account(bob().pubkey())->data.size());
}

void test_core_subscribers() {
  auto core = booted_core();
  std::vector<common::Slot> seen;
  size_t id = core->subscribe_slots(
      [&seen](const ledger::LedgerEntry &entry) { seen.push_back(entry.slot); });
  core->subscribe_slots(
      [](const ledger::LedgerEntry &) { throw std::runtime_error("subscriber failure"); });

  ASSERT_OK(core->produce_slot());
  ASSERT_OK(core->warp_to_slot(4));
  ASSERT_EQ(static_cast<size_t>(4), seen.size());
  for (size_t i = 0; i < seen.size(); ++i) {
    ASSERT_EQ(static_cast<common::Slot>(i + 1), seen[i]);
  }

  core->unsubscribe_slots(id);
  ASSERT_OK(core->produce_slot());
  ASSERT_EQ(static_cast<size_t>(4), seen.size());
}

void test_core_subscriber_calls_control_operations() {
  auto core = booted_core();
  std::atomic<bool> delivering{false};
  std::atomic<bool> airdropped{false};
  core->subscribe_slots([&](const ledger::LedgerEntry &entry) {
    if (entry.slot != 1) {
      return;
    }
    delivering.store(true);
    // Give the second producer time to queue up behind this delivery
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    airdropped.store(core->airdrop(carol().pubkey(), 7).is_ok());
  });

  bool second_ok = false;
  std::thread second([&]() {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (!delivering.load() && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    second_ok = core->produce_slot().is_ok();
  });
  auto first = core->produce_slot();
  second.join();

  ASSERT_OK(first);
  ASSERT_TRUE(second_ok);
  ASSERT_TRUE(airdropped.load());
  ASSERT_TRUE(core->ledger().latest_slot() == std::optional<common::Slot>(2));
  // The airdrop landed in slot 2, recorded by the second producer
  ASSERT_EQ(static_cast<Lamports>(7), core->latest_frozen()->get_balance(carol().pubkey()));
}

void test_loop_manual_mode() {
  auto core = booted_core();
  BlockProductionLoop loop(*core, 0);

  ASSERT_TRUE(loop.is_manual());
  ASSERT_OK(loop.start());
  ASSERT_FALSE(loop.is_running());

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  ASSERT_TRUE(core->ledger().latest_slot() == std::optional<common::Slot>(0));

  auto advanced = loop.advance();
  ASSERT_OK(advanced);
  ASSERT_EQ(static_cast<common::Slot>(1), advanced.value());
}

void test_loop_timer_produces_slots() {
  auto core = booted_core();
  BlockProductionLoop loop(*core, 10);

  ASSERT_OK(loop.start());
  ASSERT_TRUE(loop.is_running());
  ASSERT_TRUE(wait_for_slot(*core, 3));

  // Manual steps interleave with the timer without gaps
  ASSERT_OK(loop.advance());
  loop.stop();
  ASSERT_FALSE(loop.is_running());

  auto latest = core->ledger().latest_slot().value_or(0);
  ASSERT_EQ(static_cast<size_t>(latest + 1), core->ledger().size());
  std::this_thread::sleep_for(std::chrono::milliseconds(40));
  ASSERT_EQ(latest, core->ledger().latest_slot().value_or(0));
}

void test_loop_advance_while_timer_runs() {
  auto core = booted_core();
  std::vector<common::Slot> delivered;
  std::mutex delivered_mutex;
  core->subscribe_slots([&](const ledger::LedgerEntry &entry) {
    std::lock_guard<std::mutex> lock(delivered_mutex);
    delivered.push_back(entry.slot);
  });

  BlockProductionLoop loop(*core, 2);
  ASSERT_OK(loop.start());
  bool advanced = true;
  for (int i = 0; i < 30; ++i) {
    advanced = loop.advance().is_ok() && advanced;
  }
  loop.stop();
  ASSERT_TRUE(advanced);

  // Every step produced exactly one slot, with no gap or duplicate
  common::Slot latest = core->ledger().latest_slot().value_or(0);
  ASSERT_TRUE(latest >= 30);
  ASSERT_EQ(static_cast<size_t>(latest + 1), core->ledger().size());
  ASSERT_EQ(static_cast<uint64_t>(latest), core->get_stats().slots_produced);
  for (common::Slot slot = 1; slot <= latest; ++slot) {
    auto entry = core->ledger().get_entry(slot);
    ASSERT_TRUE(entry.has_value());
    ASSERT_EQ(core->ledger().get(slot - 1)->blockhash(), entry->parent_blockhash);
  }

  std::lock_guard<std::mutex> lock(delivered_mutex);
  ASSERT_EQ(static_cast<size_t>(latest), delivered.size());
  for (size_t i = 0; i < delivered.size(); ++i) {
    ASSERT_EQ(static_cast<common::Slot>(i + 1), delivered[i]);
  }
}

void test_loop_halts_on_sequence_error() {
  auto core = booted_core();
  BlockProductionLoop loop(*core, 10);
  LogCapture capture(common::LogLevel::WARN);

  loop.handle_result(common::Result<common::Slot>(common::ErrorKind::SEQUENCE, "slot 7 after 5"));
  ASSERT_TRUE(loop.is_halted());
  ASSERT_CONTAINS(capture.text(), "PRODUCTION_HALTED");

  auto refused = loop.start();
  ASSERT_ERROR_KIND(refused, common::ErrorKind::SEQUENCE);

  // Other errors do not halt
  BlockProductionLoop other(*core, 10);
  other.handle_result(common::Result<common::Slot>(common::ErrorKind::STATE, "not booted"));
  ASSERT_FALSE(other.is_halted());

  loop.clear_halt();
  ASSERT_FALSE(loop.is_halted());
  ASSERT_OK(loop.start());
  loop.stop();
}

void run_block_production_tests(TestRunner &runner) {
  std::cout << "\n=== Block Production Tests ===" << std::endl;

  runner.run_test("Core Boot", test_core_boot);
  runner.run_test("Core Produce Slot", test_core_produce_slot);
  runner.run_test("Core Counts Dropped And Failed", test_core_counts_dropped_and_failed);
  runner.run_test("Core Warp To Slot", test_core_warp_to_slot);
  runner.run_test("Core Reset", test_core_reset);
  runner.run_test("Core Airdrop And Set Account", test_core_airdrop_and_set_account);
  runner.run_test("Core Subscribers", test_core_subscribers);
  runner.run_test("Core Subscriber Calls Control Operations",
                  test_core_subscriber_calls_control_operations);
  runner.run_test("Loop Manual Mode", test_loop_manual_mode);
  runner.run_test("Loop Timer Produces Slots", test_loop_timer_produces_slots);
  runner.run_test("Loop Advance While Timer Runs", test_loop_advance_while_timer_runs);
  runner.run_test("Loop Halts On Sequence Error", test_loop_halts_on_sequence_error);
}

#ifndef COMPREHENSIVE_TESTS
int main() {
  std::cout << "=== Block Production Test Suite ===" << std::endl;
  common::Logger::instance().set_level(common::LogLevel::WARN);
  TestRunner runner;
  run_block_production_tests(runner);
  runner.print_summary();
  return runner.all_passed() ? 0 : 1;
}
#endif
