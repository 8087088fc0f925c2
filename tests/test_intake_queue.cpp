#include "banking/intake_queue.h"
#include "common/logging.h"
#include "test_framework.h"
#include "test_helpers.h"
#include <atomic>
#include <thread>
#include <vector>

using namespace localnet;
using namespace localnet::banking;
using namespace test_helpers;

namespace {

Hash window_hash() { return common::CryptoUtils::sha256({9, 9, 9}); }

std::shared_ptr<const BlockhashQueue> window_with(const Hash &hash) {
  auto window = std::make_shared<BlockhashQueue>(150);
  window->register_hash(hash, 0);
  return window;
}

} // namespace

void test_intake_submit_and_drain() {
  IntakeQueue queue;
  queue.publish_window(window_with(window_hash()));

  auto first = make_transfer(alice(), bob().pubkey(), 1, window_hash());
  auto second = make_transfer(alice(), bob().pubkey(), 2, window_hash());

  auto accepted = queue.submit(first);
  ASSERT_OK(accepted);
  ASSERT_EQ(first.signature(), accepted.value());
  ASSERT_OK(queue.submit(second));
  ASSERT_EQ(static_cast<size_t>(2), queue.size());

  auto drained = queue.drain();
  ASSERT_EQ(static_cast<size_t>(2), drained.size());
  ASSERT_EQ(first.signature(), drained[0].signature());
  ASSERT_EQ(second.signature(), drained[1].signature());
  ASSERT_EQ(static_cast<size_t>(0), queue.size());
  ASSERT_TRUE(queue.drain().empty());
}

void test_intake_rejects_duplicates() {
  IntakeQueue queue;
  queue.publish_window(window_with(window_hash()));
  auto tx = make_transfer(alice(), bob().pubkey(), 1, window_hash());

  ASSERT_OK(queue.submit(tx));
  auto duplicate = queue.submit(tx);
  ASSERT_TRUE(duplicate.is_err());
  ASSERT_TRUE(is_tx_error(duplicate.error_info(), svm::TransactionError::ALREADY_PROCESSED));
  ASSERT_CONTAINS(duplicate.error(), "already queued");

  // Once drained, the queue no longer remembers it; the bank's status cache does
  queue.drain();
  ASSERT_OK(queue.submit(tx));
}

void test_intake_rejects_committed_signatures() {
  IntakeQueue queue;
  auto committed = std::make_shared<StatusCache>(150);
  auto tx = make_transfer(alice(), bob().pubkey(), 1, window_hash());
  committed->insert(tx.signature(), 4);

  queue.publish_window(window_with(window_hash()), committed, 5);
  auto replay = queue.submit(tx);
  ASSERT_TRUE(replay.is_err());
  ASSERT_TRUE(is_tx_error(replay.error_info(), svm::TransactionError::ALREADY_PROCESSED));
  ASSERT_CONTAINS(replay.error(), "already committed");
  ASSERT_EQ(static_cast<size_t>(0), queue.size());
  ASSERT_EQ(static_cast<uint64_t>(1), queue.get_stats().rejected);

  // A different transaction still goes through
  ASSERT_OK(queue.submit(make_transfer(alice(), bob().pubkey(), 2, window_hash())));

  // clear() forgets the published cache along with the window
  queue.clear();
  ASSERT_OK(queue.submit(tx));
}

void test_intake_checks_blockhash_window() {
  IntakeQueue queue;
  auto tx = make_transfer(alice(), bob().pubkey(), 1, window_hash());

  // No window published yet: only the bank checks the blockhash
  ASSERT_OK(queue.submit(tx));
  queue.clear();

  queue.publish_window(window_with(common::CryptoUtils::sha256({1})));
  auto stale = queue.submit(tx);
  ASSERT_TRUE(stale.is_err());
  ASSERT_TRUE(is_tx_error(stale.error_info(), svm::TransactionError::BLOCKHASH_NOT_FOUND));
}

void test_intake_rejects_invalid_transactions() {
  IntakeQueue queue;
  queue.publish_window(window_with(window_hash()));

  auto tampered = make_transfer(alice(), bob().pubkey(), 1, window_hash());
  tampered.signatures[0][5] ^= 0xFF;
  auto bad_signature = queue.submit(tampered);
  ASSERT_TRUE(bad_signature.is_err());
  ASSERT_TRUE(is_tx_error(bad_signature.error_info(), svm::TransactionError::SIGNATURE_FAILURE));

  auto unsigned_tx = make_transfer(alice(), bob().pubkey(), 1, window_hash());
  unsigned_tx.signatures.clear();
  auto malformed = queue.submit(unsigned_tx);
  ASSERT_ERROR_KIND(malformed, common::ErrorKind::TRANSACTION);

  auto stats = queue.get_stats();
  ASSERT_EQ(static_cast<uint64_t>(0), stats.accepted);
  ASSERT_EQ(static_cast<uint64_t>(2), stats.rejected);
  ASSERT_EQ(static_cast<size_t>(0), stats.pending);
}

void test_intake_busy_window() {
  IntakeQueue queue;
  queue.publish_window(window_with(window_hash()));
  auto tx = make_transfer(alice(), bob().pubkey(), 1, window_hash());

  {
    BusyScope busy(queue);
    ASSERT_TRUE(queue.is_busy());
    auto refused = queue.submit(tx);
    ASSERT_ERROR_KIND(refused, common::ErrorKind::BUSY);
  }
  ASSERT_FALSE(queue.is_busy());
  ASSERT_OK(queue.submit(tx));

  auto stats = queue.get_stats();
  ASSERT_EQ(static_cast<uint64_t>(1), stats.busy);
  ASSERT_EQ(static_cast<uint64_t>(1), stats.accepted);
  // A busy refusal is not a rejection
  ASSERT_EQ(static_cast<uint64_t>(0), stats.rejected);
}

void test_intake_close_and_reopen() {
  IntakeQueue queue;
  queue.publish_window(window_with(window_hash()));
  auto kept = make_transfer(alice(), bob().pubkey(), 1, window_hash());
  auto refused = make_transfer(alice(), bob().pubkey(), 2, window_hash());

  ASSERT_OK(queue.submit(kept));
  queue.close();
  ASSERT_TRUE(queue.is_closed());

  auto result = queue.submit(refused);
  ASSERT_ERROR_KIND(result, common::ErrorKind::STATE);
  // Closed takes precedence over busy
  queue.begin_busy();
  ASSERT_ERROR_KIND(queue.submit(refused), common::ErrorKind::STATE);
  queue.end_busy();

  ASSERT_EQ(static_cast<size_t>(1), queue.size());
  queue.reopen();
  ASSERT_FALSE(queue.is_closed());
  ASSERT_OK(queue.submit(refused));
}

void test_intake_clear_resets_window() {
  IntakeQueue queue;
  queue.publish_window(window_with(common::CryptoUtils::sha256({1})));
  auto tx = make_transfer(alice(), bob().pubkey(), 1, window_hash());
  ASSERT_TRUE(queue.submit(tx).is_err());

  queue.clear();
  ASSERT_OK(queue.submit(tx));
  queue.clear();
  ASSERT_EQ(static_cast<size_t>(0), queue.size());
}

void test_intake_concurrent_submitters() {
  IntakeQueue queue;
  queue.publish_window(window_with(window_hash()));

  const int threads = 4;
  const int per_thread = 25;
  std::vector<std::vector<ledger::Transaction>> batches(threads);
  for (int t = 0; t < threads; ++t) {
    for (int i = 0; i < per_thread; ++i) {
      batches[t].push_back(make_transfer(alice(), bob().pubkey(),
                                         static_cast<Lamports>(t * per_thread + i + 1),
                                         window_hash()));
    }
  }

  std::atomic<int> failures{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < threads; ++t) {
    workers.emplace_back([&, t]() {
      for (const auto &tx : batches[t]) {
        if (!queue.submit(tx).is_ok()) {
          ++failures;
        }
      }
    });
  }
  for (auto &worker : workers) {
    worker.join();
  }

  ASSERT_EQ(0, failures.load());
  ASSERT_EQ(static_cast<size_t>(threads * per_thread), queue.size());
  ASSERT_EQ(static_cast<uint64_t>(threads * per_thread), queue.get_stats().accepted);
}

void run_intake_queue_tests(TestRunner &runner) {
  std::cout << "\n=== Intake Queue Tests ===" << std::endl;

  runner.run_test("Intake Submit And Drain", test_intake_submit_and_drain);
  runner.run_test("Intake Rejects Duplicates", test_intake_rejects_duplicates);
  runner.run_test("Intake Rejects Committed Signatures", test_intake_rejects_committed_signatures);
  runner.run_test("Intake Checks Blockhash Window", test_intake_checks_blockhash_window);
  runner.run_test("Intake Rejects Invalid Transactions", test_intake_rejects_invalid_transactions);
  runner.run_test("Intake Busy Window", test_intake_busy_window);
  runner.run_test("Intake Close And Reopen", test_intake_close_and_reopen);
  runner.run_test("Intake Clear Resets Window", test_intake_clear_resets_window);
  runner.run_test("Intake Concurrent Submitters", test_intake_concurrent_submitters);
}

#ifndef COMPREHENSIVE_TESTS
int main() {
  std::cout << "=== Intake Queue Test Suite ===" << std::endl;
  common::Logger::instance().set_level(common::LogLevel::WARN);
  TestRunner runner;
  run_intake_queue_tests(runner);
  runner.print_summary();
  return runner.all_passed() ? 0 : 1;
}
#endif
