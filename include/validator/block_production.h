#pragma once

#include "common/types.h"
#include "validator/core.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace localnet {
namespace validator {

/**
 * @brief Timer that turns the open bank into a ledger entry every tick
 *
 * With a zero interval the loop never starts a thread; slots are then
 * produced only through advance(). A SEQUENCE error stops the loop.
 */
class BlockProductionLoop {
public:
  BlockProductionLoop(ValidatorCore &core, uint32_t tick_interval_ms);
  ~BlockProductionLoop();

  BlockProductionLoop(const BlockProductionLoop &) = delete;
  BlockProductionLoop &operator=(const BlockProductionLoop &) = delete;

  /// Start the timer thread (no-op in manual mode or when running)
  Result<bool> start();

  /// Stop the timer; an in-flight step completes first
  void stop();

  /// Produce one slot now; serializes with the timer
  Result<Slot> advance();

  /// Halt on a SEQUENCE error reported by any production path
  void handle_result(const Result<Slot> &result);

  /// Forget a sequence halt after the ledger was reset; start() runs again
  void clear_halt();

  bool is_running() const { return running_.load(); }
  bool is_manual() const { return interval_.count() == 0; }
  bool is_halted() const { return halted_.load(); }
  std::chrono::milliseconds interval() const { return interval_; }

private:
  void run();

  ValidatorCore &core_;
  std::chrono::milliseconds interval_;

  std::atomic<bool> running_{false};
  std::atomic<bool> halted_{false};
  bool stop_requested_ = false;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::thread thread_;
};

} // namespace validator
} // namespace localnet
