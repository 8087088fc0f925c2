#include "validator/block_production.h"
#include "common/logging.h"

namespace localnet {
namespace validator {

BlockProductionLoop::BlockProductionLoop(ValidatorCore &core, uint32_t tick_interval_ms)
    : core_(core), interval_(tick_interval_ms) {}

BlockProductionLoop::~BlockProductionLoop() { stop(); }

Result<bool> BlockProductionLoop::start() {
  if (is_manual()) {
    LOG_INFO("Block production in manual mode");
    return Result<bool>(true);
  }
  if (halted_.load()) {
    return Result<bool>(ErrorKind::SEQUENCE, "block production halted by a sequence error");
  }
  if (running_.exchange(true)) {
    return Result<bool>(true);
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = false;
  }
  thread_ = std::thread(&BlockProductionLoop::run, this);
  LOG_INFO("Block production started, one slot every ", interval_.count(), " ms");
  return Result<bool>(true);
}

void BlockProductionLoop::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  running_.store(false);
}

Result<Slot> BlockProductionLoop::advance() {
  auto result = core_.produce_slot();
  handle_result(result);
  return result;
}

void BlockProductionLoop::clear_halt() {
  if (halted_.load()) {
    stop();
    halted_.store(false);
  }
}

void BlockProductionLoop::handle_result(const Result<Slot> &result) {
  if (!result.is_ok() && result.error_kind() == ErrorKind::SEQUENCE && !halted_.exchange(true)) {
    LOG_CRITICAL_FAILURE("validator", "block production halted: " + result.error(),
                         "PRODUCTION_HALTED");
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
    cv_.notify_all();
  }
}

void BlockProductionLoop::run() {
  auto next_tick = std::chrono::steady_clock::now() + interval_;
  while (true) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (cv_.wait_until(lock, next_tick, [this] { return stop_requested_; })) {
        break;
      }
    }

    Result<Slot> result(ErrorKind::GENERIC, "production step did not run");
    try {
      result = core_.produce_slot();
    } catch (const std::exception &e) {
      LOG_CRITICAL_FAILURE("validator", std::string("production step threw: ") + e.what(),
                           "PRODUCTION_EXCEPTION");
      break;
    }
    handle_result(result);
    if (!result.is_ok()) {
      if (halted_.load()) {
        break;
      }
      LOG_WARN("Production step failed: ", result.error_info().to_string());
    }

    next_tick += interval_;
    auto now = std::chrono::steady_clock::now();
    if (next_tick < now) {
      // Fell behind; do not burst to catch up
      next_tick = now + interval_;
    }
  }
  running_.store(false);
}

} // namespace validator
} // namespace localnet
