#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace localnet {
namespace common {

/**
 * @brief Logging levels
 *
 * Hot paths (per-transaction logging) use LOG_TRACE/LOG_DEBUG which skip
 * message formatting entirely when the level is disabled.
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5  // Invariant violations, e.g. an out-of-order ledger append
};

/**
 * @brief Parse "trace", "debug", "info", "warn", "error" or "critical"
 * @return false if the name is not recognized (level is left untouched)
 */
bool parse_log_level(const std::string& name, LogLevel& level);

/**
 * @brief Structured log entry
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string module;
    std::string thread_id;
    std::string message;
    std::string error_code;
    std::unordered_map<std::string, std::string> context;
};

/**
 * @brief Global logger
 *
 * Thread-safe; configuration can be changed at runtime. Supports text or
 * JSON lines, an optional async writer thread, and hooks that observe every
 * critical failure (the validator uses one to halt block production).
 */
class Logger {
public:
    using FailureHook = std::function<void(const LogEntry&)>;

    /// Get the singleton logger instance
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /// Set current logging level
    void set_level(LogLevel level) noexcept {
        current_level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel level() const noexcept {
        return static_cast<LogLevel>(current_level_.load(std::memory_order_relaxed));
    }

    /// Enable/disable structured JSON logging
    void set_json_format(bool enabled) noexcept {
        json_format_.store(enabled, std::memory_order_relaxed);
    }

    /// Enable/disable async logging
    void set_async_logging(bool enabled) {
        if (enabled && !async_enabled_.load()) {
            start_async_worker();
        } else if (!enabled && async_enabled_.load()) {
            stop_async_worker();
        }
    }

    /// Redirect output (nullptr restores std::cout). The stream must outlive its use.
    void set_output(std::ostream* out) {
        std::lock_guard<std::mutex> lock(output_mutex_);
        output_ = out ? out : &std::cout;
    }

    /// Register a hook invoked for every critical failure; returns its id
    size_t add_failure_hook(FailureHook hook) {
        std::lock_guard<std::mutex> lock(hook_mutex_);
        size_t id = next_hook_id_++;
        failure_hooks_.emplace_back(id, std::move(hook));
        return id;
    }

    void remove_failure_hook(size_t id) {
        std::lock_guard<std::mutex> lock(hook_mutex_);
        for (auto it = failure_hooks_.begin(); it != failure_hooks_.end(); ++it) {
            if (it->first == id) {
                failure_hooks_.erase(it);
                return;
            }
        }
    }

    /// Check if debug logging is enabled
    bool is_debug_enabled() const noexcept {
        return current_level_.load(std::memory_order_relaxed) <= static_cast<int>(LogLevel::DEBUG);
    }

    /// Check if a specific level is enabled
    bool is_enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) >= current_level_.load(std::memory_order_relaxed);
    }

    /// Log a message under the default "localnet" module
    template<typename... Args>
    void log(LogLevel level, Args&&... args) {
        if (!is_enabled(level)) return;

        std::ostringstream oss;
        (oss << ... << args);

        process_log_entry(make_entry(level, "localnet", oss.str(), "", {}));
    }

    /// Log a structured message with context
    void log_structured(LogLevel level, const std::string& module,
                       const std::string& message, const std::string& error_code = "",
                       const std::unordered_map<std::string, std::string>& context = {}) {
        if (!is_enabled(level)) return;
        process_log_entry(make_entry(level, module, message, error_code, context));
    }

    /// Log a critical failure and notify failure hooks
    void log_critical_failure(const std::string& module, const std::string& message,
                              const std::string& error_code = "",
                              const std::unordered_map<std::string, std::string>& context = {}) {
        LogEntry entry = make_entry(LogLevel::CRITICAL, module, message, error_code, context);
        process_log_entry(entry);
        notify_failure_hooks(entry);
    }

    /// Wait until the async writer has emitted everything queued so far
    void flush();

private:
    Logger() : current_level_(static_cast<int>(LogLevel::INFO)),
               json_format_(false), async_enabled_(false), worker_shutdown_(false) {}

    ~Logger() {
        stop_async_worker();
    }

    std::atomic<int> current_level_;
    std::atomic<bool> json_format_;
    std::atomic<bool> async_enabled_;
    std::atomic<bool> worker_shutdown_;

    std::ostream* output_ = &std::cout;
    std::mutex output_mutex_;

    // Async logging with a bounded queue
    static const size_t MAX_QUEUE_SIZE = 10000;
    std::queue<LogEntry> log_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable drained_cv_;
    std::thread worker_thread_;

    std::vector<std::pair<size_t, FailureHook>> failure_hooks_;
    std::mutex hook_mutex_;
    size_t next_hook_id_ = 1;

    LogEntry make_entry(LogLevel level, const std::string& module,
                        const std::string& message, const std::string& error_code,
                        const std::unordered_map<std::string, std::string>& context) const {
        return LogEntry{
            std::chrono::system_clock::now(),
            level,
            module,
            get_thread_id(),
            message,
            error_code,
            context
        };
    }

    void process_log_entry(const LogEntry& entry) {
        if (async_enabled_.load()) {
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                // Drop oldest entries if queue is full
                if (log_queue_.size() >= MAX_QUEUE_SIZE) {
                    log_queue_.pop();
                }
                log_queue_.push(entry);
            }
            queue_cv_.notify_one();
        } else {
            output_log_entry(entry);
        }
    }

    void output_log_entry(const LogEntry& entry) {
        std::string line = json_format_.load() ? format_json(entry) : format_text(entry);
        std::lock_guard<std::mutex> lock(output_mutex_);
        *output_ << line << std::endl;
    }

    void notify_failure_hooks(const LogEntry& entry);

    std::string get_thread_id() const;
    std::string format_json(const LogEntry& entry) const;
    std::string format_text(const LogEntry& entry) const;
    std::string escape_json_string(const std::string& input) const;

    void start_async_worker();
    void stop_async_worker();
    void worker_loop();
};

/// Upper-case level name used in log lines
const char* log_level_to_string(LogLevel level);

} // namespace common
} // namespace localnet

/**
 * @brief Logging macros
 *
 * LOG_TRACE and LOG_DEBUG avoid formatting when the level is disabled.
 */
#define LOG_TRACE(...) \
    do { \
        if (localnet::common::Logger::instance().is_enabled(localnet::common::LogLevel::TRACE)) { \
            localnet::common::Logger::instance().log(localnet::common::LogLevel::TRACE, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_DEBUG(...) \
    do { \
        if (localnet::common::Logger::instance().is_debug_enabled()) { \
            localnet::common::Logger::instance().log(localnet::common::LogLevel::DEBUG, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_INFO(...) \
    localnet::common::Logger::instance().log(localnet::common::LogLevel::INFO, __VA_ARGS__)

#define LOG_WARN(...) \
    localnet::common::Logger::instance().log(localnet::common::LogLevel::WARN, __VA_ARGS__)

#define LOG_ERROR(...) \
    localnet::common::Logger::instance().log(localnet::common::LogLevel::ERROR, __VA_ARGS__)

#define LOG_CRITICAL(...) \
    localnet::common::Logger::instance().log(localnet::common::LogLevel::CRITICAL, __VA_ARGS__)

/**
 * @brief Structured logging macros
 */
#define LOG_STRUCTURED(level, module, message, ...) \
    localnet::common::Logger::instance().log_structured(level, module, message, ##__VA_ARGS__)

#define LOG_CRITICAL_FAILURE(module, message, ...) \
    localnet::common::Logger::instance().log_critical_failure(module, message, ##__VA_ARGS__)

/**
 * @brief Module-specific failure macros
 */
#define LOG_GENESIS_ERROR(message, ...) \
    LOG_STRUCTURED(localnet::common::LogLevel::ERROR, "genesis", message, ##__VA_ARGS__)

#define LOG_BANK_ERROR(message, ...) \
    LOG_STRUCTURED(localnet::common::LogLevel::ERROR, "bank", message, ##__VA_ARGS__)

#define LOG_LEDGER_ERROR(message, ...) \
    LOG_CRITICAL_FAILURE("ledger", message, ##__VA_ARGS__)

#define LOG_VALIDATOR_ERROR(message, ...) \
    LOG_CRITICAL_FAILURE("validator", message, ##__VA_ARGS__)
