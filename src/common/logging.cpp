#include "common/logging.h"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace localnet {
namespace common {

bool parse_log_level(const std::string &name, LogLevel &level) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "trace") {
    level = LogLevel::TRACE;
  } else if (lower == "debug") {
    level = LogLevel::DEBUG;
  } else if (lower == "info") {
    level = LogLevel::INFO;
  } else if (lower == "warn" || lower == "warning") {
    level = LogLevel::WARN;
  } else if (lower == "error") {
    level = LogLevel::ERROR;
  } else if (lower == "critical") {
    level = LogLevel::CRITICAL;
  } else {
    return false;
  }
  return true;
}

const char *log_level_to_string(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

std::string Logger::get_thread_id() const {
  std::ostringstream oss;
  oss << std::this_thread::get_id();
  return oss.str();
}

std::string Logger::escape_json_string(const std::string &input) const {
  std::ostringstream escaped;
  for (char c : input) {
    switch (c) {
    case '"':
      escaped << "\\\"";
      break;
    case '\\':
      escaped << "\\\\";
      break;
    case '\b':
      escaped << "\\b";
      break;
    case '\f':
      escaped << "\\f";
      break;
    case '\n':
      escaped << "\\n";
      break;
    case '\r':
      escaped << "\\r";
      break;
    case '\t':
      escaped << "\\t";
      break;
    default:
      if (c >= 0 && c < 32) {
        escaped << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                << static_cast<int>(c);
      } else {
        escaped << c;
      }
      break;
    }
  }
  return escaped.str();
}

std::string Logger::format_json(const LogEntry &entry) const {
  std::ostringstream json;

  auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                entry.timestamp.time_since_epoch()) %
            1000;
  std::tm tm_utc{};
  gmtime_r(&time_t, &tm_utc);

  json << "{" << "\"timestamp\":\"" << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S")
       << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z\","
       << "\"level\":\"" << log_level_to_string(entry.level) << "\","
       << "\"module\":\"" << escape_json_string(entry.module) << "\","
       << "\"thread_id\":\"" << escape_json_string(entry.thread_id) << "\","
       << "\"message\":\"" << escape_json_string(entry.message) << "\"";

  if (!entry.error_code.empty()) {
    json << ",\"error_code\":\"" << escape_json_string(entry.error_code)
         << "\"";
  }

  if (!entry.context.empty()) {
    json << ",\"context\":{";
    bool first = true;
    for (const auto &[key, value] : entry.context) {
      if (!first)
        json << ",";
      json << "\"" << escape_json_string(key) << "\":\""
           << escape_json_string(value) << "\"";
      first = false;
    }
    json << "}";
  }

  json << "}";
  return json.str();
}

std::string Logger::format_text(const LogEntry &entry) const {
  std::ostringstream text;

  auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);
  std::tm tm_local{};
  localtime_r(&time_t, &tm_local);

  text << "[" << std::put_time(&tm_local, "%Y-%m-%d %H:%M:%S") << "] "
       << "[" << log_level_to_string(entry.level) << "] "
       << "[" << entry.module << "] " << entry.message;

  if (!entry.error_code.empty()) {
    text << " (error: " << entry.error_code << ")";
  }

  if (!entry.context.empty()) {
    text << " {";
    bool first = true;
    for (const auto &[key, value] : entry.context) {
      if (!first)
        text << ", ";
      text << key << "=" << value;
      first = false;
    }
    text << "}";
  }

  return text.str();
}

void Logger::notify_failure_hooks(const LogEntry &entry) {
  std::vector<FailureHook> hooks;
  {
    std::lock_guard<std::mutex> lock(hook_mutex_);
    for (const auto &hook : failure_hooks_) {
      hooks.push_back(hook.second);
    }
  }

  for (const auto &hook : hooks) {
    try {
      hook(entry);
    } catch (const std::exception &e) {
      // Hooks must not take the logger down; report on stderr to avoid recursion
      std::cerr << "Failure hook threw: " << e.what() << std::endl;
    }
  }
}

void Logger::flush() {
  if (!async_enabled_.load())
    return;

  std::unique_lock<std::mutex> lock(queue_mutex_);
  drained_cv_.wait(lock, [this] {
    return log_queue_.empty() || !async_enabled_.load();
  });
}

void Logger::start_async_worker() {
  if (async_enabled_.load())
    return;

  worker_shutdown_.store(false);
  async_enabled_.store(true);
  worker_thread_ = std::thread(&Logger::worker_loop, this);
}

void Logger::stop_async_worker() {
  if (!async_enabled_.load())
    return;

  worker_shutdown_.store(true);
  queue_cv_.notify_all();

  if (worker_thread_.joinable()) {
    worker_thread_.join();
  }

  async_enabled_.store(false);

  // Emit whatever the worker did not get to
  std::lock_guard<std::mutex> lock(queue_mutex_);
  while (!log_queue_.empty()) {
    output_log_entry(log_queue_.front());
    log_queue_.pop();
  }
  drained_cv_.notify_all();
}

void Logger::worker_loop() {
  while (!worker_shutdown_.load()) {
    std::unique_lock<std::mutex> lock(queue_mutex_);

    queue_cv_.wait(lock, [this] {
      return !log_queue_.empty() || worker_shutdown_.load();
    });

    while (!log_queue_.empty()) {
      auto entry = log_queue_.front();
      log_queue_.pop();
      lock.unlock();

      output_log_entry(entry);

      lock.lock();
    }
    drained_cv_.notify_all();
  }
}

} // namespace common
} // namespace localnet
