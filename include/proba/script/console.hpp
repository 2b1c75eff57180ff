#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace proba::script {

enum class LogLevel : uint8_t {
  kLog,
  kError,
  kWarn,
  kInfo,
};

auto LogLevelName(LogLevel level) -> std::string_view;

struct LogRecord {
  LogLevel level = LogLevel::kLog;
  std::string message;
  std::chrono::system_clock::time_point timestamp;
};

// Output captured from `console.*` during one run. The worker appends while
// a timed-out caller may already be taking its snapshot.
class ConsoleLog {
 public:
  void Append(LogLevel level, std::string message);

  [[nodiscard]] auto Snapshot() const -> std::vector<LogRecord>;
  [[nodiscard]] auto Size() const -> size_t;

 private:
  mutable std::mutex mutex_;
  std::vector<LogRecord> records_;
};

// One line per record; non-log levels carry an upper-case level prefix.
auto FormatRecords(const std::vector<LogRecord>& records) -> std::string;

}  // namespace proba::script
