#include "proba/script/console.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace proba::script {

auto LogLevelName(LogLevel level) -> std::string_view {
  switch (level) {
    case LogLevel::kLog:
      return "log";
    case LogLevel::kError:
      return "error";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kInfo:
      return "info";
  }
  return "log";
}

void ConsoleLog::Append(LogLevel level, std::string message) {
  std::lock_guard lock(mutex_);
  records_.push_back(
      LogRecord{
          .level = level,
          .message = std::move(message),
          .timestamp = std::chrono::system_clock::now(),
      });
}

auto ConsoleLog::Snapshot() const -> std::vector<LogRecord> {
  std::lock_guard lock(mutex_);
  return records_;
}

auto ConsoleLog::Size() const -> size_t {
  std::lock_guard lock(mutex_);
  return records_.size();
}

auto FormatRecords(const std::vector<LogRecord>& records) -> std::string {
  std::string out;
  for (const auto& record : records) {
    switch (record.level) {
      case LogLevel::kLog:
        break;
      case LogLevel::kError:
        out += "[ERROR] ";
        break;
      case LogLevel::kWarn:
        out += "[WARN] ";
        break;
      case LogLevel::kInfo:
        out += "[INFO] ";
        break;
    }
    out += record.message;
    out += '\n';
  }
  return out;
}

}  // namespace proba::script
