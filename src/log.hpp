#pragma once

#include <sstream>
#include <string>
#include <utility>

namespace deskbridge {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

bool ParseLogLevel(const std::string& s, LogLevel* out);

// Log lines go to stderr and, when a path is set, are appended to that file.
// stdout is reserved for protocol traffic and is never written here.
void InitLogging(const std::string& file_path, LogLevel min_level);
void ShutdownLogging();

bool LogEnabled(LogLevel level);
void Log(LogLevel level, const std::string& tag, const std::string& message);

std::string TruncateForLog(std::string s, size_t max_chars);

// One log line, built with operator<< and written when it goes out of scope:
//   LogInfo("mailbox") << "sent id=" << id;
// Nothing is formatted when the level is disabled.
class LogLine {
 public:
  LogLine(LogLevel level, std::string tag);
  ~LogLine();
  LogLine(const LogLine&) = delete;
  LogLine& operator=(const LogLine&) = delete;

  template <typename T>
  LogLine& operator<<(const T& value) {
    if (enabled_) oss_ << value;
    return *this;
  }

 private:
  LogLevel level_;
  std::string tag_;
  bool enabled_;
  std::ostringstream oss_;
};

inline LogLine LogDebug(std::string tag) { return LogLine(LogLevel::kDebug, std::move(tag)); }
inline LogLine LogInfo(std::string tag) { return LogLine(LogLevel::kInfo, std::move(tag)); }
inline LogLine LogWarn(std::string tag) { return LogLine(LogLevel::kWarn, std::move(tag)); }
inline LogLine LogError(std::string tag) { return LogLine(LogLevel::kError, std::move(tag)); }

}  // namespace deskbridge
