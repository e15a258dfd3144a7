#include "log.hpp"

#include <atomic>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace deskbridge {
namespace {

std::mutex g_log_mu;
std::ofstream g_log_file;
std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};

static const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
  }
  return "INFO";
}

static std::string IsoNow() {
  const auto now = std::chrono::system_clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3) << std::setfill('0') << ms << "Z";
  return oss.str();
}

}  // namespace

bool ParseLogLevel(const std::string& s, LogLevel* out) {
  if (!out) return false;
  if (s == "debug") {
    *out = LogLevel::kDebug;
  } else if (s == "info") {
    *out = LogLevel::kInfo;
  } else if (s == "warn" || s == "warning") {
    *out = LogLevel::kWarn;
  } else if (s == "error") {
    *out = LogLevel::kError;
  } else {
    return false;
  }
  return true;
}

void InitLogging(const std::string& file_path, LogLevel min_level) {
  std::lock_guard<std::mutex> lock(g_log_mu);
  g_min_level = static_cast<int>(min_level);
  if (g_log_file.is_open()) g_log_file.close();
  if (file_path.empty()) return;
  std::error_code ec;
  auto dir = std::filesystem::path(file_path).parent_path();
  if (!dir.empty()) std::filesystem::create_directories(dir, ec);
  g_log_file.open(file_path, std::ios::app);
  if (!g_log_file) {
    std::cerr << "[log] cannot open log file path=" << file_path << "\n";
  }
}

void ShutdownLogging() {
  std::lock_guard<std::mutex> lock(g_log_mu);
  if (g_log_file.is_open()) g_log_file.close();
}

bool LogEnabled(LogLevel level) {
  return static_cast<int>(level) >= g_min_level.load();
}

void Log(LogLevel level, const std::string& tag, const std::string& message) {
  if (!LogEnabled(level)) return;
  std::lock_guard<std::mutex> lock(g_log_mu);
  std::cerr << "[" << tag << "] " << message << "\n";
  std::cerr.flush();
  if (g_log_file.is_open()) {
    g_log_file << "[" << IsoNow() << "] " << LevelName(level) << " [" << tag << "] " << message << "\n";
    g_log_file.flush();
  }
}

std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

LogLine::LogLine(LogLevel level, std::string tag)
    : level_(level), tag_(std::move(tag)), enabled_(LogEnabled(level)) {}

LogLine::~LogLine() {
  if (enabled_) Log(level_, tag_, oss_.str());
}

}  // namespace deskbridge
