#include "core/log.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <utility>

namespace reentry {

namespace {

std::mutex g_log_mutex;
LogSink g_log_sink;

void WriteLine(LogLevel level, std::string_view message) {
  // 所有级别共享同一把锁，保证多线程日志不交叉且时序可读。
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  std::ostream& out = (level == LogLevel::kError) ? std::cerr : std::cout;
  out << std::put_time(&tm, "%F %T") << " [" << ToString(level) << "] "
      << message << '\n';
  if (g_log_sink) {
    g_log_sink(level, message);
  }
}

}  // namespace

const char* ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

void LogInfo(std::string_view message) {
  WriteLine(LogLevel::kInfo, message);
}

void LogWarn(std::string_view message) {
  WriteLine(LogLevel::kWarn, message);
}

void LogError(std::string_view message) {
  WriteLine(LogLevel::kError, message);
}

void SetLogSink(LogSink sink) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_log_sink = std::move(sink);
}

}  // namespace reentry
