#include "core/time_utils.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace reentry {

namespace {

constexpr std::int64_t kMillisPerSecond = 1000;
constexpr std::int64_t kMillisPerDay = 24LL * 60 * 60 * kMillisPerSecond;

// 向下取整除法：负时间戳也落到正确的秒/日。
std::int64_t FloorDiv(std::int64_t value, std::int64_t divisor) {
  std::int64_t quotient = value / divisor;
  if ((value % divisor) != 0 && ((value < 0) != (divisor < 0))) {
    --quotient;
  }
  return quotient;
}

std::tm ToUtc(std::int64_t timestamp_ms) {
  const std::time_t seconds =
      static_cast<std::time_t>(FloorDiv(timestamp_ms, kMillisPerSecond));
  std::tm tm{};
  gmtime_r(&seconds, &tm);
  return tm;
}

}  // namespace

std::int64_t CurrentTimestampMs() {
  const auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
  return now.time_since_epoch().count();
}

std::string FormatIsoUtc(std::int64_t timestamp_ms) {
  const std::tm tm = ToUtc(timestamp_ms);
  const std::int64_t millis =
      timestamp_ms - FloorDiv(timestamp_ms, kMillisPerSecond) * kMillisPerSecond;
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << millis << 'Z';
  return out.str();
}

std::string FormatFileStamp(std::int64_t timestamp_ms) {
  const std::tm tm = ToUtc(timestamp_ms);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y%m%d_%H%M%S");
  return out.str();
}

std::int64_t UtcDayIndex(std::int64_t timestamp_ms) {
  return FloorDiv(timestamp_ms, kMillisPerDay);
}

}  // namespace reentry
