#pragma once

#include <cstdint>
#include <string>

namespace reentry {

/// 当前 UTC 毫秒时间戳。
std::int64_t CurrentTimestampMs();

/// ISO-8601 UTC 时刻，毫秒精度：`2026-01-02T03:04:05.678Z`。
std::string FormatIsoUtc(std::int64_t timestamp_ms);

/// 文件名时间戳 `YYYYMMDD_HHMMSS`（UTC）。
std::string FormatFileStamp(std::int64_t timestamp_ms);

/// UTC 自然日序号（自 epoch 起的天数），用于按日计数重置。
std::int64_t UtcDayIndex(std::int64_t timestamp_ms);

}  // namespace reentry
