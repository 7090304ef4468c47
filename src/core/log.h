#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace reentry {

/// 日志级别。
enum class LogLevel {
  kInfo,
  kWarn,
  kError,
};

/// 日志级别文本化（`INFO` / `WARN` / `ERROR`）。
const char* ToString(LogLevel level);

/**
 * @brief 输出 INFO 级日志
 *
 * 行为：
 * 1. 线程安全串行写入；
 * 2. 输出到 `stdout`；
 * 3. 自动附加本地时间戳和 `[INFO]` 前缀。
 */
void LogInfo(std::string_view message);

/// 输出 WARN 级日志（`stdout`，`[WARN]` 前缀），用于可降级但需关注的事件。
void LogWarn(std::string_view message);

/**
 * @brief 输出 ERROR 级日志
 *
 * 行为：
 * 1. 线程安全串行写入；
 * 2. 输出到 `stderr`；
 * 3. 自动附加本地时间戳和 `[ERROR]` 前缀。
 */
void LogError(std::string_view message);

/// 日志旁路回调：测试用于捕获告警事件。
using LogSink = std::function<void(LogLevel, std::string_view)>;

/**
 * @brief 安装日志旁路
 *
 * 旁路与控制台输出并存；传入空函数即卸载。
 * 回调在日志锁内执行，回调中不得再调用 Log*。
 */
void SetLogSink(LogSink sink);

}  // namespace reentry
