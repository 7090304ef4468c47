#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace reentry {

/// 准入统计快照。
struct ReentryTrackerStats {
  std::uint64_t checks{0};
  std::uint64_t allowed{0};
  std::uint64_t cooldown_rejects{0};
  std::uint64_t daily_limit_rejects{0};
  std::uint64_t commits{0};
  std::uint64_t releases{0};  ///< 准入后未提交即释放（如账本写失败）。
};

/**
 * @brief 品种级再入场冷却与日内次数跟踪
 *
 * 准入与提交之间该品种被独占：同一品种的并发决策串行执行，
 * 避免两个决策同时通过日内上限检查。不同品种互不阻塞。
 * 日内计数按 UTC 自然日重置。
 */
class ReentryTracker {
 public:
  using Clock = std::function<std::int64_t()>;

  /// 品种准入凭证（RAII）：析构时若未提交则释放，不更新冷却与计数。
  class Slot {
   public:
    Slot() = default;
    Slot(Slot&& other) noexcept;
    Slot& operator=(Slot&& other) noexcept;
    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;
    ~Slot();

    bool acquired() const { return tracker_ != nullptr; }
    const std::string& symbol() const { return symbol_; }

    /**
     * @brief 提交决策：开始冷却，`counts_as_attempt` 为 true 时计入日内次数
     */
    void Commit(bool counts_as_attempt);

   private:
    friend class ReentryTracker;
    Slot(ReentryTracker* tracker, std::string symbol)
        : tracker_(tracker), symbol_(std::move(symbol)) {}
    void Reset();

    ReentryTracker* tracker_{nullptr};
    std::string symbol_;
  };

  ReentryTracker(int cooldown_minutes, int max_attempts_per_day, Clock clock = {});

  /**
   * @brief 申请品种准入
   *
   * 同品种已有在途决策时阻塞等待其提交或释放。
   * 冷却未结束或日内次数已满时返回空凭证，`out_reason` 为
   * `cooldown_period_active` / `daily_limit_exceeded`。
   */
  Slot TryAcquire(const std::string& symbol, std::string* out_reason);

  /// 当前处于冷却窗口内的品种数。
  std::size_t ActiveCooldowns() const;
  /// 今日（UTC）各品种已计入的再入场次数。
  std::map<std::string, int> DailyAttempts() const;
  ReentryTrackerStats stats() const;

 private:
  struct SymbolState {
    std::int64_t last_decision_ms{0};
    bool has_decision{false};
    std::int64_t day_index{-1};
    int attempts_today{0};
    bool in_flight{false};
  };

  void Finish(const std::string& symbol, bool commit, bool counts_as_attempt);

  int cooldown_minutes_{0};
  int max_attempts_per_day_{0};
  Clock clock_;

  mutable std::mutex mutex_;
  std::condition_variable slot_released_;
  std::unordered_map<std::string, SymbolState> state_by_symbol_;
  ReentryTrackerStats stats_;
};

}  // namespace reentry
