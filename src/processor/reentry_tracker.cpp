#include "processor/reentry_tracker.h"

#include <utility>

#include "core/time_utils.h"

namespace reentry {

namespace {

constexpr std::int64_t kMillisPerMinute = 60LL * 1000;

}  // namespace

ReentryTracker::Slot::Slot(Slot&& other) noexcept
    : tracker_(other.tracker_), symbol_(std::move(other.symbol_)) {
  other.tracker_ = nullptr;
}

ReentryTracker::Slot& ReentryTracker::Slot::operator=(Slot&& other) noexcept {
  if (this != &other) {
    Reset();
    tracker_ = other.tracker_;
    symbol_ = std::move(other.symbol_);
    other.tracker_ = nullptr;
  }
  return *this;
}

ReentryTracker::Slot::~Slot() {
  Reset();
}

void ReentryTracker::Slot::Commit(bool counts_as_attempt) {
  if (tracker_ == nullptr) {
    return;
  }
  tracker_->Finish(symbol_, true, counts_as_attempt);
  tracker_ = nullptr;
}

void ReentryTracker::Slot::Reset() {
  if (tracker_ != nullptr) {
    tracker_->Finish(symbol_, false, false);
    tracker_ = nullptr;
  }
}

ReentryTracker::ReentryTracker(int cooldown_minutes, int max_attempts_per_day, Clock clock)
    : cooldown_minutes_(cooldown_minutes),
      max_attempts_per_day_(max_attempts_per_day),
      clock_(clock ? std::move(clock) : Clock(CurrentTimestampMs)) {}

ReentryTracker::Slot ReentryTracker::TryAcquire(const std::string& symbol,
                                                std::string* out_reason) {
  std::unique_lock<std::mutex> lock(mutex_);
  slot_released_.wait(lock, [&] {
    const auto it = state_by_symbol_.find(symbol);
    return it == state_by_symbol_.end() || !it->second.in_flight;
  });

  ++stats_.checks;
  SymbolState& state = state_by_symbol_[symbol];
  const std::int64_t now_ms = clock_();

  // 规则 1：决策后冷却。
  if (cooldown_minutes_ > 0 && state.has_decision) {
    const std::int64_t elapsed = now_ms - state.last_decision_ms;
    if (elapsed >= 0 && elapsed < cooldown_minutes_ * kMillisPerMinute) {
      ++stats_.cooldown_rejects;
      if (out_reason != nullptr) {
        *out_reason = "cooldown_period_active";
      }
      return Slot();
    }
  }

  // 规则 2：日内次数上限（跨 UTC 日重置）。
  const std::int64_t today = UtcDayIndex(now_ms);
  if (state.day_index != today) {
    state.day_index = today;
    state.attempts_today = 0;
  }
  if (state.attempts_today >= max_attempts_per_day_) {
    ++stats_.daily_limit_rejects;
    if (out_reason != nullptr) {
      *out_reason = "daily_limit_exceeded";
    }
    return Slot();
  }

  state.in_flight = true;
  ++stats_.allowed;
  return Slot(this, symbol);
}

std::size_t ReentryTracker::ActiveCooldowns() const {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::int64_t now_ms = clock_();
  std::size_t active = 0;
  for (const auto& [symbol, state] : state_by_symbol_) {
    (void)symbol;
    const std::int64_t elapsed = now_ms - state.last_decision_ms;
    if (state.has_decision && elapsed >= 0 &&
        elapsed < cooldown_minutes_ * kMillisPerMinute) {
      ++active;
    }
  }
  return active;
}

std::map<std::string, int> ReentryTracker::DailyAttempts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::int64_t today = UtcDayIndex(clock_());
  std::map<std::string, int> out;
  for (const auto& [symbol, state] : state_by_symbol_) {
    if (state.day_index == today && state.attempts_today > 0) {
      out[symbol] = state.attempts_today;
    }
  }
  return out;
}

ReentryTrackerStats ReentryTracker::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void ReentryTracker::Finish(const std::string& symbol, bool commit, bool counts_as_attempt) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    SymbolState& state = state_by_symbol_[symbol];
    state.in_flight = false;
    if (commit) {
      const std::int64_t now_ms = clock_();
      state.last_decision_ms = now_ms;
      state.has_decision = true;
      const std::int64_t today = UtcDayIndex(now_ms);
      if (state.day_index != today) {
        state.day_index = today;
        state.attempts_today = 0;
      }
      if (counts_as_attempt) {
        ++state.attempts_today;
      }
      ++stats_.commits;
    } else {
      ++stats_.releases;
    }
  }
  slot_released_.notify_all();
}

}  // namespace reentry
