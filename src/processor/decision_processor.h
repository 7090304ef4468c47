#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/config.h"
#include "core/types.h"
#include "hybrid_id/hybrid_id_codec.h"
#include "ledger/integrity_ledger.h"
#include "processor/reentry_tracker.h"
#include "resolver/tiered_resolver.h"

namespace reentry {

/// 单次决策的处理结论。
enum class DecisionStatus {
  kProcessed,
  kSkipped,        ///< 准入门槛拒绝，属于有意不处理。
  kInvalidContext,
  kWriteFailure,   ///< 账本写入失败，冷却与计数不更新。
};

/// `processed` / `skipped` / `invalid_context` / `write_failure`。
const char* ToString(DecisionStatus status);

/// 账本关闭时 processed 决策的 reason：该决策没有持久化记录。
inline constexpr const char* kLedgerDisabledReason = "ledger_disabled";

/// 决策响应：`status != kProcessed` 时只有 `reason` 与身份字段有意义；
/// processed 且 `reason` 非空表示附带说明（如账本关闭）。
struct DecisionResponse {
  DecisionStatus status{DecisionStatus::kInvalidContext};
  std::string reason;

  std::string trade_id;
  std::string symbol;
  std::string hybrid_id;
  std::string comment;  ///< 31 字符内的订单注释形式。
  OutcomeClass outcome_class{OutcomeClass::kBreakeven};
  DurationClass duration_class{DurationClass::kQuick};
  ReentryAction reentry_action{ReentryAction::kNoReentry};
  std::string parameter_set_id;
  std::string resolved_tier;
  std::string chain_position;
  int generation{1};
  std::optional<int> next_generation;
  double lot_size{0.0};
  double stop_loss{0.0};
  double take_profit{0.0};
  double confidence_score{0.0};
  std::uint64_t file_seq{0};
  std::string checksum;

  /// 对外 JSON 形式；跳过/失败时为 `{status, reason, trade_id, symbol}`。
  std::string ToJson() const;
};

/// 处理统计（进程内累计）。
struct ProcessingStats {
  std::uint64_t processed{0};
  std::uint64_t skipped{0};
  std::uint64_t invalid_contexts{0};
  std::uint64_t write_failures{0};
  std::uint64_t emergency_fallbacks{0};
  std::map<std::string, std::uint64_t> skip_reasons;
  std::size_t active_cooldowns{0};
  std::map<std::string, int> daily_attempts;
};

/**
 * @brief 再入场决策处理器
 *
 * 单笔流程：
 * 1. 结构校验（含由 comment 推导 generation）；
 * 2. 准入门槛：未平仓、时长不足、手动平仓排除、冷却、日内上限；
 * 3. 结果/时长分类 -> 分层解析 -> 组合 Hybrid ID；
 * 4. 决定动作、手数与置信度；
 * 5. 写入账本成功后才提交冷却与计数。
 *
 * 依赖组件由外部持有并保证生命周期长于处理器；`ledger` 可为空（账本关闭）。
 * `Process` 可被多个线程并发调用。
 */
class DecisionProcessor {
 public:
  DecisionProcessor(ProcessorConfig config,
                    const HybridIdCodec& codec,
                    TieredResolver& resolver,
                    ReentryTracker& tracker,
                    IntegrityLedger* ledger);

  DecisionResponse Process(const DecisionContext& context);

  OutcomeClass ClassifyOutcome(double profit_loss_pips) const;
  DurationClass ClassifyDuration(double duration_minutes) const;
  /// 结果分类到词表 token（WIN->W1、LOSS->L1、BREAKEVEN->BE）。
  static std::string OutcomeToken(OutcomeClass outcome);
  /// 手数：乘数后按品种步长四舍五入，且不低于一个步长。
  double SizeLot(const std::string& symbol, double current_lot, double multiplier) const;
  double ScoreConfidence(const ResolvedParameters& resolved,
                         OutcomeClass outcome,
                         int generation) const;

  ProcessingStats Stats() const;
  /// 最近决策（新到旧），容量由 `recent_decisions_capacity` 决定。
  std::vector<DecisionResponse> RecentDecisions() const;

 private:
  bool ValidateContext(const DecisionContext& context,
                       DecisionContext* out_normalized,
                       std::string* out_reason) const;
  int DeriveGeneration(const std::string& comment) const;
  DecisionResponse Finish(DecisionResponse response);

  ProcessorConfig config_;
  const HybridIdCodec& codec_;
  TieredResolver& resolver_;
  ReentryTracker& tracker_;
  IntegrityLedger* ledger_{nullptr};

  mutable std::mutex mutex_;
  ProcessingStats stats_;
  std::deque<DecisionResponse> recent_;
};

/// 决策记录转账本业务列。
LedgerRow ToLedgerRow(const DecisionResponse& response);

}  // namespace reentry
