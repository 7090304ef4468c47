#pragma once

#include <string>

namespace reentry {

/// 平仓结果三分类（由盈亏点数阈值判定）。
enum class OutcomeClass {
  kWin,
  kLoss,
  kBreakeven,
};

/// 持仓时长四分类（按分钟阈值升序判定）。
enum class DurationClass {
  kFlash,
  kQuick,
  kLong,
  kExtended,
};

/// 再入场动作：推进到下一代，或不再入场。
enum class ReentryAction {
  kR1,
  kR2,
  kHold,
  kNoReentry,
};

/// OutcomeClass 文本化（`WIN` / `LOSS` / `BREAKEVEN`）。
inline const char* ToString(OutcomeClass outcome) {
  switch (outcome) {
    case OutcomeClass::kWin:
      return "WIN";
    case OutcomeClass::kLoss:
      return "LOSS";
    case OutcomeClass::kBreakeven:
      return "BREAKEVEN";
  }
  return "UNKNOWN";
}

/// DurationClass 文本化，与词表 duration token 一致。
inline const char* ToString(DurationClass duration) {
  switch (duration) {
    case DurationClass::kFlash:
      return "FLASH";
    case DurationClass::kQuick:
      return "QUICK";
    case DurationClass::kLong:
      return "LONG";
    case DurationClass::kExtended:
      return "EXTENDED";
  }
  return "UNKNOWN";
}

/// ReentryAction 文本化（账本与响应中的固定取值）。
inline const char* ToString(ReentryAction action) {
  switch (action) {
    case ReentryAction::kR1:
      return "R1";
    case ReentryAction::kR2:
      return "R2";
    case ReentryAction::kHold:
      return "HOLD";
    case ReentryAction::kNoReentry:
      return "NO_REENTRY";
  }
  return "UNKNOWN";
}

/// 兜底层级名：所有层级均未命中时使用。
inline constexpr const char* kEmergencyTier = "EMERGENCY";

/**
 * @brief 单笔平仓交易的决策输入
 *
 * 每笔平仓生成一次、由决策处理器消费一次，处理过程中不修改。
 * 结果/时长分类不由上游给出，而是在处理器内按阈值派生。
 */
struct DecisionContext {
  std::string trade_id;
  std::string symbol;
  std::string direction{"LONG"};  // LONG/SHORT/ANY，BUY/SELL 会被映射。
  int generation{1};  // 0 表示从 comment 中的 Hybrid ID 推导。
  double current_lot_size{0.0};
  double profit_loss_pips{0.0};
  double duration_minutes{0.0};
  bool trade_closed{true};
  std::string close_reason;  // TP/SL/MANUAL/TIMEOUT，允许为空。
  std::string proximity_state{"AT_EVENT"};
  std::string calendar_id{"NONE"};
  std::string comment;  // 原始订单注释，可能携带上一代 Hybrid ID。
};

}  // namespace reentry
