#include "processor/decision_processor.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <utility>

#include "core/json_utils.h"
#include "core/log.h"
#include "ledger/ledger_schema.h"

namespace reentry {

namespace {

constexpr double kLotRoundingScale = 1e8;

std::string ToUpper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
  return text;
}

bool IsKnownCloseReason(const std::string& reason) {
  return reason.empty() || reason == "TP" || reason == "SL" || reason == "MANUAL" ||
         reason == "TIMEOUT";
}

bool CountsAsAttempt(ReentryAction action) {
  return action == ReentryAction::kR1 || action == ReentryAction::kR2;
}

}  // namespace

const char* ToString(DecisionStatus status) {
  switch (status) {
    case DecisionStatus::kProcessed:
      return "processed";
    case DecisionStatus::kSkipped:
      return "skipped";
    case DecisionStatus::kInvalidContext:
      return "invalid_context";
    case DecisionStatus::kWriteFailure:
      return "write_failure";
  }
  return "unknown";
}

std::string DecisionResponse::ToJson() const {
  std::ostringstream oss;
  oss << "{\"status\":" << JsonQuote(ToString(status));
  if (status != DecisionStatus::kProcessed) {
    oss << ",\"reason\":" << JsonQuote(reason) << ",\"trade_id\":" << JsonQuote(trade_id)
        << ",\"symbol\":" << JsonQuote(symbol) << "}";
    return oss.str();
  }
  if (!reason.empty()) {
    oss << ",\"reason\":" << JsonQuote(reason);
  }
  oss << ",\"trade_id\":" << JsonQuote(trade_id) << ",\"symbol\":" << JsonQuote(symbol)
      << ",\"identifier\":" << JsonQuote(hybrid_id)
      << ",\"comment\":" << JsonQuote(comment)
      << ",\"outcome_class\":" << JsonQuote(ToString(outcome_class))
      << ",\"duration_class\":" << JsonQuote(ToString(duration_class))
      << ",\"reentry_action\":" << JsonQuote(ToString(reentry_action))
      << ",\"parameter_set_id\":" << JsonQuote(parameter_set_id)
      << ",\"resolved_tier\":" << JsonQuote(resolved_tier)
      << ",\"chain_position\":" << JsonQuote(chain_position)
      << ",\"generation\":" << generation << ",\"next_generation\":";
  if (next_generation.has_value()) {
    oss << *next_generation;
  } else {
    oss << "null";
  }
  oss << ",\"lot_size\":" << FormatDecimal(lot_size)
      << ",\"stop_loss\":" << FormatDecimal(stop_loss)
      << ",\"take_profit\":" << FormatDecimal(take_profit)
      << ",\"confidence_score\":" << FormatDecimal(confidence_score, 6)
      << ",\"file_seq\":" << file_seq << ",\"checksum\":" << JsonQuote(checksum) << "}";
  return oss.str();
}

LedgerRow ToLedgerRow(const DecisionResponse& response) {
  return LedgerRow{
      {"trade_id", response.trade_id},
      {"hybrid_id", response.hybrid_id},
      {"symbol", response.symbol},
      {"outcome_class", ToString(response.outcome_class)},
      {"duration_class", ToString(response.duration_class)},
      {"reentry_action", ToString(response.reentry_action)},
      {"parameter_set_id", response.parameter_set_id},
      {"resolved_tier", response.resolved_tier},
      {"chain_position", response.chain_position},
      {"lot_size", FormatDecimal(response.lot_size)},
      {"stop_loss", FormatDecimal(response.stop_loss)},
      {"take_profit", FormatDecimal(response.take_profit)},
  };
}

DecisionProcessor::DecisionProcessor(ProcessorConfig config,
                                     const HybridIdCodec& codec,
                                     TieredResolver& resolver,
                                     ReentryTracker& tracker,
                                     IntegrityLedger* ledger)
    : config_(std::move(config)),
      codec_(codec),
      resolver_(resolver),
      tracker_(tracker),
      ledger_(ledger) {}

DecisionResponse DecisionProcessor::Process(const DecisionContext& context) {
  DecisionResponse response;
  response.trade_id = context.trade_id;
  response.symbol = context.symbol;

  // 1. 结构校验。
  DecisionContext ctx;
  if (!ValidateContext(context, &ctx, &response.reason)) {
    response.status = DecisionStatus::kInvalidContext;
    LogWarn("REENTRY_DECISION_INVALID: trade_id=" + context.trade_id +
            " reason=" + response.reason);
    return Finish(std::move(response));
  }
  response.generation = ctx.generation;

  // 2. 准入门槛；冷却与日内上限在品种凭证内判定。
  std::string skip_reason;
  if (config_.process_completed_trades_only && !ctx.trade_closed) {
    skip_reason = "trade_not_completed";
  } else if (ctx.duration_minutes < config_.min_trade_duration_minutes) {
    skip_reason = "duration_too_short";
  } else if (config_.exclude_manual_closes && ctx.close_reason == "MANUAL") {
    skip_reason = "manual_close_excluded";
  }
  ReentryTracker::Slot slot;
  if (skip_reason.empty()) {
    slot = tracker_.TryAcquire(ctx.symbol, &skip_reason);
  }
  if (!slot.acquired()) {
    response.status = DecisionStatus::kSkipped;
    response.reason = skip_reason;
    LogInfo("REENTRY_DECISION_SKIPPED: trade_id=" + ctx.trade_id + " symbol=" +
            ctx.symbol + " reason=" + skip_reason);
    return Finish(std::move(response));
  }

  // 3. 分类。
  response.outcome_class = ClassifyOutcome(ctx.profit_loss_pips);
  response.duration_class = ClassifyDuration(ctx.duration_minutes);

  // 4. 分层解析。
  const ResolvedParameters resolved = resolver_.Resolve(ResolveRequest{
      .outcome = ToString(response.outcome_class),
      .duration = ToString(response.duration_class),
      .proximity = ctx.proximity_state,
      .calendar = ctx.calendar_id,
      .symbol = ctx.symbol,
      .generation = ctx.generation});
  response.parameter_set_id = resolved.parameter_set_id;
  response.resolved_tier = resolved.resolved_tier;

  // 5-6. 结果 token 映射并组合 Hybrid ID。
  HybridId id;
  HybridIdError id_error;
  if (!codec_.Compose(OutcomeToken(response.outcome_class),
                      ToString(response.duration_class), ctx.proximity_state,
                      ctx.calendar_id, ctx.direction, ctx.generation, std::nullopt, &id,
                      &id_error) ||
      !HybridIdCodec::ChainPosition(ctx.generation, &response.chain_position,
                                    &id_error)) {
    response.status = DecisionStatus::kInvalidContext;
    response.reason = std::string(ToString(id_error.code)) + ": " + id_error.message;
    LogWarn("REENTRY_DECISION_INVALID: trade_id=" + ctx.trade_id +
            " reason=" + response.reason);
    return Finish(std::move(response));
  }
  response.hybrid_id = id.ToString();
  response.comment = codec_.DecomposeForComment(response.hybrid_id).value_or("");

  // 7. 动作。
  if (!resolved.reentry_enabled || ctx.generation >= resolved.max_generation) {
    response.reentry_action = ReentryAction::kNoReentry;
  } else {
    const int next = ctx.generation + 1;
    response.next_generation = next;
    response.reentry_action = next == 2   ? ReentryAction::kR1
                              : next == 3 ? ReentryAction::kR2
                                          : ReentryAction::kHold;
  }

  // 8. 手数、止损止盈与置信度。
  response.lot_size =
      SizeLot(ctx.symbol, ctx.current_lot_size, resolved.lot_size_multiplier);
  response.stop_loss = resolved.stop_loss_pips;
  response.take_profit = resolved.take_profit_pips;
  response.confidence_score =
      ScoreConfidence(resolved, response.outcome_class, ctx.generation);

  // 9. 账本落盘；失败时凭证析构释放，冷却与计数不更新。
  if (ledger_ != nullptr) {
    const LedgerWriteResult written = ledger_->Append(ToLedgerRow(response));
    if (!written.success) {
      response.status = DecisionStatus::kWriteFailure;
      response.reason = "write_failure: " + written.error;
      return Finish(std::move(response));
    }
    response.file_seq = written.file_seq;
    response.checksum = written.checksum;
  } else {
    // 未落盘的决策不能被当作已记录。
    response.reason = kLedgerDisabledReason;
  }

  // 10. 提交冷却与日内计数。
  slot.Commit(CountsAsAttempt(response.reentry_action));
  response.status = DecisionStatus::kProcessed;

  std::ostringstream event;
  event << "REENTRY_DECISION: trade_id=" << ctx.trade_id << " symbol=" << ctx.symbol
        << " hybrid_id=" << response.hybrid_id
        << " action=" << ToString(response.reentry_action)
        << " tier=" << response.resolved_tier << " set=" << response.parameter_set_id
        << " lot=" << FormatDecimal(response.lot_size)
        << " confidence=" << FormatDecimal(response.confidence_score, 6)
        << " file_seq=" << response.file_seq;
  if (ledger_ == nullptr) {
    event << " reason=" << kLedgerDisabledReason;
    LogWarn(event.str());
  } else {
    LogInfo(event.str());
  }
  return Finish(std::move(response));
}

OutcomeClass DecisionProcessor::ClassifyOutcome(double profit_loss_pips) const {
  if (profit_loss_pips >= config_.profit_threshold_pips) {
    return OutcomeClass::kWin;
  }
  if (profit_loss_pips <= config_.loss_threshold_pips) {
    return OutcomeClass::kLoss;
  }
  return OutcomeClass::kBreakeven;
}

DurationClass DecisionProcessor::ClassifyDuration(double duration_minutes) const {
  if (duration_minutes <= config_.flash_duration_max_minutes) {
    return DurationClass::kFlash;
  }
  if (duration_minutes <= config_.quick_duration_max_minutes) {
    return DurationClass::kQuick;
  }
  if (duration_minutes <= config_.long_duration_max_minutes) {
    return DurationClass::kLong;
  }
  return DurationClass::kExtended;
}

std::string DecisionProcessor::OutcomeToken(OutcomeClass outcome) {
  // W2/L2 缺少判定阈值，当前统一映射到一级 token。
  switch (outcome) {
    case OutcomeClass::kWin:
      return "W1";
    case OutcomeClass::kLoss:
      return "L1";
    case OutcomeClass::kBreakeven:
      return "BE";
  }
  return "BE";
}

double DecisionProcessor::SizeLot(const std::string& symbol,
                                  double current_lot,
                                  double multiplier) const {
  double step = config_.lot_step;
  const auto it = config_.symbol_lot_steps.find(symbol);
  if (it != config_.symbol_lot_steps.end()) {
    step = it->second;
  }
  const double raw = current_lot * multiplier;
  double lots = std::round(raw / step) * step;
  if (lots < step) {
    lots = step;
  }
  // 去除步长乘法带来的二进制尾差。
  return std::round(lots * kLotRoundingScale) / kLotRoundingScale;
}

double DecisionProcessor::ScoreConfidence(const ResolvedParameters& resolved,
                                          OutcomeClass outcome,
                                          int generation) const {
  double score = resolved.confidence_threshold +
                 config_.confidence_specificity_weight * resolved.specificity_score;
  if (outcome == OutcomeClass::kWin) {
    score += config_.confidence_win_bonus;
  } else if (outcome == OutcomeClass::kLoss) {
    score -= config_.confidence_loss_penalty;
  }
  score -= config_.confidence_generation_penalty * std::max(generation - 1, 0);
  return std::clamp(score, 0.0, 1.0);
}

ProcessingStats DecisionProcessor::Stats() const {
  ProcessingStats out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out = stats_;
  }
  out.active_cooldowns = tracker_.ActiveCooldowns();
  out.daily_attempts = tracker_.DailyAttempts();
  return out;
}

std::vector<DecisionResponse> DecisionProcessor::RecentDecisions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<DecisionResponse>(recent_.begin(), recent_.end());
}

bool DecisionProcessor::ValidateContext(const DecisionContext& context,
                                        DecisionContext* out_normalized,
                                        std::string* out_reason) const {
  DecisionContext ctx = context;
  ctx.direction = ToUpper(ctx.direction);
  if (ctx.direction == "BUY") {
    ctx.direction = "LONG";
  } else if (ctx.direction == "SELL") {
    ctx.direction = "SHORT";
  }
  ctx.close_reason = ToUpper(ctx.close_reason);
  if (ctx.calendar_id.empty()) {
    ctx.calendar_id = "NONE";
  }

  const Vocabulary& vocabulary = codec_.vocabulary();
  std::vector<std::string> problems;
  if (ctx.trade_id.empty()) {
    problems.push_back("trade_id is required");
  }
  if (ctx.symbol.empty()) {
    problems.push_back("symbol is required");
  }
  if (!std::isfinite(ctx.current_lot_size) || ctx.current_lot_size <= 0.0) {
    problems.push_back("current_lot_size must be positive");
  }
  if (!std::isfinite(ctx.profit_loss_pips)) {
    problems.push_back("profit_loss_pips must be finite");
  }
  if (!std::isfinite(ctx.duration_minutes) || ctx.duration_minutes < 0.0) {
    problems.push_back("duration_minutes must be non-negative");
  }
  if (!vocabulary.IsLegalToken(VocabDimension::kDirection, ctx.direction)) {
    problems.push_back("Invalid direction: " + context.direction);
  }
  if (!vocabulary.IsLegalToken(VocabDimension::kProximity, ctx.proximity_state)) {
    problems.push_back("Invalid proximity: " + ctx.proximity_state);
  }
  if (!vocabulary.IsValidCalendar(ctx.calendar_id)) {
    problems.push_back("Invalid calendar: " + ctx.calendar_id);
  }
  if (!IsKnownCloseReason(ctx.close_reason)) {
    problems.push_back("Invalid close_reason: " + context.close_reason);
  }
  if (ctx.generation == 0) {
    ctx.generation = DeriveGeneration(ctx.comment);
  } else if (!vocabulary.IsValidGeneration(ctx.generation)) {
    problems.push_back("Invalid generation: " + std::to_string(ctx.generation));
  }

  if (!problems.empty()) {
    if (out_reason != nullptr) {
      std::string joined;
      for (const auto& problem : problems) {
        joined += joined.empty() ? problem : "; " + problem;
      }
      *out_reason = joined;
    }
    return false;
  }
  *out_normalized = std::move(ctx);
  return true;
}

int DecisionProcessor::DeriveGeneration(const std::string& comment) const {
  const auto [generation_min, generation_max] = codec_.vocabulary().GenerationRange();
  HybridId previous;
  if (!comment.empty() && codec_.Validate(comment) &&
      codec_.Parse(comment, &previous, nullptr)) {
    return std::min(previous.generation + 1, generation_max);
  }
  return generation_min;
}

DecisionResponse DecisionProcessor::Finish(DecisionResponse response) {
  std::lock_guard<std::mutex> lock(mutex_);
  switch (response.status) {
    case DecisionStatus::kProcessed:
      ++stats_.processed;
      if (response.resolved_tier == kEmergencyTier) {
        ++stats_.emergency_fallbacks;
      }
      break;
    case DecisionStatus::kSkipped:
      ++stats_.skipped;
      ++stats_.skip_reasons[response.reason];
      break;
    case DecisionStatus::kInvalidContext:
      ++stats_.invalid_contexts;
      break;
    case DecisionStatus::kWriteFailure:
      ++stats_.write_failures;
      break;
  }
  recent_.push_front(response);
  while (recent_.size() > static_cast<std::size_t>(config_.recent_decisions_capacity)) {
    recent_.pop_back();
  }
  return response;
}

}  // namespace reentry
