#include "resolver/parameter_set.h"

#include <algorithm>
#include <unordered_set>
#include <utility>

#include "core/json_utils.h"
#include "vocab/token_pattern.h"

namespace reentry {

namespace {

const std::vector<std::string>& AllowedParameterSetKeys() {
  static const std::vector<std::string> kKeys = {
      "id",
      "name",
      "tier",
      "outcome_class",
      "duration_class",
      "proximity_state",
      "calendar_pattern",
      "symbol_pattern",
      "reentry_enabled",
      "max_generation",
      "lot_size_multiplier",
      "stop_loss_pips",
      "take_profit_pips",
      "confidence_threshold",
      "min_wait_minutes",
      "max_wait_minutes",
      "volatility_threshold",
      "spread_threshold",
      "active",
      "created_at",
      "updated_at",
  };
  return kKeys;
}

bool IsOutcomeClassName(const std::string& value) {
  return value == "WIN" || value == "LOSS" || value == "BREAKEVEN";
}

bool Fail(const std::string& set_id, const std::string& reason, std::string* out_error) {
  if (out_error != nullptr) {
    *out_error = "参数集 " + (set_id.empty() ? std::string("<unnamed>") : set_id) +
                 ": " + reason;
  }
  return false;
}

// 字段可缺省或为 null；存在时必须是字符串。
bool ReadOptionalString(const JsonValue& item,
                        const char* key,
                        std::optional<std::string>* out,
                        std::string* out_error) {
  const JsonValue* node = JsonObjectField(&item, key);
  if (node == nullptr || node->type == JsonType::kNull) {
    out->reset();
    return true;
  }
  const auto value = JsonAsString(node);
  if (!value.has_value()) {
    if (out_error != nullptr) {
      *out_error = std::string(key) + " 必须是字符串或 null";
    }
    return false;
  }
  *out = *value;
  return true;
}

bool ReadOptionalNumber(const JsonValue& item,
                        const char* key,
                        std::optional<double>* out,
                        std::string* out_error) {
  const JsonValue* node = JsonObjectField(&item, key);
  if (node == nullptr || node->type == JsonType::kNull) {
    out->reset();
    return true;
  }
  const auto value = JsonAsNumber(node);
  if (!value.has_value()) {
    if (out_error != nullptr) {
      *out_error = std::string(key) + " 必须是数值或 null";
    }
    return false;
  }
  *out = *value;
  return true;
}

template <typename T, typename Reader>
bool ReadWithDefault(const JsonValue& item,
                     const char* key,
                     Reader reader,
                     const char* type_name,
                     T* out,
                     std::string* out_error) {
  const JsonValue* node = JsonObjectField(&item, key);
  if (node == nullptr) {
    return true;
  }
  const auto value = reader(node);
  if (!value.has_value()) {
    if (out_error != nullptr) {
      *out_error = std::string(key) + " 必须是" + type_name;
    }
    return false;
  }
  *out = static_cast<T>(*value);
  return true;
}

// 模式恰为 `*` 等价于不声明该谓词（specificity 不计入）。
void NormalizeWildcard(std::optional<std::string>* pattern) {
  if (pattern->has_value() && **pattern == "*") {
    pattern->reset();
  }
}

bool ParseParameterSet(const JsonValue& item, ParameterSet* out, std::string* out_error) {
  ParameterSet set;
  const auto id = JsonAsString(JsonObjectField(&item, "id"));
  const auto tier = JsonAsString(JsonObjectField(&item, "tier"));
  const std::string id_text = id.value_or("");
  std::string field_error;
  if (!JsonCheckAllowedKeys(item, AllowedParameterSetKeys(), &field_error)) {
    return Fail(id_text, field_error, out_error);
  }
  if (!id.has_value() || !tier.has_value()) {
    return Fail(id_text, "id 与 tier 为必填字符串", out_error);
  }
  set.id = *id;
  set.tier = *tier;
  set.name = JsonAsString(JsonObjectField(&item, "name")).value_or(set.id);

  const bool ok =
      ReadOptionalString(item, "outcome_class", &set.outcome_class, &field_error) &&
      ReadOptionalString(item, "duration_class", &set.duration_class, &field_error) &&
      ReadOptionalString(item, "proximity_state", &set.proximity_state, &field_error) &&
      ReadOptionalString(item, "calendar_pattern", &set.calendar_pattern,
                         &field_error) &&
      ReadOptionalString(item, "symbol_pattern", &set.symbol_pattern, &field_error) &&
      ReadWithDefault(item, "reentry_enabled", JsonAsBool, "布尔值",
                      &set.reentry_enabled, &field_error) &&
      ReadWithDefault(item, "max_generation", JsonAsInt, "整数", &set.max_generation,
                      &field_error) &&
      ReadWithDefault(item, "lot_size_multiplier", JsonAsNumber, "数值",
                      &set.lot_size_multiplier, &field_error) &&
      ReadWithDefault(item, "stop_loss_pips", JsonAsNumber, "数值",
                      &set.stop_loss_pips, &field_error) &&
      ReadWithDefault(item, "take_profit_pips", JsonAsNumber, "数值",
                      &set.take_profit_pips, &field_error) &&
      ReadWithDefault(item, "confidence_threshold", JsonAsNumber, "数值",
                      &set.confidence_threshold, &field_error) &&
      ReadWithDefault(item, "min_wait_minutes", JsonAsInt, "整数",
                      &set.min_wait_minutes, &field_error) &&
      ReadWithDefault(item, "max_wait_minutes", JsonAsInt, "整数",
                      &set.max_wait_minutes, &field_error) &&
      ReadOptionalNumber(item, "volatility_threshold", &set.volatility_threshold,
                         &field_error) &&
      ReadOptionalNumber(item, "spread_threshold", &set.spread_threshold,
                         &field_error) &&
      ReadWithDefault(item, "active", JsonAsBool, "布尔值", &set.active, &field_error);
  if (!ok) {
    return Fail(set.id, field_error, out_error);
  }
  NormalizeWildcard(&set.calendar_pattern);
  NormalizeWildcard(&set.symbol_pattern);
  *out = std::move(set);
  return true;
}

}  // namespace

MatchResult MatchParameterSet(const ParameterSet& parameter_set,
                              const MatchCriteria& criteria) {
  MatchResult result;
  if (!parameter_set.active) {
    return result;
  }
  int matched_fields = 0;
  const auto check_exact = [&](const std::optional<std::string>& expected,
                               const std::string& actual) {
    if (!expected.has_value()) {
      return true;
    }
    ++result.declared_fields;
    if (*expected != actual) {
      return false;
    }
    ++matched_fields;
    return true;
  };
  const auto check_pattern = [&](const std::optional<std::string>& pattern,
                                 const std::string& actual) {
    if (!pattern.has_value()) {
      return true;
    }
    ++result.declared_fields;
    if (!MatchesTokenPattern(actual, *pattern)) {
      return false;
    }
    ++matched_fields;
    return true;
  };

  if (!check_exact(parameter_set.outcome_class, criteria.outcome) ||
      !check_exact(parameter_set.duration_class, criteria.duration) ||
      !check_exact(parameter_set.proximity_state, criteria.proximity) ||
      !check_pattern(parameter_set.calendar_pattern, criteria.calendar) ||
      !check_pattern(parameter_set.symbol_pattern, criteria.symbol)) {
    return MatchResult{};
  }
  result.matched = true;
  result.specificity =
      result.declared_fields == 0
          ? 0.0
          : static_cast<double>(matched_fields) / result.declared_fields;
  return result;
}

std::vector<ParameterSet> DefaultParameterSets() {
  std::vector<ParameterSet> sets;

  ParameterSet global;
  global.id = "global_default";
  global.name = "Global Default Parameters";
  global.tier = "GLOBAL";
  sets.push_back(global);

  ParameterSet cal8;
  cal8.id = "cal8_high_impact";
  cal8.name = "CAL8 High Impact Events";
  cal8.tier = "TIER1";
  cal8.calendar_pattern = "CAL8_*";
  cal8.lot_size_multiplier = 0.8;
  cal8.stop_loss_pips = 15.0;
  cal8.take_profit_pips = 30.0;
  cal8.confidence_threshold = 0.7;
  sets.push_back(cal8);

  ParameterSet win;
  win.id = "win_outcomes";
  win.name = "Win Outcome Re-entries";
  win.tier = "TIER2";
  win.outcome_class = "WIN";
  win.lot_size_multiplier = 1.2;
  win.stop_loss_pips = 25.0;
  win.take_profit_pips = 50.0;
  win.confidence_threshold = 0.5;
  sets.push_back(win);

  ParameterSet loss;
  loss.id = "loss_outcomes";
  loss.name = "Loss Outcome Re-entries";
  loss.tier = "TIER2";
  loss.outcome_class = "LOSS";
  loss.lot_size_multiplier = 0.7;
  loss.stop_loss_pips = 15.0;
  loss.take_profit_pips = 30.0;
  loss.confidence_threshold = 0.8;
  sets.push_back(loss);

  ParameterSet flash;
  flash.id = "flash_no_reentry";
  flash.name = "Flash Duration - No Re-entry";
  flash.tier = "TIER3";
  flash.duration_class = "FLASH";
  flash.reentry_enabled = false;
  flash.confidence_threshold = 1.0;
  sets.push_back(flash);

  return sets;
}

bool ValidateParameterSet(const ParameterSet& parameter_set,
                          const Vocabulary& vocabulary,
                          const std::vector<std::string>& tier_hierarchy,
                          std::string* out_error) {
  const std::string& id = parameter_set.id;
  if (id.empty()) {
    return Fail(id, "id 不能为空", out_error);
  }
  if (std::find(tier_hierarchy.begin(), tier_hierarchy.end(), parameter_set.tier) ==
      tier_hierarchy.end()) {
    return Fail(id, "tier 不在层级列表中: " + parameter_set.tier, out_error);
  }
  // 解析请求只携带结果类别名；词表 token（W1/L2/BE...）永远不会命中，装载即拒绝。
  if (parameter_set.outcome_class.has_value() &&
      !IsOutcomeClassName(*parameter_set.outcome_class)) {
    if (vocabulary.IsLegalToken(VocabDimension::kOutcome, *parameter_set.outcome_class)) {
      return Fail(id,
                  "outcome_class 须为 WIN/LOSS/BREAKEVEN，不接受词表 token: " +
                      *parameter_set.outcome_class,
                  out_error);
    }
    return Fail(id, "outcome_class 非法: " + *parameter_set.outcome_class, out_error);
  }
  if (parameter_set.duration_class.has_value() &&
      !vocabulary.IsLegalToken(VocabDimension::kDuration,
                               *parameter_set.duration_class)) {
    return Fail(id, "duration_class 非法: " + *parameter_set.duration_class, out_error);
  }
  if (parameter_set.proximity_state.has_value() &&
      !vocabulary.IsLegalToken(VocabDimension::kProximity,
                               *parameter_set.proximity_state)) {
    return Fail(id, "proximity_state 非法: " + *parameter_set.proximity_state,
                out_error);
  }
  std::string pattern_error;
  if (parameter_set.calendar_pattern.has_value() &&
      !IsValidTokenPattern(*parameter_set.calendar_pattern, &pattern_error)) {
    return Fail(id, "calendar_pattern " + pattern_error, out_error);
  }
  if (parameter_set.symbol_pattern.has_value() &&
      !IsValidTokenPattern(*parameter_set.symbol_pattern, &pattern_error)) {
    return Fail(id, "symbol_pattern " + pattern_error, out_error);
  }
  if (!vocabulary.IsValidGeneration(parameter_set.max_generation)) {
    return Fail(id,
                "max_generation 超出词表区间: " +
                    std::to_string(parameter_set.max_generation),
                out_error);
  }
  if (parameter_set.lot_size_multiplier <= 0.0 || parameter_set.stop_loss_pips <= 0.0 ||
      parameter_set.take_profit_pips <= 0.0) {
    return Fail(id, "lot_size_multiplier/stop_loss_pips/take_profit_pips 必须 > 0",
                out_error);
  }
  if (parameter_set.confidence_threshold < 0.0 ||
      parameter_set.confidence_threshold > 1.0) {
    return Fail(id, "confidence_threshold 必须位于 [0, 1]", out_error);
  }
  if (parameter_set.min_wait_minutes < 0 ||
      parameter_set.min_wait_minutes > parameter_set.max_wait_minutes) {
    return Fail(id, "必须满足 0 <= min_wait_minutes <= max_wait_minutes", out_error);
  }
  if ((parameter_set.volatility_threshold.has_value() &&
       *parameter_set.volatility_threshold < 0.0) ||
      (parameter_set.spread_threshold.has_value() &&
       *parameter_set.spread_threshold < 0.0)) {
    return Fail(id, "volatility_threshold/spread_threshold 不能为负", out_error);
  }
  return true;
}

bool ValidateParameterSets(const std::vector<ParameterSet>& parameter_sets,
                           const Vocabulary& vocabulary,
                           const std::vector<std::string>& tier_hierarchy,
                           std::string* out_error) {
  std::unordered_set<std::string> seen_ids;
  for (const auto& parameter_set : parameter_sets) {
    if (!ValidateParameterSet(parameter_set, vocabulary, tier_hierarchy, out_error)) {
      return false;
    }
    if (!seen_ids.insert(parameter_set.id).second) {
      return Fail(parameter_set.id, "id 重复", out_error);
    }
  }
  return true;
}

bool LoadParameterSetsFromJson(const std::string& file_path,
                               const Vocabulary& vocabulary,
                               const std::vector<std::string>& tier_hierarchy,
                               std::vector<ParameterSet>* out_sets,
                               std::string* out_error) {
  if (out_sets == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_sets 为空";
    }
    return false;
  }
  JsonValue root;
  if (!ParseJsonFile(file_path, &root, out_error)) {
    return false;
  }
  if (!JsonCheckAllowedKeys(root, {"version", "last_updated", "parameter_sets"},
                            out_error)) {
    return false;
  }
  const JsonValue* items = JsonObjectField(&root, "parameter_sets");
  if (items == nullptr || items->type != JsonType::kArray) {
    if (out_error != nullptr) {
      *out_error = "parameter_sets 必须是数组: " + file_path;
    }
    return false;
  }

  std::vector<ParameterSet> loaded;
  loaded.reserve(items->array_value.size());
  for (std::size_t i = 0; i < items->array_value.size(); ++i) {
    const JsonValue& item = items->array_value[i];
    if (item.type != JsonType::kObject) {
      if (out_error != nullptr) {
        *out_error = "parameter_sets[" + std::to_string(i) + "] 必须是对象";
      }
      return false;
    }
    ParameterSet parameter_set;
    if (!ParseParameterSet(item, &parameter_set, out_error)) {
      return false;
    }
    loaded.push_back(std::move(parameter_set));
  }
  if (!ValidateParameterSets(loaded, vocabulary, tier_hierarchy, out_error)) {
    return false;
  }
  *out_sets = std::move(loaded);
  return true;
}

}  // namespace reentry
