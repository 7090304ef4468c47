#pragma once

#include <optional>
#include <string>
#include <vector>

#include "vocab/vocabulary.h"

namespace reentry {

/**
 * @brief 分层参数集
 *
 * 匹配谓词为空表示该字段通配；calendar/symbol 支持 `*` / `X*` / `*X` 模式。
 * 加载后只读，仅通过解析器 Reload 整体替换。
 */
struct ParameterSet {
  std::string id;
  std::string name;
  std::string tier;

  /// WIN / LOSS / BREAKEVEN；不接受词表 token。
  std::optional<std::string> outcome_class;
  std::optional<std::string> duration_class;
  std::optional<std::string> proximity_state;
  std::optional<std::string> calendar_pattern;
  std::optional<std::string> symbol_pattern;

  bool reentry_enabled{true};
  int max_generation{3};
  double lot_size_multiplier{1.0};
  double stop_loss_pips{20.0};
  double take_profit_pips{40.0};
  double confidence_threshold{0.6};
  int min_wait_minutes{0};
  int max_wait_minutes{60};

  // 市场条件过滤仅透传给下游，解析器不据此匹配。
  std::optional<double> volatility_threshold;
  std::optional<double> spread_threshold;

  bool active{true};
};

/// 单次匹配的上下文取值。
struct MatchCriteria {
  std::string outcome;
  std::string duration;
  std::string proximity;
  std::string calendar;
  std::string symbol;
};

/// 匹配结果：`declared_fields` 为非通配谓词数量，用于同分排序。
struct MatchResult {
  bool matched{false};
  double specificity{0.0};
  int declared_fields{0};
};

/**
 * @brief 计算参数集对上下文的匹配
 *
 * 任一非通配谓词不满足即不匹配；全部满足时 specificity = 命中数 / 声明数，
 * 纯通配参数集匹配一切且 specificity 为 0。未激活的参数集恒不匹配。
 */
MatchResult MatchParameterSet(const ParameterSet& parameter_set,
                              const MatchCriteria& criteria);

/// 内置默认参数集（参数文件缺失时使用）。
std::vector<ParameterSet> DefaultParameterSets();

/**
 * @brief 校验单个参数集
 *
 * @param tier_hierarchy 允许的层级名
 * @return false 时 `out_error` 带参数集 id 与字段名
 */
bool ValidateParameterSet(const ParameterSet& parameter_set,
                          const Vocabulary& vocabulary,
                          const std::vector<std::string>& tier_hierarchy,
                          std::string* out_error);

/// 校验整组参数集：逐个校验并检查 id 唯一。
bool ValidateParameterSets(const std::vector<ParameterSet>& parameter_sets,
                           const Vocabulary& vocabulary,
                           const std::vector<std::string>& tier_hierarchy,
                           std::string* out_error);

/**
 * @brief 从 JSON 文件加载参数集
 *
 * 文件结构：`{"version": ..., "last_updated": ..., "parameter_sets": [...]}`。
 * 任一条目非法则整体失败，`out_sets` 保持不变。
 */
bool LoadParameterSetsFromJson(const std::string& file_path,
                               const Vocabulary& vocabulary,
                               const std::vector<std::string>& tier_hierarchy,
                               std::vector<ParameterSet>* out_sets,
                               std::string* out_error);

}  // namespace reentry
