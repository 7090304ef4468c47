#pragma once

#include <map>
#include <string>
#include <vector>

namespace reentry {

/// 词表来源：为空时使用内置默认词表。
struct VocabularyConfig {
  std::string file_path;
  // 为 true 时词表文件缺失/非法直接启动失败；否则告警后回退内置默认。
  bool require_file{false};
};

/// 分层参数解析配置。
struct ResolverConfig {
  std::string parameter_sets_path{"./config/parameter_sets.json"};
  // 层级顺序即优先级：靠前层级只要命中即整体胜出。
  std::vector<std::string> tier_hierarchy{"EXACT", "TIER1", "TIER2", "TIER3",
                                          "GLOBAL"};
  // 参数文件不存在时使用内置默认参数集。
  bool use_defaults_if_missing{true};
};

/// 决策处理器参数：准入门槛、分类阈值、仓位与置信度调整。
struct ProcessorConfig {
  bool process_completed_trades_only{true};
  double min_trade_duration_minutes{1.0};
  bool exclude_manual_closes{false};
  int reentry_cooldown_minutes{15};
  int max_reentry_attempts_per_day{5};
  double profit_threshold_pips{5.0};   ///< 盈亏点数 >= 该值判为 WIN。
  double loss_threshold_pips{-5.0};    ///< 盈亏点数 <= 该值判为 LOSS。
  double flash_duration_max_minutes{5.0};
  double quick_duration_max_minutes{30.0};
  double long_duration_max_minutes{240.0};  ///< 超过该值为 EXTENDED。
  double lot_step{0.01};  ///< 默认最小手数步长。
  std::map<std::string, double> symbol_lot_steps;  ///< 品种级步长覆盖。
  double confidence_specificity_weight{0.2};
  double confidence_win_bonus{0.1};
  double confidence_loss_penalty{0.1};
  double confidence_generation_penalty{0.05};  ///< 每多一代扣减。
  int recent_decisions_capacity{100};
};

/// 完整性账本参数。
struct LedgerConfig {
  bool enabled{true};
  std::string output_directory{"./data/reentry"};
  int rotation_hours{24};
  int max_file_size_mb{100};
};

/// 服务运行参数。
struct ServiceConfig {
  std::string name{"reentry-core"};
  int worker_threads{2};
};

/// 应用主配置：聚合词表、解析器、处理器、账本与服务运行参数。
struct ReentryConfig {
  VocabularyConfig vocabulary{};
  ResolverConfig resolver{};
  ProcessorConfig processor{};
  LedgerConfig ledger{};
  ServiceConfig service{};
};

/**
 * @brief 轻量 YAML 配置加载器
 *
 * 支持 section / subsection / `key: value` / 行内 `[a, b]` 列表与 `#` 注释。
 * 未知键、非法取值和跨字段约束冲突都会使加载失败，`out_config` 保持不变。
 */
bool LoadReentryConfigFromYaml(const std::string& file_path,
                               ReentryConfig* out_config,
                               std::string* out_error);

/// 对已填充的配置执行跨字段校验（YAML 加载末尾也会调用）。
bool ValidateReentryConfig(const ReentryConfig& config, std::string* out_error);

}  // namespace reentry
