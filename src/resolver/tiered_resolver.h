#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/config.h"
#include "core/service_component.h"
#include "resolver/parameter_set.h"
#include "vocab/vocabulary.h"

namespace reentry {

/// 单次解析请求：六维上下文中参与匹配的五维加当前 generation。
struct ResolveRequest {
  std::string outcome;
  std::string duration;
  std::string proximity;
  std::string calendar;
  std::string symbol;
  int generation{1};
};

/// 解析结果：命中参数集的取值与命中元信息。
struct ResolvedParameters {
  std::string parameter_set_id;
  std::string parameter_set_name;
  std::string resolved_tier;
  double specificity_score{0.0};

  bool reentry_enabled{false};
  int max_generation{1};
  double lot_size_multiplier{1.0};
  double stop_loss_pips{0.0};
  double take_profit_pips{0.0};
  double confidence_threshold{1.0};
  int min_wait_minutes{0};
  int max_wait_minutes{0};
  std::optional<double> volatility_threshold;
  std::optional<double> spread_threshold;

  bool generation_allowed{false};      ///< 请求 generation <= max_generation。
  std::optional<int> next_generation;  ///< 已到上限时为空。
};

/// 不可变参数集快照；Reload 整体替换，Resolve 只读。
struct ResolverSnapshot {
  std::vector<ParameterSet> parameter_sets;
  std::string source;  ///< 文件路径或 `builtin-defaults`。
  std::int64_t loaded_at_ms{0};
};

/// 解析统计（进程内累计）。
struct ResolverStats {
  std::uint64_t resolves{0};
  std::uint64_t emergency_fallbacks{0};
  std::uint64_t reloads{0};
  std::uint64_t reload_failures{0};
  std::map<std::string, std::uint64_t> tier_hits;
};

/// 解析器状态报告。
struct ResolverStatus {
  std::size_t total_parameter_sets{0};
  std::size_t active_parameter_sets{0};
  std::vector<std::string> tier_hierarchy;
  std::map<std::string, std::size_t> tier_counts;  ///< 各层级激活参数集数量。
  std::string source;
  std::string loaded_at;  ///< ISO-8601；未加载时为空。
  ResolverStats stats;
};

/**
 * @brief 分层参数解析器
 *
 * 按层级顺序遍历，首个存在匹配的层级整体胜出；层内按
 * specificity 降序、声明字段数降序、参数集 id 字节序升序取唯一结果。
 * 所有层级均无匹配时返回 EMERGENCY 兜底（禁止再入场）并输出 ERROR 告警。
 *
 * 并发：快照以 `shared_ptr<const>` 持有，Reload 在锁内替换指针，
 * Resolve 在锁内复制指针后无锁匹配，不会观察到半更新状态。
 */
class TieredResolver : public ServiceComponent {
 public:
  TieredResolver(ResolverConfig config, std::shared_ptr<const Vocabulary> vocabulary);

  const char* component_name() const override { return "resolver"; }
  /// 首次加载参数集（同 Reload）。
  bool Initialize(std::string* out_error) override { return Reload(out_error); }
  void Start() override {}
  void Stop() override {}
  /// 无激活参数集为 unhealthy；缺少 GLOBAL 兜底或发生过 EMERGENCY 为 degraded。
  ComponentHealth HealthCheck() const override;

  /**
   * @brief 从配置的参数文件（重新）加载
   *
   * 文件不存在且允许默认时装载内置默认参数集；
   * 文件存在但非法时返回 false，保留原快照。
   */
  bool Reload(std::string* out_error);

  /// 直接装载给定参数集（校验通过才替换快照）。
  bool LoadParameterSets(std::vector<ParameterSet> parameter_sets,
                         std::string source,
                         std::string* out_error);

  ResolvedParameters Resolve(const ResolveRequest& request);

  std::shared_ptr<const ResolverSnapshot> snapshot() const;
  std::vector<ParameterSet> ParameterSetsForTier(const std::string& tier) const;
  ResolverStatus Status() const;
  const std::vector<std::string>& tier_hierarchy() const {
    return config_.tier_hierarchy;
  }

 private:
  void SwapSnapshot(std::shared_ptr<const ResolverSnapshot> next);
  void RecordResolve(const std::string& tier);

  ResolverConfig config_;
  std::shared_ptr<const Vocabulary> vocabulary_;

  mutable std::mutex mutex_;
  std::shared_ptr<const ResolverSnapshot> snapshot_;
  ResolverStats stats_;
};

/// 兜底结果：禁止再入场、置信度 1.0、层级 EMERGENCY。
ResolvedParameters EmergencyFallbackParameters(int generation);

}  // namespace reentry
