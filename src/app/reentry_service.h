#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/config.h"
#include "core/service_component.h"
#include "hybrid_id/hybrid_id_codec.h"
#include "ledger/integrity_ledger.h"
#include "processor/decision_executor.h"
#include "processor/decision_processor.h"
#include "processor/reentry_tracker.h"
#include "resolver/tiered_resolver.h"
#include "vocab/vocabulary.h"

namespace reentry {

/**
 * @brief 再入场决策服务（显式上下文对象）
 *
 * 持有并串联全部组件：词表 -> 编解码器 -> 解析器 -> 账本 -> 跟踪器 -> 处理器 -> 执行器。
 * 由调用方构造一次并按引用传递，不存在进程级全局实例。
 *
 * 生命周期：
 * 1. Initialize：构造组件并按依赖顺序初始化，任一失败即中止；
 * 2. Start：启动执行器工作线程；
 * 3. Stop / 析构：按逆序停止，执行器先排空已投递任务。
 */
class ReentryService {
 public:
  using Clock = std::function<std::int64_t()>;

  /// `clock` 为空时使用系统时钟（测试可注入，供账本与跟踪器共用）。
  explicit ReentryService(ReentryConfig config, Clock clock = {});
  ~ReentryService();

  ReentryService(const ReentryService&) = delete;
  ReentryService& operator=(const ReentryService&) = delete;

  bool Initialize(std::string* out_error);
  void Start();
  void Stop();

  /// 同步处理单笔决策（调用线程内执行）。
  DecisionResponse Process(const DecisionContext& context);
  /// 按输入顺序逐笔同步处理；同品种的冷却与账本序号只取决于输入顺序。
  std::vector<DecisionResponse> ProcessBatch(const std::vector<DecisionContext>& contexts);
  /// 异步投递；需先 Start。
  bool Submit(const DecisionContext& context);
  void PollResults(std::vector<DecisionResponse>* out_results);
  void WaitIdle();

  /// 重新读取参数集文件并原子替换快照；失败时保留原快照。
  bool ReloadParameterSets(std::string* out_error);

  std::vector<ComponentHealth> HealthCheck() const;

  const ReentryConfig& config() const { return config_; }
  const Vocabulary& vocabulary() const { return *vocabulary_; }
  const HybridIdCodec& codec() const { return *codec_; }
  TieredResolver& resolver() { return *resolver_; }
  DecisionProcessor& processor() { return *processor_; }
  /// 账本关闭时为空。
  IntegrityLedger* ledger() { return ledger_.get(); }

 private:
  ReentryConfig config_;
  Clock clock_;

  std::shared_ptr<const Vocabulary> vocabulary_;
  std::unique_ptr<HybridIdCodec> codec_;
  std::unique_ptr<TieredResolver> resolver_;
  std::unique_ptr<IntegrityLedger> ledger_;
  std::unique_ptr<ReentryTracker> tracker_;
  std::unique_ptr<DecisionProcessor> processor_;
  std::unique_ptr<DecisionExecutor> executor_;

  std::vector<ServiceComponent*> components_;  ///< 初始化顺序，停止时逆序。
  bool initialized_{false};
  bool started_{false};
};

}  // namespace reentry
