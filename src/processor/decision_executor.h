#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "core/service_component.h"
#include "core/types.h"
#include "processor/decision_processor.h"

namespace reentry {

/**
 * @brief 决策执行器（固定工作线程池）
 *
 * 调用方投递平仓上下文后立即返回，工作线程并发调用 `DecisionProcessor::Process`，
 * 结果缓存在线程安全缓冲区中由调用方轮询消费。
 * 已投递的任务一定被处理：Stop 先排空队列再退出，保证账本写入不被中途放弃。
 */
class DecisionExecutor : public ServiceComponent {
 public:
  /**
   * @param processor 决策处理器，生命周期由外部管理（不持有所有权）
   * @param worker_threads 工作线程数，至少 1
   */
  DecisionExecutor(DecisionProcessor* processor, int worker_threads);
  ~DecisionExecutor() override;

  DecisionExecutor(const DecisionExecutor&) = delete;
  DecisionExecutor& operator=(const DecisionExecutor&) = delete;

  const char* component_name() const override { return "decision_executor"; }
  bool Initialize(std::string* out_error) override;
  /// 启动工作线程；重复调用无副作用。
  void Start() override;
  /// 排空队列后停止全部工作线程（幂等）。
  void Stop() override;
  ComponentHealth HealthCheck() const override;

  /// 投递一个决策任务；已停止时返回 false 且不入队。
  bool Submit(const DecisionContext& context);

  /// 非阻塞轮询结果；返回后 `out_results` 持有本轮全部结果。
  void PollResults(std::vector<DecisionResponse>* out_results);

  /// 阻塞直到所有已投递任务处理完毕。
  void WaitIdle();

  bool running() const;
  std::size_t pending() const;

 private:
  void WorkerLoop();

  DecisionProcessor* processor_{nullptr};  ///< 外部注入处理器（不拥有所有权）。
  int worker_threads_{1};
  std::vector<std::thread> workers_;

  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::condition_variable idle_cv_;
  std::queue<DecisionContext> task_queue_;
  std::size_t in_progress_{0};
  bool accepting_{false};
  bool stopping_{false};

  std::mutex result_mutex_;
  std::vector<DecisionResponse> results_;
};

}  // namespace reentry
