#include "processor/decision_executor.h"

#include <algorithm>
#include <utility>

#include "core/log.h"

namespace reentry {

DecisionExecutor::DecisionExecutor(DecisionProcessor* processor, int worker_threads)
    : processor_(processor), worker_threads_(std::max(worker_threads, 1)) {}

DecisionExecutor::~DecisionExecutor() {
  Stop();
}

bool DecisionExecutor::Initialize(std::string* out_error) {
  if (processor_ == nullptr) {
    if (out_error != nullptr) {
      *out_error = "决策执行器未注入处理器";
    }
    return false;
  }
  return true;
}

ComponentHealth DecisionExecutor::HealthCheck() const {
  ComponentHealth health;
  health.component = component_name();
  std::lock_guard<std::mutex> lock(queue_mutex_);
  if (!accepting_) {
    health.state = HealthState::kDegraded;
    health.detail = "stopped";
  } else {
    health.detail = "workers=" + std::to_string(workers_.size()) +
                    " pending=" + std::to_string(task_queue_.size() + in_progress_);
  }
  return health;
}

void DecisionExecutor::Start() {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  if (!workers_.empty()) {
    return;
  }
  accepting_ = true;
  stopping_ = false;
  for (int i = 0; i < worker_threads_; ++i) {
    workers_.emplace_back(&DecisionExecutor::WorkerLoop, this);
  }
  LogInfo("DECISION_EXECUTOR_STARTED: workers=" + std::to_string(worker_threads_));
}

void DecisionExecutor::Stop() {
  std::vector<std::thread> workers;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    accepting_ = false;
    stopping_ = true;
    workers.swap(workers_);
  }
  queue_cv_.notify_all();
  for (auto& worker : workers) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  if (!workers.empty()) {
    LogInfo("DECISION_EXECUTOR_STOPPED");
  }
}

bool DecisionExecutor::Submit(const DecisionContext& context) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!accepting_) {
      return false;
    }
    task_queue_.push(context);
  }
  queue_cv_.notify_one();
  return true;
}

void DecisionExecutor::PollResults(std::vector<DecisionResponse>* out_results) {
  if (out_results == nullptr) {
    return;
  }
  out_results->clear();
  std::lock_guard<std::mutex> lock(result_mutex_);
  if (results_.empty()) {
    return;
  }
  out_results->swap(results_);
}

void DecisionExecutor::WaitIdle() {
  std::unique_lock<std::mutex> lock(queue_mutex_);
  idle_cv_.wait(lock, [this] { return task_queue_.empty() && in_progress_ == 0; });
}

bool DecisionExecutor::running() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return accepting_;
}

std::size_t DecisionExecutor::pending() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return task_queue_.size() + in_progress_;
}

void DecisionExecutor::WorkerLoop() {
  while (true) {
    DecisionContext context;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] { return stopping_ || !task_queue_.empty(); });
      // 停止时先排空队列，已投递任务不丢弃。
      if (task_queue_.empty()) {
        break;
      }
      context = std::move(task_queue_.front());
      task_queue_.pop();
      ++in_progress_;
    }

    DecisionResponse response;
    if (processor_ != nullptr) {
      response = processor_->Process(context);
    } else {
      response.trade_id = context.trade_id;
      response.symbol = context.symbol;
      response.reason = "processor not configured";
    }
    {
      std::lock_guard<std::mutex> lock(result_mutex_);
      results_.push_back(std::move(response));
    }
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      --in_progress_;
    }
    idle_cv_.notify_all();
  }
}

}  // namespace reentry
