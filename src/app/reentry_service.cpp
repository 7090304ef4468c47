#include "app/reentry_service.h"

#include <utility>

#include "core/log.h"
#include "core/time_utils.h"
#include "ledger/ledger_schema.h"

namespace reentry {

ReentryService::ReentryService(ReentryConfig config, Clock clock)
    : config_(std::move(config)),
      clock_(clock ? std::move(clock) : Clock(CurrentTimestampMs)) {}

ReentryService::~ReentryService() {
  Stop();
}

bool ReentryService::Initialize(std::string* out_error) {
  if (initialized_) {
    return true;
  }
  std::string error;
  if (!ValidateReentryConfig(config_, &error)) {
    if (out_error != nullptr) {
      *out_error = "配置非法: " + error;
    }
    return false;
  }

  vocabulary_ = BuildVocabulary(config_.vocabulary, &error);
  if (!vocabulary_) {
    if (out_error != nullptr) {
      *out_error = error;
    }
    return false;
  }
  codec_ = std::make_unique<HybridIdCodec>(vocabulary_);
  resolver_ = std::make_unique<TieredResolver>(config_.resolver, vocabulary_);
  if (config_.ledger.enabled) {
    ledger_ = std::make_unique<IntegrityLedger>(config_.ledger, ReentryDecisionSchema(),
                                                clock_);
  }
  tracker_ = std::make_unique<ReentryTracker>(
      config_.processor.reentry_cooldown_minutes,
      config_.processor.max_reentry_attempts_per_day, clock_);
  processor_ = std::make_unique<DecisionProcessor>(config_.processor, *codec_, *resolver_,
                                                   *tracker_, ledger_.get());
  executor_ = std::make_unique<DecisionExecutor>(processor_.get(),
                                                 config_.service.worker_threads);

  components_.clear();
  components_.push_back(resolver_.get());
  if (ledger_) {
    components_.push_back(ledger_.get());
  }
  components_.push_back(executor_.get());

  for (ServiceComponent* component : components_) {
    if (!component->Initialize(&error)) {
      if (out_error != nullptr) {
        *out_error = std::string(component->component_name()) + " 初始化失败: " + error;
      }
      LogError("SERVICE_INIT_FAILED: component=" +
               std::string(component->component_name()) + " error=" + error);
      return false;
    }
  }
  initialized_ = true;
  LogInfo("SERVICE_INITIALIZED: name=" + config_.service.name +
          " ledger=" + (ledger_ ? config_.ledger.output_directory : std::string("disabled")) +
          " workers=" + std::to_string(config_.service.worker_threads));
  return true;
}

void ReentryService::Start() {
  if (!initialized_ || started_) {
    return;
  }
  for (ServiceComponent* component : components_) {
    component->Start();
  }
  started_ = true;
  LogInfo("SERVICE_STARTED: name=" + config_.service.name);
}

void ReentryService::Stop() {
  if (!started_) {
    return;
  }
  for (auto it = components_.rbegin(); it != components_.rend(); ++it) {
    (*it)->Stop();
  }
  started_ = false;
  LogInfo("SERVICE_STOPPED: name=" + config_.service.name);
}

DecisionResponse ReentryService::Process(const DecisionContext& context) {
  if (!initialized_) {
    DecisionResponse response;
    response.trade_id = context.trade_id;
    response.symbol = context.symbol;
    response.reason = "service not initialized";
    return response;
  }
  return processor_->Process(context);
}

std::vector<DecisionResponse> ReentryService::ProcessBatch(
    const std::vector<DecisionContext>& contexts) {
  std::vector<DecisionResponse> responses;
  responses.reserve(contexts.size());
  for (const auto& context : contexts) {
    responses.push_back(Process(context));
  }
  return responses;
}

bool ReentryService::Submit(const DecisionContext& context) {
  return started_ && executor_->Submit(context);
}

void ReentryService::PollResults(std::vector<DecisionResponse>* out_results) {
  if (!executor_) {
    if (out_results != nullptr) {
      out_results->clear();
    }
    return;
  }
  executor_->PollResults(out_results);
}

void ReentryService::WaitIdle() {
  if (executor_) {
    executor_->WaitIdle();
  }
}

bool ReentryService::ReloadParameterSets(std::string* out_error) {
  if (!resolver_) {
    if (out_error != nullptr) {
      *out_error = "service not initialized";
    }
    return false;
  }
  return resolver_->Reload(out_error);
}

std::vector<ComponentHealth> ReentryService::HealthCheck() const {
  std::vector<ComponentHealth> out;
  out.reserve(components_.size());
  for (const ServiceComponent* component : components_) {
    out.push_back(component->HealthCheck());
  }
  return out;
}

}  // namespace reentry
