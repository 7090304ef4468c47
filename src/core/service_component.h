#pragma once

#include <string>

namespace reentry {

/// 组件健康状态。
enum class HealthState {
  kHealthy,
  kDegraded,
  kUnhealthy,
};

inline const char* ToString(HealthState state) {
  switch (state) {
    case HealthState::kHealthy:
      return "healthy";
    case HealthState::kDegraded:
      return "degraded";
    case HealthState::kUnhealthy:
      return "unhealthy";
  }
  return "unknown";
}

struct ComponentHealth {
  std::string component;
  HealthState state{HealthState::kHealthy};
  std::string detail;
};

/**
 * @brief 服务组件能力接口
 *
 * 生命周期：Initialize -> Start -> Stop，由持有者（ReentryService）按序驱动。
 * 各组件独立实现，不共享基类状态。
 */
class ServiceComponent {
 public:
  virtual ~ServiceComponent() = default;

  virtual const char* component_name() const = 0;
  /// 一次性初始化；失败时 `out_error` 给出原因，服务启动中止。
  virtual bool Initialize(std::string* out_error) = 0;
  virtual void Start() = 0;
  /// 幂等停止。
  virtual void Stop() = 0;
  virtual ComponentHealth HealthCheck() const = 0;
};

}  // namespace reentry
