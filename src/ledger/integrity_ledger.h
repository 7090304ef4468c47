#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include "core/config.h"
#include "core/service_component.h"
#include "ledger/ledger_schema.h"

namespace reentry {

/// 追加结果：失败时 `error` 为可直接展示的原因，且没有任何行被提交。
struct LedgerWriteResult {
  bool success{false};
  std::uint64_t file_seq{0};
  std::string checksum;
  std::string file_path;
  std::string timestamp;
  std::string error;
};

/**
 * @brief 完整性账本（追加写、校验和保护、序号有序）
 *
 * 每次追加：
 * 1. 在同一把锁内分配序号、计算校验和并完成写入；
 * 2. 新文件写 `<final>.tmp`（表头+行），fsync 后 rename；
 *    已有文件以 O_APPEND 只写新行后 fsync，失败截回原长度；
 * 3. 成功后才推进序号，失败不留空洞也不重复。
 *
 * 文件名 `<record_type>_<YYYYMMDD>_<HHMMSS>.csv`（UTC，文件开启时刻），
 * 超过 `rotation_hours` 或 `max_file_size_mb` 后轮转。
 */
class IntegrityLedger : public ServiceComponent {
 public:
  using Clock = std::function<std::int64_t()>;

  IntegrityLedger(LedgerConfig config, const LedgerSchema& schema, Clock clock = {});

  const char* component_name() const override { return "ledger"; }
  /// 创建输出目录。
  bool Initialize(std::string* out_error) override;
  void Start() override {}
  void Stop() override {}
  /// 输出目录不可用为 unhealthy；最近一次写入失败为 degraded。
  ComponentHealth HealthCheck() const override;

  /**
   * @brief 追加一条记录
   *
   * @param fields 业务列（不含 file_seq/checksum_sha256/timestamp），须与结构完全一致
   */
  LedgerWriteResult Append(const LedgerRow& fields);

  /// 最近一次成功写入的序号；尚未写入为 0。
  std::uint64_t last_sequence() const;
  std::string current_file() const;
  const LedgerSchema& schema() const { return schema_; }

 private:
  bool EnsureFileLocked(std::int64_t now_ms, std::string* out_error);
  bool AdoptExistingFileLocked(const std::string& path, std::string* out_error);

  LedgerConfig config_;
  const LedgerSchema& schema_;
  Clock clock_;

  mutable std::mutex mutex_;
  std::uint64_t next_seq_{1};
  std::string current_file_;
  std::int64_t file_started_ms_{0};
  std::uintmax_t current_size_{0};
  std::uint64_t write_failures_{0};
  bool last_write_failed_{false};
};

}  // namespace reentry
