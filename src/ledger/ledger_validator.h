#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ledger/ledger_schema.h"

namespace reentry {

/// 校验问题分类。
enum class LedgerIssueKind {
  kIo,
  kFileName,
  kHeader,
  kShape,
  kFieldType,
  kChecksumFormat,
  kChecksumMismatch,
  kSequenceViolation,
};

const char* ToString(LedgerIssueKind kind);

struct LedgerIssue {
  LedgerIssueKind kind{LedgerIssueKind::kShape};
  std::size_t row{0};  ///< 数据行号（从 1 开始）；0 表示文件级问题。
  std::string field;
  std::string message;
};

/// 单文件校验报告。
struct ValidationReport {
  std::string file_path;
  std::string record_type;
  bool passed{false};
  std::size_t total_rows{0};
  std::size_t valid_rows{0};
  std::size_t invalid_rows{0};
  std::optional<std::uint64_t> first_seq;
  std::optional<std::uint64_t> last_seq;
  std::vector<LedgerIssue> issues;
};

/**
 * @brief 账本独立校验器
 *
 * 不依赖写入方的任何状态：按文件名识别记录结构（未知类型退化为通用结构），
 * 校验表头、每行形状与类型、校验和以及 file_seq 严格递增，
 * 汇总全部问题而非遇错即停。只读，不修改被检查文件。
 */
class LedgerValidator {
 public:
  ValidationReport Verify(const std::string& file_path) const;
  /// 指定结构校验（忽略文件名推断）。
  ValidationReport Verify(const std::string& file_path, const LedgerSchema& schema) const;
  /// 校验目录下全部 `*.csv`（按文件名排序）；`.tmp` 文件忽略。
  std::vector<ValidationReport> VerifyDirectory(const std::string& directory) const;

 private:
  ValidationReport VerifyText(const std::string& file_path,
                              const std::string& text,
                              const LedgerSchema* schema) const;
};

/// 人类可读的报告文本（CLI 输出）。
std::string FormatValidationReport(const ValidationReport& report);

}  // namespace reentry
