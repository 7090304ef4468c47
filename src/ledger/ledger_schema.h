#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reentry {

inline constexpr const char* kFileSeqField = "file_seq";
inline constexpr const char* kChecksumField = "checksum_sha256";
inline constexpr const char* kTimestampField = "timestamp";

/// 账本列类型：决定校验器的类型检查方式。
enum class LedgerFieldType {
  kInteger,
  kDecimal,
  kText,
  kTimestamp,
  kChecksum,
};

const char* ToString(LedgerFieldType type);

struct LedgerField {
  std::string name;
  LedgerFieldType type{LedgerFieldType::kText};
  bool required{true};  ///< false 时允许空单元格。
};

/**
 * @brief 账本记录结构
 *
 * `fields` 为完整列序，前三列固定为 `file_seq, checksum_sha256, timestamp`。
 */
struct LedgerSchema {
  std::string record_type;
  std::vector<LedgerField> fields;

  std::vector<std::string> Header() const;
  const LedgerField* FindField(std::string_view name) const;
  /// 除前三个系统列外的业务列名。
  std::vector<std::string> RecordFieldNames() const;
};

/// 一行记录：列名 -> 单元格文本（CSV 引号处理之前的原文）。
using LedgerRow = std::map<std::string, std::string>;

const LedgerSchema& ReentryDecisionSchema();
const LedgerSchema& TradeResultSchema();

/// 按记录类型查找内置结构；未知返回 `nullptr`。
const LedgerSchema* FindLedgerSchema(std::string_view record_type);

/**
 * @brief 解析账本文件名 `<record_type>_<YYYYMMDD>_<HHMMSS>.csv`
 *
 * 成功时返回 record_type；格式不符返回空。
 */
std::optional<std::string> ParseLedgerFileName(std::string_view file_name);

/// 由表头构造通用结构：系统列按固定类型，其余列视为可空文本。
LedgerSchema GenericLedgerSchema(const std::vector<std::string>& header);

/**
 * @brief 计算行校验和
 *
 * 取除 `checksum_sha256` 外的全部列，按列名字节序排序，
 * 以 `|` 连接各单元格文本后做 SHA-256，输出 64 位小写十六进制。
 */
bool ComputeRecordChecksum(const LedgerRow& row,
                           std::string* out_checksum,
                           std::string* out_error);

/// 重新计算并比对行内 `checksum_sha256`。
bool VerifyRecordChecksum(const LedgerRow& row);

/// 64 位小写十六进制。
bool IsChecksumText(std::string_view text);

/// ISO-8601 时刻：`YYYY-MM-DDTHH:MM:SS[.f+][Z|±HH:MM]`。
bool IsIsoTimestamp(std::string_view text);

/// 单元格类型检查；失败时 `out_reason` 给出原因。
bool CheckLedgerCell(const LedgerField& field,
                     std::string_view cell,
                     std::string* out_reason);

/// 定点格式化并去除尾随零（`1.50000` -> `1.5`，`2.0` -> `2`）。
std::string FormatDecimal(double value, int precision = 8);

/// RFC-4180 单元格编码：含 `,` `"` 或换行时加引号并双写内部引号。
std::string EncodeCsvCell(std::string_view cell);
/// 编码一整行（不含行尾换行符）。
std::string EncodeCsvRow(const std::vector<std::string>& cells);

/**
 * @brief RFC-4180 解码
 *
 * 支持引号内换行与 `\r\n` 行尾；末尾空行忽略。引号未闭合返回 false。
 */
bool DecodeCsv(std::string_view text,
               std::vector<std::vector<std::string>>* out_records,
               std::string* out_error);

}  // namespace reentry
