#include "ledger/ledger_schema.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <iomanip>
#include <sstream>
#include <utility>

#include "core/digest.h"

namespace reentry {

namespace {

constexpr char kChecksumJoiner = '|';

std::vector<LedgerField> SystemFields() {
  return {
      {kFileSeqField, LedgerFieldType::kInteger, true},
      {kChecksumField, LedgerFieldType::kChecksum, true},
      {kTimestampField, LedgerFieldType::kTimestamp, true},
  };
}

LedgerSchema MakeSchema(std::string record_type, std::vector<LedgerField> record_fields) {
  LedgerSchema schema;
  schema.record_type = std::move(record_type);
  schema.fields = SystemFields();
  schema.fields.insert(schema.fields.end(), record_fields.begin(), record_fields.end());
  return schema;
}

bool AllDigits(std::string_view text) {
  return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char ch) {
    return std::isdigit(ch) != 0;
  });
}

bool DigitsAt(std::string_view text, std::size_t pos, std::size_t count) {
  return pos + count <= text.size() && AllDigits(text.substr(pos, count));
}

}  // namespace

const char* ToString(LedgerFieldType type) {
  switch (type) {
    case LedgerFieldType::kInteger:
      return "integer";
    case LedgerFieldType::kDecimal:
      return "decimal";
    case LedgerFieldType::kText:
      return "text";
    case LedgerFieldType::kTimestamp:
      return "timestamp";
    case LedgerFieldType::kChecksum:
      return "checksum";
  }
  return "unknown";
}

std::vector<std::string> LedgerSchema::Header() const {
  std::vector<std::string> header;
  header.reserve(fields.size());
  for (const auto& field : fields) {
    header.push_back(field.name);
  }
  return header;
}

const LedgerField* LedgerSchema::FindField(std::string_view name) const {
  for (const auto& field : fields) {
    if (field.name == name) {
      return &field;
    }
  }
  return nullptr;
}

std::vector<std::string> LedgerSchema::RecordFieldNames() const {
  std::vector<std::string> names;
  for (const auto& field : fields) {
    if (field.name != kFileSeqField && field.name != kChecksumField &&
        field.name != kTimestampField) {
      names.push_back(field.name);
    }
  }
  return names;
}

const LedgerSchema& ReentryDecisionSchema() {
  static const LedgerSchema kSchema = MakeSchema(
      "reentry_decisions",
      {
          {"trade_id", LedgerFieldType::kText, true},
          {"hybrid_id", LedgerFieldType::kText, true},
          {"symbol", LedgerFieldType::kText, true},
          {"outcome_class", LedgerFieldType::kText, true},
          {"duration_class", LedgerFieldType::kText, true},
          {"reentry_action", LedgerFieldType::kText, true},
          {"parameter_set_id", LedgerFieldType::kText, true},
          {"resolved_tier", LedgerFieldType::kText, true},
          {"chain_position", LedgerFieldType::kText, true},
          {"lot_size", LedgerFieldType::kDecimal, true},
          {"stop_loss", LedgerFieldType::kDecimal, true},
          {"take_profit", LedgerFieldType::kDecimal, true},
      });
  return kSchema;
}

const LedgerSchema& TradeResultSchema() {
  static const LedgerSchema kSchema = MakeSchema(
      "trade_results",
      {
          {"trade_id", LedgerFieldType::kText, true},
          {"symbol", LedgerFieldType::kText, true},
          {"direction", LedgerFieldType::kText, true},
          {"lot_size", LedgerFieldType::kDecimal, true},
          {"open_price", LedgerFieldType::kDecimal, true},
          {"close_price", LedgerFieldType::kDecimal, true},
          {"open_time", LedgerFieldType::kTimestamp, true},
          {"close_time", LedgerFieldType::kTimestamp, true},
          {"duration_minutes", LedgerFieldType::kDecimal, true},
          {"profit_loss", LedgerFieldType::kDecimal, true},
          {"profit_loss_pips", LedgerFieldType::kDecimal, true},
          {"stop_loss", LedgerFieldType::kDecimal, false},
          {"take_profit", LedgerFieldType::kDecimal, false},
          {"close_reason", LedgerFieldType::kText, false},
          {"commission", LedgerFieldType::kDecimal, false},
          {"swap", LedgerFieldType::kDecimal, false},
          {"magic_number", LedgerFieldType::kInteger, false},
          {"comment", LedgerFieldType::kText, false},
      });
  return kSchema;
}

const LedgerSchema* FindLedgerSchema(std::string_view record_type) {
  if (record_type == ReentryDecisionSchema().record_type) {
    return &ReentryDecisionSchema();
  }
  if (record_type == TradeResultSchema().record_type) {
    return &TradeResultSchema();
  }
  return nullptr;
}

std::optional<std::string> ParseLedgerFileName(std::string_view file_name) {
  // `_YYYYMMDD_HHMMSS.csv` 固定 20 字节。
  constexpr std::size_t kSuffixLength = 20;
  if (file_name.size() <= kSuffixLength) {
    return std::nullopt;
  }
  const std::size_t stamp = file_name.size() - kSuffixLength;
  if (file_name[stamp] != '_' || !DigitsAt(file_name, stamp + 1, 8) ||
      file_name[stamp + 9] != '_' || !DigitsAt(file_name, stamp + 10, 6) ||
      file_name.substr(stamp + 16) != ".csv") {
    return std::nullopt;
  }
  return std::string(file_name.substr(0, stamp));
}

LedgerSchema GenericLedgerSchema(const std::vector<std::string>& header) {
  LedgerSchema schema;
  schema.record_type = "generic";
  const std::vector<LedgerField> system_fields = SystemFields();
  for (const auto& name : header) {
    const auto it = std::find_if(system_fields.begin(), system_fields.end(),
                                 [&](const LedgerField& field) {
                                   return field.name == name;
                                 });
    if (it != system_fields.end()) {
      schema.fields.push_back(*it);
    } else {
      schema.fields.push_back({name, LedgerFieldType::kText, false});
    }
  }
  return schema;
}

bool ComputeRecordChecksum(const LedgerRow& row,
                           std::string* out_checksum,
                           std::string* out_error) {
  // std::map 已按键字节序排列。
  std::string payload;
  bool first = true;
  for (const auto& [name, value] : row) {
    if (name == kChecksumField) {
      continue;
    }
    if (!first) {
      payload.push_back(kChecksumJoiner);
    }
    payload += value;
    first = false;
  }
  return Sha256Hex(payload, out_checksum, out_error);
}

bool VerifyRecordChecksum(const LedgerRow& row) {
  const auto it = row.find(kChecksumField);
  if (it == row.end() || !IsChecksumText(it->second)) {
    return false;
  }
  std::string expected;
  if (!ComputeRecordChecksum(row, &expected, nullptr)) {
    return false;
  }
  return expected == it->second;
}

bool IsChecksumText(std::string_view text) {
  return text.size() == 64U &&
         std::all_of(text.begin(), text.end(), [](unsigned char ch) {
           return std::isdigit(ch) != 0 || (ch >= 'a' && ch <= 'f');
         });
}

bool IsIsoTimestamp(std::string_view text) {
  // YYYY-MM-DDTHH:MM:SS
  if (text.size() < 19U || !DigitsAt(text, 0, 4) || text[4] != '-' ||
      !DigitsAt(text, 5, 2) || text[7] != '-' || !DigitsAt(text, 8, 2) ||
      (text[10] != 'T' && text[10] != ' ') || !DigitsAt(text, 11, 2) ||
      text[13] != ':' || !DigitsAt(text, 14, 2) || text[16] != ':' ||
      !DigitsAt(text, 17, 2)) {
    return false;
  }
  const int month = std::stoi(std::string(text.substr(5, 2)));
  const int day = std::stoi(std::string(text.substr(8, 2)));
  const int hour = std::stoi(std::string(text.substr(11, 2)));
  const int minute = std::stoi(std::string(text.substr(14, 2)));
  const int second = std::stoi(std::string(text.substr(17, 2)));
  if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
      second > 60) {
    return false;
  }
  std::size_t pos = 19;
  if (pos < text.size() && text[pos] == '.') {
    const std::size_t begin = ++pos;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
      ++pos;
    }
    if (pos == begin) {
      return false;
    }
  }
  if (pos == text.size()) {
    return true;
  }
  if (text[pos] == 'Z') {
    return pos + 1 == text.size();
  }
  if (text[pos] == '+' || text[pos] == '-') {
    return pos + 6 == text.size() && DigitsAt(text, pos + 1, 2) &&
           text[pos + 3] == ':' && DigitsAt(text, pos + 4, 2);
  }
  return false;
}

bool CheckLedgerCell(const LedgerField& field,
                     std::string_view cell,
                     std::string* out_reason) {
  const auto fail = [&](const std::string& reason) {
    if (out_reason != nullptr) {
      *out_reason = reason;
    }
    return false;
  };
  if (cell.empty()) {
    return field.required ? fail("必填字段为空") : true;
  }
  switch (field.type) {
    case LedgerFieldType::kText:
      return true;
    case LedgerFieldType::kChecksum:
      return IsChecksumText(cell) ? true : fail("不是 64 位小写十六进制");
    case LedgerFieldType::kTimestamp:
      return IsIsoTimestamp(cell) ? true : fail("不是 ISO-8601 时间: " + std::string(cell));
    case LedgerFieldType::kInteger: {
      const std::string_view digits = cell.front() == '-' ? cell.substr(1) : cell;
      return AllDigits(digits) ? true : fail("不是整数: " + std::string(cell));
    }
    case LedgerFieldType::kDecimal: {
      const std::string text(cell);
      try {
        std::size_t consumed = 0;
        const double value = std::stod(text, &consumed);
        if (consumed != text.size() || !std::isfinite(value)) {
          return fail("不是有限小数: " + text);
        }
      } catch (const std::exception&) {
        return fail("不是有限小数: " + text);
      }
      return true;
    }
  }
  return fail("未知字段类型");
}

std::string FormatDecimal(double value, int precision) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << value;
  std::string text = oss.str();
  if (text.find('.') != std::string::npos) {
    while (!text.empty() && text.back() == '0') {
      text.pop_back();
    }
    if (!text.empty() && text.back() == '.') {
      text.pop_back();
    }
  }
  if (text == "-0") {
    text = "0";
  }
  return text;
}

std::string EncodeCsvCell(std::string_view cell) {
  if (cell.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string(cell);
  }
  std::string quoted = "\"";
  for (const char ch : cell) {
    if (ch == '"') {
      quoted.push_back('"');
    }
    quoted.push_back(ch);
  }
  quoted.push_back('"');
  return quoted;
}

std::string EncodeCsvRow(const std::vector<std::string>& cells) {
  std::string line;
  for (std::size_t i = 0; i < cells.size(); ++i) {
    if (i > 0) {
      line.push_back(',');
    }
    line += EncodeCsvCell(cells[i]);
  }
  return line;
}

bool DecodeCsv(std::string_view text,
               std::vector<std::vector<std::string>>* out_records,
               std::string* out_error) {
  if (out_records == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_records 为空";
    }
    return false;
  }
  std::vector<std::vector<std::string>> records;
  std::vector<std::string> record;
  std::string cell;
  bool in_quotes = false;
  bool cell_quoted = false;
  std::size_t line = 1;

  const auto finish_record = [&]() {
    record.push_back(std::move(cell));
    cell.clear();
    // 空行不构成记录。
    if (!(record.size() == 1U && record.front().empty() && !cell_quoted)) {
      records.push_back(std::move(record));
    }
    record.clear();
    cell_quoted = false;
  };

  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (in_quotes) {
      if (ch == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          cell.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        if (ch == '\n') {
          ++line;
        }
        cell.push_back(ch);
      }
      continue;
    }
    if (ch == '"' && cell.empty() && !cell_quoted) {
      in_quotes = true;
      cell_quoted = true;
    } else if (ch == ',') {
      record.push_back(std::move(cell));
      cell.clear();
      cell_quoted = false;
    } else if (ch == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
      continue;
    } else if (ch == '\n') {
      finish_record();
      ++line;
    } else {
      cell.push_back(ch);
    }
  }
  if (in_quotes) {
    if (out_error != nullptr) {
      *out_error = "引号未闭合，行号: " + std::to_string(line);
    }
    return false;
  }
  if (!cell.empty() || !record.empty() || cell_quoted) {
    finish_record();
  }
  *out_records = std::move(records);
  return true;
}

}  // namespace reentry
