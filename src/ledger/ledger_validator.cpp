#include "ledger/ledger_validator.h"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <sstream>
#include <utility>

namespace reentry {

namespace {

void AddIssue(ValidationReport* report,
              LedgerIssueKind kind,
              std::size_t row,
              std::string field,
              std::string message) {
  report->issues.push_back(LedgerIssue{.kind = kind,
                                       .row = row,
                                       .field = std::move(field),
                                       .message = std::move(message)});
}

void CheckHeader(const std::vector<std::string>& header,
                 const LedgerSchema& schema,
                 bool declared_schema,
                 ValidationReport* report) {
  std::map<std::string, int> seen;
  for (const auto& name : header) {
    if (++seen[name] == 2) {
      AddIssue(report, LedgerIssueKind::kHeader, 0, name, "表头列重复");
    }
  }
  for (const auto& field : schema.fields) {
    if (seen.find(field.name) == seen.end()) {
      AddIssue(report, LedgerIssueKind::kHeader, 0, field.name, "表头缺少列");
    }
  }
  if (!declared_schema) {
    return;
  }
  bool all_known = true;
  for (const auto& name : header) {
    if (schema.FindField(name) == nullptr) {
      all_known = false;
      AddIssue(report, LedgerIssueKind::kHeader, 0, name, "表头包含未声明列");
    }
  }
  if (all_known && header.size() == schema.fields.size() && header != schema.Header()) {
    AddIssue(report, LedgerIssueKind::kHeader, 0, "", "表头列顺序与记录结构不一致");
  }
}

}  // namespace

const char* ToString(LedgerIssueKind kind) {
  switch (kind) {
    case LedgerIssueKind::kIo:
      return "IO";
    case LedgerIssueKind::kFileName:
      return "FileName";
    case LedgerIssueKind::kHeader:
      return "Header";
    case LedgerIssueKind::kShape:
      return "Shape";
    case LedgerIssueKind::kFieldType:
      return "FieldType";
    case LedgerIssueKind::kChecksumFormat:
      return "ChecksumFormat";
    case LedgerIssueKind::kChecksumMismatch:
      return "ChecksumMismatch";
    case LedgerIssueKind::kSequenceViolation:
      return "SequenceViolation";
  }
  return "Unknown";
}

ValidationReport LedgerValidator::Verify(const std::string& file_path) const {
  const std::string file_name = std::filesystem::path(file_path).filename().string();
  const auto record_type = ParseLedgerFileName(file_name);
  const LedgerSchema* schema =
      record_type.has_value() ? FindLedgerSchema(*record_type) : nullptr;

  std::ifstream in(file_path, std::ios::binary);
  if (!in.is_open()) {
    ValidationReport report;
    report.file_path = file_path;
    report.record_type = record_type.value_or("");
    AddIssue(&report, LedgerIssueKind::kIo, 0, "", "无法读取文件: " + file_path);
    return report;
  }
  const std::string text((std::istreambuf_iterator<char>(in)),
                         std::istreambuf_iterator<char>());
  ValidationReport report = VerifyText(file_path, text, schema);
  if (record_type.has_value()) {
    report.record_type = *record_type;
  } else {
    AddIssue(&report, LedgerIssueKind::kFileName, 0, "",
             "文件名不符合 <record_type>_<YYYYMMDD>_<HHMMSS>.csv: " + file_name);
    report.passed = false;
  }
  return report;
}

ValidationReport LedgerValidator::Verify(const std::string& file_path,
                                         const LedgerSchema& schema) const {
  std::ifstream in(file_path, std::ios::binary);
  if (!in.is_open()) {
    ValidationReport report;
    report.file_path = file_path;
    report.record_type = schema.record_type;
    AddIssue(&report, LedgerIssueKind::kIo, 0, "", "无法读取文件: " + file_path);
    return report;
  }
  const std::string text((std::istreambuf_iterator<char>(in)),
                         std::istreambuf_iterator<char>());
  return VerifyText(file_path, text, &schema);
}

std::vector<ValidationReport> LedgerValidator::VerifyDirectory(
    const std::string& directory) const {
  std::vector<ValidationReport> reports;
  std::vector<std::string> files;
  std::error_code ec;
  std::filesystem::directory_iterator it(directory, ec);
  if (ec) {
    ValidationReport report;
    report.file_path = directory;
    AddIssue(&report, LedgerIssueKind::kIo, 0, "",
             "无法打开目录: " + directory + " (" + ec.message() + ")");
    reports.push_back(std::move(report));
    return reports;
  }
  for (const auto& entry : it) {
    if (entry.is_regular_file(ec) && entry.path().extension() == ".csv") {
      files.push_back(entry.path().string());
    }
  }
  std::sort(files.begin(), files.end());
  for (const auto& file : files) {
    reports.push_back(Verify(file));
  }
  return reports;
}

ValidationReport LedgerValidator::VerifyText(const std::string& file_path,
                                             const std::string& text,
                                             const LedgerSchema* schema) const {
  ValidationReport report;
  report.file_path = file_path;
  if (schema != nullptr) {
    report.record_type = schema->record_type;
  }

  std::vector<std::vector<std::string>> records;
  std::string decode_error;
  if (!DecodeCsv(text, &records, &decode_error)) {
    AddIssue(&report, LedgerIssueKind::kShape, 0, "", decode_error);
    return report;
  }
  if (records.empty()) {
    AddIssue(&report, LedgerIssueKind::kHeader, 0, "", "文件为空，缺少表头");
    return report;
  }

  const std::vector<std::string>& header = records.front();
  const LedgerSchema effective = schema != nullptr ? *schema : GenericLedgerSchema(header);
  CheckHeader(header, effective, schema != nullptr, &report);

  const bool has_checksum =
      std::find(header.begin(), header.end(), kChecksumField) != header.end();
  const bool has_seq = std::find(header.begin(), header.end(), kFileSeqField) != header.end();
  std::optional<std::uint64_t> previous_seq;

  for (std::size_t r = 1; r < records.size(); ++r) {
    const std::vector<std::string>& cells = records[r];
    const std::size_t row_number = r;
    const std::size_t issues_before = report.issues.size();
    ++report.total_rows;

    if (cells == header) {
      AddIssue(&report, LedgerIssueKind::kShape, row_number, "", "重复表头行");
      ++report.invalid_rows;
      continue;
    }
    if (cells.size() != header.size()) {
      AddIssue(&report, LedgerIssueKind::kShape, row_number, "",
               "列数 " + std::to_string(cells.size()) + " 与表头 " +
                   std::to_string(header.size()) + " 不一致");
      ++report.invalid_rows;
      continue;
    }

    LedgerRow row;
    for (std::size_t c = 0; c < header.size(); ++c) {
      row.emplace(header[c], cells[c]);
    }

    bool checksum_well_formed = false;
    for (const auto& field : effective.fields) {
      const auto cell = row.find(field.name);
      if (cell == row.end()) {
        continue;
      }
      std::string reason;
      if (field.type == LedgerFieldType::kChecksum) {
        checksum_well_formed = IsChecksumText(cell->second);
        if (!checksum_well_formed) {
          AddIssue(&report, LedgerIssueKind::kChecksumFormat, row_number, field.name,
                   "校验和不是 64 位小写十六进制");
        }
      } else if (!CheckLedgerCell(field, cell->second, &reason)) {
        AddIssue(&report, LedgerIssueKind::kFieldType, row_number, field.name, reason);
      }
    }

    if (has_checksum && checksum_well_formed && !VerifyRecordChecksum(row)) {
      AddIssue(&report, LedgerIssueKind::kChecksumMismatch, row_number, kChecksumField,
               "校验和与行内容不一致");
    }

    if (has_seq) {
      const std::string& seq_text = row[kFileSeqField];
      std::optional<std::uint64_t> seq;
      if (!seq_text.empty() && seq_text.front() != '-') {
        try {
          std::size_t consumed = 0;
          const std::uint64_t parsed = std::stoull(seq_text, &consumed);
          if (consumed == seq_text.size()) {
            seq = parsed;
          }
        } catch (const std::exception&) {
          seq.reset();
        }
      }
      if (seq.has_value()) {
        if (previous_seq.has_value() && *seq <= *previous_seq) {
          AddIssue(&report, LedgerIssueKind::kSequenceViolation, row_number,
                   kFileSeqField,
                   "file_seq 未严格递增: " + std::to_string(*previous_seq) + " -> " +
                       std::to_string(*seq));
        }
        if (!report.first_seq.has_value()) {
          report.first_seq = seq;
        }
        report.last_seq = seq;
        previous_seq = seq;
      }
    }

    if (report.issues.size() == issues_before) {
      ++report.valid_rows;
    } else {
      ++report.invalid_rows;
    }
  }

  report.passed = report.issues.empty();
  return report;
}

std::string FormatValidationReport(const ValidationReport& report) {
  std::ostringstream oss;
  oss << (report.passed ? "PASS" : "FAIL") << " " << report.file_path
      << " record_type=" << (report.record_type.empty() ? "-" : report.record_type)
      << " rows=" << report.total_rows << " valid=" << report.valid_rows
      << " invalid=" << report.invalid_rows;
  if (report.first_seq.has_value()) {
    oss << " file_seq=" << *report.first_seq << ".." << *report.last_seq;
  }
  oss << "\n";
  for (const auto& issue : report.issues) {
    oss << "  [" << ToString(issue.kind) << "]";
    if (issue.row > 0) {
      oss << " row=" << issue.row;
    }
    if (!issue.field.empty()) {
      oss << " field=" << issue.field;
    }
    oss << " " << issue.message << "\n";
  }
  return oss.str();
}

}  // namespace reentry
