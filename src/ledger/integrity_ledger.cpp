#include "ledger/integrity_ledger.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>
#include <vector>

#include "core/log.h"
#include "core/time_utils.h"

namespace reentry {

namespace {

constexpr std::int64_t kMillisPerHour = 60LL * 60 * 1000;
constexpr std::uintmax_t kBytesPerMb = 1024ULL * 1024ULL;

std::string ErrnoText(const std::string& action, const std::string& path) {
  return action + " 失败: " + path + " (" + std::strerror(errno) + ")";
}

bool ReadWholeFile(const std::string& path, std::string* out_text, std::string* out_error) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    if (out_error != nullptr) {
      *out_error = "无法读取账本文件: " + path;
    }
    return false;
  }
  out_text->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) {
    if (out_error != nullptr) {
      *out_error = "读取账本文件失败: " + path;
    }
    return false;
  }
  return true;
}

// 目录 fsync 保证 rename 本身落盘。
bool SyncDirectory(const std::filesystem::path& directory, std::string* out_error) {
  const std::string dir = directory.empty() ? std::string(".") : directory.string();
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    if (out_error != nullptr) {
      *out_error = ErrnoText("打开目录", dir);
    }
    return false;
  }
  const bool ok = ::fsync(fd) == 0;
  if (!ok && out_error != nullptr) {
    *out_error = ErrnoText("fsync 目录", dir);
  }
  ::close(fd);
  return ok;
}

/**
 * @brief 原子替换文件内容
 *
 * 写 `<path>.tmp` -> fsync -> rename -> fsync 目录。
 * rename 之前任一步失败都会删除临时文件，目标文件保持原状。
 */
bool WriteFileAtomically(const std::string& path,
                         const std::string& content,
                         std::string* out_error) {
  const std::string tmp_path = path + ".tmp";
  const int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    if (out_error != nullptr) {
      *out_error = ErrnoText("创建临时文件", tmp_path);
    }
    return false;
  }
  const auto abort_write = [&](const std::string& error) {
    ::close(fd);
    ::unlink(tmp_path.c_str());
    if (out_error != nullptr) {
      *out_error = error;
    }
    return false;
  };

  std::size_t written = 0;
  while (written < content.size()) {
    const ssize_t n = ::write(fd, content.data() + written, content.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return abort_write(ErrnoText("写入临时文件", tmp_path));
    }
    written += static_cast<std::size_t>(n);
  }
  if (::fsync(fd) != 0) {
    return abort_write(ErrnoText("fsync 临时文件", tmp_path));
  }
  if (::close(fd) != 0) {
    ::unlink(tmp_path.c_str());
    if (out_error != nullptr) {
      *out_error = ErrnoText("关闭临时文件", tmp_path);
    }
    return false;
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    ::unlink(tmp_path.c_str());
    if (out_error != nullptr) {
      *out_error = "重命名临时文件失败: " + tmp_path + " (" + ec.message() + ")";
    }
    return false;
  }
  std::string sync_error;
  if (!SyncDirectory(std::filesystem::path(path).parent_path(), &sync_error)) {
    // rename 已生效，行已可见，只能告警。
    LogWarn("LEDGER_DIR_SYNC_FAILED: " + sync_error);
  }
  return true;
}

/**
 * @brief 向已有文件追加一行
 *
 * O_APPEND 写入 -> fsync，开销只与行长有关。写入或 fsync 失败时截回原长度，
 * 文件内不留半行。原文件末尾缺换行时先补一个。
 */
bool AppendToFile(const std::string& path,
                  const std::string& line,
                  std::uintmax_t* out_size,
                  std::string* out_error) {
  const int fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
  if (fd < 0) {
    if (out_error != nullptr) {
      *out_error = ErrnoText("打开账本文件", path);
    }
    return false;
  }
  struct stat st {};
  if (::fstat(fd, &st) != 0) {
    if (out_error != nullptr) {
      *out_error = ErrnoText("读取账本文件大小", path);
    }
    ::close(fd);
    return false;
  }
  const off_t original_size = st.st_size;

  std::string data;
  if (original_size > 0) {
    const int read_fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    char last = '\n';
    if (read_fd >= 0) {
      if (::pread(read_fd, &last, 1, original_size - 1) != 1) {
        last = '\n';
      }
      ::close(read_fd);
    }
    if (last != '\n') {
      data.push_back('\n');
    }
  }
  data += line;

  const auto abort_append = [&](const std::string& error) {
    if (::ftruncate(fd, original_size) != 0) {
      LogError("LEDGER_TRUNCATE_FAILED: file=" + path + " " + ErrnoText("截断", path));
    }
    ::close(fd);
    if (out_error != nullptr) {
      *out_error = error;
    }
    return false;
  };

  std::size_t written = 0;
  while (written < data.size()) {
    const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return abort_append(ErrnoText("追加账本文件", path));
    }
    written += static_cast<std::size_t>(n);
  }
  if (::fsync(fd) != 0) {
    return abort_append(ErrnoText("fsync 账本文件", path));
  }
  if (::close(fd) != 0) {
    // fsync 已成功，行已落盘，只能告警。
    LogWarn("LEDGER_CLOSE_FAILED: " + ErrnoText("关闭账本文件", path));
  }
  *out_size = static_cast<std::uintmax_t>(original_size) + data.size();
  return true;
}

}  // namespace

IntegrityLedger::IntegrityLedger(LedgerConfig config, const LedgerSchema& schema, Clock clock)
    : config_(std::move(config)),
      schema_(schema),
      clock_(clock ? std::move(clock) : Clock(CurrentTimestampMs)) {}

bool IntegrityLedger::Initialize(std::string* out_error) {
  std::error_code ec;
  std::filesystem::create_directories(config_.output_directory, ec);
  if (ec) {
    if (out_error != nullptr) {
      *out_error = "创建账本目录失败: " + config_.output_directory + " (" +
                   ec.message() + ")";
    }
    return false;
  }
  LogInfo("LEDGER_READY: record_type=" + schema_.record_type +
          " directory=" + config_.output_directory);
  return true;
}

LedgerWriteResult IntegrityLedger::Append(const LedgerRow& fields) {
  LedgerWriteResult result;
  const std::vector<std::string> record_fields = schema_.RecordFieldNames();
  for (const auto& name : record_fields) {
    if (fields.find(name) == fields.end()) {
      result.error = "记录缺少字段: " + name;
      return result;
    }
  }
  if (fields.size() != record_fields.size()) {
    for (const auto& [name, value] : fields) {
      (void)value;
      if (schema_.FindField(name) == nullptr || name == kFileSeqField ||
          name == kChecksumField || name == kTimestampField) {
        result.error = "记录包含未声明字段: " + name;
        return result;
      }
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const std::int64_t now_ms = clock_();
  if (!EnsureFileLocked(now_ms, &result.error)) {
    ++write_failures_;
    last_write_failed_ = true;
    LogError("LEDGER_WRITE_FAILED: record_type=" + schema_.record_type +
             " error=" + result.error);
    return result;
  }

  const std::uint64_t seq = next_seq_;
  LedgerRow row = fields;
  row[kFileSeqField] = std::to_string(seq);
  row[kTimestampField] = FormatIsoUtc(now_ms);
  std::string checksum;
  if (!ComputeRecordChecksum(row, &checksum, &result.error)) {
    ++write_failures_;
    last_write_failed_ = true;
    LogError("LEDGER_WRITE_FAILED: record_type=" + schema_.record_type +
             " error=" + result.error);
    return result;
  }
  row[kChecksumField] = checksum;

  std::vector<std::string> cells;
  cells.reserve(schema_.fields.size());
  for (const auto& field : schema_.fields) {
    cells.push_back(row[field.name]);
  }

  const std::string line = EncodeCsvRow(cells) + "\n";
  std::uintmax_t new_size = 0;
  std::error_code ec;
  bool written = false;
  if (std::filesystem::exists(current_file_, ec)) {
    written = AppendToFile(current_file_, line, &new_size, &result.error);
  } else {
    // 新文件整体原子落盘，读者不会看到只有表头或半行的文件。
    const std::string content = EncodeCsvRow(schema_.Header()) + "\n" + line;
    written = WriteFileAtomically(current_file_, content, &result.error);
    new_size = content.size();
  }
  if (!written) {
    ++write_failures_;
    last_write_failed_ = true;
    LogError("LEDGER_WRITE_FAILED: file=" + current_file_ + " file_seq=" +
             std::to_string(seq) + " error=" + result.error);
    return result;
  }

  next_seq_ = seq + 1;
  current_size_ = new_size;
  last_write_failed_ = false;
  result.success = true;
  result.file_seq = seq;
  result.checksum = checksum;
  result.file_path = current_file_;
  result.timestamp = row[kTimestampField];
  LogInfo("LEDGER_APPEND: file=" + current_file_ + " file_seq=" + std::to_string(seq) +
          " checksum=" + checksum);
  return result;
}

ComponentHealth IntegrityLedger::HealthCheck() const {
  ComponentHealth health;
  health.component = component_name();
  std::error_code ec;
  if (!std::filesystem::is_directory(config_.output_directory, ec)) {
    health.state = HealthState::kUnhealthy;
    health.detail = "output directory unavailable: " + config_.output_directory;
    return health;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (last_write_failed_) {
    health.state = HealthState::kDegraded;
    health.detail = "last write failed, write_failures=" + std::to_string(write_failures_);
  } else {
    health.detail = "last_file_seq=" + std::to_string(next_seq_ - 1);
  }
  return health;
}

std::uint64_t IntegrityLedger::last_sequence() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return next_seq_ - 1;
}

std::string IntegrityLedger::current_file() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_file_;
}

bool IntegrityLedger::EnsureFileLocked(std::int64_t now_ms, std::string* out_error) {
  if (!current_file_.empty()) {
    const bool expired =
        now_ms - file_started_ms_ >= config_.rotation_hours * kMillisPerHour;
    const bool oversized =
        current_size_ >= static_cast<std::uintmax_t>(config_.max_file_size_mb) * kBytesPerMb;
    if (!expired && !oversized) {
      return true;
    }
  }

  const std::filesystem::path path =
      std::filesystem::path(config_.output_directory) /
      (schema_.record_type + "_" + FormatFileStamp(now_ms) + ".csv");
  const std::string path_text = path.string();
  if (path_text == current_file_) {
    // 同一秒内无法生成新文件名，继续写当前文件。
    return true;
  }

  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    if (!AdoptExistingFileLocked(path_text, out_error)) {
      return false;
    }
  } else {
    current_size_ = 0;
  }
  if (!current_file_.empty()) {
    LogInfo("LEDGER_ROTATED: from=" + current_file_ + " to=" + path_text);
  }
  current_file_ = path_text;
  file_started_ms_ = now_ms;
  return true;
}

bool IntegrityLedger::AdoptExistingFileLocked(const std::string& path,
                                              std::string* out_error) {
  std::string text;
  if (!ReadWholeFile(path, &text, out_error)) {
    return false;
  }
  std::vector<std::vector<std::string>> records;
  if (!DecodeCsv(text, &records, out_error)) {
    return false;
  }
  if (records.empty() || records.front() != schema_.Header()) {
    if (out_error != nullptr) {
      *out_error = "已有账本文件表头不匹配: " + path;
    }
    return false;
  }
  // 续写已有文件时序号必须大于文件内最后一行。
  std::uint64_t last_seq = 0;
  for (std::size_t i = 1; i < records.size(); ++i) {
    if (records[i].empty()) {
      continue;
    }
    try {
      last_seq = std::max<std::uint64_t>(last_seq, std::stoull(records[i].front()));
    } catch (const std::exception&) {
      if (out_error != nullptr) {
        *out_error = "已有账本文件 file_seq 非法: " + path + " 行 " + std::to_string(i);
      }
      return false;
    }
  }
  if (last_seq >= next_seq_) {
    next_seq_ = last_seq + 1;
  }
  current_size_ = text.size();
  LogInfo("LEDGER_RESUMED: file=" + path + " last_file_seq=" + std::to_string(last_seq));
  return true;
}

}  // namespace reentry
