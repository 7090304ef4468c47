#include <atomic>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "app/reentry_service.h"
#include "core/config.h"
#include "core/digest.h"
#include "core/log.h"
#include "core/time_utils.h"
#include "hybrid_id/hybrid_id_codec.h"
#include "ledger/integrity_ledger.h"
#include "ledger/ledger_schema.h"
#include "ledger/ledger_validator.h"
#include "processor/decision_executor.h"
#include "processor/decision_processor.h"
#include "processor/reentry_tracker.h"
#include "resolver/parameter_set.h"
#include "resolver/tiered_resolver.h"
#include "vocab/token_pattern.h"
#include "vocab/vocabulary.h"

namespace {

// 覆盖再入场决策核心链路：
// - 词表 / Hybrid ID 编解码 / 注释哈希；
// - 分层解析的层级优先、层内排序与兜底告警；
// - 账本原子追加、并发序号与独立校验；
// - 决策处理器准入门槛、冷却与日内上限。

// 2026-01-15T10:00:00Z
constexpr std::int64_t kBaseTimeMs = 1768471200000LL;
constexpr std::int64_t kMinuteMs = 60LL * 1000;

bool NearlyEqual(double lhs, double rhs, double eps = 1e-6) {
  return std::fabs(lhs - rhs) < eps;
}

std::filesystem::path FreshTempDir(const std::string& name) {
  const std::filesystem::path dir = std::filesystem::temp_directory_path() / name;
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir, ec);
  return dir;
}

bool WriteTextFile(const std::filesystem::path& path, const std::string& text) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return false;
  }
  out << text;
  return out.good();
}

std::string ReadTextFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool HasIssue(const reentry::ValidationReport& report, reentry::LedgerIssueKind kind) {
  for (const auto& issue : report.issues) {
    if (issue.kind == kind) {
      return true;
    }
  }
  return false;
}

reentry::LedgerRow DecisionRow(const std::string& trade_id) {
  return reentry::LedgerRow{
      {"trade_id", trade_id},
      {"hybrid_id", "W1_QUICK_AT_EVENT_NONE_LONG_1"},
      {"symbol", "EURUSD"},
      {"outcome_class", "WIN"},
      {"duration_class", "QUICK"},
      {"reentry_action", "R1"},
      {"parameter_set_id", "global_default"},
      {"resolved_tier", "GLOBAL"},
      {"chain_position", "O"},
      {"lot_size", "0.1"},
      {"stop_loss", "20"},
      {"take_profit", "40"},
  };
}

reentry::ParameterSet GlobalOnlySet() {
  reentry::ParameterSet set;
  set.id = "global_only";
  set.name = "Global Only";
  set.tier = "GLOBAL";
  set.reentry_enabled = true;
  set.lot_size_multiplier = 1.0;
  return set;
}

reentry::DecisionContext ClosedTrade(const std::string& trade_id,
                                     const std::string& symbol) {
  reentry::DecisionContext context;
  context.trade_id = trade_id;
  context.symbol = symbol;
  context.direction = "BUY";
  context.generation = 1;
  context.current_lot_size = 0.1;
  context.profit_loss_pips = 25.0;
  context.duration_minutes = 15.0;
  context.trade_closed = true;
  context.close_reason = "tp";
  context.proximity_state = "AT_EVENT";
  context.calendar_id = "";
  return context;
}

// 捕获 Log* 输出，作用域结束自动卸载。
class ScopedLogCapture {
 public:
  ScopedLogCapture() {
    reentry::SetLogSink([this](reentry::LogLevel level, std::string_view message) {
      std::lock_guard<std::mutex> lock(mutex_);
      lines_.emplace_back(level, std::string(message));
    });
  }
  ~ScopedLogCapture() { reentry::SetLogSink({}); }

  bool Contains(reentry::LogLevel level, const std::string& needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [line_level, text] : lines_) {
      if (line_level == level && text.find(needle) != std::string::npos) {
        return true;
      }
    }
    return false;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::pair<reentry::LogLevel, std::string>> lines_;
};

}  // namespace

int main() {
  const auto vocabulary = std::make_shared<const reentry::Vocabulary>();
  const reentry::HybridIdCodec codec(vocabulary);

  {
    // 时间格式：ISO-8601 毫秒与文件名时间戳。
    if (reentry::FormatIsoUtc(kBaseTimeMs + 678) != "2026-01-15T10:00:00.678Z") {
      std::cerr << "ISO 时间格式错误: " << reentry::FormatIsoUtc(kBaseTimeMs + 678)
                << "\n";
      return 1;
    }
    if (reentry::FormatFileStamp(kBaseTimeMs) != "20260115_100000") {
      std::cerr << "文件名时间戳错误: " << reentry::FormatFileStamp(kBaseTimeMs) << "\n";
      return 1;
    }
    if (reentry::UtcDayIndex(kBaseTimeMs) + 1 !=
        reentry::UtcDayIndex(kBaseTimeMs + 24 * 60 * kMinuteMs)) {
      std::cerr << "UTC 日序号应按自然日递增\n";
      return 1;
    }
  }

  {
    // 模式匹配：精确 / 前缀 / 后缀 / 全通配。
    if (!reentry::MatchesTokenPattern("CAL8_USD_NFP_H", "CAL8_*") ||
        reentry::MatchesTokenPattern("CAL5_USD_NFP_H", "CAL8_*") ||
        !reentry::MatchesTokenPattern("EURUSD", "*USD") ||
        !reentry::MatchesTokenPattern("XAUUSD", "*") ||
        !reentry::MatchesTokenPattern("EURUSD", "EURUSD") ||
        reentry::MatchesTokenPattern("EURUSDX", "EURUSD")) {
      std::cerr << "token 模式匹配结果不符合预期\n";
      return 1;
    }
  }

  {
    // 词表：默认集合、上下文校验与日历规则。
    if (!vocabulary->IsLegalToken(reentry::VocabDimension::kProximity, "AT_EVENT") ||
        vocabulary->IsLegalToken(reentry::VocabDimension::kOutcome, "W3")) {
      std::cerr << "默认词表 token 集合不符合预期\n";
      return 1;
    }
    if (!vocabulary->IsValidCalendar("NONE") ||
        !vocabulary->IsValidCalendar("CAL8_USD_NFP_H") ||
        vocabulary->IsValidCalendar("CAL8_X") ||
        vocabulary->IsValidCalendar("CAL9_USD_NFP") ||
        vocabulary->IsValidCalendar("CAL8__USD_NFP")) {
      std::cerr << "日历校验结果不符合预期\n";
      return 1;
    }
    const reentry::VocabularyCheck check =
        vocabulary->IsValidContext("W9", "QUICK", "AT_EVENT", "NONE", "UP", 4);
    if (check.valid || check.reasons.size() != 3U ||
        check.reasons.front() != "Invalid outcome: W9") {
      std::cerr << "上下文校验应返回全部失败原因\n";
      return 1;
    }
    if (vocabulary->OutcomeRank("L2").value_or(0) != -2 ||
        vocabulary->FindDurationBucket("EXTENDED") == nullptr ||
        vocabulary->FindDurationBucket("EXTENDED")->max_minutes.has_value()) {
      std::cerr << "词表桶查询不符合预期\n";
      return 1;
    }
  }

  {
    // 词表文件：覆盖生效、未知字段拒绝、缺失时按配置回退或失败。
    const auto dir = FreshTempDir("reentry_test_vocab");
    const auto good = dir / "vocab.json";
    const auto bad = dir / "vocab_bad.json";
    if (!WriteTextFile(good, R"({"generation_range": {"min": 1, "max": 5},
                                 "calendar_patterns": ["CAL8_*"]})") ||
        !WriteTextFile(bad, R"({"generation_range": {"min": 1, "max": 3},
                                "colour": "red"})")) {
      std::cerr << "写入词表测试文件失败\n";
      return 1;
    }
    reentry::VocabularyData data;
    std::string error;
    if (!reentry::LoadVocabularyFromJson(good.string(), &data, &error) ||
        data.generation_max != 5 || data.calendar_patterns.size() != 1U ||
        data.outcome_buckets.size() != 5U) {
      std::cerr << "词表覆盖加载失败: " << error << "\n";
      return 1;
    }
    if (reentry::LoadVocabularyFromJson(bad.string(), &data, &error)) {
      std::cerr << "预期未知词表字段导致加载失败\n";
      return 1;
    }

    reentry::VocabularyConfig lenient{.file_path = (dir / "missing.json").string(),
                                      .require_file = false};
    const auto fallback = reentry::BuildVocabulary(lenient, &error);
    if (fallback == nullptr || fallback->GenerationRange().second != 3) {
      std::cerr << "词表文件缺失时应回退内置默认\n";
      return 1;
    }
    reentry::VocabularyConfig strict{.file_path = (dir / "missing.json").string(),
                                     .require_file = true};
    if (reentry::BuildVocabulary(strict, &error) != nullptr || error.empty()) {
      std::cerr << "require_file=true 时词表缺失应失败\n";
      return 1;
    }
  }

  {
    // 组合与解析：多段 proximity 与 calendar。
    reentry::HybridId id;
    reentry::HybridIdError error;
    if (!codec.Compose("W1", "QUICK", "AT_EVENT", "CAL8_USD_NFP_H", "LONG", 1,
                       std::nullopt, &id, &error)) {
      std::cerr << "组合 Hybrid ID 失败: " << error.message << "\n";
      return 1;
    }
    if (id.ToString() != "W1_QUICK_AT_EVENT_CAL8_USD_NFP_H_LONG_1") {
      std::cerr << "Hybrid ID 文本不符合预期: " << id.ToString() << "\n";
      return 1;
    }
    reentry::HybridId parsed;
    if (!codec.Parse("W1_QUICK_AT_EVENT_CAL8_USD_NFP_H_LONG_1", &parsed, &error)) {
      std::cerr << "解析 Hybrid ID 失败: " << error.message << "\n";
      return 1;
    }
    if (parsed.outcome != "W1" || parsed.duration != "QUICK" ||
        parsed.proximity != "AT_EVENT" || parsed.calendar != "CAL8_USD_NFP_H" ||
        parsed.direction != "LONG" || parsed.generation != 1 ||
        parsed.suffix.has_value()) {
      std::cerr << "解析结果字段不符合预期: " << parsed.ToString() << "\n";
      return 1;
    }
    if (!codec.Validate("W1_QUICK_AT_EVENT_CAL8_USD_NFP_H_LONG_1")) {
      std::cerr << "合法 Hybrid ID 应通过校验\n";
      return 1;
    }
  }

  {
    // 带后缀的往返：全数字后缀不会被误认为 generation。
    const std::vector<reentry::HybridId> samples = {
        {"L1", "EXTENDED", "PRE_1H", "CAL5_EUR_CPI", "SHORT", 3, std::string("a1b2c3")},
        {"BE", "FLASH", "POST_30M", "NONE", "ANY", 2, std::string("000002")},
        {"W2", "LONG", "AT_EVENT", "CAL8_GBP_BOE_RATE", "LONG", 1, std::nullopt},
    };
    for (const auto& sample : samples) {
      reentry::HybridId composed;
      reentry::HybridIdError error;
      if (!codec.Compose(sample.outcome, sample.duration, sample.proximity,
                         sample.calendar, sample.direction, sample.generation,
                         sample.suffix, &composed, &error)) {
        std::cerr << "组合失败: " << sample.ToString() << " " << error.message << "\n";
        return 1;
      }
      reentry::HybridId parsed;
      if (!codec.Parse(composed.ToString(), &parsed, &error) || !(parsed == sample)) {
        std::cerr << "往返不一致: " << composed.ToString() << "\n";
        return 1;
      }
    }
  }

  {
    // 分段一致性：日历片段与 generation 数字、方向 token、临近 token 同形时，
    // 全部词表组合仍须往返一致。
    const std::vector<std::string> calendars = {
        "NONE", "CAL8_USD_NFP_H", "CAL8_USD_2_H", "CAL8_USD_LONG_H",
        "CAL5_AT_EVENT", "CAL5_EUR_1_SHORT"};
    const std::vector<std::optional<std::string>> suffixes = {
        std::nullopt, std::string("abc123"), std::string("000003")};
    const auto [generation_min, generation_max] = vocabulary->GenerationRange();
    std::size_t checked = 0;
    for (const auto& outcome : vocabulary->LegalTokens(reentry::VocabDimension::kOutcome)) {
      for (const auto& duration :
           vocabulary->LegalTokens(reentry::VocabDimension::kDuration)) {
        for (const auto& proximity :
             vocabulary->LegalTokens(reentry::VocabDimension::kProximity)) {
          for (const auto& calendar : calendars) {
            for (const auto& direction :
                 vocabulary->LegalTokens(reentry::VocabDimension::kDirection)) {
              for (int generation = generation_min; generation <= generation_max;
                   ++generation) {
                for (const auto& suffix : suffixes) {
                  reentry::HybridId composed;
                  reentry::HybridIdError error;
                  if (!codec.Compose(outcome, duration, proximity, calendar, direction,
                                     generation, suffix, &composed, &error)) {
                    std::cerr << "组合失败: " << outcome << " " << calendar << " "
                              << error.message << "\n";
                    return 1;
                  }
                  reentry::HybridId parsed;
                  if (!codec.Parse(composed.ToString(), &parsed, &error) ||
                      !(parsed == composed) || !codec.Validate(composed.ToString())) {
                    std::cerr << "分段往返不一致: " << composed.ToString() << "\n";
                    return 1;
                  }
                  ++checked;
                }
              }
            }
          }
        }
      }
    }
    if (checked == 0U) {
      std::cerr << "分段一致性用例为空\n";
      return 1;
    }
  }

  {
    // 非法输入：错误分类。
    reentry::HybridId id;
    reentry::HybridIdError error;
    if (codec.Compose("W9", "QUICK", "AT_EVENT", "NONE", "LONG", 1, std::nullopt, &id,
                      &error) ||
        error.code != reentry::HybridIdErrorCode::kInvalidComponent) {
      std::cerr << "非法 outcome 应返回 InvalidComponent\n";
      return 1;
    }
    if (codec.Compose("W1", "QUICK", "AT_EVENT", "NONE", "LONG", 1,
                      std::string("ABC123"), &id, &error) ||
        error.code != reentry::HybridIdErrorCode::kInvalidSuffix) {
      std::cerr << "大写后缀应返回 InvalidSuffix\n";
      return 1;
    }
    if (codec.Compose("W1", "QUICK", "AT_EVENT", "NONE", "LONG", 4, std::nullopt, &id,
                      &error)) {
      std::cerr << "generation 越界应组合失败\n";
      return 1;
    }

    const std::vector<std::string> malformed = {
        "W1_QUICK_AT_EVENT",
        "W1__QUICK_AT_EVENT_NONE_LONG_1",
        "W1_QUICK_AT_EVENT_NONE_LONG_9",
        "W1_QUICK_AT_EVENT_NONE_LONG_1_ABCDEF",
        "W1_QUICK_AT_EVENT_NONE_LONG_1_abcdef_x",
        "W1_QUICK_AT_EVENT_NONE_LONG_01",
    };
    for (const auto& text : malformed) {
      if (codec.Parse(text, &id, &error) ||
          error.code != reentry::HybridIdErrorCode::kMalformedIdentifier) {
        std::cerr << "预期 MalformedIdentifier: " << text << "\n";
        return 1;
      }
    }
    // 结构合法但词表非法：Parse 成功、Validate 失败。
    if (!codec.Parse("W9_QUICK_AT_EVENT_NONE_LONG_1", &id, &error) ||
        codec.Validate("W9_QUICK_AT_EVENT_NONE_LONG_1")) {
      std::cerr << "词表非法的 Hybrid ID 应只在 Validate 阶段失败\n";
      return 1;
    }
  }

  {
    // 注释哈希：与 SHA-256 十六进制前 6 位一致，且跨调用稳定。
    if (reentry::HybridIdCodec::CommentHash("").value_or("") != "e3b0c4" ||
        reentry::HybridIdCodec::CommentHash("abc").value_or("") != "ba7816") {
      std::cerr << "注释哈希与 SHA-256 参考值不一致\n";
      return 1;
    }
    const std::string identifier = "W1_QUICK_AT_EVENT_CAL8_USD_NFP_H_LONG_1";
    std::string digest;
    std::string error;
    if (!reentry::Sha256Hex(identifier, &digest, &error)) {
      std::cerr << "SHA-256 计算失败: " << error << "\n";
      return 1;
    }
    const auto hash = reentry::HybridIdCodec::CommentHash(identifier);
    if (!hash.has_value() || *hash != digest.substr(0, 6) ||
        reentry::HybridIdCodec::CommentHash(identifier) != hash ||
        !reentry::IsValidHybridIdSuffix(*hash)) {
      std::cerr << "注释哈希不稳定或格式错误\n";
      return 1;
    }

    const auto comment = codec.DecomposeForComment(identifier);
    if (!comment.has_value() || comment->size() > 31U ||
        *comment != "W1_QUIC_AT_1_" + *hash) {
      std::cerr << "订单注释形式不符合预期: " << comment.value_or("<none>") << "\n";
      return 1;
    }
    if (!codec.ValidateCommentSuffixParity(identifier, *hash) ||
        codec.ValidateCommentSuffixParity(identifier, "zzzzzz")) {
      std::cerr << "注释后缀一致性校验错误\n";
      return 1;
    }
  }

  {
    // 链位置与下一代。
    std::string position;
    reentry::HybridIdError error;
    const std::vector<std::pair<int, std::string>> expected = {
        {1, "O"}, {2, "R1"}, {3, "R2"}};
    for (const auto& [generation, label] : expected) {
      if (!reentry::HybridIdCodec::ChainPosition(generation, &position, &error) ||
          position != label) {
        std::cerr << "链位置映射错误: generation=" << generation << "\n";
        return 1;
      }
    }
    if (reentry::HybridIdCodec::ChainPosition(4, &position, &error) ||
        error.code != reentry::HybridIdErrorCode::kInvalidGeneration) {
      std::cerr << "generation=4 应返回 InvalidGeneration\n";
      return 1;
    }
    if (codec.NextGeneration(1).value_or(0) != 2 || codec.NextGeneration(3).has_value()) {
      std::cerr << "NextGeneration 边界错误\n";
      return 1;
    }
  }

  {
    // 行校验和：与列顺序无关，篡改任一列即失配。
    reentry::LedgerRow row{{"b", "2"}, {"a", "1"}, {"file_seq", "7"}};
    std::string checksum;
    std::string expected;
    std::string error;
    if (!reentry::ComputeRecordChecksum(row, &checksum, &error) ||
        !reentry::Sha256Hex("1|2|7", &expected, &error) || checksum != expected) {
      std::cerr << "行校验和计算规则错误\n";
      return 1;
    }
    row[reentry::kChecksumField] = checksum;
    std::string again;
    if (!reentry::ComputeRecordChecksum(row, &again, &error) || again != checksum ||
        !reentry::VerifyRecordChecksum(row)) {
      std::cerr << "校验和应排除自身列\n";
      return 1;
    }
    row["a"] = "1.0";
    if (reentry::VerifyRecordChecksum(row)) {
      std::cerr << "篡改后的行不应通过校验\n";
      return 1;
    }
  }

  {
    // CSV 编码：引号与逗号转义。
    if (reentry::EncodeCsvCell("a,b") != "\"a,b\"" ||
        reentry::EncodeCsvCell("say \"hi\"") != "\"say \"\"hi\"\"\"" ||
        reentry::EncodeCsvCell("plain") != "plain") {
      std::cerr << "CSV 单元格编码错误\n";
      return 1;
    }
    std::vector<std::vector<std::string>> records;
    std::string error;
    if (!reentry::DecodeCsv("x,\"a,b\"\r\n\"multi\nline\",2\n\n", &records, &error) ||
        records.size() != 2U || records[0][1] != "a,b" || records[1][0] != "multi\nline") {
      std::cerr << "CSV 解码错误: " << error << "\n";
      return 1;
    }
    if (reentry::DecodeCsv("a,\"unterminated\n", &records, &error)) {
      std::cerr << "未闭合引号应解码失败\n";
      return 1;
    }
    if (reentry::FormatDecimal(1.5) != "1.5" || reentry::FormatDecimal(2.0) != "2" ||
        reentry::FormatDecimal(0.12) != "0.12") {
      std::cerr << "FormatDecimal 输出不符合预期\n";
      return 1;
    }
  }

  {
    // 账本并发追加：序号唯一且连续，校验器全部通过。
    const auto dir = FreshTempDir("reentry_test_ledger_concurrent");
    reentry::LedgerConfig config;
    config.output_directory = dir.string();
    reentry::IntegrityLedger ledger(config, reentry::ReentryDecisionSchema(),
                                    [] { return kBaseTimeMs; });
    std::string error;
    if (!ledger.Initialize(&error)) {
      std::cerr << "账本初始化失败: " << error << "\n";
      return 1;
    }

    constexpr int kThreads = 4;
    constexpr int kPerThread = 25;
    std::mutex seq_mutex;
    std::set<std::uint64_t> seqs;
    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
      workers.emplace_back([&, t] {
        for (int i = 0; i < kPerThread; ++i) {
          const auto result =
              ledger.Append(DecisionRow("T" + std::to_string(t) + "-" + std::to_string(i)));
          if (!result.success) {
            ++failures;
            continue;
          }
          std::lock_guard<std::mutex> lock(seq_mutex);
          seqs.insert(result.file_seq);
        }
      });
    }
    for (auto& worker : workers) {
      worker.join();
    }
    constexpr std::size_t kTotal = static_cast<std::size_t>(kThreads * kPerThread);
    if (failures.load() != 0 || seqs.size() != kTotal || *seqs.begin() != 1U ||
        *seqs.rbegin() != kTotal || ledger.last_sequence() != kTotal) {
      std::cerr << "并发追加序号不连续: failures=" << failures.load()
                << " unique=" << seqs.size() << "\n";
      return 1;
    }

    const std::filesystem::path file = ledger.current_file();
    if (file.filename() != "reentry_decisions_20260115_100000.csv" ||
        std::filesystem::exists(file.string() + ".tmp")) {
      std::cerr << "账本文件命名错误或残留临时文件: " << file << "\n";
      return 1;
    }
    const std::string text = ReadTextFile(file);
    const std::string header = reentry::EncodeCsvRow(reentry::ReentryDecisionSchema().Header());
    if (text.rfind(header + "\n", 0) != 0 ||
        text.find(header, header.size()) != std::string::npos) {
      std::cerr << "账本表头应只出现一次\n";
      return 1;
    }

    reentry::LedgerValidator validator;
    const reentry::ValidationReport report = validator.Verify(file.string());
    if (!report.passed || report.total_rows != kTotal || report.valid_rows != kTotal ||
        report.record_type != "reentry_decisions" || report.first_seq.value_or(0) != 1U ||
        report.last_seq.value_or(0) != kTotal) {
      std::cerr << "并发写入后的账本应通过校验:\n"
                << reentry::FormatValidationReport(report);
      return 1;
    }
  }

  {
    // 账本续写与轮转：同名文件续接序号，超时后切换新文件。
    const auto dir = FreshTempDir("reentry_test_ledger_rotation");
    reentry::LedgerConfig config;
    config.output_directory = dir.string();
    config.rotation_hours = 24;
    std::int64_t now_ms = kBaseTimeMs;
    const auto clock = [&now_ms] { return now_ms; };

    std::string first_file;
    {
      reentry::IntegrityLedger ledger(config, reentry::ReentryDecisionSchema(), clock);
      std::string error;
      if (!ledger.Initialize(&error) || !ledger.Append(DecisionRow("A1")).success ||
          !ledger.Append(DecisionRow("A2")).success) {
        std::cerr << "首个账本实例写入失败: " << error << "\n";
        return 1;
      }
      first_file = ledger.current_file();
    }

    reentry::IntegrityLedger resumed(config, reentry::ReentryDecisionSchema(), clock);
    const auto third = resumed.Append(DecisionRow("A3"));
    if (!third.success || third.file_seq != 3U || third.file_path != first_file) {
      std::cerr << "续写已有文件时序号应从 3 开始，实际 " << third.file_seq << "\n";
      return 1;
    }

    now_ms += 25 * 60 * kMinuteMs;
    const auto fourth = resumed.Append(DecisionRow("A4"));
    if (!fourth.success || fourth.file_seq != 4U || fourth.file_path == first_file) {
      std::cerr << "超过 rotation_hours 后应轮转到新文件\n";
      return 1;
    }

    reentry::LedgerValidator validator;
    for (const auto& report : validator.VerifyDirectory(dir.string())) {
      if (!report.passed) {
        std::cerr << "轮转后的账本文件应通过校验:\n"
                  << reentry::FormatValidationReport(report);
        return 1;
      }
    }
  }

  {
    // 已有文件只追加新行：原内容逐字节保留，文件大小按行长增长。
    const auto dir = FreshTempDir("reentry_test_ledger_append_only");
    reentry::LedgerConfig config;
    config.output_directory = dir.string();
    reentry::IntegrityLedger ledger(config, reentry::ReentryDecisionSchema(),
                                    [] { return kBaseTimeMs; });
    std::string error;
    if (!ledger.Initialize(&error)) {
      std::cerr << "账本初始化失败: " << error << "\n";
      return 1;
    }
    constexpr int kRows = 400;
    std::string previous;
    for (int i = 1; i <= kRows; ++i) {
      const auto result = ledger.Append(DecisionRow("N" + std::to_string(i)));
      if (!result.success || result.file_seq != static_cast<std::uint64_t>(i)) {
        std::cerr << "连续追加失败: i=" << i << " " << result.error << "\n";
        return 1;
      }
      if (i % 100 == 0 || i == 1) {
        const std::string text = ReadTextFile(result.file_path);
        if (text.compare(0, previous.size(), previous) != 0 ||
            text.size() <= previous.size()) {
          std::cerr << "追加不应改写已有内容: i=" << i << "\n";
          return 1;
        }
        previous = text;
      }
    }
    const std::string file = ledger.current_file();
    std::size_t line_count = 0;
    for (const char c : ReadTextFile(file)) {
      line_count += c == '\n' ? 1U : 0U;
    }
    if (line_count != static_cast<std::size_t>(kRows) + 1U) {
      std::cerr << "追加后行数不符: " << line_count << "\n";
      return 1;
    }

    // 末尾缺换行（如外部截断）时续写先补换行，不拼接到上一行。
    std::string text = ReadTextFile(file);
    text.pop_back();
    if (!WriteTextFile(file, text)) {
      std::cerr << "写入截断测试文件失败\n";
      return 1;
    }
    reentry::IntegrityLedger resumed(config, reentry::ReentryDecisionSchema(),
                                     [] { return kBaseTimeMs; });
    const auto next = resumed.Append(DecisionRow("N_RESUMED"));
    if (!next.success || next.file_seq != static_cast<std::uint64_t>(kRows) + 1U ||
        next.file_path != file) {
      std::cerr << "缺换行文件续写失败: " << next.error << "\n";
      return 1;
    }

    reentry::LedgerValidator validator;
    const auto report = validator.Verify(file);
    if (!report.passed || report.valid_rows != static_cast<std::size_t>(kRows) + 1U) {
      std::cerr << "大量追加后的账本应通过校验:\n" << reentry::FormatValidationReport(report);
      return 1;
    }
  }

  {
    // 账本不可写：返回失败、不推进序号、健康检查不可用。
    const auto dir = FreshTempDir("reentry_test_ledger_unwritable");
    const auto blocker = dir / "not_a_directory";
    if (!WriteTextFile(blocker, "x")) {
      std::cerr << "写入占位文件失败\n";
      return 1;
    }
    reentry::LedgerConfig config;
    config.output_directory = blocker.string();
    reentry::IntegrityLedger ledger(config, reentry::ReentryDecisionSchema(),
                                    [] { return kBaseTimeMs; });
    const auto result = ledger.Append(DecisionRow("X1"));
    if (result.success || result.error.empty() || ledger.last_sequence() != 0U ||
        ledger.HealthCheck().state != reentry::HealthState::kUnhealthy) {
      std::cerr << "不可写目录应导致追加失败且不推进序号\n";
      return 1;
    }

    reentry::LedgerRow incomplete = DecisionRow("X2");
    incomplete.erase("symbol");
    if (ledger.Append(incomplete).success) {
      std::cerr << "缺列记录应被拒绝\n";
      return 1;
    }
  }

  {
    // 校验器：一次性汇报多处损坏。
    const auto dir = FreshTempDir("reentry_test_ledger_corrupt");
    reentry::LedgerConfig config;
    config.output_directory = dir.string();
    reentry::IntegrityLedger ledger(config, reentry::ReentryDecisionSchema(),
                                    [] { return kBaseTimeMs; });
    std::string error;
    if (!ledger.Initialize(&error)) {
      std::cerr << "账本初始化失败: " << error << "\n";
      return 1;
    }
    for (const char* trade_id : {"C1", "C2", "C3", "C4"}) {
      if (!ledger.Append(DecisionRow(trade_id)).success) {
        std::cerr << "写入损坏测试数据失败\n";
        return 1;
      }
    }

    const std::string file = ledger.current_file();
    std::vector<std::vector<std::string>> records;
    if (!reentry::DecodeCsv(ReadTextFile(file), &records, &error) || records.size() != 5U) {
      std::cerr << "读取账本失败: " << error << "\n";
      return 1;
    }
    const auto& header = records[0];
    const auto column = [&header](const std::string& name) {
      for (std::size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) {
          return i;
        }
      }
      return header.size();
    };
    records[1][column("lot_size")] = "9.99";               // 内容篡改
    records[2][column(reentry::kChecksumField)] = "ZZZ";   // 校验和格式
    records[3][column("stop_loss")] = "abc";               // 类型错误 + 失配
    records[4][column(reentry::kFileSeqField)] = "1";      // 序号回退 + 失配

    std::string corrupted;
    for (const auto& record : records) {
      corrupted += reentry::EncodeCsvRow(record) + "\n";
    }
    if (!WriteTextFile(file, corrupted)) {
      std::cerr << "写回损坏账本失败\n";
      return 1;
    }

    reentry::LedgerValidator validator;
    const reentry::ValidationReport report = validator.Verify(file);
    if (report.passed || report.total_rows != 4U || report.invalid_rows != 4U ||
        !HasIssue(report, reentry::LedgerIssueKind::kChecksumMismatch) ||
        !HasIssue(report, reentry::LedgerIssueKind::kChecksumFormat) ||
        !HasIssue(report, reentry::LedgerIssueKind::kFieldType) ||
        !HasIssue(report, reentry::LedgerIssueKind::kSequenceViolation)) {
      std::cerr << "校验器未汇报全部损坏:\n" << reentry::FormatValidationReport(report);
      return 1;
    }

    const auto header_only = dir / "reentry_decisions_20260115_110000.csv";
    if (!WriteTextFile(header_only, "file_seq,timestamp,trade_id\n")) {
      std::cerr << "写入表头测试文件失败\n";
      return 1;
    }
    if (validator.Verify(header_only.string()).passed) {
      std::cerr << "缺列表头应校验失败\n";
      return 1;
    }
  }

  {
    // 层级优先：TIER1 的低 specificity 命中压过 TIER2 的完全命中。
    reentry::TieredResolver resolver(reentry::ResolverConfig{}, vocabulary);
    reentry::ParameterSet tier1;
    tier1.id = "tier1_catch_all";
    tier1.tier = "TIER1";
    tier1.lot_size_multiplier = 0.5;
    reentry::ParameterSet tier2;
    tier2.id = "tier2_win";
    tier2.tier = "TIER2";
    tier2.outcome_class = "WIN";
    std::string error;
    if (!resolver.LoadParameterSets({tier1, tier2, GlobalOnlySet()}, "test", &error)) {
      std::cerr << "装载参数集失败: " << error << "\n";
      return 1;
    }
    const auto resolved = resolver.Resolve(reentry::ResolveRequest{
        .outcome = "WIN", .duration = "QUICK", .proximity = "AT_EVENT",
        .calendar = "NONE", .symbol = "EURUSD", .generation = 1});
    if (resolved.resolved_tier != "TIER1" || resolved.parameter_set_id != "tier1_catch_all" ||
        !NearlyEqual(resolved.specificity_score, 0.0) ||
        !NearlyEqual(resolved.lot_size_multiplier, 0.5)) {
      std::cerr << "层级顺序应优先于 specificity，实际命中 " << resolved.parameter_set_id
                << "\n";
      return 1;
    }
    if (resolver.Status().stats.tier_hits["TIER1"] != 1U) {
      std::cerr << "层级命中统计错误\n";
      return 1;
    }
  }

  {
    // 层内排序：声明字段更多者优先，完全同分按 id 字节序。
    reentry::TieredResolver resolver(reentry::ResolverConfig{}, vocabulary);
    reentry::ParameterSet broad;
    broad.id = "exact_broad";
    broad.tier = "EXACT";
    broad.outcome_class = "WIN";
    reentry::ParameterSet narrow;
    narrow.id = "exact_narrow";
    narrow.tier = "EXACT";
    narrow.outcome_class = "WIN";
    narrow.duration_class = "QUICK";
    narrow.symbol_pattern = "EUR*";
    reentry::ParameterSet twin_b = narrow;
    twin_b.id = "loss_b";
    twin_b.outcome_class = "LOSS";
    reentry::ParameterSet twin_a = twin_b;
    twin_a.id = "loss_a";
    std::string error;
    if (!resolver.LoadParameterSets({broad, narrow, twin_b, twin_a, GlobalOnlySet()},
                                    "test", &error)) {
      std::cerr << "装载参数集失败: " << error << "\n";
      return 1;
    }
    const auto win = resolver.Resolve(reentry::ResolveRequest{
        .outcome = "WIN", .duration = "QUICK", .proximity = "AT_EVENT",
        .calendar = "NONE", .symbol = "EURUSD", .generation = 1});
    if (win.parameter_set_id != "exact_narrow" || win.resolved_tier != "EXACT") {
      std::cerr << "层内应选择声明字段更多的参数集，实际 " << win.parameter_set_id << "\n";
      return 1;
    }
    const auto loss = resolver.Resolve(reentry::ResolveRequest{
        .outcome = "LOSS", .duration = "QUICK", .proximity = "AT_EVENT",
        .calendar = "NONE", .symbol = "EURGBP", .generation = 1});
    if (loss.parameter_set_id != "loss_a") {
      std::cerr << "完全同分应按 id 升序，实际 " << loss.parameter_set_id << "\n";
      return 1;
    }
    const auto other = resolver.Resolve(reentry::ResolveRequest{
        .outcome = "WIN", .duration = "QUICK", .proximity = "AT_EVENT",
        .calendar = "NONE", .symbol = "XAUUSD", .generation = 3});
    if (other.parameter_set_id != "exact_broad" || other.next_generation.has_value() ||
        !other.generation_allowed) {
      std::cerr << "symbol 不匹配时应退回较宽参数集，且 generation=3 无下一代\n";
      return 1;
    }
  }

  {
    // 全部层级未命中：EMERGENCY 兜底并输出 ERROR 告警。
    ScopedLogCapture capture;
    reentry::TieredResolver resolver(reentry::ResolverConfig{}, vocabulary);
    reentry::ParameterSet loss_only;
    loss_only.id = "loss_only";
    loss_only.tier = "TIER2";
    loss_only.outcome_class = "LOSS";
    std::string error;
    if (!resolver.LoadParameterSets({loss_only}, "test", &error)) {
      std::cerr << "装载参数集失败: " << error << "\n";
      return 1;
    }
    const auto resolved = resolver.Resolve(reentry::ResolveRequest{
        .outcome = "WIN", .duration = "QUICK", .proximity = "AT_EVENT",
        .calendar = "NONE", .symbol = "EURUSD", .generation = 1});
    if (resolved.resolved_tier != "EMERGENCY" || resolved.reentry_enabled ||
        resolved.parameter_set_id != "emergency_fallback" ||
        !NearlyEqual(resolved.confidence_threshold, 1.0)) {
      std::cerr << "未命中时应返回 EMERGENCY 兜底\n";
      return 1;
    }
    if (!capture.Contains(reentry::LogLevel::kError, "RESOLVER_EXHAUSTED")) {
      std::cerr << "EMERGENCY 兜底必须输出 ERROR 告警\n";
      return 1;
    }
    if (resolver.HealthCheck().state != reentry::HealthState::kDegraded) {
      std::cerr << "缺少 GLOBAL 兜底时解析器应为 degraded\n";
      return 1;
    }
  }

  {
    // 参数文件整体加载：任一条目非法则整体失败，原快照保留。
    const auto dir = FreshTempDir("reentry_test_parameter_sets");
    const auto path = dir / "parameter_sets.json";
    if (!WriteTextFile(path, R"({"version": "1.0", "parameter_sets": [
        {"id": "global_default", "tier": "GLOBAL"},
        {"id": "cal8", "tier": "TIER1", "calendar_pattern": "CAL8_*",
         "lot_size_multiplier": 0.8}
      ]})")) {
      std::cerr << "写入参数文件失败\n";
      return 1;
    }
    reentry::ResolverConfig config;
    config.parameter_sets_path = path.string();
    config.use_defaults_if_missing = false;
    reentry::TieredResolver resolver(config, vocabulary);
    std::string error;
    if (!resolver.Initialize(&error) || resolver.snapshot()->parameter_sets.size() != 2U ||
        resolver.snapshot()->source != path.string()) {
      std::cerr << "参数文件加载失败: " << error << "\n";
      return 1;
    }
    const auto cal8 = resolver.Resolve(reentry::ResolveRequest{
        .outcome = "LOSS", .duration = "LONG", .proximity = "PRE_1H",
        .calendar = "CAL8_USD_NFP_H", .symbol = "EURUSD", .generation = 1});
    if (cal8.parameter_set_id != "cal8" || !NearlyEqual(cal8.specificity_score, 1.0)) {
      std::cerr << "日历模式参数集未命中\n";
      return 1;
    }

    if (!WriteTextFile(path, R"({"version": "1.1", "parameter_sets": [
        {"id": "global_default", "tier": "GLOBAL"},
        {"id": "broken", "tier": "TIER9"}
      ]})")) {
      std::cerr << "写入参数文件失败\n";
      return 1;
    }
    std::vector<reentry::ParameterSet> loaded = {GlobalOnlySet()};
    if (reentry::LoadParameterSetsFromJson(path.string(), *vocabulary,
                                           config.tier_hierarchy, &loaded, &error) ||
        loaded.size() != 1U || loaded.front().id != "global_only") {
      std::cerr << "非法参数文件不应部分加载\n";
      return 1;
    }
    if (resolver.Reload(&error) || resolver.snapshot()->parameter_sets.size() != 2U ||
        resolver.Status().stats.reload_failures != 1U) {
      std::cerr << "重载失败时应保留原快照\n";
      return 1;
    }

    if (!WriteTextFile(path, R"({"parameter_sets": [
        {"id": "global_default", "tier": "GLOBAL", "lot_multiplier": 2.0}
      ]})") ||
        reentry::LoadParameterSetsFromJson(path.string(), *vocabulary,
                                           config.tier_hierarchy, &loaded, &error)) {
      std::cerr << "参数集未知字段应被拒绝\n";
      return 1;
    }

    // outcome_class 只接受结果类别名：W1 等词表 token 装载即失败，不会静默失配。
    if (!WriteTextFile(path, R"({"parameter_sets": [
        {"id": "global_default", "tier": "GLOBAL"},
        {"id": "big_win", "tier": "TIER1", "outcome_class": "W1"}
      ]})")) {
      std::cerr << "写入参数文件失败\n";
      return 1;
    }
    error.clear();
    if (reentry::LoadParameterSetsFromJson(path.string(), *vocabulary,
                                           config.tier_hierarchy, &loaded, &error) ||
        error.find("big_win") == std::string::npos ||
        error.find("W1") == std::string::npos) {
      std::cerr << "词表 token 形式的 outcome_class 应被拒绝: " << error << "\n";
      return 1;
    }
    reentry::ParameterSet token_keyed = GlobalOnlySet();
    token_keyed.id = "token_keyed";
    token_keyed.tier = "TIER1";
    token_keyed.outcome_class = "BE";
    if (reentry::ValidateParameterSet(token_keyed, *vocabulary, config.tier_hierarchy,
                                      &error)) {
      std::cerr << "outcome_class=BE 应校验失败\n";
      return 1;
    }
    token_keyed.outcome_class = "BREAKEVEN";
    if (!reentry::ValidateParameterSet(token_keyed, *vocabulary, config.tier_hierarchy,
                                       &error)) {
      std::cerr << "outcome_class=BREAKEVEN 应校验通过: " << error << "\n";
      return 1;
    }

    reentry::ResolverConfig missing;
    missing.parameter_sets_path = (dir / "missing.json").string();
    reentry::TieredResolver defaults(missing, vocabulary);
    if (!defaults.Initialize(&error) ||
        defaults.snapshot()->parameter_sets.size() != reentry::DefaultParameterSets().size() ||
        defaults.HealthCheck().state != reentry::HealthState::kHealthy) {
      std::cerr << "参数文件缺失时应装载内置默认参数集\n";
      return 1;
    }
    missing.use_defaults_if_missing = false;
    reentry::TieredResolver strict(missing, vocabulary);
    if (strict.Initialize(&error)) {
      std::cerr << "禁止默认时参数文件缺失应失败\n";
      return 1;
    }
  }

  {
    // 决策：仅 GLOBAL 层、25 点盈利、15 分钟 -> WIN/QUICK/R1，手数不变。
    const auto dir = FreshTempDir("reentry_test_processor");
    std::int64_t now_ms = kBaseTimeMs;
    const auto clock = [&now_ms] { return now_ms; };

    reentry::ProcessorConfig processor_config;
    reentry::TieredResolver resolver(reentry::ResolverConfig{}, vocabulary);
    std::string error;
    if (!resolver.LoadParameterSets({GlobalOnlySet()}, "test", &error)) {
      std::cerr << "装载参数集失败: " << error << "\n";
      return 1;
    }
    reentry::LedgerConfig ledger_config;
    ledger_config.output_directory = dir.string();
    reentry::IntegrityLedger ledger(ledger_config, reentry::ReentryDecisionSchema(), clock);
    if (!ledger.Initialize(&error)) {
      std::cerr << "账本初始化失败: " << error << "\n";
      return 1;
    }
    reentry::ReentryTracker tracker(processor_config.reentry_cooldown_minutes,
                                    processor_config.max_reentry_attempts_per_day, clock);
    reentry::DecisionProcessor processor(processor_config, codec, resolver, tracker,
                                         &ledger);

    const auto response = processor.Process(ClosedTrade("T1", "EURUSD"));
    if (response.status != reentry::DecisionStatus::kProcessed) {
      std::cerr << "决策应成功，实际 " << reentry::ToString(response.status) << " "
                << response.reason << "\n";
      return 1;
    }
    if (response.outcome_class != reentry::OutcomeClass::kWin ||
        response.duration_class != reentry::DurationClass::kQuick ||
        response.reentry_action != reentry::ReentryAction::kR1 ||
        response.resolved_tier != "GLOBAL" || !NearlyEqual(response.lot_size, 0.1) ||
        response.hybrid_id != "W1_QUICK_AT_EVENT_NONE_LONG_1" ||
        response.chain_position != "O" || response.next_generation.value_or(0) != 2 ||
        !NearlyEqual(response.confidence_score, 0.7) || response.file_seq != 1U ||
        response.checksum.size() != 64U || !response.reason.empty()) {
      std::cerr << "GLOBAL 决策结果不符合预期: " << response.ToJson() << "\n";
      return 1;
    }
    if (response.ToJson().find("\"reentry_action\":\"R1\"") == std::string::npos) {
      std::cerr << "决策 JSON 缺少动作字段: " << response.ToJson() << "\n";
      return 1;
    }

    // 时长不足：跳过且不写账本。
    auto short_trade = ClosedTrade("T2", "GBPUSD");
    short_trade.duration_minutes = 0.5;
    const auto skipped = processor.Process(short_trade);
    if (skipped.status != reentry::DecisionStatus::kSkipped ||
        skipped.reason != "duration_too_short" || ledger.last_sequence() != 1U ||
        skipped.ToJson() !=
            R"({"status":"skipped","reason":"duration_too_short","trade_id":"T2","symbol":"GBPUSD"})") {
      std::cerr << "时长不足应跳过且不落账本: " << skipped.ToJson() << "\n";
      return 1;
    }

    // 冷却：同品种 1 分钟后被拒，16 分钟后放行。
    now_ms += kMinuteMs;
    const auto cooling = processor.Process(ClosedTrade("T3", "EURUSD"));
    if (cooling.status != reentry::DecisionStatus::kSkipped ||
        cooling.reason != "cooldown_period_active") {
      std::cerr << "冷却期内同品种应被跳过\n";
      return 1;
    }
    now_ms += 15 * kMinuteMs;
    const auto after_cooldown = processor.Process(ClosedTrade("T4", "EURUSD"));
    if (after_cooldown.status != reentry::DecisionStatus::kProcessed ||
        after_cooldown.file_seq != 2U) {
      std::cerr << "冷却结束后应恢复处理\n";
      return 1;
    }

    // generation 由上一代 Hybrid ID 注释推导。
    auto chained = ClosedTrade("T5", "USDJPY");
    chained.generation = 0;
    chained.comment = "W1_QUICK_AT_EVENT_NONE_LONG_1";
    chained.direction = "sell";
    const auto second = processor.Process(chained);
    if (second.status != reentry::DecisionStatus::kProcessed || second.generation != 2 ||
        second.chain_position != "R1" ||
        second.reentry_action != reentry::ReentryAction::kR2 ||
        second.hybrid_id != "W1_QUICK_AT_EVENT_NONE_SHORT_2") {
      std::cerr << "由注释推导 generation 失败: " << second.ToJson() << "\n";
      return 1;
    }

    // 非法上下文：汇总全部原因。
    auto invalid = ClosedTrade("T6", "AUDUSD");
    invalid.direction = "UP";
    invalid.proximity_state = "SOON";
    const auto rejected = processor.Process(invalid);
    if (rejected.status != reentry::DecisionStatus::kInvalidContext ||
        rejected.reason.find("Invalid direction: UP") == std::string::npos ||
        rejected.reason.find("Invalid proximity: SOON") == std::string::npos) {
      std::cerr << "非法上下文原因不完整: " << rejected.reason << "\n";
      return 1;
    }

    const reentry::ProcessingStats stats = processor.Stats();
    if (stats.processed != 3U || stats.skipped != 2U || stats.invalid_contexts != 1U ||
        stats.skip_reasons.at("duration_too_short") != 1U ||
        stats.daily_attempts.at("EURUSD") != 2 ||
        processor.RecentDecisions().front().trade_id != "T6") {
      std::cerr << "处理统计不符合预期\n";
      return 1;
    }

    reentry::LedgerValidator validator;
    const auto report = validator.Verify(ledger.current_file());
    if (!report.passed || report.total_rows != 3U) {
      std::cerr << "决策账本应通过校验:\n" << reentry::FormatValidationReport(report);
      return 1;
    }
  }

  {
    // 账本关闭：决策照常处理，但带 ledger_disabled 标记且没有序号。
    reentry::TieredResolver resolver(reentry::ResolverConfig{}, vocabulary);
    std::string error;
    if (!resolver.LoadParameterSets({GlobalOnlySet()}, "test", &error)) {
      std::cerr << "装载参数集失败: " << error << "\n";
      return 1;
    }
    reentry::ReentryTracker tracker(15, 5, [] { return kBaseTimeMs; });
    reentry::DecisionProcessor processor(reentry::ProcessorConfig{}, codec, resolver, tracker,
                                         nullptr);
    const auto response = processor.Process(ClosedTrade("U1", "EURUSD"));
    if (response.status != reentry::DecisionStatus::kProcessed ||
        response.reason != reentry::kLedgerDisabledReason || response.file_seq != 0U ||
        !response.checksum.empty() ||
        response.ToJson().find("\"reason\":\"ledger_disabled\"") == std::string::npos) {
      std::cerr << "账本关闭时决策应标记 ledger_disabled: " << response.ToJson() << "\n";
      return 1;
    }
  }

  {
    // 分类边界与手数步长。
    reentry::ProcessorConfig config;
    config.symbol_lot_steps["XAUUSD"] = 0.1;
    reentry::TieredResolver resolver(reentry::ResolverConfig{}, vocabulary);
    reentry::ReentryTracker tracker(15, 5);
    reentry::DecisionProcessor processor(config, codec, resolver, tracker, nullptr);
    if (processor.ClassifyOutcome(5.0) != reentry::OutcomeClass::kWin ||
        processor.ClassifyOutcome(4.9) != reentry::OutcomeClass::kBreakeven ||
        processor.ClassifyOutcome(-5.0) != reentry::OutcomeClass::kLoss) {
      std::cerr << "结果分类阈值错误\n";
      return 1;
    }
    if (processor.ClassifyDuration(5.0) != reentry::DurationClass::kFlash ||
        processor.ClassifyDuration(30.0) != reentry::DurationClass::kQuick ||
        processor.ClassifyDuration(240.0) != reentry::DurationClass::kLong ||
        processor.ClassifyDuration(241.0) != reentry::DurationClass::kExtended) {
      std::cerr << "时长分类阈值错误\n";
      return 1;
    }
    if (!NearlyEqual(processor.SizeLot("EURUSD", 0.1, 1.2), 0.12) ||
        !NearlyEqual(processor.SizeLot("EURUSD", 0.01, 0.3), 0.01) ||
        !NearlyEqual(processor.SizeLot("XAUUSD", 1.0, 0.7), 0.7) ||
        !NearlyEqual(processor.SizeLot("XAUUSD", 0.2, 0.2), 0.1)) {
      std::cerr << "手数步长取整错误\n";
      return 1;
    }
    if (reentry::DecisionProcessor::OutcomeToken(reentry::OutcomeClass::kLoss) != "L1" ||
        reentry::DecisionProcessor::OutcomeToken(reentry::OutcomeClass::kBreakeven) !=
            "BE") {
      std::cerr << "结果 token 映射错误\n";
      return 1;
    }
  }

  {
    // 日内上限：只有提交的再入场计数，未提交的凭证释放后不计数，跨日重置。
    std::int64_t now_ms = kBaseTimeMs;
    reentry::ReentryTracker tracker(0, 2, [&now_ms] { return now_ms; });
    std::string reason;
    {
      auto released = tracker.TryAcquire("EURUSD", &reason);
      if (!released.acquired()) {
        std::cerr << "首次准入应成功\n";
        return 1;
      }
    }
    for (int i = 0; i < 2; ++i) {
      auto slot = tracker.TryAcquire("EURUSD", &reason);
      if (!slot.acquired()) {
        std::cerr << "日内上限前准入应成功\n";
        return 1;
      }
      slot.Commit(true);
    }
    if (tracker.TryAcquire("EURUSD", &reason).acquired() ||
        reason != "daily_limit_exceeded") {
      std::cerr << "达到日内上限应拒绝\n";
      return 1;
    }
    if (!tracker.TryAcquire("GBPUSD", &reason).acquired()) {
      std::cerr << "其他品种不受影响\n";
      return 1;
    }
    now_ms += 24 * 60 * kMinuteMs;
    if (!tracker.TryAcquire("EURUSD", &reason).acquired()) {
      std::cerr << "跨 UTC 日后计数应重置\n";
      return 1;
    }
    const auto stats = tracker.stats();
    if (stats.commits != 2U || stats.daily_limit_rejects != 1U || stats.releases != 3U) {
      std::cerr << "准入统计不符合预期: commits=" << stats.commits
                << " releases=" << stats.releases << "\n";
      return 1;
    }
  }

  {
    // 同品种并发决策串行：日内上限不会被同时突破。
    reentry::ReentryTracker tracker(0, 3, [] { return kBaseTimeMs; });
    std::atomic<int> committed{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
      workers.emplace_back([&] {
        for (int i = 0; i < 5; ++i) {
          std::string reason;
          auto slot = tracker.TryAcquire("EURUSD", &reason);
          if (slot.acquired()) {
            slot.Commit(true);
            ++committed;
          }
        }
      });
    }
    for (auto& worker : workers) {
      worker.join();
    }
    if (committed.load() != 3 || tracker.DailyAttempts().at("EURUSD") != 3) {
      std::cerr << "并发准入突破日内上限: " << committed.load() << "\n";
      return 1;
    }
  }

  {
    // 账本写失败：决策返回 write_failure，且不进入冷却。
    const auto dir = FreshTempDir("reentry_test_processor_write_failure");
    const auto blocker = dir / "blocked";
    if (!WriteTextFile(blocker, "x")) {
      std::cerr << "写入占位文件失败\n";
      return 1;
    }
    reentry::LedgerConfig ledger_config;
    ledger_config.output_directory = blocker.string();
    reentry::IntegrityLedger ledger(ledger_config, reentry::ReentryDecisionSchema(),
                                    [] { return kBaseTimeMs; });
    reentry::TieredResolver resolver(reentry::ResolverConfig{}, vocabulary);
    std::string error;
    if (!resolver.LoadParameterSets({GlobalOnlySet()}, "test", &error)) {
      std::cerr << "装载参数集失败: " << error << "\n";
      return 1;
    }
    reentry::ReentryTracker tracker(15, 5, [] { return kBaseTimeMs; });
    reentry::DecisionProcessor processor(reentry::ProcessorConfig{}, codec, resolver,
                                         tracker, &ledger);
    const auto first = processor.Process(ClosedTrade("W1", "EURUSD"));
    const auto retry = processor.Process(ClosedTrade("W2", "EURUSD"));
    if (first.status != reentry::DecisionStatus::kWriteFailure ||
        retry.status != reentry::DecisionStatus::kWriteFailure ||
        tracker.ActiveCooldowns() != 0U || tracker.stats().releases != 2U) {
      std::cerr << "写失败不应开始冷却: " << first.ToJson() << "\n";
      return 1;
    }
  }

  {
    // 配置加载：合法文件与未知字段拒绝（带行号）。
    const auto dir = FreshTempDir("reentry_test_config");
    const auto good = dir / "reentry.yaml";
    const auto bad = dir / "reentry_bad.yaml";
    if (!WriteTextFile(good,
                       "# test\n"
                       "resolver:\n"
                       "  tier_hierarchy: [TIER1, GLOBAL]\n"
                       "processor:\n"
                       "  reentry_cooldown_minutes: 30\n"
                       "  lot_steps:\n"
                       "    XAUUSD: 0.1\n"
                       "  exclude_manual_closes: true\n"
                       "ledger:\n"
                       "  output_directory: \"/tmp/reentry ledger\"\n") ||
        !WriteTextFile(bad,
                       "processor:\n"
                       "  reentry_cooldown_minutes: 30\n"
                       "  cooldown_jitter: 5\n")) {
      std::cerr << "写入配置测试文件失败\n";
      return 1;
    }
    reentry::ReentryConfig config;
    std::string error;
    if (!reentry::LoadReentryConfigFromYaml(good.string(), &config, &error)) {
      std::cerr << "合法配置加载失败: " << error << "\n";
      return 1;
    }
    if (config.resolver.tier_hierarchy != std::vector<std::string>{"TIER1", "GLOBAL"} ||
        config.processor.reentry_cooldown_minutes != 30 ||
        !config.processor.exclude_manual_closes ||
        !NearlyEqual(config.processor.symbol_lot_steps.at("XAUUSD"), 0.1) ||
        config.ledger.output_directory != "/tmp/reentry ledger") {
      std::cerr << "配置字段解析不符合预期\n";
      return 1;
    }

    reentry::ReentryConfig untouched;
    if (reentry::LoadReentryConfigFromYaml(bad.string(), &untouched, &error) ||
        error.find("cooldown_jitter") == std::string::npos ||
        error.find("行号: 3") == std::string::npos ||
        untouched.processor.reentry_cooldown_minutes != 15) {
      std::cerr << "未知配置项应带行号报错且不修改输出: " << error << "\n";
      return 1;
    }

    reentry::ReentryConfig conflicting;
    conflicting.processor.quick_duration_max_minutes = 3.0;
    if (reentry::ValidateReentryConfig(conflicting, &error)) {
      std::cerr << "时长阈值冲突应校验失败\n";
      return 1;
    }
  }

  {
    // 服务整链：异步投递、账本落盘、健康检查。
    const auto dir = FreshTempDir("reentry_test_service");
    reentry::ReentryConfig config;
    config.resolver.parameter_sets_path = (dir / "missing_parameter_sets.json").string();
    config.ledger.output_directory = (dir / "ledger").string();
    config.service.worker_threads = 3;
    reentry::ReentryService service(config, [] { return kBaseTimeMs; });
    std::string error;
    if (!service.Initialize(&error)) {
      std::cerr << "服务初始化失败: " << error << "\n";
      return 1;
    }
    service.Start();

    const std::vector<std::string> symbols = {"EURUSD", "GBPUSD", "USDJPY", "AUDUSD"};
    for (std::size_t i = 0; i < symbols.size(); ++i) {
      if (!service.Submit(ClosedTrade("S" + std::to_string(i), symbols[i]))) {
        std::cerr << "投递决策失败\n";
        return 1;
      }
    }
    service.WaitIdle();
    std::vector<reentry::DecisionResponse> results;
    service.PollResults(&results);
    if (results.size() != symbols.size()) {
      std::cerr << "异步结果数量不符: " << results.size() << "\n";
      return 1;
    }
    for (const auto& result : results) {
      // 默认参数集：WIN 命中 TIER2 win_outcomes（乘数 1.2）。
      if (result.status != reentry::DecisionStatus::kProcessed ||
          result.parameter_set_id != "win_outcomes" ||
          !NearlyEqual(result.lot_size, 0.12)) {
        std::cerr << "异步决策结果不符合预期: " << result.ToJson() << "\n";
        return 1;
      }
    }
    for (const auto& health : service.HealthCheck()) {
      if (health.state != reentry::HealthState::kHealthy) {
        std::cerr << "组件不健康: " << health.component << " " << health.detail << "\n";
        return 1;
      }
    }
    service.Stop();
    if (service.Submit(ClosedTrade("late", "NZDUSD"))) {
      std::cerr << "停止后不应再接受投递\n";
      return 1;
    }

    reentry::LedgerValidator validator;
    const auto reports = validator.VerifyDirectory((dir / "ledger").string());
    if (reports.size() != 1U || !reports.front().passed ||
        reports.front().total_rows != symbols.size()) {
      std::cerr << "服务账本校验失败\n";
      return 1;
    }
  }

  {
    // 批量处理：结果与输入一一对应，同品种冷却与账本序号按输入顺序确定。
    const auto dir = FreshTempDir("reentry_test_service_batch");
    reentry::ReentryConfig config;
    config.resolver.parameter_sets_path = (dir / "missing_parameter_sets.json").string();
    config.ledger.output_directory = (dir / "ledger").string();
    config.service.worker_threads = 4;
    reentry::ReentryService service(config, [] { return kBaseTimeMs; });
    std::string error;
    if (!service.Initialize(&error)) {
      std::cerr << "服务初始化失败: " << error << "\n";
      return 1;
    }
    reentry::DecisionContext short_trade = ClosedTrade("B4", "USDJPY");
    short_trade.duration_minutes = 0.5;
    const std::vector<reentry::DecisionContext> batch = {
        ClosedTrade("B1", "EURUSD"), ClosedTrade("B2", "EURUSD"),
        ClosedTrade("B3", "GBPUSD"), short_trade};

    for (int round = 0; round < 3; ++round) {
      const auto results = service.ProcessBatch(batch);
      if (results.size() != batch.size()) {
        std::cerr << "批量结果数量不符: " << results.size() << "\n";
        return 1;
      }
      for (std::size_t i = 0; i < batch.size(); ++i) {
        if (results[i].trade_id != batch[i].trade_id) {
          std::cerr << "批量结果顺序与输入不一致: " << results[i].trade_id << "\n";
          return 1;
        }
      }
      if (round == 0) {
        if (results[0].status != reentry::DecisionStatus::kProcessed ||
            results[0].file_seq != 1U ||
            results[1].reason != "cooldown_period_active" ||
            results[2].status != reentry::DecisionStatus::kProcessed ||
            results[2].file_seq != 2U || results[3].reason != "duration_too_short") {
          std::cerr << "首轮批量结果不符合预期: " << results[1].ToJson() << "\n";
          return 1;
        }
      } else if (results[0].reason != "cooldown_period_active" ||
                 results[2].reason != "cooldown_period_active") {
        // 时钟固定，冷却未结束，后续轮次同品种全部跳过。
        std::cerr << "冷却期内重复批量应全部跳过\n";
        return 1;
      }
    }
  }

  std::cout << "reentry_core tests passed\n";
  return 0;
}
