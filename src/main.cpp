#include <cmath>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "app/reentry_service.h"
#include "core/config.h"
#include "core/json_utils.h"
#include "core/log.h"
#include "hybrid_id/hybrid_id_codec.h"
#include "ledger/ledger_schema.h"
#include "ledger/ledger_validator.h"
#include "resolver/tiered_resolver.h"
#include "vocab/vocabulary.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr const char* kDefaultConfigPath = "config/reentry.yaml";

struct RuntimeOptions {
  std::optional<std::string> config_path;
  std::string input_path;
  std::string command;
  std::vector<std::string> args;
};

void PrintUsage() {
  std::cerr
      << "用法: reentry_cli [--config=PATH] <command> [args]\n"
         "  compose OUTCOME DURATION PROXIMITY CALENDAR DIRECTION GENERATION [SUFFIX]\n"
         "  parse ID | validate ID | hash ID | comment ID\n"
         "  chain GENERATION\n"
         "  vocab\n"
         "  resolve OUTCOME DURATION PROXIMITY CALENDAR SYMBOL [GENERATION]\n"
         "  status\n"
         "  process --input=FILE\n"
         "  verify FILE|DIR\n";
}

bool ParseInt(const std::string& raw, int* out_value) {
  if (out_value == nullptr || raw.empty()) {
    return false;
  }
  try {
    std::size_t consumed = 0;
    const int parsed = std::stoi(raw, &consumed);
    if (consumed != raw.size()) {
      return false;
    }
    *out_value = parsed;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

bool ParseDouble(const std::string& raw, double* out_value) {
  if (out_value == nullptr || raw.empty()) {
    return false;
  }
  try {
    std::size_t consumed = 0;
    const double parsed = std::stod(raw, &consumed);
    if (consumed != raw.size() || !std::isfinite(parsed)) {
      return false;
    }
    *out_value = parsed;
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

bool ParseOptions(int argc, char** argv, RuntimeOptions* out_options) {
  RuntimeOptions options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg.rfind("--config=", 0) == 0) {
      options.config_path = arg.substr(std::string("--config=").size());
      continue;
    }
    if (arg == "--config" && i + 1 < argc) {
      options.config_path = argv[++i];
      continue;
    }
    if (arg.rfind("--input=", 0) == 0) {
      options.input_path = arg.substr(std::string("--input=").size());
      continue;
    }
    if (arg == "--input" && i + 1 < argc) {
      options.input_path = argv[++i];
      continue;
    }
    if (arg.rfind("--", 0) == 0) {
      std::cerr << "未知选项: " << arg << "\n";
      return false;
    }
    if (options.command.empty()) {
      options.command = arg;
    } else {
      options.args.push_back(arg);
    }
  }
  if (options.command.empty()) {
    return false;
  }
  *out_options = std::move(options);
  return true;
}

// 显式指定的配置必须可加载；未指定时默认文件存在才加载，否则使用内置默认。
bool LoadConfig(const RuntimeOptions& options, reentry::ReentryConfig* out_config) {
  std::string path;
  if (options.config_path.has_value()) {
    path = *options.config_path;
  } else {
    std::error_code ec;
    if (!std::filesystem::exists(kDefaultConfigPath, ec)) {
      return true;
    }
    path = kDefaultConfigPath;
  }
  std::string error;
  if (!reentry::LoadReentryConfigFromYaml(path, out_config, &error)) {
    reentry::LogError("配置加载失败: " + error);
    return false;
  }
  reentry::LogInfo("配置加载成功: file=" + path);
  return true;
}

std::string HybridIdToJson(const reentry::HybridId& id) {
  std::ostringstream oss;
  oss << "{\"outcome\":" << reentry::JsonQuote(id.outcome)
      << ",\"duration\":" << reentry::JsonQuote(id.duration)
      << ",\"proximity\":" << reentry::JsonQuote(id.proximity)
      << ",\"calendar\":" << reentry::JsonQuote(id.calendar)
      << ",\"direction\":" << reentry::JsonQuote(id.direction)
      << ",\"generation\":" << id.generation << ",\"suffix\":"
      << (id.suffix.has_value() ? reentry::JsonQuote(*id.suffix) : std::string("null"))
      << "}";
  return oss.str();
}

std::string ResolvedToJson(const reentry::ResolvedParameters& resolved) {
  std::ostringstream oss;
  oss << "{\"parameter_set_id\":" << reentry::JsonQuote(resolved.parameter_set_id)
      << ",\"parameter_set_name\":" << reentry::JsonQuote(resolved.parameter_set_name)
      << ",\"resolved_tier\":" << reentry::JsonQuote(resolved.resolved_tier)
      << ",\"specificity_score\":" << reentry::FormatDecimal(resolved.specificity_score)
      << ",\"reentry_enabled\":" << (resolved.reentry_enabled ? "true" : "false")
      << ",\"max_generation\":" << resolved.max_generation
      << ",\"lot_size_multiplier\":" << reentry::FormatDecimal(resolved.lot_size_multiplier)
      << ",\"stop_loss_pips\":" << reentry::FormatDecimal(resolved.stop_loss_pips)
      << ",\"take_profit_pips\":" << reentry::FormatDecimal(resolved.take_profit_pips)
      << ",\"confidence_threshold\":"
      << reentry::FormatDecimal(resolved.confidence_threshold)
      << ",\"min_wait_minutes\":" << resolved.min_wait_minutes
      << ",\"max_wait_minutes\":" << resolved.max_wait_minutes
      << ",\"generation_allowed\":" << (resolved.generation_allowed ? "true" : "false")
      << ",\"next_generation\":"
      << (resolved.next_generation.has_value() ? std::to_string(*resolved.next_generation)
                                               : std::string("null"))
      << "}";
  return oss.str();
}

int RunCodecCommand(const RuntimeOptions& options, const reentry::ReentryConfig& config) {
  std::string error;
  const auto vocabulary = reentry::BuildVocabulary(config.vocabulary, &error);
  if (!vocabulary) {
    reentry::LogError(error);
    return kExitFailure;
  }
  const reentry::HybridIdCodec codec(vocabulary);
  const std::string& command = options.command;
  const std::vector<std::string>& args = options.args;

  if (command == "vocab") {
    std::cout << vocabulary->Summary();
    return kExitOk;
  }
  if (command == "chain") {
    int generation = 0;
    if (args.size() != 1U || !ParseInt(args[0], &generation)) {
      return kExitUsage;
    }
    std::string position;
    reentry::HybridIdError id_error;
    if (!reentry::HybridIdCodec::ChainPosition(generation, &position, &id_error)) {
      std::cerr << reentry::ToString(id_error.code) << ": " << id_error.message << "\n";
      return kExitFailure;
    }
    std::cout << position << "\n";
    return kExitOk;
  }
  if (command == "compose") {
    int generation = 0;
    if ((args.size() != 6U && args.size() != 7U) || !ParseInt(args[5], &generation)) {
      return kExitUsage;
    }
    std::optional<std::string> suffix;
    if (args.size() == 7U) {
      suffix = args[6];
    }
    reentry::HybridId id;
    reentry::HybridIdError id_error;
    if (!codec.Compose(args[0], args[1], args[2], args[3], args[4], generation, suffix,
                       &id, &id_error)) {
      std::cerr << reentry::ToString(id_error.code) << ": " << id_error.message << "\n";
      return kExitFailure;
    }
    std::cout << id.ToString() << "\n";
    return kExitOk;
  }

  if (args.size() != 1U) {
    return kExitUsage;
  }
  const std::string& text = args[0];
  if (command == "parse") {
    reentry::HybridId id;
    reentry::HybridIdError id_error;
    if (!codec.Parse(text, &id, &id_error)) {
      std::cerr << reentry::ToString(id_error.code) << ": " << id_error.message << "\n";
      return kExitFailure;
    }
    std::cout << HybridIdToJson(id) << "\n";
    return kExitOk;
  }
  if (command == "validate") {
    const bool valid = codec.Validate(text);
    std::cout << (valid ? "valid" : "invalid") << "\n";
    return valid ? kExitOk : kExitFailure;
  }
  if (command == "hash") {
    const auto hash = reentry::HybridIdCodec::CommentHash(text);
    if (!hash.has_value()) {
      return kExitFailure;
    }
    std::cout << *hash << "\n";
    return kExitOk;
  }
  if (command == "comment") {
    const auto comment = codec.DecomposeForComment(text);
    if (!comment.has_value()) {
      return kExitFailure;
    }
    std::cout << *comment << "\n";
    return kExitOk;
  }
  return kExitUsage;
}

bool ReadContexts(const std::string& path,
                  std::vector<reentry::DecisionContext>* out_contexts,
                  std::string* out_error) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    *out_error = "无法读取输入文件: " + path;
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(in)),
                         std::istreambuf_iterator<char>());
  std::vector<std::vector<std::string>> records;
  if (!reentry::DecodeCsv(text, &records, out_error)) {
    return false;
  }
  if (records.empty()) {
    *out_error = "输入文件缺少表头: " + path;
    return false;
  }
  const std::vector<std::string>& header = records.front();
  for (std::size_t r = 1; r < records.size(); ++r) {
    const std::vector<std::string>& cells = records[r];
    const std::string where = "第 " + std::to_string(r) + " 行";
    if (cells.size() != header.size()) {
      *out_error = where + " 列数与表头不一致";
      return false;
    }
    reentry::DecisionContext context;
    for (std::size_t c = 0; c < header.size(); ++c) {
      const std::string& key = header[c];
      const std::string& value = cells[c];
      bool ok = true;
      if (key == "trade_id") {
        context.trade_id = value;
      } else if (key == "symbol") {
        context.symbol = value;
      } else if (key == "direction") {
        context.direction = value;
      } else if (key == "generation") {
        ok = ParseInt(value, &context.generation);
      } else if (key == "current_lot_size" || key == "lot_size") {
        ok = ParseDouble(value, &context.current_lot_size);
      } else if (key == "profit_loss_pips") {
        ok = ParseDouble(value, &context.profit_loss_pips);
      } else if (key == "duration_minutes") {
        ok = ParseDouble(value, &context.duration_minutes);
      } else if (key == "trade_closed") {
        ok = value == "true" || value == "false" || value == "1" || value == "0";
        context.trade_closed = value == "true" || value == "1";
      } else if (key == "close_reason") {
        context.close_reason = value;
      } else if (key == "proximity_state") {
        context.proximity_state = value;
      } else if (key == "calendar_id") {
        context.calendar_id = value;
      } else if (key == "comment") {
        context.comment = value;
      } else {
        *out_error = "未知列: " + key;
        return false;
      }
      if (!ok) {
        *out_error = where + " 字段 " + key + " 非法: " + value;
        return false;
      }
    }
    out_contexts->push_back(std::move(context));
  }
  return true;
}

int RunServiceCommand(const RuntimeOptions& options, const reentry::ReentryConfig& config) {
  reentry::ReentryConfig service_config = config;
  // 只读命令不需要账本写入。
  if (options.command != "process") {
    service_config.ledger.enabled = false;
  }
  reentry::ReentryService service(service_config);
  std::string error;
  if (!service.Initialize(&error)) {
    reentry::LogError("服务初始化失败: " + error);
    return kExitFailure;
  }

  if (options.command == "resolve") {
    const std::vector<std::string>& args = options.args;
    int generation = 1;
    if ((args.size() != 5U && args.size() != 6U) ||
        (args.size() == 6U && !ParseInt(args[5], &generation))) {
      return kExitUsage;
    }
    const reentry::ResolvedParameters resolved = service.resolver().Resolve(
        reentry::ResolveRequest{.outcome = args[0],
                                .duration = args[1],
                                .proximity = args[2],
                                .calendar = args[3],
                                .symbol = args[4],
                                .generation = generation});
    std::cout << ResolvedToJson(resolved) << "\n";
    return kExitOk;
  }

  if (options.command == "status") {
    const reentry::ResolverStatus status = service.resolver().Status();
    std::cout << "parameter_sets: total=" << status.total_parameter_sets
              << " active=" << status.active_parameter_sets << " source=" << status.source
              << " loaded_at=" << status.loaded_at << "\n";
    for (const auto& tier : status.tier_hierarchy) {
      std::cout << "  " << tier << ": " << status.tier_counts.at(tier) << "\n";
    }
    for (const auto& health : service.HealthCheck()) {
      std::cout << health.component << ": " << reentry::ToString(health.state) << " "
                << health.detail << "\n";
    }
    return kExitOk;
  }

  // process
  if (options.input_path.empty()) {
    return kExitUsage;
  }
  std::vector<reentry::DecisionContext> contexts;
  if (!ReadContexts(options.input_path, &contexts, &error)) {
    reentry::LogError(error);
    return kExitFailure;
  }
  // 批量输入按文件顺序同步处理，输出顺序与输入一致。
  const std::vector<reentry::DecisionResponse> results = service.ProcessBatch(contexts);

  int exit_code = kExitOk;
  for (const auto& response : results) {
    std::cout << response.ToJson() << "\n";
    if (response.status == reentry::DecisionStatus::kInvalidContext ||
        response.status == reentry::DecisionStatus::kWriteFailure) {
      exit_code = kExitFailure;
    }
  }
  return exit_code;
}

int RunVerifyCommand(const RuntimeOptions& options) {
  if (options.args.size() != 1U) {
    return kExitUsage;
  }
  const std::string& target = options.args[0];
  reentry::LedgerValidator validator;
  std::vector<reentry::ValidationReport> reports;
  std::error_code ec;
  if (std::filesystem::is_directory(target, ec)) {
    reports = validator.VerifyDirectory(target);
  } else {
    reports.push_back(validator.Verify(target));
  }
  bool all_passed = true;
  for (const auto& report : reports) {
    std::cout << reentry::FormatValidationReport(report);
    all_passed = all_passed && report.passed;
  }
  return all_passed ? kExitOk : kExitFailure;
}

}  // namespace

int main(int argc, char** argv) {
  RuntimeOptions options;
  if (!ParseOptions(argc, argv, &options)) {
    PrintUsage();
    return kExitUsage;
  }

  int exit_code = kExitUsage;
  if (options.command == "verify") {
    exit_code = RunVerifyCommand(options);
  } else {
    reentry::ReentryConfig config;
    if (!LoadConfig(options, &config)) {
      return kExitFailure;
    }
    const std::string& command = options.command;
    if (command == "compose" || command == "parse" || command == "validate" ||
        command == "hash" || command == "comment" || command == "chain" ||
        command == "vocab") {
      exit_code = RunCodecCommand(options, config);
    } else if (command == "resolve" || command == "status" || command == "process") {
      exit_code = RunServiceCommand(options, config);
    }
  }
  if (exit_code == kExitUsage) {
    PrintUsage();
  }
  return exit_code;
}
