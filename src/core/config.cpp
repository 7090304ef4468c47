#include "core/config.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace reentry {

namespace {

// 以下工具函数用于“轻量 YAML 解析”：
// - 通过缩进识别 section / subsection；
// - 键路径经注册表分派，未注册即视为未知键。
std::string Trim(const std::string& text) {
  std::size_t begin = 0;
  while (begin < text.size() &&
         std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }

  std::size_t end = text.size();
  while (end > begin &&
         std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return text.substr(begin, end - begin);
}

std::string StripInlineComment(const std::string& line) {
  // 仅剔除非引号上下文中的 `#` 注释，避免误伤字符串内容。
  bool in_single_quotes = false;
  bool in_double_quotes = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '\'' && !in_double_quotes) {
      in_single_quotes = !in_single_quotes;
      continue;
    }
    if (ch == '"' && !in_single_quotes) {
      in_double_quotes = !in_double_quotes;
      continue;
    }
    if (ch == '#' && !in_single_quotes && !in_double_quotes) {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string Unquote(const std::string& text) {
  if (text.size() < 2) {
    return text;
  }
  const bool single_quoted = text.front() == '\'' && text.back() == '\'';
  const bool double_quoted = text.front() == '"' && text.back() == '"';
  if (single_quoted || double_quoted) {
    return text.substr(1, text.size() - 2);
  }
  return text;
}

bool ParseScalar(const std::string& text, double* out_value) {
  std::istringstream iss(text);
  double value = 0.0;
  iss >> value;
  if (!iss.fail() && iss.eof()) {
    *out_value = value;
    return true;
  }
  return false;
}

bool ParseScalar(const std::string& text, int* out_value) {
  std::istringstream iss(text);
  int value = 0;
  iss >> value;
  if (!iss.fail() && iss.eof()) {
    *out_value = value;
    return true;
  }
  return false;
}

bool ParseScalar(const std::string& text, bool* out_value) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "true" || lowered == "1" || lowered == "yes") {
    *out_value = true;
    return true;
  }
  if (lowered == "false" || lowered == "0" || lowered == "no") {
    *out_value = false;
    return true;
  }
  return false;
}

bool ParseScalar(const std::string& text, std::string* out_value) {
  *out_value = Unquote(text);
  return true;
}

bool ParseScalar(const std::string& text, std::vector<std::string>* out_items) {
  std::string trimmed = Trim(text);
  if (trimmed.size() < 2 || trimmed.front() != '[' || trimmed.back() != ']') {
    return false;
  }
  trimmed = trimmed.substr(1, trimmed.size() - 2);
  std::vector<std::string> items;
  std::string token;
  std::istringstream iss(trimmed);
  while (std::getline(iss, token, ',')) {
    const std::string item = Trim(Unquote(Trim(token)));
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  *out_items = std::move(items);
  return true;
}

using FieldSetter = std::function<bool(const std::string&, ReentryConfig*)>;

template <typename Section, typename Field>
FieldSetter Bind(Section ReentryConfig::*section, Field Section::*field) {
  return [section, field](const std::string& raw, ReentryConfig* config) {
    return ParseScalar(raw, &((config->*section).*field));
  };
}

// 键路径注册表：`section.key` -> 解析写入函数。
const std::unordered_map<std::string, FieldSetter>& FieldRegistry() {
  static const std::unordered_map<std::string, FieldSetter> kRegistry = {
      {"vocabulary.file", Bind(&ReentryConfig::vocabulary, &VocabularyConfig::file_path)},
      {"vocabulary.require_file",
       Bind(&ReentryConfig::vocabulary, &VocabularyConfig::require_file)},

      {"resolver.parameter_sets_file",
       Bind(&ReentryConfig::resolver, &ResolverConfig::parameter_sets_path)},
      {"resolver.tier_hierarchy",
       Bind(&ReentryConfig::resolver, &ResolverConfig::tier_hierarchy)},
      {"resolver.use_defaults_if_missing",
       Bind(&ReentryConfig::resolver, &ResolverConfig::use_defaults_if_missing)},

      {"processor.process_completed_trades_only",
       Bind(&ReentryConfig::processor, &ProcessorConfig::process_completed_trades_only)},
      {"processor.min_trade_duration_minutes",
       Bind(&ReentryConfig::processor, &ProcessorConfig::min_trade_duration_minutes)},
      {"processor.exclude_manual_closes",
       Bind(&ReentryConfig::processor, &ProcessorConfig::exclude_manual_closes)},
      {"processor.reentry_cooldown_minutes",
       Bind(&ReentryConfig::processor, &ProcessorConfig::reentry_cooldown_minutes)},
      {"processor.max_reentry_attempts_per_day",
       Bind(&ReentryConfig::processor, &ProcessorConfig::max_reentry_attempts_per_day)},
      {"processor.profit_threshold_pips",
       Bind(&ReentryConfig::processor, &ProcessorConfig::profit_threshold_pips)},
      {"processor.loss_threshold_pips",
       Bind(&ReentryConfig::processor, &ProcessorConfig::loss_threshold_pips)},
      {"processor.flash_duration_max_minutes",
       Bind(&ReentryConfig::processor, &ProcessorConfig::flash_duration_max_minutes)},
      {"processor.quick_duration_max_minutes",
       Bind(&ReentryConfig::processor, &ProcessorConfig::quick_duration_max_minutes)},
      {"processor.long_duration_max_minutes",
       Bind(&ReentryConfig::processor, &ProcessorConfig::long_duration_max_minutes)},
      {"processor.lot_step", Bind(&ReentryConfig::processor, &ProcessorConfig::lot_step)},
      {"processor.confidence_specificity_weight",
       Bind(&ReentryConfig::processor, &ProcessorConfig::confidence_specificity_weight)},
      {"processor.confidence_win_bonus",
       Bind(&ReentryConfig::processor, &ProcessorConfig::confidence_win_bonus)},
      {"processor.confidence_loss_penalty",
       Bind(&ReentryConfig::processor, &ProcessorConfig::confidence_loss_penalty)},
      {"processor.confidence_generation_penalty",
       Bind(&ReentryConfig::processor, &ProcessorConfig::confidence_generation_penalty)},
      {"processor.recent_decisions_capacity",
       Bind(&ReentryConfig::processor, &ProcessorConfig::recent_decisions_capacity)},

      {"ledger.enabled", Bind(&ReentryConfig::ledger, &LedgerConfig::enabled)},
      {"ledger.output_directory",
       Bind(&ReentryConfig::ledger, &LedgerConfig::output_directory)},
      {"ledger.rotation_hours", Bind(&ReentryConfig::ledger, &LedgerConfig::rotation_hours)},
      {"ledger.max_file_size_mb",
       Bind(&ReentryConfig::ledger, &LedgerConfig::max_file_size_mb)},

      {"service.name", Bind(&ReentryConfig::service, &ServiceConfig::name)},
      {"service.worker_threads",
       Bind(&ReentryConfig::service, &ServiceConfig::worker_threads)},
  };
  return kRegistry;
}

bool IsKnownSection(const std::string& section) {
  return section == "vocabulary" || section == "resolver" ||
         section == "processor" || section == "ledger" || section == "service";
}

bool Fail(const std::string& message, std::string* out_error) {
  if (out_error != nullptr) {
    *out_error = message;
  }
  return false;
}

}  // namespace

bool LoadReentryConfigFromYaml(const std::string& file_path,
                               ReentryConfig* out_config,
                               std::string* out_error) {
  if (out_config == nullptr) {
    return Fail("out_config 为空", out_error);
  }

  std::ifstream input(file_path);
  if (!input.is_open()) {
    return Fail("无法打开配置文件: " + file_path, out_error);
  }

  ReentryConfig config = *out_config;
  std::string current_section;
  std::string current_subsection;
  std::string line;
  int line_no = 0;
  while (std::getline(input, line)) {
    ++line_no;
    const std::string no_comment = Trim(StripInlineComment(line));
    if (no_comment.empty()) {
      continue;
    }
    const std::string at_line = "，行号: " + std::to_string(line_no);

    const std::size_t indent = line.find_first_not_of(' ');
    if (indent == std::string::npos) {
      continue;
    }

    if (indent == 0) {
      if (no_comment.back() != ':') {
        return Fail("顶层只允许 section 声明" + at_line, out_error);
      }
      current_section = Trim(no_comment.substr(0, no_comment.size() - 1));
      current_subsection.clear();
      if (!IsKnownSection(current_section)) {
        return Fail("未知配置段: " + current_section + at_line, out_error);
      }
      continue;
    }

    if (current_section.empty()) {
      return Fail("配置项缺少所属 section" + at_line, out_error);
    }

    if (indent == 2 && no_comment.back() == ':') {
      current_subsection = Trim(no_comment.substr(0, no_comment.size() - 1));
      if (current_section != "processor" || current_subsection != "lot_steps") {
        return Fail("未知配置子段: " + current_section + "." + current_subsection +
                        at_line,
                    out_error);
      }
      continue;
    }
    if (indent <= 2) {
      current_subsection.clear();
    }

    const std::size_t colon_pos = no_comment.find(':');
    if (colon_pos == std::string::npos) {
      return Fail("配置行缺少 ':'" + at_line, out_error);
    }
    const std::string key = Trim(no_comment.substr(0, colon_pos));
    const std::string value = Trim(no_comment.substr(colon_pos + 1));
    if (value.empty()) {
      return Fail(current_section + "." + key + " 缺少取值" + at_line, out_error);
    }

    if (!current_subsection.empty()) {
      // processor.lot_steps: 品种 -> 最小手数步长。
      double step = 0.0;
      if (!ParseScalar(Unquote(value), &step)) {
        return Fail("processor.lot_steps." + key + " 解析失败" + at_line, out_error);
      }
      config.processor.symbol_lot_steps[Unquote(key)] = step;
      continue;
    }

    const std::string path = current_section + "." + key;
    const auto& registry = FieldRegistry();
    const auto it = registry.find(path);
    if (it == registry.end()) {
      return Fail("未知配置项: " + path + at_line, out_error);
    }
    const std::string scalar = (value.front() == '[') ? value : Unquote(value);
    if (!it->second(scalar, &config)) {
      return Fail(path + " 解析失败" + at_line, out_error);
    }
  }

  if (!ValidateReentryConfig(config, out_error)) {
    return false;
  }
  *out_config = config;
  return true;
}

bool ValidateReentryConfig(const ReentryConfig& config, std::string* out_error) {
  const ProcessorConfig& p = config.processor;
  if (config.resolver.tier_hierarchy.empty()) {
    return Fail("resolver.tier_hierarchy 不能为空", out_error);
  }
  std::unordered_set<std::string> seen_tiers;
  for (const auto& tier : config.resolver.tier_hierarchy) {
    if (tier == "EMERGENCY") {
      return Fail("resolver.tier_hierarchy 不能包含保留层级 EMERGENCY", out_error);
    }
    if (!seen_tiers.insert(tier).second) {
      return Fail("resolver.tier_hierarchy 存在重复层级: " + tier, out_error);
    }
  }
  if (p.min_trade_duration_minutes < 0.0) {
    return Fail("processor.min_trade_duration_minutes 不能为负数", out_error);
  }
  if (p.reentry_cooldown_minutes < 0) {
    return Fail("processor.reentry_cooldown_minutes 不能为负数", out_error);
  }
  if (p.max_reentry_attempts_per_day < 0) {
    return Fail("processor.max_reentry_attempts_per_day 不能为负数", out_error);
  }
  if (p.profit_threshold_pips < p.loss_threshold_pips) {
    return Fail("processor.profit_threshold_pips 不能小于 loss_threshold_pips",
                out_error);
  }
  if (p.flash_duration_max_minutes < 0.0 ||
      p.quick_duration_max_minutes <= p.flash_duration_max_minutes ||
      p.long_duration_max_minutes <= p.quick_duration_max_minutes) {
    return Fail("processor 时长阈值必须满足 0 <= flash < quick < long", out_error);
  }
  if (p.lot_step <= 0.0) {
    return Fail("processor.lot_step 必须大于 0", out_error);
  }
  for (const auto& [symbol, step] : p.symbol_lot_steps) {
    if (step <= 0.0) {
      return Fail("processor.lot_steps." + symbol + " 必须大于 0", out_error);
    }
  }
  if (p.confidence_specificity_weight < 0.0 || p.confidence_win_bonus < 0.0 ||
      p.confidence_loss_penalty < 0.0 || p.confidence_generation_penalty < 0.0) {
    return Fail("processor confidence 调整参数不能为负数", out_error);
  }
  if (p.recent_decisions_capacity <= 0) {
    return Fail("processor.recent_decisions_capacity 必须大于 0", out_error);
  }
  if (config.ledger.output_directory.empty()) {
    return Fail("ledger.output_directory 不能为空", out_error);
  }
  if (config.ledger.rotation_hours <= 0) {
    return Fail("ledger.rotation_hours 必须大于 0", out_error);
  }
  if (config.ledger.max_file_size_mb <= 0) {
    return Fail("ledger.max_file_size_mb 必须大于 0", out_error);
  }
  if (config.service.worker_threads < 1) {
    return Fail("service.worker_threads 必须至少为 1", out_error);
  }
  if (config.vocabulary.require_file && config.vocabulary.file_path.empty()) {
    return Fail("vocabulary.require_file=true 时 vocabulary.file 不能为空", out_error);
  }
  return true;
}

}  // namespace reentry
