#include "vocab/vocabulary.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_set>

#include "core/json_utils.h"
#include "core/log.h"
#include "vocab/token_pattern.h"

namespace reentry {

namespace {

bool Contains(const std::vector<std::string>& tokens, const std::string& token) {
  return std::find(tokens.begin(), tokens.end(), token) != tokens.end();
}

bool IsTokenText(const std::string& token) {
  if (token.empty()) {
    return false;
  }
  return std::all_of(token.begin(), token.end(), [](unsigned char ch) {
    return std::isupper(ch) != 0 || std::isdigit(ch) != 0 || ch == '_';
  });
}

bool IsAllDigits(const std::string& token) {
  return !token.empty() &&
         std::all_of(token.begin(), token.end(),
                     [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

// 校验同一维度 token：文本合法、唯一，且按需禁止 `_`（该维度在 Hybrid ID 中占单段）。
bool CheckTokens(const std::vector<std::string>& tokens,
                 const char* dimension,
                 bool single_segment,
                 std::string* out_error) {
  if (tokens.empty()) {
    if (out_error != nullptr) {
      *out_error = std::string(dimension) + " 词表不能为空";
    }
    return false;
  }
  std::unordered_set<std::string> seen;
  for (const auto& token : tokens) {
    std::string reason;
    if (!IsTokenText(token)) {
      reason = "只能包含大写字母、数字与 '_'";
    } else if (single_segment && token.find('_') != std::string::npos) {
      reason = "不能包含 '_'";
    } else if (IsAllDigits(token)) {
      reason = "不能为纯数字";
    } else if (!seen.insert(token).second) {
      reason = "重复";
    }
    if (!reason.empty()) {
      if (out_error != nullptr) {
        *out_error = std::string(dimension) + " token '" + token + "' " + reason;
      }
      return false;
    }
  }
  return true;
}

template <typename Bucket>
std::vector<std::string> TokensOf(const std::vector<Bucket>& buckets) {
  std::vector<std::string> tokens;
  tokens.reserve(buckets.size());
  for (const auto& bucket : buckets) {
    tokens.push_back(bucket.token);
  }
  return tokens;
}

bool FailJson(const std::string& where, const std::string& reason,
              std::string* out_error) {
  if (out_error != nullptr) {
    *out_error = "词表 " + where + ": " + reason;
  }
  return false;
}

bool ReadOutcomeBuckets(const JsonValue& node,
                        std::vector<OutcomeBucket>* out,
                        std::string* out_error) {
  if (node.type != JsonType::kArray) {
    return FailJson("outcome_buckets", "必须是数组", out_error);
  }
  out->clear();
  for (const auto& item : node.array_value) {
    std::string key_error;
    if (!JsonCheckAllowedKeys(item, {"token", "rank", "desc"}, &key_error)) {
      return FailJson("outcome_buckets", key_error, out_error);
    }
    const auto token = JsonAsString(JsonObjectField(&item, "token"));
    const auto rank = JsonAsInt(JsonObjectField(&item, "rank"));
    if (!token.has_value() || !rank.has_value()) {
      return FailJson("outcome_buckets", "token(string)/rank(int) 必填", out_error);
    }
    OutcomeBucket bucket;
    bucket.token = *token;
    bucket.rank = *rank;
    bucket.desc = JsonAsString(JsonObjectField(&item, "desc")).value_or("");
    out->push_back(std::move(bucket));
  }
  return true;
}

bool ReadDurationBuckets(const JsonValue& node,
                         std::vector<DurationBucket>* out,
                         std::string* out_error) {
  if (node.type != JsonType::kArray) {
    return FailJson("duration_buckets", "必须是数组", out_error);
  }
  out->clear();
  for (const auto& item : node.array_value) {
    std::string key_error;
    if (!JsonCheckAllowedKeys(item, {"token", "max_minutes", "iso_limit", "desc"},
                              &key_error)) {
      return FailJson("duration_buckets", key_error, out_error);
    }
    const auto token = JsonAsString(JsonObjectField(&item, "token"));
    if (!token.has_value()) {
      return FailJson("duration_buckets", "token(string) 必填", out_error);
    }
    DurationBucket bucket;
    bucket.token = *token;
    const JsonValue* max_minutes = JsonObjectField(&item, "max_minutes");
    if (max_minutes != nullptr && max_minutes->type != JsonType::kNull) {
      const auto parsed = JsonAsInt(max_minutes);
      if (!parsed.has_value() || *parsed <= 0) {
        return FailJson("duration_buckets", *token + ".max_minutes 必须为正整数或 null",
                        out_error);
      }
      bucket.max_minutes = *parsed;
    }
    bucket.desc = JsonAsString(JsonObjectField(&item, "desc")).value_or("");
    out->push_back(std::move(bucket));
  }
  return true;
}

bool ReadProximityBuckets(const JsonValue& node,
                          std::vector<ProximityBucket>* out,
                          std::string* out_error) {
  if (node.type != JsonType::kArray) {
    return FailJson("proximity_buckets", "必须是数组", out_error);
  }
  out->clear();
  for (const auto& item : node.array_value) {
    std::string key_error;
    if (!JsonCheckAllowedKeys(item, {"token", "window_minutes", "desc"}, &key_error)) {
      return FailJson("proximity_buckets", key_error, out_error);
    }
    const auto token = JsonAsString(JsonObjectField(&item, "token"));
    const JsonValue* window = JsonObjectField(&item, "window_minutes");
    if (!token.has_value() || window == nullptr ||
        window->type != JsonType::kArray || window->array_value.size() != 2U) {
      return FailJson("proximity_buckets", "token 与 window_minutes[2] 必填", out_error);
    }
    const auto begin = JsonAsInt(&window->array_value[0]);
    const auto end = JsonAsInt(&window->array_value[1]);
    if (!begin.has_value() || !end.has_value() || *begin > *end) {
      return FailJson("proximity_buckets", *token + ".window_minutes 非法", out_error);
    }
    ProximityBucket bucket;
    bucket.token = *token;
    bucket.window_begin_minutes = *begin;
    bucket.window_end_minutes = *end;
    bucket.desc = JsonAsString(JsonObjectField(&item, "desc")).value_or("");
    out->push_back(std::move(bucket));
  }
  return true;
}

bool ReadStringArray(const JsonValue& node,
                     const char* where,
                     std::vector<std::string>* out,
                     std::string* out_error) {
  if (node.type != JsonType::kArray) {
    return FailJson(where, "必须是字符串数组", out_error);
  }
  out->clear();
  for (const auto& item : node.array_value) {
    const auto text = JsonAsString(&item);
    if (!text.has_value()) {
      return FailJson(where, "必须是字符串数组", out_error);
    }
    out->push_back(*text);
  }
  return true;
}

}  // namespace

const char* ToString(VocabDimension dimension) {
  switch (dimension) {
    case VocabDimension::kOutcome:
      return "outcome";
    case VocabDimension::kDuration:
      return "duration";
    case VocabDimension::kProximity:
      return "proximity";
    case VocabDimension::kDirection:
      return "direction";
  }
  return "unknown";
}

Vocabulary::Vocabulary() : Vocabulary(DefaultData()) {}

Vocabulary::Vocabulary(VocabularyData data)
    : data_(std::move(data)),
      outcome_tokens_(TokensOf(data_.outcome_buckets)),
      duration_tokens_(TokensOf(data_.duration_buckets)),
      proximity_tokens_(TokensOf(data_.proximity_buckets)) {}

VocabularyData Vocabulary::DefaultData() {
  VocabularyData data;
  data.outcome_buckets = {
      {"W2", 2, "Strong win"},
      {"W1", 1, "Win"},
      {"BE", 0, "Break-even"},
      {"L1", -1, "Loss"},
      {"L2", -2, "Strong loss"},
  };
  data.duration_buckets = {
      {"FLASH", 5, "Very short burst; <= 5 minutes"},
      {"QUICK", 30, "Short move; <= 30 minutes"},
      {"LONG", 240, "Sustained move; <= 4 hours"},
      {"EXTENDED", std::nullopt, "Prolonged; > 4 hours"},
  };
  data.proximity_buckets = {
      {"PRE_1H", -60, 0, "Pre-event window"},
      {"AT_EVENT", 0, 5, "At event window"},
      {"POST_30M", 1, 30, "Post-event window"},
  };
  data.direction_tokens = {"LONG", "SHORT", "ANY"};
  data.generation_min = 1;
  data.generation_max = 3;
  data.calendar_patterns = {"CAL8_*", "CAL5_*"};
  data.calendar_min_length = 8;
  return data;
}

const std::vector<std::string>& Vocabulary::LegalTokens(VocabDimension dimension) const {
  switch (dimension) {
    case VocabDimension::kOutcome:
      return outcome_tokens_;
    case VocabDimension::kDuration:
      return duration_tokens_;
    case VocabDimension::kProximity:
      return proximity_tokens_;
    case VocabDimension::kDirection:
      return data_.direction_tokens;
  }
  return data_.direction_tokens;
}

bool Vocabulary::IsLegalToken(VocabDimension dimension, const std::string& token) const {
  return Contains(LegalTokens(dimension), token);
}

bool Vocabulary::IsValidGeneration(int generation) const {
  return generation >= data_.generation_min && generation <= data_.generation_max;
}

bool Vocabulary::IsValidCalendar(const std::string& calendar) const {
  if (calendar == "NONE") {
    return true;
  }
  if (calendar.size() < data_.calendar_min_length || !IsTokenText(calendar)) {
    return false;
  }
  // 禁止空段（`CAL8__X`、结尾 `_`），否则 Hybrid ID 分段无法还原。
  if (calendar.find("__") != std::string::npos || calendar.back() == '_') {
    return false;
  }
  for (const auto& pattern : data_.calendar_patterns) {
    if (MatchesTokenPattern(calendar, pattern)) {
      return true;
    }
  }
  return false;
}

VocabularyCheck Vocabulary::IsValidContext(const std::string& outcome,
                                           const std::string& duration,
                                           const std::string& proximity,
                                           const std::string& calendar,
                                           const std::string& direction,
                                           int generation) const {
  VocabularyCheck check;
  if (!IsLegalToken(VocabDimension::kOutcome, outcome)) {
    check.reasons.push_back("Invalid outcome: " + outcome);
  }
  if (!IsLegalToken(VocabDimension::kDuration, duration)) {
    check.reasons.push_back("Invalid duration: " + duration);
  }
  if (!IsLegalToken(VocabDimension::kProximity, proximity)) {
    check.reasons.push_back("Invalid proximity: " + proximity);
  }
  if (!IsValidCalendar(calendar)) {
    check.reasons.push_back("Invalid calendar: " + calendar);
  }
  if (!IsLegalToken(VocabDimension::kDirection, direction)) {
    check.reasons.push_back("Invalid direction: " + direction);
  }
  if (!IsValidGeneration(generation)) {
    check.reasons.push_back("Invalid generation: " + std::to_string(generation));
  }
  check.valid = check.reasons.empty();
  return check;
}

std::optional<int> Vocabulary::OutcomeRank(const std::string& outcome) const {
  for (const auto& bucket : data_.outcome_buckets) {
    if (bucket.token == outcome) {
      return bucket.rank;
    }
  }
  return std::nullopt;
}

const DurationBucket* Vocabulary::FindDurationBucket(const std::string& duration) const {
  for (const auto& bucket : data_.duration_buckets) {
    if (bucket.token == duration) {
      return &bucket;
    }
  }
  return nullptr;
}

const ProximityBucket* Vocabulary::FindProximityBucket(
    const std::string& proximity) const {
  for (const auto& bucket : data_.proximity_buckets) {
    if (bucket.token == proximity) {
      return &bucket;
    }
  }
  return nullptr;
}

std::string Vocabulary::Summary() const {
  std::ostringstream oss;
  oss << "# Re-entry Vocabulary Summary\n\n";
  oss << "## Duration Buckets\n";
  for (const auto& bucket : data_.duration_buckets) {
    oss << "- **" << bucket.token << "**: " << bucket.desc << " (max: ";
    if (bucket.max_minutes.has_value()) {
      oss << *bucket.max_minutes;
    } else {
      oss << "unlimited";
    }
    oss << " minutes)\n";
  }
  oss << "\n## Proximity Buckets\n";
  for (const auto& bucket : data_.proximity_buckets) {
    oss << "- **" << bucket.token << "**: " << bucket.desc << " ("
        << bucket.window_begin_minutes << " to " << bucket.window_end_minutes
        << " minutes)\n";
  }
  oss << "\n## Outcome Buckets\n";
  for (const auto& bucket : data_.outcome_buckets) {
    oss << "- **" << bucket.token << "** (rank " << bucket.rank << "): "
        << bucket.desc << "\n";
  }
  oss << "\n## Direction Options\n";
  for (const auto& direction : data_.direction_tokens) {
    oss << "- **" << direction << "**\n";
  }
  oss << "\n## Calendar Patterns\n- NONE\n";
  for (const auto& pattern : data_.calendar_patterns) {
    oss << "- " << pattern << "\n";
  }
  oss << "\n## Generation Range: " << data_.generation_min << " to "
      << data_.generation_max << "\n";
  return oss.str();
}

bool ValidateVocabularyData(const VocabularyData& data, std::string* out_error) {
  if (!CheckTokens(TokensOf(data.outcome_buckets), "outcome", true, out_error) ||
      !CheckTokens(TokensOf(data.duration_buckets), "duration", true, out_error) ||
      !CheckTokens(TokensOf(data.proximity_buckets), "proximity", false, out_error) ||
      !CheckTokens(data.direction_tokens, "direction", true, out_error)) {
    return false;
  }
  if (data.generation_min < 1 || data.generation_max < data.generation_min) {
    if (out_error != nullptr) {
      *out_error = "generation_range 必须满足 1 <= min <= max";
    }
    return false;
  }
  if (data.strength_min > data.strength_max) {
    if (out_error != nullptr) {
      *out_error = "strength_range 必须满足 min <= max";
    }
    return false;
  }
  if (data.calendar_patterns.empty()) {
    if (out_error != nullptr) {
      *out_error = "calendar_patterns 不能为空";
    }
    return false;
  }
  for (const auto& pattern : data.calendar_patterns) {
    if (!IsValidTokenPattern(pattern, out_error)) {
      return false;
    }
  }
  return true;
}

bool LoadVocabularyFromJson(const std::string& file_path,
                            VocabularyData* out_data,
                            std::string* out_error) {
  if (out_data == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_data 为空";
    }
    return false;
  }
  JsonValue root;
  if (!ParseJsonFile(file_path, &root, out_error)) {
    return false;
  }
  std::string key_error;
  if (!JsonCheckAllowedKeys(root,
                            {"version", "duration_buckets", "proximity_buckets",
                             "outcome_buckets", "direction_enum", "generation_range",
                             "strength_range", "calendar_patterns",
                             "calendar_min_length"},
                            &key_error)) {
    return FailJson(file_path, key_error, out_error);
  }

  // 缺省的段沿用内置默认值。
  VocabularyData data = Vocabulary::DefaultData();
  if (const JsonValue* node = JsonObjectField(&root, "outcome_buckets")) {
    if (!ReadOutcomeBuckets(*node, &data.outcome_buckets, out_error)) {
      return false;
    }
  }
  if (const JsonValue* node = JsonObjectField(&root, "duration_buckets")) {
    if (!ReadDurationBuckets(*node, &data.duration_buckets, out_error)) {
      return false;
    }
  }
  if (const JsonValue* node = JsonObjectField(&root, "proximity_buckets")) {
    if (!ReadProximityBuckets(*node, &data.proximity_buckets, out_error)) {
      return false;
    }
  }
  if (const JsonValue* node = JsonObjectField(&root, "direction_enum")) {
    if (!ReadStringArray(*node, "direction_enum", &data.direction_tokens, out_error)) {
      return false;
    }
  }
  if (const JsonValue* node = JsonObjectField(&root, "calendar_patterns")) {
    if (!ReadStringArray(*node, "calendar_patterns", &data.calendar_patterns,
                         out_error)) {
      return false;
    }
  }
  if (const JsonValue* node = JsonObjectField(&root, "generation_range")) {
    const auto min = JsonAsInt(JsonObjectField(node, "min"));
    const auto max = JsonAsInt(JsonObjectField(node, "max"));
    if (!JsonCheckAllowedKeys(*node, {"min", "max"}, &key_error) ||
        !min.has_value() || !max.has_value()) {
      return FailJson("generation_range", "需要整数 min/max", out_error);
    }
    data.generation_min = *min;
    data.generation_max = *max;
  }
  if (const JsonValue* node = JsonObjectField(&root, "strength_range")) {
    const auto min = JsonAsNumber(JsonObjectField(node, "min"));
    const auto max = JsonAsNumber(JsonObjectField(node, "max"));
    if (!JsonCheckAllowedKeys(*node, {"min", "max"}, &key_error) ||
        !min.has_value() || !max.has_value()) {
      return FailJson("strength_range", "需要数值 min/max", out_error);
    }
    data.strength_min = *min;
    data.strength_max = *max;
  }
  if (const JsonValue* node = JsonObjectField(&root, "calendar_min_length")) {
    const auto length = JsonAsInt(node);
    if (!length.has_value() || *length < 1) {
      return FailJson("calendar_min_length", "必须为正整数", out_error);
    }
    data.calendar_min_length = static_cast<std::size_t>(*length);
  }

  if (!ValidateVocabularyData(data, out_error)) {
    return false;
  }
  *out_data = std::move(data);
  return true;
}

std::shared_ptr<const Vocabulary> BuildVocabulary(const VocabularyConfig& config,
                                                  std::string* out_error) {
  if (config.file_path.empty()) {
    return std::make_shared<const Vocabulary>();
  }
  VocabularyData data;
  std::string load_error;
  if (LoadVocabularyFromJson(config.file_path, &data, &load_error)) {
    LogInfo("VOCABULARY_LOADED: file=" + config.file_path);
    return std::make_shared<const Vocabulary>(std::move(data));
  }
  if (config.require_file) {
    if (out_error != nullptr) {
      *out_error = "词表加载失败: " + load_error;
    }
    return nullptr;
  }
  LogWarn("VOCABULARY_FALLBACK_DEFAULT: " + load_error);
  return std::make_shared<const Vocabulary>();
}

}  // namespace reentry
