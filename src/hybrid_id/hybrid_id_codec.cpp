#include "hybrid_id/hybrid_id_codec.h"

#include <algorithm>
#include <cctype>
#include <utility>
#include <vector>

#include "core/digest.h"

namespace reentry {

namespace {

constexpr char kDelimiter = '_';
constexpr std::size_t kMinSegments = 6;
constexpr std::size_t kCommentHashLength = 6;
constexpr std::size_t kMaxCommentLength = 31;

std::vector<std::string> SplitSegments(std::string_view text) {
  std::vector<std::string> segments;
  std::size_t begin = 0;
  while (true) {
    const std::size_t end = text.find(kDelimiter, begin);
    if (end == std::string_view::npos) {
      segments.emplace_back(text.substr(begin));
      break;
    }
    segments.emplace_back(text.substr(begin, end - begin));
    begin = end + 1;
  }
  return segments;
}

std::string JoinSegments(const std::vector<std::string>& segments,
                         std::size_t begin,
                         std::size_t end) {
  std::string joined;
  for (std::size_t i = begin; i < end; ++i) {
    if (i > begin) {
      joined.push_back(kDelimiter);
    }
    joined += segments[i];
  }
  return joined;
}

// 仅接受规范十进制（无前导零），避免 `000002` 这类后缀被误认为 generation。
std::optional<int> CanonicalGeneration(const std::string& segment) {
  if (segment.empty() || segment.size() > 3U ||
      !std::all_of(segment.begin(), segment.end(),
                   [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
    return std::nullopt;
  }
  if (segment.size() > 1U && segment.front() == '0') {
    return std::nullopt;
  }
  return std::stoi(segment);
}

bool Fail(HybridIdErrorCode code, std::string message, HybridIdError* out_error) {
  if (out_error != nullptr) {
    out_error->code = code;
    out_error->message = std::move(message);
  }
  return false;
}

}  // namespace

std::string HybridId::ToString() const {
  std::string text = outcome + kDelimiter + duration + kDelimiter + proximity +
                     kDelimiter + calendar + kDelimiter + direction + kDelimiter +
                     std::to_string(generation);
  if (suffix.has_value()) {
    text += kDelimiter;
    text += *suffix;
  }
  return text;
}

const char* ToString(HybridIdErrorCode code) {
  switch (code) {
    case HybridIdErrorCode::kInvalidComponent:
      return "InvalidComponent";
    case HybridIdErrorCode::kInvalidSuffix:
      return "InvalidSuffix";
    case HybridIdErrorCode::kMalformedIdentifier:
      return "MalformedIdentifier";
    case HybridIdErrorCode::kInvalidGeneration:
      return "InvalidGeneration";
  }
  return "Unknown";
}

bool IsValidHybridIdSuffix(std::string_view suffix) {
  return suffix.size() == kCommentHashLength &&
         std::all_of(suffix.begin(), suffix.end(), [](unsigned char ch) {
           return std::isdigit(ch) != 0 || (ch >= 'a' && ch <= 'z');
         });
}

HybridIdCodec::HybridIdCodec(std::shared_ptr<const Vocabulary> vocabulary)
    : vocabulary_(vocabulary ? std::move(vocabulary)
                             : std::make_shared<const Vocabulary>()) {}

bool HybridIdCodec::Compose(const std::string& outcome,
                            const std::string& duration,
                            const std::string& proximity,
                            const std::string& calendar,
                            const std::string& direction,
                            int generation,
                            const std::optional<std::string>& suffix,
                            HybridId* out_id,
                            HybridIdError* out_error) const {
  const VocabularyCheck check = vocabulary_->IsValidContext(
      outcome, duration, proximity, calendar, direction, generation);
  if (!check.valid) {
    std::string message = "Invalid components:";
    for (const auto& reason : check.reasons) {
      message += " " + reason + ";";
    }
    message.pop_back();
    return Fail(HybridIdErrorCode::kInvalidComponent, std::move(message), out_error);
  }
  if (suffix.has_value() && !IsValidHybridIdSuffix(*suffix)) {
    return Fail(HybridIdErrorCode::kInvalidSuffix,
                "Invalid suffix format: " + *suffix +
                    ". Must be 6 lowercase alphanumeric chars",
                out_error);
  }
  if (out_id != nullptr) {
    *out_id = HybridId{.outcome = outcome,
                       .duration = duration,
                       .proximity = proximity,
                       .calendar = calendar,
                       .direction = direction,
                       .generation = generation,
                       .suffix = suffix};
  }
  return true;
}

bool HybridIdCodec::Parse(std::string_view text,
                          HybridId* out_id,
                          HybridIdError* out_error) const {
  const std::vector<std::string> segments = SplitSegments(text);
  if (segments.size() < kMinSegments) {
    return Fail(HybridIdErrorCode::kMalformedIdentifier,
                "Hybrid ID must have at least 6 components, got " +
                    std::to_string(segments.size()),
                out_error);
  }
  for (const auto& segment : segments) {
    if (segment.empty()) {
      return Fail(HybridIdErrorCode::kMalformedIdentifier,
                  "Hybrid ID contains an empty component: " + std::string(text),
                  out_error);
    }
  }

  // proximity：最长匹配词表 token；均未命中时退化为单段，留给 Validate 报错。
  std::size_t proximity_end = 3;
  const auto& proximity_tokens = vocabulary_->LegalTokens(VocabDimension::kProximity);
  for (std::size_t end = segments.size() - 3; end > 2; --end) {
    const std::string candidate = JoinSegments(segments, 2, end);
    if (std::find(proximity_tokens.begin(), proximity_tokens.end(), candidate) !=
        proximity_tokens.end()) {
      proximity_end = end;
      break;
    }
  }

  // generation 位置至少为 proximity_end + 2（中间需有 calendar 与 direction）。
  const auto [generation_min, generation_max] = vocabulary_->GenerationRange();
  std::size_t generation_index = 0;
  int generation = 0;
  for (std::size_t i = segments.size(); i > proximity_end + 2; --i) {
    const auto value = CanonicalGeneration(segments[i - 1]);
    if (value.has_value() && *value >= generation_min && *value <= generation_max) {
      generation_index = i - 1;
      generation = *value;
      break;
    }
  }
  if (generation_index == 0) {
    return Fail(HybridIdErrorCode::kMalformedIdentifier,
                "No valid generation found in hybrid ID: " + std::string(text),
                out_error);
  }

  std::optional<std::string> suffix;
  const std::size_t trailing = segments.size() - generation_index - 1;
  if (trailing == 1U) {
    if (!IsValidHybridIdSuffix(segments.back())) {
      return Fail(HybridIdErrorCode::kMalformedIdentifier,
                  "Invalid trailing component after generation: " + segments.back(),
                  out_error);
    }
    suffix = segments.back();
  } else if (trailing > 1U) {
    return Fail(HybridIdErrorCode::kMalformedIdentifier,
                "Unexpected components after generation in hybrid ID: " +
                    std::string(text),
                out_error);
  }

  if (out_id != nullptr) {
    *out_id = HybridId{.outcome = segments[0],
                       .duration = segments[1],
                       .proximity = JoinSegments(segments, 2, proximity_end),
                       .calendar = JoinSegments(segments, proximity_end,
                                                generation_index - 1),
                       .direction = segments[generation_index - 1],
                       .generation = generation,
                       .suffix = std::move(suffix)};
  }
  return true;
}

bool HybridIdCodec::Validate(std::string_view text) const {
  HybridId id;
  if (!Parse(text, &id, nullptr)) {
    return false;
  }
  return vocabulary_
      ->IsValidContext(id.outcome, id.duration, id.proximity, id.calendar,
                       id.direction, id.generation)
      .valid;
}

std::optional<std::string> HybridIdCodec::CommentHash(std::string_view identifier) {
  std::string digest;
  if (!Sha256Hex(identifier, &digest, nullptr)) {
    return std::nullopt;
  }
  std::string collected;
  while (true) {
    for (const char ch : digest) {
      if ((ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'z')) {
        collected.push_back(ch);
        if (collected.size() == kCommentHashLength) {
          return collected;
        }
      }
    }
    std::string next;
    if (!Sha256Hex(digest, &next, nullptr)) {
      return std::nullopt;
    }
    digest = std::move(next);
  }
}

bool HybridIdCodec::ChainPosition(int generation,
                                  std::string* out_position,
                                  HybridIdError* out_error) {
  const char* position = nullptr;
  switch (generation) {
    case 1:
      position = "O";
      break;
    case 2:
      position = "R1";
      break;
    case 3:
      position = "R2";
      break;
    default:
      return Fail(HybridIdErrorCode::kInvalidGeneration,
                  "Invalid generation: " + std::to_string(generation), out_error);
  }
  if (out_position != nullptr) {
    *out_position = position;
  }
  return true;
}

std::optional<int> HybridIdCodec::NextGeneration(int current_generation) const {
  if (!vocabulary_->IsValidGeneration(current_generation) ||
      current_generation >= vocabulary_->GenerationRange().second) {
    return std::nullopt;
  }
  return current_generation + 1;
}

std::optional<std::string> HybridIdCodec::DecomposeForComment(
    std::string_view identifier) const {
  auto hash = CommentHash(identifier);
  if (!hash.has_value()) {
    return std::nullopt;
  }
  HybridId id;
  if (!Parse(identifier, &id, nullptr)) {
    return hash;
  }
  const std::string generation = std::to_string(id.generation);
  std::string short_form = id.outcome + kDelimiter + id.duration.substr(0, 4) +
                           kDelimiter + id.proximity.substr(0, 2) + kDelimiter +
                           generation + kDelimiter + *hash;
  if (short_form.size() > kMaxCommentLength) {
    short_form = id.outcome + kDelimiter + generation + kDelimiter + *hash;
  }
  return short_form;
}

bool HybridIdCodec::ValidateCommentSuffixParity(std::string_view identifier,
                                                std::string_view expected_suffix) const {
  const auto hash = CommentHash(identifier);
  return hash.has_value() && *hash == expected_suffix;
}

}  // namespace reentry
