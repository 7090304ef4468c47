#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/config.h"

namespace reentry {

/// 词表维度（calendar 与 generation 不是枚举集合，单独校验）。
enum class VocabDimension {
  kOutcome,
  kDuration,
  kProximity,
  kDirection,
};

const char* ToString(VocabDimension dimension);

/// 结果桶：token + 排序等级（W2=2 ... L2=-2）。
struct OutcomeBucket {
  std::string token;
  int rank{0};
  std::string desc;
};

/// 时长桶：`max_minutes` 为空表示无上限（EXTENDED）。
struct DurationBucket {
  std::string token;
  std::optional<int> max_minutes;
  std::string desc;
};

/// 事件邻近桶：相对事件时间的分钟窗口 [begin, end]。
struct ProximityBucket {
  std::string token;
  int window_begin_minutes{0};
  int window_end_minutes{0};
  std::string desc;
};

/// 词表原始数据：内置默认值或外部 JSON 覆盖。
struct VocabularyData {
  std::vector<OutcomeBucket> outcome_buckets;
  std::vector<DurationBucket> duration_buckets;
  std::vector<ProximityBucket> proximity_buckets;
  std::vector<std::string> direction_tokens;
  int generation_min{1};
  int generation_max{3};
  double strength_min{0.0};
  double strength_max{1.0};
  std::vector<std::string> calendar_patterns;
  std::size_t calendar_min_length{8};
};

/// 上下文校验结果：`reasons` 为面向运维的可读原因列表。
struct VocabularyCheck {
  bool valid{true};
  std::vector<std::string> reasons;
};

/**
 * @brief 再入场词表（只读）
 *
 * 启动时构造一次，此后不可变，可在线程间共享。
 * 所有校验均返回结构化结果而非抛异常，由调用方决定拒绝还是告警。
 */
class Vocabulary {
 public:
  /// 使用内置默认词表。
  Vocabulary();
  explicit Vocabulary(VocabularyData data);

  /// 内置默认词表数据。
  static VocabularyData DefaultData();

  const std::vector<std::string>& LegalTokens(VocabDimension dimension) const;
  bool IsLegalToken(VocabDimension dimension, const std::string& token) const;

  /// 合法 generation 区间 (min, max)。
  std::pair<int, int> GenerationRange() const {
    return {data_.generation_min, data_.generation_max};
  }
  std::pair<double, double> StrengthRange() const {
    return {data_.strength_min, data_.strength_max};
  }
  bool IsValidGeneration(int generation) const;

  /// `NONE` 或匹配任一日历模式（`CAL8_*` / `CAL5_*`）且满足最小长度。
  bool IsValidCalendar(const std::string& calendar) const;

  /// 六维上下文整体校验，返回全部失败原因。
  VocabularyCheck IsValidContext(const std::string& outcome,
                                 const std::string& duration,
                                 const std::string& proximity,
                                 const std::string& calendar,
                                 const std::string& direction,
                                 int generation) const;

  std::optional<int> OutcomeRank(const std::string& outcome) const;
  const DurationBucket* FindDurationBucket(const std::string& duration) const;
  const ProximityBucket* FindProximityBucket(const std::string& proximity) const;

  /// 人类可读的词表摘要（Markdown）。
  std::string Summary() const;

  const VocabularyData& data() const { return data_; }

 private:
  VocabularyData data_;
  std::vector<std::string> outcome_tokens_;
  std::vector<std::string> duration_tokens_;
  std::vector<std::string> proximity_tokens_;
};

/// 校验词表数据自洽性（token 唯一、分段规则、generation 区间等）。
bool ValidateVocabularyData(const VocabularyData& data, std::string* out_error);

/**
 * @brief 从 JSON 文件加载词表覆盖
 *
 * 文件结构与内置默认值同构；未知字段与非法取值均使加载失败。
 */
bool LoadVocabularyFromJson(const std::string& file_path,
                            VocabularyData* out_data,
                            std::string* out_error);

/**
 * @brief 按配置构造词表
 *
 * 未配置文件时使用内置默认；文件加载失败时：
 * - `require_file=true` 返回 `nullptr` 并写入 `out_error`；
 * - 否则输出 WARN 日志并回退内置默认。
 */
std::shared_ptr<const Vocabulary> BuildVocabulary(const VocabularyConfig& config,
                                                  std::string* out_error);

}  // namespace reentry
