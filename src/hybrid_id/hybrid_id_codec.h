#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "vocab/vocabulary.h"

namespace reentry {

/// Hybrid ID 各维度取值；`suffix` 为可选的 6 位小写字母数字后缀。
struct HybridId {
  std::string outcome;
  std::string duration;
  std::string proximity;
  std::string calendar;
  std::string direction;
  int generation{1};
  std::optional<std::string> suffix;

  /// `_` 连接的规范文本形式。
  std::string ToString() const;

  bool operator==(const HybridId&) const = default;
};

/// 编解码错误分类：输入形态错误，调用方不应自动重试。
enum class HybridIdErrorCode {
  kInvalidComponent,
  kInvalidSuffix,
  kMalformedIdentifier,
  kInvalidGeneration,
};

const char* ToString(HybridIdErrorCode code);

struct HybridIdError {
  HybridIdErrorCode code{HybridIdErrorCode::kMalformedIdentifier};
  std::string message;
};

/**
 * @brief Hybrid ID 编解码器
 *
 * 格式：`OUTCOME_DURATION_PROXIMITY_CALENDAR_DIRECTION_GENERATION[_suffix]`。
 * 除词表引用外无状态，可跨线程共享。
 *
 * 解析规则（proximity 与 calendar 都可能包含 `_`）：
 * 1. 前两段为 outcome / duration；
 * 2. 自第三段起取能拼出词表 proximity token 的最长前缀；
 * 3. 自尾部向前找第一个规范十进制且落在 generation 区间内的段；
 * 4. 其前一段为 direction，proximity 与 direction 之间全部为 calendar；
 * 5. generation 之后至多一段，且必须是合法后缀。
 */
class HybridIdCodec {
 public:
  explicit HybridIdCodec(std::shared_ptr<const Vocabulary> vocabulary);

  /// 组合六维上下文；维度非法返回 kInvalidComponent，后缀非法返回 kInvalidSuffix。
  bool Compose(const std::string& outcome,
               const std::string& duration,
               const std::string& proximity,
               const std::string& calendar,
               const std::string& direction,
               int generation,
               const std::optional<std::string>& suffix,
               HybridId* out_id,
               HybridIdError* out_error) const;

  /// 解析文本；只做结构还原，词表合法性由 `Validate` 负责。
  bool Parse(std::string_view text, HybridId* out_id, HybridIdError* out_error) const;

  /// 解析并做词表校验；任何失败都返回 false。
  bool Validate(std::string_view text) const;

  /**
   * @brief 6 位注释后缀哈希
   *
   * SHA-256(标识 UTF-8 字节) 的十六进制摘要自左向右取 `[0-9a-z]` 字符，
   * 不足 6 位则对摘要文本再次哈希继续取。仅在 OpenSSL 失败时返回空。
   */
  static std::optional<std::string> CommentHash(std::string_view identifier);

  /// generation 1/2/3 映射为 O/R1/R2，其余返回 kInvalidGeneration。
  static bool ChainPosition(int generation,
                            std::string* out_position,
                            HybridIdError* out_error);

  /// 下一代 generation；已到词表上限或输入越界时为空。
  std::optional<int> NextGeneration(int current_generation) const;

  /**
   * @brief 生成 MT4 订单注释（31 字符上限）
   *
   * 依次尝试 `outcome_dur4_prox2_gen_hash`、`outcome_gen_hash`；
   * 标识无法解析时只返回哈希。
   */
  std::optional<std::string> DecomposeForComment(std::string_view identifier) const;

  /// 校验注释后缀与标识哈希一致。
  bool ValidateCommentSuffixParity(std::string_view identifier,
                                   std::string_view expected_suffix) const;

  const Vocabulary& vocabulary() const { return *vocabulary_; }

 private:
  std::shared_ptr<const Vocabulary> vocabulary_;
};

/// 后缀格式：恰好 6 位 `[a-z0-9]`。
bool IsValidHybridIdSuffix(std::string_view suffix);

}  // namespace reentry
