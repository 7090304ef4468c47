#pragma once

#include <string>
#include <string_view>

namespace reentry {

/**
 * @brief 通配模式匹配
 *
 * 支持四种形式：
 * - `*`：匹配任意值；
 * - `X*`：前缀匹配；
 * - `*X`：后缀匹配；
 * - 其余按字面全等匹配。
 *
 * 词表的日历校验与参数解析器的 calendar/symbol 谓词共用本函数，保证两侧语义一致。
 */
bool MatchesTokenPattern(std::string_view value, std::string_view pattern);

/**
 * @brief 校验模式语法
 *
 * 非空；`*` 至多一个且只能位于首或尾；其余字符限定为字母、数字与 `_ . -`。
 */
bool IsValidTokenPattern(std::string_view pattern, std::string* out_error);

}  // namespace reentry
