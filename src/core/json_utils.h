#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace reentry {

/// 轻量 JSON AST 节点类型，覆盖词表/参数集配置使用到的 JSON 子集。
enum class JsonType {
  kNull,
  kBool,
  kNumber,
  kString,
  kArray,
  kObject,
};

/// 轻量 JSON 值表示（对象/数组为递归结构）。
struct JsonValue {
  JsonType type{JsonType::kNull};
  bool bool_value{false};
  double number_value{0.0};
  std::string string_value;
  std::vector<JsonValue> array_value;
  std::unordered_map<std::string, JsonValue> object_value;
};

/**
 * @brief JSON 解析入口
 *
 * @param text 原始 JSON 文本
 * @param out_value 解析结果
 * @param out_error 失败原因（含行列号，可选输出）
 * @return true 解析成功
 * @return false 解析失败
 */
bool ParseJson(const std::string& text,
               JsonValue* out_value,
               std::string* out_error);

/// 读取文件并解析为 JSON；文件不可读与语法错误都写入 `out_error`。
bool ParseJsonFile(const std::string& file_path,
                   JsonValue* out_value,
                   std::string* out_error);

/**
 * @brief 获取对象字段
 *
 * 仅做类型检查，不抛异常；字段不存在返回 `nullptr`。
 */
const JsonValue* JsonObjectField(const JsonValue* value, const std::string& key);

/**
 * @brief 校验对象只包含允许的键
 *
 * 发现未知键时返回 `false`，`out_error` 列出首个未知键（按字典序，保证报错稳定）。
 */
bool JsonCheckAllowedKeys(const JsonValue& value,
                          const std::vector<std::string>& allowed_keys,
                          std::string* out_error);

/// 严格字符串：仅 `kString` 返回值。
std::optional<std::string> JsonAsString(const JsonValue* value);
/// 严格数值：仅 `kNumber` 返回值。
std::optional<double> JsonAsNumber(const JsonValue* value);
/// 严格整数：`kNumber` 且无小数部分。
std::optional<int> JsonAsInt(const JsonValue* value);
/// 严格布尔：仅 `kBool` 返回值。
std::optional<bool> JsonAsBool(const JsonValue* value);

/// 生成带双引号的 JSON 字符串字面量（处理转义与控制字符）。
std::string JsonQuote(std::string_view text);

}  // namespace reentry
