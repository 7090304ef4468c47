#include "core/json_utils.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <exception>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

namespace reentry {

namespace {

constexpr int kMaxDepth = 64;

void AppendUtf8(unsigned int codepoint, std::string* out) {
  if (codepoint <= 0x7F) {
    out->push_back(static_cast<char>(codepoint));
  } else if (codepoint <= 0x7FF) {
    out->push_back(static_cast<char>(0xC0 | (codepoint >> 6U)));
    out->push_back(static_cast<char>(0x80 | (codepoint & 0x3FU)));
  } else if (codepoint <= 0xFFFF) {
    out->push_back(static_cast<char>(0xE0 | (codepoint >> 12U)));
    out->push_back(static_cast<char>(0x80 | ((codepoint >> 6U) & 0x3FU)));
    out->push_back(static_cast<char>(0x80 | (codepoint & 0x3FU)));
  } else {
    out->push_back(static_cast<char>(0xF0 | (codepoint >> 18U)));
    out->push_back(static_cast<char>(0x80 | ((codepoint >> 12U) & 0x3FU)));
    out->push_back(static_cast<char>(0x80 | ((codepoint >> 6U) & 0x3FU)));
    out->push_back(static_cast<char>(0x80 | (codepoint & 0x3FU)));
  }
}

// 递归下降读取器：游标同时维护行列号，报错定位到具体位置。
class JsonReader {
 public:
  explicit JsonReader(const std::string& text) : text_(text) {}

  bool Read(JsonValue* out_value, std::string* out_error) {
    if (out_value == nullptr) {
      if (out_error != nullptr) {
        *out_error = "out_value 为空";
      }
      return false;
    }
    SkipWhitespace();
    if (!ReadValue(out_value, 0)) {
      return Report(out_error);
    }
    SkipWhitespace();
    if (!AtEnd()) {
      error_ = "JSON 尾部存在多余字符";
      return Report(out_error);
    }
    return true;
  }

 private:
  bool ReadValue(JsonValue* out, int depth) {
    if (depth > kMaxDepth) {
      return Fail("JSON 嵌套层级过深");
    }
    if (AtEnd()) {
      return Fail("JSON 意外结束");
    }
    switch (Peek()) {
      case '{':
        return ReadObject(out, depth);
      case '[':
        return ReadArray(out, depth);
      case '"':
        out->type = JsonType::kString;
        return ReadString(&out->string_value);
      case 't':
        out->type = JsonType::kBool;
        out->bool_value = true;
        return ReadLiteral("true");
      case 'f':
        out->type = JsonType::kBool;
        out->bool_value = false;
        return ReadLiteral("false");
      case 'n':
        out->type = JsonType::kNull;
        return ReadLiteral("null");
      default:
        break;
    }
    if (Peek() == '-' || std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      out->type = JsonType::kNumber;
      return ReadNumber(&out->number_value);
    }
    return Fail("JSON 非法值起始字符");
  }

  bool ReadObject(JsonValue* out, int depth) {
    Advance();  // '{'
    out->type = JsonType::kObject;
    out->object_value.clear();
    SkipWhitespace();
    if (TryConsume('}')) {
      return true;
    }
    while (true) {
      SkipWhitespace();
      if (AtEnd() || Peek() != '"') {
        return Fail("JSON 对象键必须是字符串");
      }
      std::string key;
      if (!ReadString(&key)) {
        return false;
      }
      if (out->object_value.count(key) != 0U) {
        return Fail("JSON 对象存在重复键: " + key);
      }
      SkipWhitespace();
      if (!TryConsume(':')) {
        return Fail("JSON 期望字符 ':'");
      }
      SkipWhitespace();
      JsonValue item;
      if (!ReadValue(&item, depth + 1)) {
        return false;
      }
      out->object_value.emplace(std::move(key), std::move(item));
      SkipWhitespace();
      if (TryConsume('}')) {
        return true;
      }
      if (!TryConsume(',')) {
        return Fail("JSON 对象缺少 ',' 或 '}'");
      }
    }
  }

  bool ReadArray(JsonValue* out, int depth) {
    Advance();  // '['
    out->type = JsonType::kArray;
    out->array_value.clear();
    SkipWhitespace();
    if (TryConsume(']')) {
      return true;
    }
    while (true) {
      SkipWhitespace();
      JsonValue item;
      if (!ReadValue(&item, depth + 1)) {
        return false;
      }
      out->array_value.push_back(std::move(item));
      SkipWhitespace();
      if (TryConsume(']')) {
        return true;
      }
      if (!TryConsume(',')) {
        return Fail("JSON 数组缺少 ',' 或 ']'");
      }
    }
  }

  bool ReadHex4(unsigned int* out) {
    unsigned int value = 0;
    for (int i = 0; i < 4; ++i) {
      if (AtEnd()) {
        return Fail("JSON unicode 转义不完整");
      }
      const char hex = Advance();
      value <<= 4U;
      if (hex >= '0' && hex <= '9') {
        value += static_cast<unsigned int>(hex - '0');
      } else if (hex >= 'a' && hex <= 'f') {
        value += static_cast<unsigned int>(hex - 'a' + 10);
      } else if (hex >= 'A' && hex <= 'F') {
        value += static_cast<unsigned int>(hex - 'A' + 10);
      } else {
        return Fail("JSON unicode 转义非法");
      }
    }
    *out = value;
    return true;
  }

  bool ReadString(std::string* out) {
    Advance();  // '"'
    out->clear();
    while (!AtEnd()) {
      const char ch = Advance();
      if (ch == '"') {
        return true;
      }
      if (static_cast<unsigned char>(ch) < 0x20) {
        return Fail("JSON 字符串包含未转义控制字符");
      }
      if (ch != '\\') {
        out->push_back(ch);
        continue;
      }
      if (AtEnd()) {
        return Fail("JSON 字符串转义不完整");
      }
      const char esc = Advance();
      switch (esc) {
        case '"':
        case '\\':
        case '/':
          out->push_back(esc);
          break;
        case 'b':
          out->push_back('\b');
          break;
        case 'f':
          out->push_back('\f');
          break;
        case 'n':
          out->push_back('\n');
          break;
        case 'r':
          out->push_back('\r');
          break;
        case 't':
          out->push_back('\t');
          break;
        case 'u': {
          unsigned int codepoint = 0;
          if (!ReadHex4(&codepoint)) {
            return false;
          }
          // UTF-16 代理对合并为单个码点。
          if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
            if (!TryConsume('\\') || !TryConsume('u')) {
              return Fail("JSON 代理对缺少低位");
            }
            unsigned int low = 0;
            if (!ReadHex4(&low)) {
              return false;
            }
            if (low < 0xDC00 || low > 0xDFFF) {
              return Fail("JSON 代理对低位非法");
            }
            codepoint = 0x10000 + ((codepoint - 0xD800) << 10U) + (low - 0xDC00);
          } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
            return Fail("JSON 孤立的代理对低位");
          }
          AppendUtf8(codepoint, out);
          break;
        }
        default:
          return Fail("JSON 字符串转义字符非法");
      }
    }
    return Fail("JSON 字符串缺少结束引号");
  }

  bool ReadLiteral(const char* literal) {
    const std::size_t len = std::char_traits<char>::length(literal);
    if (text_.compare(cursor_, len, literal) != 0) {
      return Fail(std::string("JSON 字面量非法，期望 ") + literal);
    }
    for (std::size_t i = 0; i < len; ++i) {
      Advance();
    }
    return true;
  }

  bool ReadNumber(double* out) {
    const std::size_t begin = cursor_;
    TryConsume('-');
    if (!ConsumeDigits()) {
      return Fail("JSON 数字解析失败");
    }
    if (TryConsume('.') && !ConsumeDigits()) {
      return Fail("JSON 小数解析失败");
    }
    if (TryConsume('e') || TryConsume('E')) {
      if (!TryConsume('+')) {
        TryConsume('-');
      }
      if (!ConsumeDigits()) {
        return Fail("JSON 指数解析失败");
      }
    }
    try {
      *out = std::stod(text_.substr(begin, cursor_ - begin));
    } catch (const std::exception&) {
      return Fail("JSON 数字超出范围");
    }
    return true;
  }

  bool ConsumeDigits() {
    const std::size_t begin = cursor_;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
    return cursor_ > begin;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool TryConsume(char ch) {
    if (!AtEnd() && Peek() == ch) {
      Advance();
      return true;
    }
    return false;
  }

  bool AtEnd() const { return cursor_ >= text_.size(); }
  char Peek() const { return text_[cursor_]; }

  char Advance() {
    const char ch = text_[cursor_++];
    if (ch == '\n') {
      ++line_;
      column_ = 1;
    } else {
      ++column_;
    }
    return ch;
  }

  bool Fail(std::string message) {
    if (error_.empty()) {
      error_ = std::move(message);
      error_line_ = line_;
      error_column_ = column_;
    }
    return false;
  }

  bool Report(std::string* out_error) const {
    if (out_error != nullptr) {
      const int line = error_line_ > 0 ? error_line_ : line_;
      const int column = error_column_ > 0 ? error_column_ : column_;
      *out_error = error_ + "（line=" + std::to_string(line) +
                   ", column=" + std::to_string(column) + "）";
    }
    return false;
  }

  const std::string& text_;
  std::size_t cursor_{0};
  int line_{1};
  int column_{1};
  std::string error_;
  int error_line_{0};
  int error_column_{0};
};

}  // namespace

bool ParseJson(const std::string& text,
               JsonValue* out_value,
               std::string* out_error) {
  JsonReader reader(text);
  return reader.Read(out_value, out_error);
}

bool ParseJsonFile(const std::string& file_path,
                   JsonValue* out_value,
                   std::string* out_error) {
  std::ifstream in(file_path);
  if (!in.is_open()) {
    if (out_error != nullptr) {
      *out_error = "无法打开 JSON 文件: " + file_path;
    }
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  std::string parse_error;
  if (!ParseJson(buffer.str(), out_value, &parse_error)) {
    if (out_error != nullptr) {
      *out_error = file_path + ": " + parse_error;
    }
    return false;
  }
  return true;
}

const JsonValue* JsonObjectField(const JsonValue* value, const std::string& key) {
  if (value == nullptr || value->type != JsonType::kObject) {
    return nullptr;
  }
  const auto it = value->object_value.find(key);
  if (it == value->object_value.end()) {
    return nullptr;
  }
  return &it->second;
}

bool JsonCheckAllowedKeys(const JsonValue& value,
                          const std::vector<std::string>& allowed_keys,
                          std::string* out_error) {
  if (value.type != JsonType::kObject) {
    if (out_error != nullptr) {
      *out_error = "期望 JSON 对象";
    }
    return false;
  }
  std::vector<std::string> unknown;
  for (const auto& [key, item] : value.object_value) {
    (void)item;
    if (std::find(allowed_keys.begin(), allowed_keys.end(), key) ==
        allowed_keys.end()) {
      unknown.push_back(key);
    }
  }
  if (unknown.empty()) {
    return true;
  }
  std::sort(unknown.begin(), unknown.end());
  if (out_error != nullptr) {
    *out_error = "未知字段: " + unknown.front();
  }
  return false;
}

std::optional<std::string> JsonAsString(const JsonValue* value) {
  if (value == nullptr || value->type != JsonType::kString) {
    return std::nullopt;
  }
  return value->string_value;
}

std::optional<double> JsonAsNumber(const JsonValue* value) {
  if (value == nullptr || value->type != JsonType::kNumber) {
    return std::nullopt;
  }
  return value->number_value;
}

std::optional<int> JsonAsInt(const JsonValue* value) {
  const auto number = JsonAsNumber(value);
  if (!number.has_value()) {
    return std::nullopt;
  }
  const double integral = std::trunc(*number);
  if (integral != *number ||
      integral < static_cast<double>(std::numeric_limits<int>::min()) ||
      integral > static_cast<double>(std::numeric_limits<int>::max())) {
    return std::nullopt;
  }
  return static_cast<int>(integral);
}

std::optional<bool> JsonAsBool(const JsonValue* value) {
  if (value == nullptr || value->type != JsonType::kBool) {
    return std::nullopt;
  }
  return value->bool_value;
}

std::string JsonQuote(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 2U);
  out.push_back('"');
  for (const char ch : text) {
    switch (ch) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char buffer[8];
          std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out += buffer;
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
  out.push_back('"');
  return out;
}

}  // namespace reentry
