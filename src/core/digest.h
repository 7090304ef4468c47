#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace reentry {

/// 字节序列转小写十六进制文本。
std::string BytesToHex(const unsigned char* bytes, std::size_t size);

/**
 * @brief 计算 SHA-256 并输出 64 位小写十六进制摘要
 *
 * 输入按原始字节参与摘要（调用方保证为 UTF-8 文本）。
 * 仅在 OpenSSL 摘要接口失败时返回 `false`。
 */
bool Sha256Hex(std::string_view data,
               std::string* out_hex,
               std::string* out_error);

}  // namespace reentry
