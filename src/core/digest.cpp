#include "core/digest.h"

#include <openssl/evp.h>

namespace reentry {

std::string BytesToHex(const unsigned char* bytes, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.resize(size * 2U);
  for (std::size_t i = 0; i < size; ++i) {
    const unsigned char v = bytes[i];
    out[i * 2U] = kHex[(v >> 4U) & 0x0FU];
    out[i * 2U + 1U] = kHex[v & 0x0FU];
  }
  return out;
}

bool Sha256Hex(std::string_view data,
               std::string* out_hex,
               std::string* out_error) {
  if (out_hex == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_hex 为空";
    }
    return false;
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  const int ok = EVP_Digest(data.data(),
                            data.size(),
                            digest,
                            &digest_len,
                            EVP_sha256(),
                            nullptr);
  if (ok != 1 || digest_len == 0U) {
    if (out_error != nullptr) {
      *out_error = "OpenSSL SHA-256 计算失败";
    }
    return false;
  }
  *out_hex = BytesToHex(digest, digest_len);
  return true;
}

}  // namespace reentry
