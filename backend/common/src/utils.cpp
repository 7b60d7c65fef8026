/**
 * @file utils.cpp
 * @brief 通用工具函数实现
 *
 * 随机数和编码使用 OpenSSL 库实现
 */

#include "keyward/utils.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <limits>
#include <sstream>

// OpenSSL 头文件
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace keyward {
namespace utils {

// ============================================================================
// 安全随机数
// ============================================================================

std::vector<uint8_t> SecureRandomBytes(size_t len) {
  std::vector<uint8_t> buf(len);
  if (len == 0)
    return buf;
  if (RAND_bytes(buf.data(), static_cast<int>(len)) != 1) {
    unsigned long err = ERR_get_error();
    char msg[256] = {0};
    ERR_error_string_n(err, msg, sizeof(msg));
    throw EntropyError(std::string("RAND_bytes failed: ") + msg);
  }
  return buf;
}

std::string SecureRandomString(size_t length, const std::string &charset) {
  if (charset.empty() || charset.size() > 256)
    throw std::invalid_argument("charset size must be in [1, 256]");

  // 只接受 < limit 的字节，limit 为 charset 大小的整数倍，保证均匀
  const size_t n = charset.size();
  const size_t limit = 256 - (256 % n);

  std::string result;
  result.reserve(length);
  while (result.size() < length) {
    // 多取一些，减少被拒绝后再次调用 RAND_bytes 的次数
    auto bytes = SecureRandomBytes((length - result.size()) * 2);
    for (uint8_t b : bytes) {
      if (b >= limit)
        continue;
      result += charset[b % n];
      if (result.size() == length)
        break;
    }
  }
  return result;
}

// ============================================================================
// 时间函数实现
// ============================================================================

int64_t GetTimestampMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

// ============================================================================
// 编码函数实现
// ============================================================================

std::string Base64Encode(const uint8_t *data, size_t len) {
  // 每 3 字节输出 4 字符，EVP_EncodeBlock 额外写一个 '\0'
  std::string out(4 * ((len + 2) / 3) + 1, '\0');
  int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]), data,
                          static_cast<int>(len));
  out.resize(n < 0 ? 0 : static_cast<size_t>(n));
  return out;
}

// ============================================================================
// 字符串处理函数实现
// ============================================================================

std::string Trim(const std::string &str) {
  auto start = str.find_first_not_of(" \t\r\n");
  if (start == std::string::npos)
    return "";
  auto end = str.find_last_not_of(" \t\r\n");
  return str.substr(start, end - start + 1);
}

std::string ToLower(const std::string &str) {
  std::string result = str;
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

std::string ToUpper(const std::string &str) {
  std::string result = str;
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return result;
}

bool StartsWith(const std::string &str, const std::string &prefix) {
  return str.size() >= prefix.size() &&
         str.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> Split(const std::string &str, char delimiter) {
  std::vector<std::string> parts;
  std::string item;
  std::istringstream in(str);
  while (std::getline(in, item, delimiter))
    parts.push_back(item);
  return parts;
}

// ============================================================================
// 类型转换函数实现
// ============================================================================

int64_t ToInt64(const std::string &str, int64_t default_val) {
  std::string s = Trim(str);
  if (s.empty())
    return default_val;
  errno = 0;
  char *end = nullptr;
  long long v = std::strtoll(s.c_str(), &end, 10);
  if (errno != 0 || end == s.c_str() || *end != '\0')
    return default_val;
  return static_cast<int64_t>(v);
}

int32_t ToInt32(const std::string &str, int32_t default_val) {
  int64_t v = ToInt64(str, static_cast<int64_t>(default_val));
  if (v < std::numeric_limits<int32_t>::min() ||
      v > std::numeric_limits<int32_t>::max())
    return default_val;
  return static_cast<int32_t>(v);
}

}  // namespace utils
}  // namespace keyward
