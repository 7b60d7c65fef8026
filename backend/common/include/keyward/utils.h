#pragma once

/**
 * @file utils.h
 * @brief 通用工具函数库
 *
 * 提供安全随机数、时间处理、编码、字符串操作等常用功能
 *
 * @example
 *   #include <keyward/utils.h>
 *
 *   // 生成 20 位大写字母数字串
 *   std::string id = keyward::utils::SecureRandomString(20, "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ");
 *
 *   // 获取当前时间
 *   int64_t now = keyward::utils::GetTimestampMs();
 */

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace keyward {
namespace utils {

// ============================================================================
// 安全随机数 (使用 OpenSSL RAND_bytes)
// ============================================================================

/**
 * @brief 随机源失败（RAND_bytes 返回非 1）
 *
 * 表示运行环境不可用，调用方不应重试，直接终止当前请求。
 */
class EntropyError : public std::runtime_error {
public:
    explicit EntropyError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief 从 CSPRNG 读取 len 个随机字节
 * @throws EntropyError 随机源失败
 */
std::vector<uint8_t> SecureRandomBytes(size_t len);

/**
 * @brief 从 charset 中均匀抽取 length 个字符（拒绝采样，无取模偏差）
 * @param charset 字符集，长度 1-256
 * @throws EntropyError 随机源失败
 * @throws std::invalid_argument charset 为空或超过 256
 *
 * @example
 *   std::string code = SecureRandomString(6, "0123456789");  // 6 位数字
 */
std::string SecureRandomString(size_t length, const std::string& charset);

// ============================================================================
// 时间函数
// ============================================================================

/**
 * @brief 获取当前时间戳（毫秒）
 */
int64_t GetTimestampMs();


// ============================================================================
// 编码函数
// ============================================================================

/**
 * @brief 标准 Base64 编码（含 '=' 填充，不换行）
 *
 * @example
 *   auto raw = SecureRandomBytes(30);
 *   std::string encoded = Base64Encode(raw.data(), raw.size());  // 40 字符
 */
std::string Base64Encode(const uint8_t* data, size_t len);

// ============================================================================
// 字符串处理函数
// ============================================================================

std::string Trim(const std::string& str);
std::string ToLower(const std::string& str);
std::string ToUpper(const std::string& str);
bool StartsWith(const std::string& str, const std::string& prefix);
std::vector<std::string> Split(const std::string& str, char delimiter);

// ============================================================================
// 类型转换函数
// ============================================================================

/**
 * @brief 字符串转 int32（整串必须是合法整数，否则返回默认值）
 * @example
 *   int32_t n = ToInt32("123");        // 123
 *   int32_t n = ToInt32("12ab", -1);   // -1
 */
int32_t ToInt32(const std::string& str, int32_t default_val = 0);
int64_t ToInt64(const std::string& str, int64_t default_val = 0);

}  // namespace utils
}  // namespace keyward
