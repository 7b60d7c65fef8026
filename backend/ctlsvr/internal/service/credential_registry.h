#pragma once

#include <memory>
#include <shared_mutex>
#include <string>

#include "keyward/error_code.h"
#include "../store/credential_store.h"
#include "credential_generator.h"

namespace keyward::ctl {

/**
 * 凭证注册表：用户名 -> 凭证，提供原子的 Generate / Fetch / Reset
 *
 * 并发约定：
 *   - Generate/Reset 持独占锁完成「查询 -> 生成 -> 持久化」，同名并发 Generate
 *     只有一个成功，其余看到 ALREADY_EXISTS；Reset 之间串行，各自返回自己写入的值。
 *   - Fetch 持共享锁，不会读到写了一半的凭证。
 *   - 返回值均为拷贝。
 *
 * 状态机：Absent --Generate--> Active --Reset--> Active，无删除。
 */
class CredentialRegistry {
public:
  CredentialRegistry(std::shared_ptr<CredentialStore> store,
                     std::shared_ptr<CredentialGenerator> generator);
  ~CredentialRegistry();

  CredentialRegistry(const CredentialRegistry &) = delete;
  CredentialRegistry &operator=(const CredentialRegistry &) = delete;

  // 为新用户生成凭证
  // 错误：INVALID_PARAM / ALREADY_EXISTS / STORAGE_ERROR
  Result<Credential> Generate(const std::string &name);

  // 读取现有凭证
  // 错误：INVALID_PARAM / NOT_FOUND / STORAGE_ERROR
  Result<Credential> Fetch(const std::string &name);

  // 整体替换现有凭证，旧值在提交后立即失效
  // 错误：INVALID_PARAM / NOT_FOUND / STORAGE_ERROR
  Result<Credential> Reset(const std::string &name);

  // 当前凭证数量
  size_t Size();

  // 用户名校验：非空、不超过 kMaxNameLength、不含控制字符
  static bool IsValidName(const std::string &name);

  static constexpr size_t kMaxNameLength = 256;

private:
  std::shared_ptr<CredentialStore> store_;
  std::shared_ptr<CredentialGenerator> generator_;
  std::shared_mutex mutex_;
};

} // namespace keyward::ctl
