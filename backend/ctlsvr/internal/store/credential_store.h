#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "keyward/error_code.h"

namespace keyward::ctl {

constexpr size_t kAccessKeyIdLength = 20;
constexpr size_t kSecretAccessKeyLength = 40;

/**
 * 访问凭证：name 为键，AccessKeyID / SecretAccessKey 为定长随机串
 */
struct Credential {
  std::string name;
  std::string access_key_id;
  std::string secret_access_key;
  int64_t created_at = 0; // 首次 Generate 时间（毫秒），Reset 不变
  int64_t updated_at = 0; // 最近一次 Generate/Reset 提交时间（毫秒）
};

/**
 * 凭证存储接口
 *
 * 只负责单 key 的读写；Generate 的「不存在才插入」与 Reset 的原子替换
 * 由 CredentialRegistry 在其锁内组合 Get + Put 完成。
 *
 * RocksDB Key 设计：
 *   cred:{name}  -> Credential (JSON)
 */
class CredentialStore {
public:
  virtual ~CredentialStore() = default;

  // 查询；不存在返回 NOT_FOUND，读失败返回 STORAGE_ERROR / DATA_CORRUPTED
  virtual Result<Credential> Get(const std::string &name) = 0;

  // 插入或覆盖；返回前已持久化
  virtual Status Put(const Credential &cred) = 0;

  // 当前凭证数量
  virtual size_t Count() = 0;
};

/**
 * 内存实现（store_type=memory 及单元测试）
 */
class MemoryCredentialStore : public CredentialStore {
public:
  Result<Credential> Get(const std::string &name) override;
  Status Put(const Credential &cred) override;
  size_t Count() override;

private:
  std::mutex mutex_;
  std::unordered_map<std::string, Credential> creds_;
};

/**
 * RocksDB 实现，写入使用 sync=true
 */
class RocksDBCredentialStore : public CredentialStore {
public:
  // 打开失败抛 std::runtime_error
  explicit RocksDBCredentialStore(const std::string &db_path);
  ~RocksDBCredentialStore() override;

  Result<Credential> Get(const std::string &name) override;
  Status Put(const Credential &cred) override;
  size_t Count() override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace keyward::ctl
