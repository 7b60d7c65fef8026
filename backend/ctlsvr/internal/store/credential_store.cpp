/**
 * @file credential_store.cpp
 * @brief 凭证存储实现（内存 / RocksDB）
 *
 * Key 设计：
 *   cred:{name}  -> Credential JSON
 */

#include "credential_store.h"
#include <nlohmann/json.hpp>
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <stdexcept>

using json = nlohmann::json;

namespace keyward::ctl {

// ============================================================================
// JSON 序列化/反序列化
// ============================================================================

namespace {

constexpr const char *KEY_PREFIX_CRED = "cred:";

/// Credential -> JSON string
std::string SerializeCredential(const Credential &cred) {
  json j;
  j["name"] = cred.name;
  j["access_key_id"] = cred.access_key_id;
  j["secret_access_key"] = cred.secret_access_key;
  j["created_at"] = cred.created_at;
  j["updated_at"] = cred.updated_at;
  return j.dump();
}

/// JSON string -> Credential，字段缺失或长度不符视为损坏
Result<Credential> DeserializeCredential(const std::string &data) {
  Credential cred;
  try {
    json j = json::parse(data);
    cred.name = j.at("name").get<std::string>();
    cred.access_key_id = j.at("access_key_id").get<std::string>();
    cred.secret_access_key = j.at("secret_access_key").get<std::string>();
    cred.created_at = j.value("created_at", int64_t{0});
    cred.updated_at = j.value("updated_at", int64_t{0});
  } catch (const json::exception &e) {
    return Error(ErrorCode::DATA_CORRUPTED,
                 std::string("credential record unreadable: ") + e.what());
  }
  if (cred.access_key_id.size() != kAccessKeyIdLength ||
      cred.secret_access_key.size() != kSecretAccessKeyLength) {
    return Error(ErrorCode::DATA_CORRUPTED,
                 "credential record has wrong key length");
  }
  return cred;
}

} // namespace

// ============================================================================
// MemoryCredentialStore 实现
// ============================================================================

Result<Credential> MemoryCredentialStore::Get(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = creds_.find(name);
  if (it == creds_.end())
    return Error(ErrorCode::NOT_FOUND, "no credential for " + name);
  return it->second;
}

Status MemoryCredentialStore::Put(const Credential &cred) {
  std::lock_guard<std::mutex> lock(mutex_);
  creds_[cred.name] = cred;
  return Status::OK();
}

size_t MemoryCredentialStore::Count() {
  std::lock_guard<std::mutex> lock(mutex_);
  return creds_.size();
}

// ============================================================================
// RocksDBCredentialStore 实现
// ============================================================================

struct RocksDBCredentialStore::Impl {
  std::unique_ptr<rocksdb::DB> db;
  std::string db_path;
};

RocksDBCredentialStore::RocksDBCredentialStore(const std::string &db_path)
    : impl_(std::make_unique<Impl>()) {

  impl_->db_path = db_path;

  rocksdb::Options options;
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  rocksdb::DB *raw = nullptr;
  rocksdb::Status status = rocksdb::DB::Open(options, db_path, &raw);
  if (!status.ok()) {
    throw std::runtime_error("Failed to open RocksDB: " + status.ToString());
  }
  impl_->db.reset(raw);
}

RocksDBCredentialStore::~RocksDBCredentialStore() = default;

Result<Credential> RocksDBCredentialStore::Get(const std::string &name) {
  std::string value;
  rocksdb::Status status =
      impl_->db->Get(rocksdb::ReadOptions(), KEY_PREFIX_CRED + name, &value);

  if (status.IsNotFound())
    return Error(ErrorCode::NOT_FOUND, "no credential for " + name);
  if (!status.ok())
    return Error(ErrorCode::STORAGE_ERROR, "RocksDB get: " + status.ToString());

  return DeserializeCredential(value);
}

Status RocksDBCredentialStore::Put(const Credential &cred) {
  rocksdb::WriteOptions write_opts;
  write_opts.sync = true; // 返回即持久化，重启后 Fetch 可见

  rocksdb::Status status = impl_->db->Put(
      write_opts, KEY_PREFIX_CRED + cred.name, SerializeCredential(cred));
  if (!status.ok())
    return Status(ErrorCode::STORAGE_ERROR, "RocksDB put: " + status.ToString());
  return Status::OK();
}

size_t RocksDBCredentialStore::Count() {
  const std::string prefix = KEY_PREFIX_CRED;
  size_t n = 0;
  std::unique_ptr<rocksdb::Iterator> it(
      impl_->db->NewIterator(rocksdb::ReadOptions()));
  for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix);
       it->Next()) {
    ++n;
  }
  return n;
}

} // namespace keyward::ctl
