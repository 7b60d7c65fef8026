/**
 * @file credential_registry.cpp
 * @brief 凭证注册表（生成 / 读取 / 轮换）
 */

#include "credential_registry.h"
#include "keyward/utils.h"
#include <keyward/log_helper.h>

#include <mutex>

namespace keyward::ctl {

namespace {

// Reset 后新旧值任一字段相同则重新生成的上限次数
constexpr int kMaxRedraws = 8;

Error InvalidName(const std::string &name) {
  if (name.empty())
    return Error(ErrorCode::INVALID_PARAM, "user name is empty");
  return Error(ErrorCode::INVALID_PARAM, "user name is malformed");
}

} // namespace

// ============================================================================
// 构造/析构
// ============================================================================

CredentialRegistry::CredentialRegistry(
    std::shared_ptr<CredentialStore> store,
    std::shared_ptr<CredentialGenerator> generator)
    : store_(std::move(store)), generator_(std::move(generator)) {}

CredentialRegistry::~CredentialRegistry() = default;

bool CredentialRegistry::IsValidName(const std::string &name) {
  if (name.empty() || name.size() > kMaxNameLength)
    return false;
  for (char c : name) {
    unsigned char uc = static_cast<unsigned char>(c);
    if (uc < 0x20 || uc == 0x7F)
      return false;
  }
  return true;
}

// ============================================================================
// Generate
// ============================================================================

Result<Credential> CredentialRegistry::Generate(const std::string &name) {
  if (!IsValidName(name))
    return InvalidName(name);

  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto existing = store_->Get(name);
  if (existing.ok()) {
    LogWarning(TAG("service", "ctlsvr").Add("user", name),
               "Generate rejected: credential already exists");
    return Error(ErrorCode::ALREADY_EXISTS,
                 "credential already exists for " + name + ", use Reset");
  }
  if (existing.error().code != ErrorCode::NOT_FOUND)
    return existing.error();

  Credential cred = generator_->NewCredential();
  cred.name = name;
  cred.created_at = utils::GetTimestampMs();
  cred.updated_at = cred.created_at;

  Status st = store_->Put(cred);
  if (!st.ok()) {
    LogError(TAG("service", "ctlsvr").Add("user", name),
             "Generate commit failed: " << st.error().ToString());
    return st.error();
  }

  LogInfo(TAG("service", "ctlsvr").Add("user", name),
          "credential generated, access_key_id=" << cred.access_key_id);
  return cred;
}

// ============================================================================
// Fetch
// ============================================================================

Result<Credential> CredentialRegistry::Fetch(const std::string &name) {
  if (!IsValidName(name))
    return InvalidName(name);

  std::shared_lock<std::shared_mutex> lock(mutex_);
  return store_->Get(name);
}

// ============================================================================
// Reset
// ============================================================================

Result<Credential> CredentialRegistry::Reset(const std::string &name) {
  if (!IsValidName(name))
    return InvalidName(name);

  std::unique_lock<std::shared_mutex> lock(mutex_);

  auto existing = store_->Get(name);
  if (!existing.ok()) {
    if (existing.error().code == ErrorCode::NOT_FOUND) {
      LogWarning(TAG("service", "ctlsvr").Add("user", name),
                 "Reset rejected: no credential");
    }
    return existing.error();
  }
  const Credential &old = existing.value();

  Credential cred = generator_->NewCredential();
  int redraws = 0;
  while (cred.access_key_id == old.access_key_id ||
         cred.secret_access_key == old.secret_access_key) {
    if (++redraws > kMaxRedraws) {
      return Error(ErrorCode::ENTROPY_UNAVAILABLE,
                   "generator keeps returning the previous credential");
    }
    cred = generator_->NewCredential();
  }
  cred.name = name;
  cred.created_at = old.created_at;
  cred.updated_at = utils::GetTimestampMs();

  Status st = store_->Put(cred);
  if (!st.ok()) {
    LogError(TAG("service", "ctlsvr").Add("user", name),
             "Reset commit failed: " << st.error().ToString());
    return st.error();
  }

  LogInfo(TAG("service", "ctlsvr").Add("user", name),
          "credential reset, access_key_id=" << cred.access_key_id);
  return cred;
}

size_t CredentialRegistry::Size() {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return store_->Count();
}

} // namespace keyward::ctl
