#pragma once

#include "../store/credential_store.h"

namespace keyward::ctl {

/**
 * 凭证生成能力。Registry 只依赖此接口，测试可替换为确定性实现。
 */
class CredentialGenerator {
public:
  virtual ~CredentialGenerator() = default;

  // 返回 name 为空的新凭证；随机源失败时抛 keyward::utils::EntropyError
  virtual Credential NewCredential() = 0;
};

/**
 * OpenSSL CSPRNG 实现
 *   AccessKeyID     20 位，字符集 0-9A-Z，拒绝采样
 *   SecretAccessKey 40 位，30 个随机字节的标准 Base64
 */
class RandomCredentialGenerator : public CredentialGenerator {
public:
  Credential NewCredential() override;
};

} // namespace keyward::ctl
