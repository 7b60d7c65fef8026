#include "credential_generator.h"
#include "keyward/utils.h"

namespace keyward::ctl {

namespace {

constexpr const char *kAccessKeyAlphabet = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";

// 30 字节 Base64 恰好 40 字符且无 '=' 填充
constexpr size_t kSecretEntropyBytes = kSecretAccessKeyLength / 4 * 3;

} // namespace

Credential RandomCredentialGenerator::NewCredential() {
  Credential cred;
  cred.access_key_id =
      utils::SecureRandomString(kAccessKeyIdLength, kAccessKeyAlphabet);

  auto bytes = utils::SecureRandomBytes(kSecretEntropyBytes);
  cred.secret_access_key = utils::Base64Encode(bytes.data(), bytes.size());
  return cred;
}

} // namespace keyward::ctl
