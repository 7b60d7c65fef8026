#pragma once

#include <memory>

#include "keyward/error_code.h"
#include "../rpc/rpc_types.h"

namespace keyward::ctl {

class CredentialRegistry;

/**
 * Auth.* 门面：AuthArgs -> CredentialRegistry -> AuthReply
 *
 * 注册表返回的 INVALID_PARAM / ALREADY_EXISTS / NOT_FOUND 统一映射为 400，
 * 调用方需看错误体中的 code/kind 区分；其余错误映射为 500。
 */
class AuthHandler {
public:
  explicit AuthHandler(std::shared_ptr<CredentialRegistry> registry);
  ~AuthHandler();

  Result<AuthReply> Generate(const AuthArgs &args);
  Result<AuthReply> Fetch(const AuthArgs &args);
  Result<AuthReply> Reset(const AuthArgs &args);

  // 错误码 -> HTTP 状态码
  static unsigned TransportStatus(ErrorCode code);

private:
  std::shared_ptr<CredentialRegistry> registry_;
};

} // namespace keyward::ctl
