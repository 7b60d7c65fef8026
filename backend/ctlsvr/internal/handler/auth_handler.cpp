#include "auth_handler.h"
#include "../service/credential_registry.h"
#include <keyward/log_helper.h>

namespace keyward::ctl {

namespace {

Result<AuthReply> ToReply(const char *method, const std::string &user,
                          const Result<Credential> &result) {
  if (!result.ok()) {
    LogDebug(TAG("method", method).Add("user", user),
             "failed: " << result.error().ToString());
    return result.error();
  }
  AuthReply reply;
  reply.name = result->name;
  reply.access_key_id = result->access_key_id;
  reply.secret_access_key = result->secret_access_key;
  return reply;
}

} // namespace

AuthHandler::AuthHandler(std::shared_ptr<CredentialRegistry> registry)
    : registry_(std::move(registry)) {}

AuthHandler::~AuthHandler() = default;

Result<AuthReply> AuthHandler::Generate(const AuthArgs &args) {
  return ToReply(kMethodAuthGenerate, args.user, registry_->Generate(args.user));
}

Result<AuthReply> AuthHandler::Fetch(const AuthArgs &args) {
  return ToReply(kMethodAuthFetch, args.user, registry_->Fetch(args.user));
}

Result<AuthReply> AuthHandler::Reset(const AuthArgs &args) {
  return ToReply(kMethodAuthReset, args.user, registry_->Reset(args.user));
}

unsigned AuthHandler::TransportStatus(ErrorCode code) {
  switch (code) {
  case ErrorCode::OK:
    return 200;
  case ErrorCode::INVALID_PARAM:
  case ErrorCode::ALREADY_EXISTS:
  case ErrorCode::NOT_FOUND:
  case ErrorCode::RPC_INVALID_REQUEST:
  case ErrorCode::RPC_METHOD_NOT_FOUND:
    return 400;
  case ErrorCode::RPC_PATH_NOT_FOUND:
    return 404;
  case ErrorCode::RPC_METHOD_NOT_ALLOWED:
    return 405;
  case ErrorCode::RPC_UNSUPPORTED_MEDIA_TYPE:
    return 415;
  default:
    return 500;
  }
}

} // namespace keyward::ctl
