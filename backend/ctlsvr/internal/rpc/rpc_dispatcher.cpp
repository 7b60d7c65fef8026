#include "rpc_dispatcher.h"
#include "rpc_codec.h"
#include "../handler/auth_handler.h"
#include "../handler/server_handler.h"

#include <keyward/log_helper.h>
#include <keyward/utils.h>

#include <exception>

using json = nlohmann::json;

namespace keyward::ctl {

namespace {

template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

http::response<http::string_body> MakeResponse(const http::request<http::string_body> &req,
                                               unsigned status, std::string body) {
  http::response<http::string_body> res{static_cast<http::status>(status), req.version()};
  res.set(http::field::server, "keyward-ctlsvr");
  res.set(http::field::content_type, kJsonContentType);
  res.keep_alive(req.keep_alive());
  res.body() = std::move(body);
  res.prepare_payload();
  return res;
}

http::response<http::string_body> ErrorResponse(const http::request<http::string_body> &req,
                                                const Error &error, const json &id) {
  return MakeResponse(req, AuthHandler::TransportStatus(error.code), EncodeError(error, id));
}

template <typename T>
http::response<http::string_body> ReplyResponse(const http::request<http::string_body> &req,
                                                const Result<T> &result, const json &id) {
  if (!result.ok())
    return ErrorResponse(req, result.error(), id);
  return MakeResponse(req, 200, EncodeResult(json(result.value()), id));
}

} // namespace

RpcDispatcher::RpcDispatcher(std::shared_ptr<AuthHandler> auth,
                             std::shared_ptr<ServerHandler> server)
    : auth_(std::move(auth)), server_(std::move(server)) {}

bool RpcDispatcher::IsJsonContentType(const std::string &value) {
  std::string media = value.substr(0, value.find(';'));
  return utils::ToLower(utils::Trim(media)) == kJsonContentType;
}

http::response<http::string_body>
RpcDispatcher::HandleRequest(const http::request<http::string_body> &req) {
  try {
    return Route(req);
  } catch (const std::exception &e) {
    LogError(TAG("service", "ctlsvr"), "request failed: " << e.what());
    return ErrorResponse(req, Error(ErrorCode::INTERNAL_ERROR, "internal error"), nullptr);
  }
}

http::response<http::string_body>
RpcDispatcher::Route(const http::request<http::string_body> &req) {
  const json null_id = nullptr;

  std::string target(req.target());
  std::string path = target.substr(0, target.find('?'));
  if (path != kRpcPath) {
    LogDebug(TAG("path", path), "path not found");
    return ErrorResponse(req, Error(ErrorCode::RPC_PATH_NOT_FOUND, "no handler for " + path), null_id);
  }

  if (req.method() != http::verb::post) {
    auto res = ErrorResponse(req,
                             Error(ErrorCode::RPC_METHOD_NOT_ALLOWED,
                                   "rpc: POST method required, received " +
                                       std::string(req.method_string())),
                             null_id);
    res.set(http::field::allow, "POST");
    return res;
  }

  auto ct = req.find(http::field::content_type);
  std::string content_type = ct == req.end() ? std::string() : std::string(ct->value());
  if (!IsJsonContentType(content_type)) {
    return ErrorResponse(req,
                         Error(ErrorCode::RPC_UNSUPPORTED_MEDIA_TYPE,
                               "rpc: unrecognized Content-Type: " + content_type),
                         null_id);
  }

  json id = nullptr;
  auto decoded = DecodeRequest(req.body(), &id);
  if (!decoded.ok()) {
    LogDebug(TAG("code", std::to_string(decoded.error().Code())), decoded.error().message);
    return ErrorResponse(req, decoded.error(), id);
  }

  const Operation &op = decoded->op;
  try {
    return std::visit(
        Overloaded{
            [&](const GenerateOp &o) { return ReplyResponse(req, auth_->Generate(o.args), id); },
            [&](const FetchOp &o) { return ReplyResponse(req, auth_->Fetch(o.args), id); },
            [&](const ResetOp &o) { return ReplyResponse(req, auth_->Reset(o.args), id); },
            [&](const MemStatsOp &) {
              return MakeResponse(req, 200, EncodeResult(json(server_->MemStats()), id));
            },
            [&](const SysInfoOp &) {
              return MakeResponse(req, 200, EncodeResult(json(server_->SysInfo()), id));
            },
        },
        op);
  } catch (const std::exception &e) {
    LogError(TAG("method", MethodName(op)), "unhandled exception: " << e.what());
    return ErrorResponse(req, Error(ErrorCode::INTERNAL_ERROR, "internal error"), id);
  }
}

} // namespace keyward::ctl
