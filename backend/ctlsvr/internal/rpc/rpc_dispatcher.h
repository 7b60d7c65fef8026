#pragma once

#include <memory>
#include <string>

#include <boost/beast/http.hpp>

namespace keyward::ctl {

class AuthHandler;
class ServerHandler;

namespace http = boost::beast::http;

constexpr const char *kRpcPath = "/rpc";
constexpr const char *kJsonContentType = "application/json";

/**
 * RPC 分发：校验路径 / 方法 / Content-Type，解码请求，调用对应 handler，编码响应。
 *
 * 与传输层无关，HttpListener 的每个 Session 直接调用 HandleRequest；
 * 单元测试可不经网络构造 request 调用。线程安全（handler 自身线程安全）。
 */
class RpcDispatcher {
public:
  RpcDispatcher(std::shared_ptr<AuthHandler> auth, std::shared_ptr<ServerHandler> server);

  http::response<http::string_body> HandleRequest(const http::request<http::string_body> &req);

  /**
   * 不含参数的媒体类型是否为 application/json（忽略大小写与 ;charset 等参数）
   */
  static bool IsJsonContentType(const std::string &value);

private:
  // 校验 + 解码 + 调用；异常由 HandleRequest 统一转为 500
  http::response<http::string_body> Route(const http::request<http::string_body> &req);

  std::shared_ptr<AuthHandler> auth_;
  std::shared_ptr<ServerHandler> server_;
};

} // namespace keyward::ctl
