#pragma once

#include <atomic>
#include <string>

#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "keyward/error_code.h"
#include "rpc_types.h"

namespace keyward::ctl {

/** 原始 HTTP 响应（状态码 + 头 + body） */
struct HttpReply {
    unsigned status = 0;
    std::string content_type;
    std::string allow;
    std::string body;
};

/**
 * ctlsvr JSON-RPC 同步客户端（Boost.Beast）
 * 每次调用新建一条短连接；可多线程共用，id 自增。
 */
class RpcClient {
public:
    RpcClient(std::string host, unsigned short port, int timeout_sec = 10);

    /** 发送任意 HTTP 请求，传输失败返回 RPC_TRANSPORT_ERROR */
    Result<HttpReply> Send(boost::beast::http::verb verb, const std::string& target,
                           const std::string& content_type, const std::string& body);

    /**
     * 调用方法，返回 result 字段；服务端错误按 error.code 还原为 Error
     * @param arg 单个参数对象，编码为 params: [arg]
     */
    Result<nlohmann::json> Call(const std::string& method, const nlohmann::json& arg);

    Result<AuthReply> Generate(const std::string& user);
    Result<AuthReply> Fetch(const std::string& user);
    Result<AuthReply> Reset(const std::string& user);
    Result<MemStatsReply> MemStats();
    Result<SysInfoReply> SysInfo();

private:
    Result<AuthReply> CallAuth(const char* method, const std::string& user);

    std::string host_;
    unsigned short port_;
    int timeout_sec_;
    std::atomic<int64_t> next_id_{1};
};

}  // namespace keyward::ctl
