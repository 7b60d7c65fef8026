#include "rpc_client.h"
#include "rpc_codec.h"
#include "rpc_dispatcher.h"

#include <chrono>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

namespace keyward::ctl {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;
using json = nlohmann::json;

RpcClient::RpcClient(std::string host, unsigned short port, int timeout_sec)
    : host_(std::move(host)), port_(port), timeout_sec_(timeout_sec) {}

Result<HttpReply> RpcClient::Send(http::verb verb, const std::string& target,
                                  const std::string& content_type, const std::string& body) {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    beast::error_code ec;

    auto results = resolver.resolve(host_, std::to_string(port_), ec);
    if (ec)
        return Error(ErrorCode::RPC_TRANSPORT_ERROR, "resolve: " + ec.message());

    stream.expires_after(std::chrono::seconds(timeout_sec_));
    stream.connect(results, ec);
    if (ec)
        return Error(ErrorCode::RPC_TRANSPORT_ERROR, "connect: " + ec.message());

    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, host_);
    req.set(http::field::user_agent, "keyward-rpc-client");
    if (!content_type.empty())
        req.set(http::field::content_type, content_type);
    req.body() = body;
    req.prepare_payload();

    http::write(stream, req, ec);
    if (ec)
        return Error(ErrorCode::RPC_TRANSPORT_ERROR, "write: " + ec.message());

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res, ec);
    if (ec)
        return Error(ErrorCode::RPC_TRANSPORT_ERROR, "read: " + ec.message());

    // 对端可能已先关闭，忽略 shutdown 错误
    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

    HttpReply reply;
    reply.status = res.result_int();
    reply.content_type = std::string(res[http::field::content_type]);
    reply.allow = std::string(res[http::field::allow]);
    reply.body = std::move(res.body());
    return reply;
}

Result<json> RpcClient::Call(const std::string& method, const json& arg) {
    json id = next_id_.fetch_add(1);
    auto sent = Send(http::verb::post, kRpcPath, kJsonContentType,
                     EncodeRequest(method, arg, id));
    if (!sent.ok())
        return sent.error();

    auto result = DecodeReply(sent->body, id);
    if (!result.ok() && result.error().code == ErrorCode::RPC_TRANSPORT_ERROR)
        return Error(ErrorCode::RPC_TRANSPORT_ERROR,
                     result.error().message + " (HTTP " + std::to_string(sent->status) + ")");
    return result;
}

Result<AuthReply> RpcClient::CallAuth(const char* method, const std::string& user) {
    auto result = Call(method, AuthArgs{user});
    if (!result.ok())
        return result.error();
    return result->get<AuthReply>();
}

Result<AuthReply> RpcClient::Generate(const std::string& user) {
    return CallAuth(kMethodAuthGenerate, user);
}

Result<AuthReply> RpcClient::Fetch(const std::string& user) {
    return CallAuth(kMethodAuthFetch, user);
}

Result<AuthReply> RpcClient::Reset(const std::string& user) {
    return CallAuth(kMethodAuthReset, user);
}

Result<MemStatsReply> RpcClient::MemStats() {
    auto result = Call(kMethodServerMemStats, json::object());
    if (!result.ok())
        return result.error();
    return result->get<MemStatsReply>();
}

Result<SysInfoReply> RpcClient::SysInfo() {
    auto result = Call(kMethodServerSysInfo, json::object());
    if (!result.ok())
        return result.error();
    return result->get<SysInfoReply>();
}

}  // namespace keyward::ctl
