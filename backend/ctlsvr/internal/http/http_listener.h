#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include <boost/beast.hpp>

namespace keyward::ctl {

class RpcDispatcher;

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

/**
 * HTTP 监听器：Boost.Beast 实现，接受连接并为每个连接创建 HttpSession。
 * Session 支持 keep-alive，请求交给 RpcDispatcher 处理。
 *
 * port 为 0 时由系统分配端口，可通过 LocalPort() 取得（测试用）。
 */
class HttpListener : public std::enable_shared_from_this<HttpListener> {
public:
    HttpListener(net::io_context& ioc,
                 const std::string& host, int port,
                 std::shared_ptr<RpcDispatcher> dispatcher,
                 int request_timeout_sec);
    ~HttpListener();

    void Run();
    void Stop();

    unsigned short LocalPort() const;

private:
    void DoAccept();
    void OnAccept(beast::error_code ec, tcp::socket socket);

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::shared_ptr<RpcDispatcher> dispatcher_;
    int request_timeout_sec_;
    std::atomic<bool> stopped_{false};
};

}  // namespace keyward::ctl
