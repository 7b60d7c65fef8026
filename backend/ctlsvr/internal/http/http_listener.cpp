/**
 * @file http_listener.cpp
 * @brief Boost.Beast HTTP 监听器与 Session
 *
 * 每连接一个 Session，运行在独立 strand 上：读请求 -> 分发 -> 写响应，
 * keep-alive 时继续读下一个请求。读写均受 request_timeout_sec 约束。
 */

#include "http_listener.h"
#include "../rpc/rpc_codec.h"
#include "../rpc/rpc_dispatcher.h"

#include <keyward/log_helper.h>

#include <boost/optional.hpp>

#include <chrono>
#include <sstream>
#include <stdexcept>

namespace keyward::ctl {

namespace http = beast::http;

namespace {

constexpr std::size_t kMaxBodyBytes = 1024 * 1024;

void fail(beast::error_code ec, const char* what) {
    LogWarning(TAG("service", "ctlsvr"), "http " << what << ": " << ec.message());
}

std::string RemoteEndpointString(const beast::tcp_stream& stream) {
    beast::error_code ec;
    auto ep = stream.socket().remote_endpoint(ec);
    if (ec) return "unknown";
    std::ostringstream os;
    os << ep.address().to_string() << ":" << ep.port();
    return os.str();
}

// 分发层异常时的兜底响应，不回显请求内容，发送后关闭连接
http::response<http::string_body> InternalErrorResponse(unsigned version) {
    http::response<http::string_body> res{http::status::internal_server_error, version};
    res.set(http::field::content_type, kJsonContentType);
    res.keep_alive(false);
    res.body() = EncodeError(Error(ErrorCode::INTERNAL_ERROR, "internal error"), nullptr);
    res.prepare_payload();
    return res;
}

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket,
                std::shared_ptr<RpcDispatcher> dispatcher,
                int request_timeout_sec)
        : stream_(std::move(socket))
        , dispatcher_(std::move(dispatcher))
        , timeout_(std::chrono::seconds(request_timeout_sec)) {}

    void Run() {
        net::dispatch(stream_.get_executor(),
            beast::bind_front_handler(&HttpSession::DoRead, shared_from_this()));
    }

private:
    void DoRead() {
        parser_.emplace();
        parser_->body_limit(kMaxBodyBytes);
        stream_.expires_after(timeout_);
        http::async_read(stream_, buffer_, *parser_,
            beast::bind_front_handler(&HttpSession::OnRead, shared_from_this()));
    }

    void OnRead(beast::error_code ec, std::size_t bytes_transferred) {
        (void)bytes_transferred;
        if (ec == http::error::end_of_stream) {
            DoClose();
            return;
        }
        if (ec) {
            if (ec != beast::error::timeout && ec != net::error::operation_aborted)
                fail(ec, "read");
            return;
        }

        http::request<http::string_body> req = parser_->release();
        LogDebug(TAG("remote", RemoteEndpointString(stream_)),
                 req.method_string() << " " << req.target());

        try {
            response_ = dispatcher_->HandleRequest(req);
        } catch (const std::exception& e) {
            LogError(TAG("service", "ctlsvr"), "dispatch failed: " << e.what());
            response_ = InternalErrorResponse(req.version());
        }
        DoWrite();
    }

    void DoWrite() {
        stream_.expires_after(timeout_);
        http::async_write(stream_, response_,
            beast::bind_front_handler(&HttpSession::OnWrite, shared_from_this()));
    }

    void OnWrite(beast::error_code ec, std::size_t bytes_transferred) {
        (void)bytes_transferred;
        if (ec) {
            fail(ec, "write");
            return;
        }
        if (response_.need_eof()) {
            DoClose();
            return;
        }
        DoRead();
    }

    void DoClose() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    boost::optional<http::request_parser<http::string_body>> parser_;
    http::response<http::string_body> response_;
    std::shared_ptr<RpcDispatcher> dispatcher_;
    std::chrono::seconds timeout_;
};

}  // namespace

// ---------------------------------------------------------------------------
// HttpListener
// ---------------------------------------------------------------------------

HttpListener::HttpListener(net::io_context& ioc,
                           const std::string& host, int port,
                           std::shared_ptr<RpcDispatcher> dispatcher,
                           int request_timeout_sec)
    : ioc_(ioc)
    , acceptor_(ioc)
    , dispatcher_(std::move(dispatcher))
    , request_timeout_sec_(request_timeout_sec) {
    beast::error_code ec;
    std::string bind_host = host.empty() ? "0.0.0.0" : host;
    auto addr = net::ip::make_address(bind_host, ec);
    if (ec)
        throw std::runtime_error("invalid host '" + host + "': " + ec.message());

    tcp::endpoint endpoint(addr, static_cast<unsigned short>(port));
    acceptor_.open(endpoint.protocol(), ec);
    if (ec)
        throw std::runtime_error("acceptor open: " + ec.message());
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec)
        throw std::runtime_error("acceptor set_option: " + ec.message());
    acceptor_.bind(endpoint, ec);
    if (ec)
        throw std::runtime_error("acceptor bind " + bind_host + ":" + std::to_string(port) +
                                 ": " + ec.message());
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec)
        throw std::runtime_error("acceptor listen: " + ec.message());
}

HttpListener::~HttpListener() = default;

void HttpListener::Run() {
    DoAccept();
}

void HttpListener::Stop() {
    // acceptor 非线程安全，关闭操作投递到 io_context
    net::post(ioc_, [self = shared_from_this()]() {
        self->stopped_ = true;
        beast::error_code ec;
        self->acceptor_.close(ec);
    });
}

unsigned short HttpListener::LocalPort() const {
    beast::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

void HttpListener::DoAccept() {
    if (stopped_) return;
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(&HttpListener::OnAccept, shared_from_this()));
}

void HttpListener::OnAccept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (!stopped_)
            fail(ec, "accept");
        return;
    }
    std::make_shared<HttpSession>(std::move(socket), dispatcher_, request_timeout_sec_)->Run();
    DoAccept();
}

}  // namespace keyward::ctl
