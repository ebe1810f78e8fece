#include "protocols/http/HttpSession.hpp"
#include "protocols/http/HttpRouter.hpp"
#include "logging/LogRegistry.hpp"

using namespace rv::logging;

namespace rv::http {

HttpSession::HttpSession(tcp::socket socket, std::shared_ptr<HttpRouter> router)
    : socket_(std::move(socket)), router_(std::move(router)) { buffer_.max_size(8192); }

void HttpSession::run() {
    do_read();
}

void HttpSession::do_read() {
    auto self = shared_from_this();
    req_ = {};

    http::async_read(socket_, buffer_, req_,
                     [self](beast::error_code ec, std::size_t bytes) {
                         self->on_read(ec, bytes);
                     });
}

void HttpSession::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == http::error::end_of_stream) return do_close();

    if (ec) {
        LogRegistry::http()->error("[HttpSession] Read error: {}", ec.message());
        return;
    }

    LogRegistry::http()->debug("[HttpSession] Read {} bytes: {}", bytes, std::string(req_.target()));

    res_ = std::make_shared<http::response<http::string_body>>(router_->route(req_));
    const bool close = res_->need_eof();

    auto self = shared_from_this();
    http::async_write(socket_, *res_,
                      [self, close](beast::error_code ec, std::size_t bytes) {
                          self->on_write(close, ec, bytes);
                      });
}

void HttpSession::on_write(const bool close, beast::error_code ec, const std::size_t bytes) {
    (void)bytes;

    if (ec) {
        LogRegistry::http()->error("[HttpSession] Write error: {}", ec.message());
        return;
    }

    if (close) {
        do_close();
        return;
    }

    res_.reset();
    do_read();
}

void HttpSession::do_close() {
    beast::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_send, ec);
    // ignore errors on shutdown
}

}
