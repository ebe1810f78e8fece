#include "protocols/http/HttpServer.hpp"
#include "protocols/http/HttpSession.hpp"
#include "protocols/http/HttpRouter.hpp"
#include "logging/LogRegistry.hpp"

using namespace rv::logging;

namespace rv::http {

HttpServer::HttpServer(net::io_context& ioc, const tcp::endpoint& endpoint, std::shared_ptr<HttpRouter> router)
    : acceptor_(ioc), socket_(ioc), router_(std::move(router)) {
    beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.bind(endpoint, ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) throw beast::system_error(ec);
}

void HttpServer::run() {
    LogRegistry::http()->info("[HttpServer] Serving the query API on {}:{}",
                              acceptor_.local_endpoint().address().to_string(), acceptor_.local_endpoint().port());
    do_accept();
}

void HttpServer::do_accept() {
    acceptor_.async_accept(socket_, [self = shared_from_this()](beast::error_code ec) mutable {
        if (!ec) std::make_shared<HttpSession>(std::move(self->socket_), self->router_)->run();
        else LogRegistry::http()->warn("[HttpServer] Accept failed: {}", ec.message());
        self->socket_ = tcp::socket(self->acceptor_.get_executor());
        self->do_accept();
    });
}

} // namespace rv::http
