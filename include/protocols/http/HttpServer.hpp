#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio.hpp>
#include <memory>

namespace rv::http {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;
class HttpRouter;

class HttpServer : public std::enable_shared_from_this<HttpServer> {
public:
    HttpServer(net::io_context& ioc, const tcp::endpoint& endpoint, std::shared_ptr<HttpRouter> router);

    void run();

    [[nodiscard]] tcp::endpoint localEndpoint() const { return acceptor_.local_endpoint(); }

private:
    void do_accept();

    tcp::acceptor acceptor_;
    tcp::socket socket_;
    std::shared_ptr<HttpRouter> router_;
};

} // namespace rv::http
