#include "protocols/shell/commands.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/usage/ProjectUsage.hpp"
#include "protocols/http/HttpRouter.hpp"
#include "protocols/http/HttpServer.hpp"
#include "util/shellArgsHelpers.hpp"
#include "logging/LogRegistry.hpp"
#include "runtime/Deps.hpp"
#include "storage/StorageBackend.hpp"

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include <fmt/core.h>

using namespace rv::shell;
using namespace rv::logging;
using namespace rv::runtime;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

CommandResult handle_help(const CommandCall& call, const std::weak_ptr<Router>& router) {
    const auto r = router.lock();
    if (!r) return failed("help: command router is gone");
    if (call.positionals.size() > 1) return invalid("help: expected at most one command");

    if (call.positionals.empty()) return usage(r->help());
    if (!r->hasCommand(call.positionals[0]))
        return invalid(fmt::format("help: unknown command '{}'\n\n{}", call.positionals[0], r->help()));
    return usage(r->help(call.positionals[0]));
}

CommandResult handle_version(const CommandCall& call) {
    if (!call.positionals.empty()) return invalid("version: unexpected arguments");
    return ok("ReelVault v" RV_VERSION "\n");
}

CommandResult handle_serve(const CommandCall& call, const std::shared_ptr<Deps>& deps) {
    if (call.positionals.size() > 1) return invalid("serve: expected at most one [port]");

    auto port = deps->config.api.port;
    if (!call.positionals.empty()) {
        const auto p = parseInt(call.positionals[0]);
        if (!p || *p < 1 || *p > 65535) return invalid(fmt::format("serve: invalid port '{}'", call.positionals[0]));
        port = static_cast<uint16_t>(*p);
    }
    const auto host = optVal(call, "host").value_or(deps->config.api.host);

    boost::system::error_code ec;
    const auto address = net::ip::make_address(host, ec);
    if (ec) return invalid(fmt::format("serve: invalid host '{}': {}", host, ec.message()));

    deps->backend->ready();

    net::io_context ioc;
    const auto router = std::make_shared<rv::http::HttpRouter>(deps);
    const auto server = std::make_shared<rv::http::HttpServer>(ioc, tcp::endpoint{address, port}, router);

    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&ioc](const boost::system::error_code&, int sig) {
        LogRegistry::http()->info("[serve] Received signal {}, shutting down", sig);
        ioc.stop();
    });

    server->run();

    const auto ep = server->localEndpoint();
    std::cout << fmt::format("Serving ReelVault API on http://{}:{} (Ctrl+C to stop)", ep.address().to_string(), ep.port())
              << std::endl;
    LogRegistry::http()->info("[serve] Listening on {}:{}", ep.address().to_string(), ep.port());

    ioc.run();
    return ok("Server stopped.\n");
}

}

void rv::shell::registerSystemCommands(const std::shared_ptr<Router>& r, const std::shared_ptr<Deps>& deps) {
    const std::weak_ptr<Router> weak = r;

    r->registerCommand(SystemUsage::help(), [weak](const CommandCall& call) {
        return handle_help(call, weak);
    });

    r->registerCommand(SystemUsage::version(), [](const CommandCall& call) {
        return handle_version(call);
    });

    r->registerCommand(SystemUsage::serve(), [deps](const CommandCall& call) {
        return handle_serve(call, deps);
    });
}
