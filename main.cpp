// Runtime
#include "runtime/Deps.hpp"

// Shell
#include "protocols/shell/Router.hpp"
#include "protocols/shell/commands.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "config/paths.hpp"
#include "logging/LogRegistry.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace rv::config;
using namespace rv::logging;
using namespace rv::runtime;
using namespace rv::shell;

int main(const int argc, char** argv) {
    std::shared_ptr<Router> router;

    try {
        ConfigRegistry::init(rv::paths::getConfigPath());
        LogRegistry::init(rv::paths::expandHome(ConfigRegistry::get().logging.log_dir));

        const auto deps = Deps::fromConfig(ConfigRegistry::get());
        router = std::make_shared<Router>();
        registerAllCommands(router, deps);
    } catch (const std::exception& e) {
        std::cerr << "Failed to start ReelVault: " << e.what() << std::endl;
        return 1;
    }

    const std::vector<std::string> args(argv + 1, argv + argc);
    LogRegistry::reelvault()->debug("[main] Dispatching {} argument(s)", args.size());

    const auto res = router->execute(args);
    if (!res.stdout_text.empty()) std::cout << res.stdout_text;
    if (!res.stderr_text.empty()) {
        std::cerr << res.stderr_text;
        if (res.stderr_text.back() != '\n') std::cerr << '\n';
    }

    return res.exit_code;
}
