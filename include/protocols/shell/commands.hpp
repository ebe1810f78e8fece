#pragma once

#include <memory>

namespace rv::runtime { struct Deps; }

namespace rv::shell {

class Router;

void registerProjectCommands(const std::shared_ptr<Router>& r, const std::shared_ptr<runtime::Deps>& deps);
void registerSystemCommands(const std::shared_ptr<Router>& r, const std::shared_ptr<runtime::Deps>& deps);

inline void registerAllCommands(const std::shared_ptr<Router>& r, const std::shared_ptr<runtime::Deps>& deps) {
    registerProjectCommands(r, deps);
    registerSystemCommands(r, deps);
}

}
