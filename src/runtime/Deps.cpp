#include "runtime/Deps.hpp"
#include "storage/StorageBackend.hpp"
#include "project/ProjectStore.hpp"
#include "project/ContextStore.hpp"
#include "project/ProjectLocator.hpp"
#include "project/VersionEngine.hpp"
#include "config/paths.hpp"
#include "logging/LogRegistry.hpp"

using namespace rv::runtime;
using namespace rv::logging;

std::shared_ptr<Deps> Deps::fromConfig(const config::Config& cfg) {
    return withBackend(cfg, storage::makeBackend(cfg.storage));
}

std::shared_ptr<Deps> Deps::withBackend(const config::Config& cfg, std::shared_ptr<storage::StorageBackend> backend) {
    auto deps = std::make_shared<Deps>();
    deps->config = cfg;
    deps->backend = std::move(backend);
    deps->projectStore = std::make_shared<project::ProjectStore>(cfg.project.metadata_dir);
    deps->context = std::make_shared<project::ContextStore>(paths::expandHome(cfg.project.context_file));
    deps->locator = std::make_shared<project::ProjectLocator>(deps->projectStore, cfg.project.discovery_dirs);
    deps->engine = std::make_shared<project::VersionEngine>(deps->backend, deps->projectStore);

    LogRegistry::reelvault()->debug("[Deps] Wired {} backend", cfg.storage.backend);
    return deps;
}
