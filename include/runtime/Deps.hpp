#pragma once

#include "config/Config.hpp"

#include <memory>

namespace rv::storage { class StorageBackend; }
namespace rv::project {
class ProjectStore;
class ContextStore;
class ProjectLocator;
class VersionEngine;
}

namespace rv::runtime {

// Everything a command or request handler needs, built once from the configuration
// and handed to the CLI and the HTTP server explicitly.
struct Deps {
    config::Config config;
    std::shared_ptr<storage::StorageBackend> backend;
    std::shared_ptr<project::ProjectStore> projectStore;
    std::shared_ptr<project::ContextStore> context;
    std::shared_ptr<project::ProjectLocator> locator;
    std::shared_ptr<project::VersionEngine> engine;

    static std::shared_ptr<Deps> fromConfig(const config::Config& cfg);

    // Same wiring over an existing backend (tests, alternate roots).
    static std::shared_ptr<Deps> withBackend(const config::Config& cfg, std::shared_ptr<storage::StorageBackend> backend);
};

}
