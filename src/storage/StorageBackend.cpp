#include "storage/StorageBackend.hpp"
#include "storage/LocalStorageBackend.hpp"
#include "storage/ContainerStorageBackend.hpp"
#include "config/Config.hpp"
#include "config/paths.hpp"

#include <stdexcept>

std::shared_ptr<rv::storage::StorageBackend> rv::storage::makeBackend(const config::StorageConfig& cfg) {
    switch (types::backend_type_from_string(cfg.backend)) {
        case types::BackendType::Local:
            return std::make_shared<LocalStorageBackend>(paths::expandHome(cfg.local.root));
        case types::BackendType::Container:
            return std::make_shared<ContainerStorageBackend>(cfg.container);
    }
    throw std::invalid_argument("Unsupported storage backend: " + cfg.backend);
}
