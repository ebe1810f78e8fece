#pragma once

#include "types/AssetTracking.hpp"

#include <memory>
#include <string>

namespace rv::storage { class StorageBackend; }

namespace rv::tracking {

// Persists per-commit tracking records as <projectId>/vNNN/asset-tracking.json in the backend.
class TrackingStore {
public:
    explicit TrackingStore(std::shared_ptr<storage::StorageBackend> backend);

    void save(const std::string& projectId, const types::AssetTracking& tracking) const;
    [[nodiscard]] types::AssetTracking load(const std::string& projectId, int version) const;

private:
    std::shared_ptr<storage::StorageBackend> backend_;
};

}
