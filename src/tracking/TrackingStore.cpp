#include "tracking/TrackingStore.hpp"
#include "storage/StorageBackend.hpp"
#include "storage/keys.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <fstream>
#include <stdexcept>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace rv::tracking;
using namespace rv::logging;

TrackingStore::TrackingStore(std::shared_ptr<storage::StorageBackend> backend) : backend_(std::move(backend)) {}

void TrackingStore::save(const std::string& projectId, const types::AssetTracking& tracking) const {
    const util::TempFile tmp("asset-tracking");
    {
        std::ofstream out(tmp.path(), std::ios::trunc);
        if (!out) throw std::runtime_error("Failed to open " + tmp.path().string());
        out << nlohmann::json(tracking).dump(2);
        if (!out) throw std::runtime_error("Failed to write tracking record to " + tmp.path().string());
    }

    const auto key = storage::trackingKey(projectId, tracking.version);
    backend_->copyIn(tmp.path(), key);
    LogRegistry::tracking()->debug("[TrackingStore] Saved {}", key);
}

rv::types::AssetTracking TrackingStore::load(const std::string& projectId, const int version) const {
    const auto key = storage::trackingKey(projectId, version);
    if (!backend_->exists(key)) throw std::out_of_range("No tracking record for version " + std::to_string(version));

    const util::TempFile tmp("asset-tracking");
    backend_->copyOut(key, tmp.path());

    try {
        return nlohmann::json::parse(util::readFileToString(tmp.path())).get<types::AssetTracking>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(fmt::format("Corrupt tracking record {}: {}", key, e.what()));
    }
}
