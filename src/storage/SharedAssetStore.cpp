#include "storage/SharedAssetStore.hpp"
#include "storage/StorageBackend.hpp"
#include "storage/keys.hpp"
#include "logging/LogRegistry.hpp"

using namespace rv::storage;
using namespace rv::logging;

SharedAssetStore::SharedAssetStore(std::shared_ptr<StorageBackend> backend, std::string projectId)
    : backend_(std::move(backend)), projectId_(std::move(projectId)) {}

void SharedAssetStore::rebuildIndex(const std::vector<types::Version>& versions) {
    index_.clear();
    for (const auto& v : versions)
        for (const auto& a : v.assets)
            if (!a.backend_key.empty()) index_[a.filename] = a.backend_key;
}

std::vector<ResolvedAsset> SharedAssetStore::resolve(const std::vector<types::AssetReference>& found) {
    backend_->makeNamespace(sharedAssetsNamespace(projectId_));

    std::vector<ResolvedAsset> resolved;
    resolved.reserve(found.size());

    for (const auto& asset : found) {
        ResolvedAsset r{asset, false};
        const auto sharedKey = sharedAssetKey(projectId_, asset.filename);

        try {
            if (backend_->exists(sharedKey)) {
                const auto it = index_.find(asset.filename);
                r.asset.backend_key = it != index_.end() ? it->second : sharedKey;
                LogRegistry::assets()->info("[SharedAssetStore] Reusing existing asset: {}", asset.filename);
            } else {
                backend_->copyIn(asset.original_path, sharedKey);
                r.asset.backend_key = sharedKey;
                r.copied = true;
                LogRegistry::assets()->info("[SharedAssetStore] Copied new asset: {}", asset.filename);
            }
        } catch (const std::exception& e) {
            LogRegistry::assets()->warn("[SharedAssetStore] Failed to store asset {}: {}", asset.filename, e.what());
            continue;
        }

        index_[asset.filename] = r.asset.backend_key;
        resolved.push_back(std::move(r));
    }

    return resolved;
}
