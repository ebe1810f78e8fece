#pragma once

#include "types/AssetReference.hpp"
#include "types/Version.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace rv::storage {

class StorageBackend;

struct ResolvedAsset {
    types::AssetReference asset;   // backend_key filled in
    bool copied{};                 // false when an existing shared object was reused
};

// Project-wide pool of assets, one object per distinct filename.
// Identity is the filename alone: a different local file with a name already in the pool is not copied.
class SharedAssetStore {
public:
    SharedAssetStore(std::shared_ptr<StorageBackend> backend, std::string projectId);

    // filename -> backend key, from every asset recorded by prior versions
    void rebuildIndex(const std::vector<types::Version>& versions);

    // Copies new assets into the pool and reuses existing ones. Assets that fail to copy are
    // logged and left out of the result.
    std::vector<ResolvedAsset> resolve(const std::vector<types::AssetReference>& found);

    [[nodiscard]] const std::unordered_map<std::string, std::string>& index() const { return index_; }
    [[nodiscard]] const std::string& projectId() const { return projectId_; }

private:
    std::shared_ptr<StorageBackend> backend_;
    std::string projectId_;
    std::unordered_map<std::string, std::string> index_;
};

}
