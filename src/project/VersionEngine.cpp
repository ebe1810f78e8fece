#include "project/VersionEngine.hpp"
#include "project/ProjectStore.hpp"
#include "assets/Extractor.hpp"
#include "assets/Relinker.hpp"
#include "storage/StorageBackend.hpp"
#include "storage/SharedAssetStore.hpp"
#include "storage/keys.hpp"
#include "tracking/Differ.hpp"
#include "tracking/TrackingStore.hpp"
#include "logging/LogRegistry.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <fmt/core.h>

using namespace rv::project;
using namespace rv::types;
using namespace rv::logging;
namespace fs = std::filesystem;

namespace {

fs::path requireProjectFile(const fs::path& projectFile) {
    std::error_code ec;
    if (!fs::is_regular_file(projectFile, ec))
        throw std::invalid_argument(fmt::format("Project file does not exist: {}", projectFile.string()));
    return fs::absolute(projectFile).lexically_normal();
}

}

VersionEngine::VersionEngine(std::shared_ptr<storage::StorageBackend> backend, std::shared_ptr<ProjectStore> store)
    : backend_(std::move(backend)),
      store_(std::move(store)),
      tracking_(std::make_shared<tracking::TrackingStore>(backend_)) {}

Version VersionEngine::capture(const Project& project,
                               const int number,
                               const std::string& message,
                               const fs::path& projectFile) const {
    const auto parsed = assets::extractAssets(projectFile);
    for (const auto& missing : parsed.missing_assets)
        LogRegistry::assets()->warn("[VersionEngine] Referenced asset not found: {}", missing);

    Version v;
    v.number = number;
    v.message = message;
    v.timestamp = util::now();
    v.size = fs::file_size(projectFile);

    const auto id = project.id();
    const auto ns = storage::versionNamespace(id, number);
    backend_->makeNamespace(ns);

    const auto key = storage::joinKey({ns, projectFile.filename().string()});
    backend_->copyIn(projectFile, key);
    v.backend_key = key;

    storage::SharedAssetStore shared(backend_, id);
    shared.rebuildIndex(project.versions);
    for (auto& r : shared.resolve(parsed.assets)) v.assets.push_back(std::move(r.asset));

    if (v.assets.size() < parsed.assets.size())
        LogRegistry::assets()->warn("[VersionEngine] {} of {} assets could not be stored for v{}",
                                    parsed.assets.size() - v.assets.size(), parsed.assets.size(), number);

    v.asset_count = static_cast<unsigned int>(parsed.assets.size());
    v.total_size = parsed.total_size;

    const auto* previous = project.latest();
    const auto track = tracking::diff(number, message, v.assets,
                                      previous ? previous->assets : std::vector<AssetReference>{}, v.timestamp);
    try {
        tracking_->save(id, track);
    } catch (const std::exception& e) {
        LogRegistry::tracking()->warn("[VersionEngine] Failed to save asset tracking for v{}: {}", number, e.what());
    }

    return v;
}

Project VersionEngine::initialize(const fs::path& projectFile, const bool force) {
    const auto file = requireProjectFile(projectFile);
    const auto storePath = store_->storePathFor(file);

    if (ProjectStore::exists(storePath) && !force)
        throw std::invalid_argument(fmt::format("Project already initialized at {}", storePath.string()));

    backend_->ready();

    Project project;
    project.name = file.filename().string();
    project.project_path = file;
    project.created_at = util::now();
    project.backend = backend_->type();
    project.volume = backend_->volume();

    project.versions.push_back(capture(project, 0, INITIAL_MESSAGE, file));
    ProjectStore::save(project, storePath);

    LogRegistry::audit()->info("[VersionEngine] Initialized {} (id {}) with {} assets",
                               project.name, project.id(), project.versions.front().asset_count);
    return project;
}

Version VersionEngine::commit(Project& project,
                              const fs::path& storePath,
                              const std::string& message,
                              const fs::path& projectFile) {
    const auto file = requireProjectFile(projectFile);
    backend_->ready();

    const auto number = static_cast<int>(project.versions.size());
    if (std::ranges::find(project.versions, number, &Version::number) != project.versions.end())
        LogRegistry::project()->warn("[VersionEngine] Version {} of {} already exists after an earlier removal; "
                                     "its stored snapshot will be overwritten", number, project.id());
    auto version = capture(project, number, message, file);

    const auto previousPath = project.project_path;
    project.project_path = file;
    project.versions.push_back(version);

    try {
        ProjectStore::save(project, storePath);
    } catch (...) {
        project.versions.pop_back();
        project.project_path = previousPath;
        throw;
    }

    LogRegistry::audit()->info("[VersionEngine] Committed {} v{}: \"{}\" ({} assets)",
                               project.id(), number, message, version.asset_count);
    return version;
}

const Version& VersionEngine::getVersion(const Project& project, const int number) {
    if (number < 0 || number >= static_cast<int>(project.versions.size()))
        throw std::out_of_range(fmt::format("Version {} does not exist", number));

    const auto it = std::ranges::find(project.versions, number, &Version::number);
    if (it == project.versions.end())
        throw std::out_of_range(fmt::format("Version {} does not exist", number));
    return *it;
}

void VersionEngine::removeVersion(Project& project, const fs::path& storePath, const int number) const {
    auto kept = project.versions;
    const auto removed = std::erase_if(kept, [number](const Version& v) { return v.number == number; });
    if (removed == 0) throw std::out_of_range(fmt::format("Version {} does not exist", number));

    auto updated = project;
    updated.versions = std::move(kept);
    ProjectStore::save(updated, storePath);
    project = std::move(updated);

    LogRegistry::audit()->info("[VersionEngine] Removed {} v{}", project.id(), number);
}

unsigned int VersionEngine::pruneMissingBackedVersions(Project& project, const fs::path& storePath) const {
    backend_->ready();

    std::vector<Version> kept;
    kept.reserve(project.versions.size());
    unsigned int removed = 0;

    for (const auto& v : project.versions) {
        if (v.backend_key.empty() || backend_->exists(v.backend_key)) {
            kept.push_back(v);
            continue;
        }
        LogRegistry::project()->info("[VersionEngine] v{} is missing from the backend ({})", v.number, v.backend_key);
        ++removed;
    }

    if (removed == 0) return 0;

    auto updated = project;
    updated.versions = std::move(kept);
    ProjectStore::save(updated, storePath);
    project = std::move(updated);

    LogRegistry::audit()->info("[VersionEngine] Pruned {} versions from {}", removed, project.id());
    return removed;
}

fs::path VersionEngine::restoreVersion(const Project& project, const int number, const fs::path& outDir) const {
    const auto& v = getVersion(project, number);
    if (v.backend_key.empty())
        throw std::runtime_error(fmt::format("Version {} has no stored project file", number));

    backend_->ready();
    fs::create_directories(outDir);

    const auto dest = outDir / fs::path(v.backend_key).filename();
    backend_->copyOut(v.backend_key, dest);

    std::map<fs::path, fs::path> moves;
    for (const auto& a : v.assets) {
        std::error_code ec;
        if (fs::exists(a.original_path, ec) || a.backend_key.empty()) continue;

        const auto target = fs::absolute(outDir / "assets" / a.filename).lexically_normal();
        try {
            backend_->copyOut(a.backend_key, target);
            moves.emplace(a.original_path, target);
        } catch (const std::exception& e) {
            LogRegistry::assets()->warn("[VersionEngine] Could not restore asset {}: {}", a.filename, e.what());
        }
    }

    assets::relinkReferences(dest, project.project_path.parent_path(), moves);

    LogRegistry::project()->info("[VersionEngine] Restored {} v{} to {} ({} assets relinked)",
                                 project.id(), number, dest.string(), moves.size());
    return dest;
}

void VersionEngine::deleteProject(const Project& project, const fs::path& storePath) const {
    backend_->ready();
    backend_->deleteNamespace(project.id());

    std::error_code ec;
    fs::remove_all(storePath.parent_path(), ec);
    if (ec) throw std::runtime_error(fmt::format("Failed to remove {}: {}", storePath.parent_path().string(), ec.message()));

    LogRegistry::audit()->info("[VersionEngine] Deleted project {}", project.id());
}

AssetTracking VersionEngine::loadTracking(const Project& project, const int number) const {
    const auto& v = getVersion(project, number);
    return tracking_->load(project.id(), v.number);
}
