#include "project/ProjectLocator.hpp"
#include "project/ProjectStore.hpp"
#include "project/ContextStore.hpp"
#include "config/paths.hpp"
#include "storage/StorageBackend.hpp"
#include "logging/LogRegistry.hpp"
#include "util/naming.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

using namespace rv::project;
using namespace rv::logging;
namespace fs = std::filesystem;

ProjectLocator::ProjectLocator(std::shared_ptr<ProjectStore> store, std::vector<fs::path> discoveryDirs)
    : store_(std::move(store)), discoveryDirs_(std::move(discoveryDirs)) {}

std::optional<LocatedProject> ProjectLocator::inspect(const fs::path& storePath) const {
    if (!ProjectStore::exists(storePath)) return std::nullopt;

    try {
        const auto project = ProjectStore::load(storePath);
        return LocatedProject{
            .id = project.id(),
            .name = fs::path(project.name).stem().string(),
            .store_path = storePath,
            .version_count = project.versions.size(),
        };
    } catch (const std::exception& e) {
        LogRegistry::project()->debug("[ProjectLocator] Skipping {}: {}", storePath.string(), e.what());
        return std::nullopt;
    }
}

std::vector<LocatedProject> ProjectLocator::discover() const {
    std::vector<LocatedProject> found;
    std::set<fs::path> seen;

    const auto consider = [&](const fs::path& dir) {
        const auto storePath = fs::absolute(store_->storePathInDir(dir)).lexically_normal();
        if (seen.contains(storePath)) return;
        if (auto p = inspect(storePath)) {
            seen.insert(storePath);
            found.push_back(std::move(*p));
        }
    };

    for (const auto& raw : discoveryDirs_) {
        const auto dir = paths::expandHome(raw);
        std::error_code ec;
        if (!fs::is_directory(dir, ec)) continue;

        consider(dir);
        for (fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end; !ec && it != end; it.increment(ec))
            if (std::error_code entryEc; it->is_directory(entryEc)) consider(it->path());
    }

    return found;
}

std::optional<LocatedProject> ProjectLocator::findById(const std::string& id) const {
    for (auto& p : discover())
        if (p.id == id) return p;
    return std::nullopt;
}

std::vector<CatalogEntry> ProjectLocator::catalog(const storage::StorageBackend& backend) const {
    const auto local = discover();

    std::vector<CatalogEntry> entries;
    for (const auto& ns : backend.listNamespaces()) {
        const auto slash = ns.rfind('/');
        CatalogEntry e;
        e.id = slash == std::string::npos ? ns : ns.substr(slash + 1);
        e.name = e.id;
        e.location = backend.describe(ns);

        const auto it = std::ranges::find(local, e.id, &LocatedProject::id);
        if (it != local.end()) {
            e.name = it->name;
            e.store_path = it->store_path;
            e.commit_count = it->version_count;
        }
        entries.push_back(std::move(e));
    }
    return entries;
}

std::optional<fs::path> ProjectLocator::findStore(const std::string& nameOrPath) const {
    const auto p = paths::expandHome(nameOrPath);
    std::error_code ec;

    if (fs::is_directory(p, ec)) {
        if (const auto s = store_->storePathInDir(p); ProjectStore::exists(s)) return fs::absolute(s).lexically_normal();
    } else if (fs::is_regular_file(p, ec)) {
        if (p.filename() == ProjectStore::CONFIG_FILE) return fs::absolute(p).lexically_normal();
        if (const auto s = store_->storePathFor(p); ProjectStore::exists(s)) return s;
    }

    const auto wanted = util::sanitizeProjectName(fs::path(nameOrPath).stem().string());
    for (const auto& proj : discover())
        if (proj.name == nameOrPath || proj.id == nameOrPath || proj.id == wanted) return proj.store_path;

    return std::nullopt;
}

fs::path ProjectLocator::currentStore(const ContextStore& context) const {
    if (const auto ctx = context.load()) {
        if (ProjectStore::exists(ctx->config_path)) return ctx->config_path;
        LogRegistry::project()->warn("[ProjectLocator] Selected project {} is gone ({}), clearing selection",
                                     ctx->project_name, ctx->config_path.string());
        context.clear();
    }

    if (const auto local = store_->storePathInDir(fs::current_path()); ProjectStore::exists(local)) return local;

    throw std::invalid_argument("No project selected. Run 'reelvault init <file>' or 'reelvault use <name>' first");
}
