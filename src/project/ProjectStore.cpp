#include "project/ProjectStore.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <stdexcept>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace rv::project;
using namespace rv::logging;
namespace fs = std::filesystem;

ProjectStore::ProjectStore(std::string metadataDir) : metadataDir_(std::move(metadataDir)) {}

fs::path ProjectStore::storePathFor(const fs::path& projectFile) const {
    return storePathInDir(fs::absolute(projectFile).lexically_normal().parent_path());
}

fs::path ProjectStore::storePathInDir(const fs::path& dir) const {
    return dir / metadataDir_ / CONFIG_FILE;
}

bool ProjectStore::exists(const fs::path& storePath) {
    std::error_code ec;
    return fs::is_regular_file(storePath, ec);
}

rv::types::Project ProjectStore::load(const fs::path& storePath) {
    if (!exists(storePath))
        throw std::invalid_argument(fmt::format("Not a ReelVault project: {} does not exist", storePath.string()));

    try {
        return nlohmann::json::parse(util::readFileToString(storePath)).get<types::Project>();
    } catch (const std::exception& e) {
        throw std::runtime_error(fmt::format("Failed to parse project record {}: {}", storePath.string(), e.what()));
    }
}

void ProjectStore::save(const types::Project& project, const fs::path& storePath) {
    util::writeFileAtomically(storePath, nlohmann::json(project).dump(2));
    LogRegistry::project()->debug("[ProjectStore] Saved {} ({} versions) to {}",
                                  project.name, project.versions.size(), storePath.string());
}
