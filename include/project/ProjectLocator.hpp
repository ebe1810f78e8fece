#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rv::storage { class StorageBackend; }

namespace rv::project {

class ProjectStore;
class ContextStore;

struct LocatedProject {
    std::string id;
    std::string name;
    std::filesystem::path store_path;
    std::size_t version_count{};
};

// A project namespace in the backend, joined with its local record when one is found.
struct CatalogEntry {
    std::string id;
    std::string name;
    std::string location;                           // backend description of the namespace
    std::optional<std::filesystem::path> store_path;
    std::size_t commit_count{};
};

// Finds project records on disk: <dir>/<metadata dir>/config.json for each discovery dir
// and each of its immediate subdirectories.
class ProjectLocator {
public:
    ProjectLocator(std::shared_ptr<ProjectStore> store, std::vector<std::filesystem::path> discoveryDirs);

    [[nodiscard]] std::vector<LocatedProject> discover() const;

    [[nodiscard]] std::optional<LocatedProject> findById(const std::string& id) const;

    // Every project namespace the backend holds, sorted by namespace key.
    [[nodiscard]] std::vector<CatalogEntry> catalog(const storage::StorageBackend& backend) const;

    // Accepts a store path, a project directory, a project file, or a project name / id.
    [[nodiscard]] std::optional<std::filesystem::path> findStore(const std::string& nameOrPath) const;

    // Store of the selected project, else the one in the working directory.
    // A selection whose store has disappeared is cleared. Throws std::invalid_argument when neither exists.
    [[nodiscard]] std::filesystem::path currentStore(const ContextStore& context) const;

private:
    std::shared_ptr<ProjectStore> store_;
    std::vector<std::filesystem::path> discoveryDirs_;

    [[nodiscard]] std::optional<LocatedProject> inspect(const std::filesystem::path& storePath) const;
};

}
