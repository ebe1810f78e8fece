#pragma once

#include "types/AssetTracking.hpp"
#include "types/Project.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace rv::storage { class StorageBackend; }
namespace rv::tracking { class TrackingStore; }

namespace rv::project {

class ProjectStore;

// Owns every mutation of a project's history. Each mutating call persists the project record
// at storePath before returning; if that write fails the in-memory project is left unchanged.
class VersionEngine {
public:
    static constexpr auto INITIAL_MESSAGE = "Initial version";

    VersionEngine(std::shared_ptr<storage::StorageBackend> backend, std::shared_ptr<ProjectStore> store);

    // Creates the project with version 0. Throws std::invalid_argument if the file is missing or
    // a project already exists beside it (unless force is set).
    types::Project initialize(const std::filesystem::path& projectFile, bool force = false);

    types::Version commit(types::Project& project,
                          const std::filesystem::path& storePath,
                          const std::string& message,
                          const std::filesystem::path& projectFile);

    // Throws std::out_of_range outside [0, versions) or when no version carries that number.
    [[nodiscard]] static const types::Version& getVersion(const types::Project& project, int number);

    // Removes by stored number; survivors keep their numbers.
    void removeVersion(types::Project& project, const std::filesystem::path& storePath, int number) const;

    // Drops versions whose stored project file is gone from the backend. Versions without a key are kept.
    unsigned int pruneMissingBackedVersions(types::Project& project, const std::filesystem::path& storePath) const;

    // Copies a version's project file into outDir. Assets no longer at their original path are
    // restored under outDir/assets/ and the restored project file is relinked to them.
    std::filesystem::path restoreVersion(const types::Project& project, int number, const std::filesystem::path& outDir) const;

    // Removes the backend namespace and the local metadata directory.
    void deleteProject(const types::Project& project, const std::filesystem::path& storePath) const;

    [[nodiscard]] types::AssetTracking loadTracking(const types::Project& project, int number) const;

    [[nodiscard]] const std::shared_ptr<storage::StorageBackend>& backend() const { return backend_; }

private:
    std::shared_ptr<storage::StorageBackend> backend_;
    std::shared_ptr<ProjectStore> store_;
    std::shared_ptr<tracking::TrackingStore> tracking_;

    types::Version capture(const types::Project& project,
                           int number,
                           const std::string& message,
                           const std::filesystem::path& projectFile) const;
};

}
