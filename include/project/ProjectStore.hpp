#pragma once

#include "types/Project.hpp"

#include <filesystem>
#include <string>

namespace rv::project {

// Durable project record: <project dir>/<metadata dir>/config.json, rewritten in full on every save.
class ProjectStore {
public:
    static constexpr auto CONFIG_FILE = "config.json";

    explicit ProjectStore(std::string metadataDir);

    [[nodiscard]] std::filesystem::path storePathFor(const std::filesystem::path& projectFile) const;
    [[nodiscard]] std::filesystem::path storePathInDir(const std::filesystem::path& dir) const;

    [[nodiscard]] static bool exists(const std::filesystem::path& storePath);

    // Throws std::invalid_argument when there is no project at storePath, std::runtime_error when it can't be parsed.
    [[nodiscard]] static types::Project load(const std::filesystem::path& storePath);

    static void save(const types::Project& project, const std::filesystem::path& storePath);

    [[nodiscard]] const std::string& metadataDir() const { return metadataDir_; }

private:
    std::string metadataDir_;
};

}
