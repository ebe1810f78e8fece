#pragma once

#include "storage/StorageBackend.hpp"
#include "config/Config.hpp"

#include <string>
#include <vector>

namespace rv::util {
struct ProcessResult;
}

namespace rv::storage {

// Stores objects inside a long-running container's volume, driven through the docker CLI.
// The container is only reachable through cp/exec, so every primitive is a docker invocation.
class ContainerStorageBackend : public StorageBackend {
public:
    explicit ContainerStorageBackend(config::ContainerStorageConfig cfg);
    ~ContainerStorageBackend() override = default;

    void ready() override;

    void copyIn(const std::filesystem::path& localPath, const std::string& key) override;
    void copyOut(const std::string& key, const std::filesystem::path& localPath) override;
    [[nodiscard]] bool exists(const std::string& key) const override;
    void makeNamespace(const std::string& key) override;
    void deleteNamespace(const std::string& key) override;
    [[nodiscard]] std::vector<std::string> listNamespaces(const std::string& root) const override;

    [[nodiscard]] types::BackendType type() const override { return types::BackendType::Container; }
    [[nodiscard]] std::string volume() const override { return cfg_.volume; }
    [[nodiscard]] std::string describe(const std::string& key) const override;

    // Absolute path inside the container for a key.
    [[nodiscard]] std::string containerPath(const std::string& key) const;

    // "24.0.7" >= "24.0.0"; non-numeric suffixes ("-ce", "+azure") are ignored.
    [[nodiscard]] static bool versionAtLeast(const std::string& actual, const std::string& minimum);

private:
    config::ContainerStorageConfig cfg_;

    [[nodiscard]] util::ProcessResult exec(const std::vector<std::string>& command) const;
    [[nodiscard]] bool containerExists(bool runningOnly) const;
    void createContainer() const;
};

}
