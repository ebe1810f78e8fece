#pragma once

#include "types/Project.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace rv::config {
struct StorageConfig;
}

namespace rv::storage {

// Key-addressed byte store. Keys are '/'-separated and relative to the backend root,
// e.g. "my_project/v003/my_project.aepx" or "my_project/assets/clip.mp4".
// Failing operations throw std::runtime_error.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    // Bootstraps the backend if needed and verifies it is usable.
    virtual void ready() = 0;

    virtual void copyIn(const std::filesystem::path& localPath, const std::string& key) = 0;
    virtual void copyOut(const std::string& key, const std::filesystem::path& localPath) = 0;
    [[nodiscard]] virtual bool exists(const std::string& key) const = 0;
    virtual void makeNamespace(const std::string& key) = 0;
    virtual void deleteNamespace(const std::string& key) = 0;

    // Project namespaces under root: every namespace holding at least one vNNN commit directory.
    [[nodiscard]] virtual std::vector<std::string> listNamespaces(const std::string& root = "") const = 0;

    [[nodiscard]] virtual types::BackendType type() const = 0;

    // Volume / root identifier recorded on the project.
    [[nodiscard]] virtual std::string volume() const = 0;

    // Human-readable location of a key, for messages.
    [[nodiscard]] virtual std::string describe(const std::string& key) const = 0;
};

std::shared_ptr<StorageBackend> makeBackend(const config::StorageConfig& cfg);

}
