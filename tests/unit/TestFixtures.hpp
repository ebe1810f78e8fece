#pragma once

#include "config/Config.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace rv::runtime { struct Deps; }

namespace rv::test {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "reelvault-test");
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] std::filesystem::path operator/(const std::filesystem::path& rel) const { return path_ / rel; }

private:
    std::filesystem::path path_;
};

void writeText(const std::filesystem::path& path, const std::string& text);
void writeBytes(const std::filesystem::path& path, uintmax_t size, char fill = 'x');

// Minimal project document referencing each path through a fileReference element.
std::string projectXml(const std::vector<std::string>& references);
void writeProject(const std::filesystem::path& path, const std::vector<std::string>& references);

// Config rooted entirely inside `root`: local storage, context file and discovery dir.
config::Config sandboxConfig(const std::filesystem::path& root);

std::shared_ptr<runtime::Deps> sandboxDeps(const std::filesystem::path& root);

}
