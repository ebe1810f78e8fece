#include "storage/LocalStorageBackend.hpp"
#include "storage/keys.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

using namespace rv::storage;
using namespace rv::logging;

LocalStorageBackend::LocalStorageBackend(fs::path root) : root_(fs::absolute(std::move(root)).lexically_normal()) {}

fs::path LocalStorageBackend::resolve(const std::string& key) const {
    const auto rel = fs::path(key).lexically_normal();
    if (rel.is_absolute() || (!rel.empty() && *rel.begin() == ".."))
        throw std::invalid_argument("Storage key escapes the backend root: " + key);
    return rel.empty() || rel == "." ? root_ : root_ / rel;
}

std::string LocalStorageBackend::describe(const std::string& key) const {
    return resolve(key).string();
}

void LocalStorageBackend::ready() {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) throw std::runtime_error("Storage root " + root_.string() + " is not available: " + ec.message());
    if (!fs::is_directory(root_)) throw std::runtime_error("Storage root is not a directory: " + root_.string());

    // Writable check: create and drop a probe file
    const auto probe = root_ / (".write-probe-" + util::generate_random_suffix());
    {
        std::ofstream out(probe);
        if (!out) throw std::runtime_error("Storage root is not writable: " + root_.string());
    }
    fs::remove(probe, ec);

    LogRegistry::storage()->debug("[LocalStorageBackend] Ready at {}", root_.string());
}

void LocalStorageBackend::copyIn(const fs::path& localPath, const std::string& key) {
    const auto dest = resolve(key);
    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    if (ec) throw std::runtime_error("Failed to create " + dest.parent_path().string() + ": " + ec.message());

    fs::copy_file(localPath, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) throw std::runtime_error("Failed to copy " + localPath.string() + " to " + key + ": " + ec.message());

    LogRegistry::storage()->debug("[LocalStorageBackend] Copied {} -> {}", localPath.string(), key);
}

void LocalStorageBackend::copyOut(const std::string& key, const fs::path& localPath) {
    const auto src = resolve(key);
    if (!fs::is_regular_file(src)) throw std::runtime_error("No stored object at " + key);

    std::error_code ec;
    if (localPath.has_parent_path()) fs::create_directories(localPath.parent_path(), ec);
    if (ec) throw std::runtime_error("Failed to create " + localPath.parent_path().string() + ": " + ec.message());

    fs::copy_file(src, localPath, fs::copy_options::overwrite_existing, ec);
    if (ec) throw std::runtime_error("Failed to copy " + key + " to " + localPath.string() + ": " + ec.message());
}

bool LocalStorageBackend::exists(const std::string& key) const {
    std::error_code ec;
    return fs::exists(resolve(key), ec);
}

void LocalStorageBackend::makeNamespace(const std::string& key) {
    std::error_code ec;
    fs::create_directories(resolve(key), ec);
    if (ec) throw std::runtime_error("Failed to create namespace " + key + ": " + ec.message());
}

void LocalStorageBackend::deleteNamespace(const std::string& key) {
    const auto target = resolve(key);
    if (target == root_) throw std::invalid_argument("Refusing to delete the storage root");

    std::error_code ec;
    fs::remove_all(target, ec);
    if (ec) throw std::runtime_error("Failed to delete namespace " + key + ": " + ec.message());

    LogRegistry::storage()->info("[LocalStorageBackend] Deleted namespace {}", key);
}

std::vector<std::string> LocalStorageBackend::listNamespaces(const std::string& root) const {
    std::vector<std::string> out;
    const auto base = resolve(root);
    std::error_code ec;
    if (!fs::is_directory(base, ec)) return out;

    for (const auto& entry : fs::directory_iterator(base, ec)) {
        if (!entry.is_directory()) continue;
        bool hasVersion = false;
        for (const auto& child : fs::directory_iterator(entry.path(), ec)) {
            if (child.is_directory() && isVersionDirName(child.path().filename().string())) {
                hasVersion = true;
                break;
            }
        }
        if (hasVersion) out.push_back(joinKey({root, entry.path().filename().string()}));
    }

    std::ranges::sort(out);
    return out;
}
