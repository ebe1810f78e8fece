#include "storage/ContainerStorageBackend.hpp"
#include "storage/keys.hpp"
#include "logging/LogRegistry.hpp"
#include "util/process.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <fmt/core.h>

using namespace rv::storage;
using namespace rv::logging;
using namespace rv::util;

namespace {

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::vector<int> versionParts(const std::string& v) {
    std::vector<int> parts;
    std::string cur;
    for (const char c : v) {
        if (c >= '0' && c <= '9') { cur += c; continue; }
        if (!cur.empty()) parts.push_back(std::stoi(cur));
        cur.clear();
        if (c != '.') break;
    }
    if (!cur.empty()) parts.push_back(std::stoi(cur));
    return parts;
}

}

ContainerStorageBackend::ContainerStorageBackend(config::ContainerStorageConfig cfg) : cfg_(std::move(cfg)) {}

std::string ContainerStorageBackend::containerPath(const std::string& key) const {
    const auto rel = std::filesystem::path(key).lexically_normal();
    if (rel.is_absolute() || (!rel.empty() && *rel.begin() == ".."))
        throw std::invalid_argument("Storage key escapes the backend root: " + key);
    return rel.empty() || rel == "." ? cfg_.storage_path : joinKey({cfg_.storage_path, rel.generic_string()});
}

std::string ContainerStorageBackend::describe(const std::string& key) const {
    return fmt::format("{}:{}", cfg_.name, containerPath(key));
}

bool ContainerStorageBackend::versionAtLeast(const std::string& actual, const std::string& minimum) {
    const auto a = versionParts(actual);
    const auto m = versionParts(minimum);
    if (a.empty()) return false;
    for (size_t i = 0; i < std::max(a.size(), m.size()); ++i) {
        const int av = i < a.size() ? a[i] : 0;
        const int mv = i < m.size() ? m[i] : 0;
        if (av != mv) return av > mv;
    }
    return true;
}

ProcessResult ContainerStorageBackend::exec(const std::vector<std::string>& command) const {
    std::vector<std::string> argv = {"docker", "exec", cfg_.name};
    argv.insert(argv.end(), command.begin(), command.end());
    return runProcess(argv);
}

bool ContainerStorageBackend::containerExists(const bool runningOnly) const {
    std::vector<std::string> argv = {"docker", "ps"};
    if (!runningOnly) argv.emplace_back("-a");
    argv.insert(argv.end(), {"--filter", "name=^" + cfg_.name + "$", "--format", "{{.Names}}"});
    const auto res = runProcess(argv);
    return res.ok() && trim(res.output) == cfg_.name;
}

void ContainerStorageBackend::createContainer() const {
    if (const auto vol = runProcess({"docker", "volume", "create", cfg_.volume}); !vol.ok())
        throw std::runtime_error(fmt::format("Failed to create volume {}: {}", cfg_.volume, trim(vol.output)));

    const auto run = runProcess({
        "docker", "run", "-d",
        "--name", cfg_.name,
        "-v", fmt::format("{}:{}", cfg_.volume, cfg_.storage_path),
        cfg_.image,
        "tail", "-f", "/dev/null"
    });
    if (!run.ok()) throw std::runtime_error(fmt::format("Failed to create container {}: {}", cfg_.name, trim(run.output)));

    LogRegistry::storage()->info("[ContainerStorageBackend] Created container {} on volume {}", cfg_.name, cfg_.volume);
}

void ContainerStorageBackend::ready() {
    if (!commandExists("docker")) throw std::runtime_error("Docker is not installed or not on PATH");

    const auto ver = runProcess({"docker", "version", "--format", "{{.Server.Version}}"});
    if (!ver.ok()) throw std::runtime_error("Docker engine is not reachable: " + trim(ver.output));

    const auto engineVersion = trim(ver.output);
    if (!versionAtLeast(engineVersion, cfg_.min_engine_version))
        throw std::runtime_error(fmt::format("Docker engine {} is not supported; {} or newer is required",
                                             engineVersion, cfg_.min_engine_version));

    if (!containerExists(false)) createContainer();
    else if (!containerExists(true)) {
        if (const auto start = runProcess({"docker", "start", cfg_.name}); !start.ok())
            throw std::runtime_error(fmt::format("Failed to start container {}: {}", cfg_.name, trim(start.output)));
        LogRegistry::storage()->info("[ContainerStorageBackend] Started container {}", cfg_.name);
    }

    if (const auto mk = exec({"mkdir", "-p", cfg_.storage_path}); !mk.ok())
        throw std::runtime_error(fmt::format("Storage path {} is not usable: {}", cfg_.storage_path, trim(mk.output)));
}

void ContainerStorageBackend::copyIn(const std::filesystem::path& localPath, const std::string& key) {
    const auto dest = containerPath(key);
    const auto parent = std::filesystem::path(dest).parent_path().string();
    if (const auto mk = exec({"mkdir", "-p", parent}); !mk.ok())
        throw std::runtime_error(fmt::format("Failed to create {} in container: {}", parent, trim(mk.output)));

    const auto res = runProcess({"docker", "cp", localPath.string(), fmt::format("{}:{}", cfg_.name, dest)});
    if (!res.ok()) throw std::runtime_error(fmt::format("Failed to copy {} to container: {}", localPath.string(), trim(res.output)));

    LogRegistry::storage()->debug("[ContainerStorageBackend] Copied {} -> {}", localPath.string(), dest);
}

void ContainerStorageBackend::copyOut(const std::string& key, const std::filesystem::path& localPath) {
    if (localPath.has_parent_path()) std::filesystem::create_directories(localPath.parent_path());

    const auto res = runProcess({"docker", "cp", fmt::format("{}:{}", cfg_.name, containerPath(key)), localPath.string()});
    if (!res.ok()) throw std::runtime_error(fmt::format("Failed to copy {} from container: {}", key, trim(res.output)));
}

bool ContainerStorageBackend::exists(const std::string& key) const {
    return exec({"test", "-e", containerPath(key)}).ok();
}

void ContainerStorageBackend::makeNamespace(const std::string& key) {
    if (const auto res = exec({"mkdir", "-p", containerPath(key)}); !res.ok())
        throw std::runtime_error(fmt::format("Failed to create namespace {}: {}", key, trim(res.output)));
}

void ContainerStorageBackend::deleteNamespace(const std::string& key) {
    if (trim(key).empty()) throw std::invalid_argument("Refusing to delete the storage root");
    if (const auto res = exec({"rm", "-rf", containerPath(key)}); !res.ok())
        throw std::runtime_error(fmt::format("Failed to delete namespace {}: {}", key, trim(res.output)));

    LogRegistry::storage()->info("[ContainerStorageBackend] Deleted namespace {}", key);
}

std::vector<std::string> ContainerStorageBackend::listNamespaces(const std::string& root) const {
    const auto base = containerPath(root);
    const auto res = exec({
        "sh", "-c",
        fmt::format("find '{}' -mindepth 2 -maxdepth 2 -type d -name 'v[0-9][0-9][0-9]*' | sed 's|/v[0-9]*$||' | sort -u", base)
    });

    std::vector<std::string> out;
    if (!res.ok()) {
        LogRegistry::storage()->debug("[ContainerStorageBackend] No namespaces under {}: {}", base, trim(res.output));
        return out;
    }

    std::istringstream lines(res.output);
    std::string line;
    const auto prefix = base.back() == '/' ? base : base + "/";
    while (std::getline(lines, line)) {
        line = trim(line);
        if (line.empty() || line.rfind(prefix, 0) != 0) continue;
        out.push_back(joinKey({root, line.substr(prefix.size())}));
    }

    std::ranges::sort(out);
    return out;
}
