#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace rv::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["storage"]) YAML::convert<StorageConfig>::decode(node, cfg.storage);
    if (auto node = root["project"]) YAML::convert<ProjectConfig>::decode(node, cfg.project);
    if (auto node = root["api"]) YAML::convert<ApiConfig>::decode(node, cfg.api);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    if (cfg.storage.backend != "local" && cfg.storage.backend != "container")
        throw std::invalid_argument("Invalid storage backend in " + path.string() + ": " + cfg.storage.backend);

    return cfg;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"storage", c.storage},
        {"project", c.project},
        {"api", c.api},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const StorageConfig& c) {
    j = {
        {"backend", c.backend},
        {"local", {{"root", c.local.root.string()}}},
        {"container", {
            {"name", c.container.name},
            {"volume", c.container.volume},
            {"image", c.container.image},
            {"storage_path", c.container.storage_path},
            {"min_engine_version", c.container.min_engine_version}
        }}
    };
}

void from_json(const nlohmann::json& j, StorageConfig& c) {
    c.backend = j.value("backend", "local");
    if (j.contains("local")) c.local.root = j.at("local").value("root", "~/.reelvault/storage");
    if (j.contains("container")) {
        const auto& ct = j.at("container");
        c.container.name = ct.value("name", "reelvault-storage");
        c.container.volume = ct.value("volume", "reelvault-data");
        c.container.image = ct.value("image", "alpine:latest");
        c.container.storage_path = ct.value("storage_path", "/storage/projects");
        c.container.min_engine_version = ct.value("min_engine_version", "24.0.0");
    }
}

void to_json(nlohmann::json& j, const ProjectConfig& c) {
    std::vector<std::string> dirs;
    for (const auto& d : c.discovery_dirs) dirs.push_back(d.string());
    j = {
        {"metadata_dir", c.metadata_dir},
        {"extensions", c.extensions},
        {"discovery_dirs", dirs},
        {"context_file", c.context_file.string()}
    };
}

void from_json(const nlohmann::json& j, ProjectConfig& c) {
    c.metadata_dir = j.value("metadata_dir", DEFAULT_METADATA_DIR);
    c.extensions = j.value("extensions", std::vector<std::string>{".aepx"});
    if (j.contains("discovery_dirs")) {
        c.discovery_dirs.clear();
        for (const auto& d : j.at("discovery_dirs")) c.discovery_dirs.emplace_back(d.get<std::string>());
    }
    c.context_file = j.value("context_file", "~/.reelvault/current_project.json");
}

void to_json(nlohmann::json& j, const ApiConfig& c) {
    j = {
        {"host", c.host},
        {"port", c.port}
    };
}

void from_json(const nlohmann::json& j, ApiConfig& c) {
    c.host = j.value("host", "127.0.0.1");
    c.port = j.value("port", DEFAULT_API_PORT);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    const auto& sub = c.levels.subsystem_levels;
    const auto lvl = [](const spdlog::level::level_enum l) {
        const auto sv = spdlog::level::to_string_view(l);
        return std::string(sv.data(), sv.size());
    };
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", {
            {"console_log_level", lvl(c.levels.console_log_level)},
            {"file_log_level", lvl(c.levels.file_log_level)},
            {"subsystem_levels", {
                {"reelvault", lvl(sub.reelvault)},
                {"assets", lvl(sub.assets)},
                {"storage", lvl(sub.storage)},
                {"tracking", lvl(sub.tracking)},
                {"project", lvl(sub.project)},
                {"shell", lvl(sub.shell)},
                {"http", lvl(sub.http)}
            }}
        }}
    };
}

} // namespace rv::config
