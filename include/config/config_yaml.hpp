#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace rv::config;

template<>
struct convert<LocalStorageConfig> {
    static Node encode(const LocalStorageConfig& rhs) {
        Node node;
        node["root"] = rhs.root.string();
        return node;
    }

    static bool decode(const Node& node, LocalStorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.root = node["root"].as<std::string>("~/.reelvault/storage");
        return true;
    }
};

template<>
struct convert<ContainerStorageConfig> {
    static Node encode(const ContainerStorageConfig& rhs) {
        Node node;
        node["name"] = rhs.name;
        node["volume"] = rhs.volume;
        node["image"] = rhs.image;
        node["storage_path"] = rhs.storage_path;
        node["min_engine_version"] = rhs.min_engine_version;
        return node;
    }

    static bool decode(const Node& node, ContainerStorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.name = node["name"].as<std::string>("reelvault-storage");
        rhs.volume = node["volume"].as<std::string>("reelvault-data");
        rhs.image = node["image"].as<std::string>("alpine:latest");
        rhs.storage_path = node["storage_path"].as<std::string>("/storage/projects");
        rhs.min_engine_version = node["min_engine_version"].as<std::string>("24.0.0");
        return true;
    }
};

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["backend"] = rhs.backend;
        node["local"] = rhs.local;
        node["container"] = rhs.container;
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.backend = node["backend"].as<std::string>("local");
        if (node["local"]) rhs.local = node["local"].as<LocalStorageConfig>();
        if (node["container"]) rhs.container = node["container"].as<ContainerStorageConfig>();
        return true;
    }
};

template<>
struct convert<ProjectConfig> {
    static Node encode(const ProjectConfig& rhs) {
        Node node;
        node["metadata_dir"] = rhs.metadata_dir;
        node["extensions"] = rhs.extensions;
        for (const auto& dir : rhs.discovery_dirs) node["discovery_dirs"].push_back(dir.string());
        node["context_file"] = rhs.context_file.string();
        return node;
    }

    static bool decode(const Node& node, ProjectConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.metadata_dir = node["metadata_dir"].as<std::string>(DEFAULT_METADATA_DIR);
        if (node["extensions"]) rhs.extensions = node["extensions"].as<std::vector<std::string>>();
        if (node["discovery_dirs"]) {
            rhs.discovery_dirs.clear();
            for (const auto& dir : node["discovery_dirs"].as<std::vector<std::string>>())
                rhs.discovery_dirs.emplace_back(dir);
        }
        rhs.context_file = node["context_file"].as<std::string>("~/.reelvault/current_project.json");
        return true;
    }
};

template<>
struct convert<ApiConfig> {
    static Node encode(const ApiConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        return node;
    }

    static bool decode(const Node& node, ApiConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("127.0.0.1");
        rhs.port = node["port"].as<uint16_t>(DEFAULT_API_PORT);
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["reelvault"] = to_std_string(spdlog::level::to_string_view(rhs.reelvault));
        node["assets"]    = to_std_string(spdlog::level::to_string_view(rhs.assets));
        node["storage"]   = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["tracking"]  = to_std_string(spdlog::level::to_string_view(rhs.tracking));
        node["project"]   = to_std_string(spdlog::level::to_string_view(rhs.project));
        node["shell"]     = to_std_string(spdlog::level::to_string_view(rhs.shell));
        node["http"]      = to_std_string(spdlog::level::to_string_view(rhs.http));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.reelvault = spdlog::level::from_str(node["reelvault"].as<std::string>("info"));
        rhs.assets = spdlog::level::from_str(node["assets"].as<std::string>("warning"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("info"));
        rhs.tracking = spdlog::level::from_str(node["tracking"].as<std::string>("warning"));
        rhs.project = spdlog::level::from_str(node["project"].as<std::string>("info"));
        rhs.shell = spdlog::level::from_str(node["shell"].as<std::string>("warning"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("warning"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("~/.reelvault/logs");
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

} // namespace YAML
