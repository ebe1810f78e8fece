#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace rv::config {

constexpr static uint16_t DEFAULT_API_PORT = 8080;
constexpr static auto DEFAULT_METADATA_DIR = ".reelvault";

struct LocalStorageConfig {
    std::filesystem::path root = "~/.reelvault/storage";
};

struct ContainerStorageConfig {
    std::string name = "reelvault-storage";
    std::string volume = "reelvault-data";
    std::string image = "alpine:latest";
    std::string storage_path = "/storage/projects";
    std::string min_engine_version = "24.0.0";
};

struct StorageConfig {
    std::string backend = "local"; // local | container
    LocalStorageConfig local;
    ContainerStorageConfig container;
};

struct ProjectConfig {
    std::string metadata_dir = DEFAULT_METADATA_DIR;
    std::vector<std::string> extensions = {".aepx"};
    std::vector<std::filesystem::path> discovery_dirs = {".", "~/Documents", "~/Desktop", "~/Projects"};
    std::filesystem::path context_file = "~/.reelvault/current_project.json";
};

struct ApiConfig {
    std::string host = "127.0.0.1";
    uint16_t port = DEFAULT_API_PORT;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum reelvault = spdlog::level::info;  // Startup, command dispatch
    spdlog::level::level_enum assets    = spdlog::level::warn;  // Parse failures, unresolvable references
    spdlog::level::level_enum storage   = spdlog::level::info;  // Copies, backend bootstrap
    spdlog::level::level_enum tracking  = spdlog::level::warn;
    spdlog::level::level_enum project   = spdlog::level::info;  // Commits, prunes, restores
    spdlog::level::level_enum shell     = spdlog::level::warn;
    spdlog::level::level_enum http      = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "~/.reelvault/logs";
    LogLevelsConfig levels;
};

struct Config {
    StorageConfig storage;
    ProjectConfig project;
    ApiConfig api;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const StorageConfig& c);
void from_json(const nlohmann::json& j, StorageConfig& c);
void to_json(nlohmann::json& j, const ProjectConfig& c);
void from_json(const nlohmann::json& j, ProjectConfig& c);
void to_json(nlohmann::json& j, const ApiConfig& c);
void from_json(const nlohmann::json& j, ApiConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);

} // namespace rv::config
