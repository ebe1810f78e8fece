#include "types/Project.hpp"
#include "util/timestamp.hpp"
#include "util/naming.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace rv::types;
using namespace rv::util;

std::string rv::types::to_string(const BackendType type) {
    switch (type) {
        case BackendType::Local: return "local";
        case BackendType::Container: return "container";
        default: return "unknown";
    }
}

BackendType rv::types::backend_type_from_string(const std::string& type) {
    if (type == "local") return BackendType::Local;
    if (type == "container") return BackendType::Container;
    throw std::invalid_argument("Invalid storage backend: " + type);
}

std::string Project::id() const {
    const auto stem = std::filesystem::path(name).stem().string();
    return sanitizeProjectName(stem.empty() ? name : stem);
}

const Version* Project::latest() const {
    if (versions.empty()) return nullptr;
    return &versions.back();
}

void rv::types::to_json(nlohmann::json& j, const Project& p) {
    j = {
        {"project_name", p.name},
        {"project_path", p.project_path.string()},
        {"created_at", timestampToString(p.created_at)},
        {"storage_backend", to_string(p.backend)},
        {"volume", p.volume},
        {"versions", p.versions}
    };
}

void rv::types::from_json(const nlohmann::json& j, Project& p) {
    p.name = j.at("project_name").get<std::string>();
    p.project_path = j.at("project_path").get<std::string>();
    p.created_at = parseTimestampFromString(j.at("created_at").get<std::string>());
    p.backend = backend_type_from_string(j.value("storage_backend", "local"));
    p.volume = j.value("volume", "");
    p.versions = j.at("versions").get<std::vector<Version>>();
}
