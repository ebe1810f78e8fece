#include "types/AssetReference.hpp"

#include <nlohmann/json.hpp>

using namespace rv::types;

void rv::types::to_json(nlohmann::json& j, const AssetReference& a) {
    j = {
        {"original_path", a.original_path.string()},
        {"relative_path", a.relative_path.string()},
        {"filename", a.filename},
        {"extension", a.extension},
        {"size", a.size},
        {"backend_key", a.backend_key}
    };
}

void rv::types::from_json(const nlohmann::json& j, AssetReference& a) {
    a.original_path = j.at("original_path").get<std::string>();
    a.relative_path = j.value("relative_path", "");
    a.filename = j.at("filename").get<std::string>();
    a.extension = j.value("extension", "");
    a.size = j.at("size").get<uintmax_t>();
    a.backend_key = j.value("backend_key", "");
}
