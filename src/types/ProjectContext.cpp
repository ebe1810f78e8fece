#include "types/ProjectContext.hpp"

#include <nlohmann/json.hpp>

void rv::types::to_json(nlohmann::json& j, const ProjectContext& c) {
    j = {
        {"project_name", c.project_name},
        {"config_path", c.config_path.string()}
    };
}

void rv::types::from_json(const nlohmann::json& j, ProjectContext& c) {
    c.project_name = j.value("project_name", "");
    c.config_path = j.at("config_path").get<std::string>();
}
