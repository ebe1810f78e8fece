#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace rv::types {

// The currently selected project: which store the CLI operates on by default.
struct ProjectContext {
    std::string project_name;
    std::filesystem::path config_path;
};

void to_json(nlohmann::json& j, const ProjectContext& c);
void from_json(const nlohmann::json& j, ProjectContext& c);

}
