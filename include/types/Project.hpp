#pragma once

#include "types/Version.hpp"

#include <ctime>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace rv::types {

enum class BackendType { Local, Container };

std::string to_string(BackendType type);
BackendType backend_type_from_string(const std::string& type);

struct Project {
    std::string name;                    // project file basename
    std::filesystem::path project_path;  // current project file
    std::time_t created_at{};
    std::vector<Version> versions;
    BackendType backend{BackendType::Local};
    std::string volume;

    // Backend namespace for this project, derived from the project file stem.
    [[nodiscard]] std::string id() const;

    [[nodiscard]] const Version* latest() const;

    bool operator==(const Project& other) const = default;
};

void to_json(nlohmann::json& j, const Project& p);
void from_json(const nlohmann::json& j, Project& p);

}
