#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace rv::types {

// One binary dependency captured at a specific commit.
// Deduplication identity is the filename alone.
struct AssetReference {
    std::filesystem::path original_path;
    std::filesystem::path relative_path;
    std::string filename;
    std::string extension;
    uintmax_t size{};
    std::string backend_key;

    bool operator==(const AssetReference& other) const = default;
};

void to_json(nlohmann::json& j, const AssetReference& a);
void from_json(const nlohmann::json& j, AssetReference& a);

}
