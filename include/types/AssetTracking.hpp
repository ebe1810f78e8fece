#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace rv::types {

enum class AssetState { Present, New, Removed };

std::string to_string(AssetState state);
AssetState asset_state_from_string(const std::string& state);

struct AssetStatus {
    std::string filename;
    std::string path;          // backend key
    std::string extension;
    uintmax_t size{};
    AssetState status{AssetState::New};
    bool present{};            // carried by this commit
    bool in_previous{};        // carried by the previous commit

    bool operator==(const AssetStatus& other) const = default;
};

struct AssetTracking {
    int version{};
    std::string commit_message;
    std::time_t timestamp{};
    std::vector<AssetStatus> assets;
    unsigned int total_assets{};
    unsigned int present_assets{};
    unsigned int missing_assets{};
    unsigned int new_assets{};
    unsigned int removed_assets{};

    bool operator==(const AssetTracking& other) const = default;
};

void to_json(nlohmann::json& j, const AssetStatus& s);
void from_json(const nlohmann::json& j, AssetStatus& s);
void to_json(nlohmann::json& j, const AssetTracking& t);
void from_json(const nlohmann::json& j, AssetTracking& t);

}
