#pragma once

#include "types/AssetReference.hpp"

#include <ctime>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace rv::types {

struct Version {
    int number{};
    std::string message;
    std::time_t timestamp{};
    uintmax_t size{};           // project file bytes
    std::string backend_key;    // stored project file
    std::vector<AssetReference> assets;
    unsigned int asset_count{};
    uintmax_t total_size{};     // sum of resolvable asset bytes at commit time

    bool operator==(const Version& other) const = default;
};

void to_json(nlohmann::json& j, const Version& v);
void from_json(const nlohmann::json& j, Version& v);

// Summary without the asset list, for listings.
nlohmann::json summary(const Version& v);

std::string to_string(const Version& v);

}
