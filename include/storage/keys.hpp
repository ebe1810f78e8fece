#pragma once

#include "util/naming.hpp"

#include <initializer_list>
#include <string>
#include <string_view>

namespace rv::storage {

inline constexpr std::string_view SHARED_ASSETS_DIR = "assets";
inline constexpr std::string_view TRACKING_FILE = "asset-tracking.json";

inline std::string joinKey(std::initializer_list<std::string_view> parts) {
    std::string out;
    for (const auto part : parts) {
        if (part.empty()) continue;
        if (!out.empty() && out.back() != '/') out += '/';
        out += part;
    }
    return out;
}

inline std::string versionNamespace(const std::string& projectId, const int number) {
    return joinKey({projectId, util::versionDirName(number)});
}

inline std::string sharedAssetsNamespace(const std::string& projectId) {
    return joinKey({projectId, SHARED_ASSETS_DIR});
}

inline std::string sharedAssetKey(const std::string& projectId, const std::string& filename) {
    return joinKey({projectId, SHARED_ASSETS_DIR, filename});
}

inline std::string trackingKey(const std::string& projectId, const int number) {
    return joinKey({projectId, util::versionDirName(number), TRACKING_FILE});
}

// True for names of the form vNNN.
inline bool isVersionDirName(const std::string_view name) {
    if (name.size() < 4 || name[0] != 'v') return false;
    for (size_t i = 1; i < name.size(); ++i)
        if (name[i] < '0' || name[i] > '9') return false;
    return true;
}

}
