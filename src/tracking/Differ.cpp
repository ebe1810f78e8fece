#include "tracking/Differ.hpp"

#include <unordered_set>

using namespace rv::types;

namespace {

AssetStatus statusFor(const AssetReference& a, const AssetState state, const bool present, const bool inPrevious) {
    return {
        .filename = a.filename,
        .path = a.backend_key,
        .extension = a.extension,
        .size = a.size,
        .status = state,
        .present = present,
        .in_previous = inPrevious,
    };
}

}

AssetTracking rv::tracking::diff(const int version,
                                 const std::string& message,
                                 const std::vector<AssetReference>& current,
                                 const std::vector<AssetReference>& previous,
                                 const std::time_t timestamp) {
    AssetTracking t;
    t.version = version;
    t.commit_message = message;
    t.timestamp = timestamp;

    std::unordered_set<std::string> previousNames, currentNames;
    for (const auto& a : previous) previousNames.insert(a.filename);

    for (const auto& a : current) {
        currentNames.insert(a.filename);
        const bool inPrevious = previousNames.contains(a.filename);
        t.assets.push_back(statusFor(a, inPrevious ? AssetState::Present : AssetState::New, true, inPrevious));
        if (!inPrevious) ++t.new_assets;
        ++t.present_assets;
    }

    for (const auto& a : previous) {
        if (currentNames.contains(a.filename)) continue;
        t.assets.push_back(statusFor(a, AssetState::Removed, false, true));
        ++t.removed_assets;
    }

    t.total_assets = static_cast<unsigned int>(t.assets.size());
    t.missing_assets = t.total_assets - t.present_assets;
    return t;
}
