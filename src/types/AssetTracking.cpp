#include "types/AssetTracking.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace rv::types;
using namespace rv::util;

std::string rv::types::to_string(const AssetState state) {
    switch (state) {
        case AssetState::Present: return "present";
        case AssetState::New: return "new";
        case AssetState::Removed: return "removed";
        default: return "unknown";
    }
}

AssetState rv::types::asset_state_from_string(const std::string& state) {
    if (state == "present") return AssetState::Present;
    if (state == "new") return AssetState::New;
    if (state == "removed") return AssetState::Removed;
    throw std::invalid_argument("Invalid asset status: " + state);
}

void rv::types::to_json(nlohmann::json& j, const AssetStatus& s) {
    j = {
        {"filename", s.filename},
        {"path", s.path},
        {"extension", s.extension},
        {"size", s.size},
        {"status", to_string(s.status)},
        {"present", s.present},
        {"in_previous", s.in_previous}
    };
}

void rv::types::from_json(const nlohmann::json& j, AssetStatus& s) {
    s.filename = j.at("filename").get<std::string>();
    s.path = j.value("path", "");
    s.extension = j.value("extension", "");
    s.size = j.value("size", uintmax_t{0});
    s.status = asset_state_from_string(j.at("status").get<std::string>());
    s.present = j.at("present").get<bool>();
    s.in_previous = j.at("in_previous").get<bool>();
}

void rv::types::to_json(nlohmann::json& j, const AssetTracking& t) {
    j = {
        {"version", t.version},
        {"commit_message", t.commit_message},
        {"timestamp", timestampToString(t.timestamp)},
        {"assets", t.assets},
        {"total_assets", t.total_assets},
        {"present_assets", t.present_assets},
        {"missing_assets", t.missing_assets},
        {"new_assets", t.new_assets},
        {"removed_assets", t.removed_assets}
    };
}

void rv::types::from_json(const nlohmann::json& j, AssetTracking& t) {
    t.version = j.at("version").get<int>();
    t.commit_message = j.value("commit_message", "");
    t.timestamp = parseTimestampFromString(j.at("timestamp").get<std::string>());
    t.assets = j.at("assets").get<std::vector<AssetStatus>>();
    t.total_assets = j.at("total_assets").get<unsigned int>();
    t.present_assets = j.at("present_assets").get<unsigned int>();
    t.missing_assets = j.at("missing_assets").get<unsigned int>();
    t.new_assets = j.at("new_assets").get<unsigned int>();
    t.removed_assets = j.at("removed_assets").get<unsigned int>();
}
