#include "types/Version.hpp"
#include "util/timestamp.hpp"
#include "util/cmdLineHelpers.hpp"

#include <nlohmann/json.hpp>
#include <fmt/core.h>

using namespace rv::types;
using namespace rv::util;

void rv::types::to_json(nlohmann::json& j, const Version& v) {
    j = {
        {"number", v.number},
        {"message", v.message},
        {"timestamp", timestampToString(v.timestamp)},
        {"size", v.size},
        {"backend_key", v.backend_key},
        {"assets", v.assets},
        {"asset_count", v.asset_count},
        {"total_size", v.total_size}
    };
}

void rv::types::from_json(const nlohmann::json& j, Version& v) {
    v.number = j.at("number").get<int>();
    v.message = j.at("message").get<std::string>();
    v.timestamp = parseTimestampFromString(j.at("timestamp").get<std::string>());
    v.size = j.at("size").get<uintmax_t>();
    v.backend_key = j.value("backend_key", "");
    v.assets = j.value("assets", std::vector<AssetReference>{});
    v.asset_count = j.value("asset_count", static_cast<unsigned int>(v.assets.size()));
    v.total_size = j.value("total_size", uintmax_t{0});
}

nlohmann::json rv::types::summary(const Version& v) {
    return {
        {"number", v.number},
        {"message", v.message},
        {"timestamp", displayTimestamp(v.timestamp)},
        {"size", v.size},
        {"asset_count", v.asset_count},
        {"total_size", v.total_size}
    };
}

std::string rv::types::to_string(const Version& v) {
    using namespace rv::shell;

    std::string out;
    out += fmt::format("Version:    {}\n", v.number);
    out += fmt::format("Message:    {}\n", v.message);
    out += fmt::format("Time:       {}\n", displayTimestamp(v.timestamp));
    out += fmt::format("Proj Size:  {}\n", human_bytes(v.size));
    out += fmt::format("Assets:     {} files ({})\n", v.asset_count, human_bytes(v.total_size));
    if (!v.backend_key.empty()) out += fmt::format("Stored at:  {}\n", v.backend_key);

    if (!v.assets.empty()) {
        out += "\nAssets:\n";
        for (const auto& a : v.assets)
            out += fmt::format("  - {} ({})  {}\n", a.filename, a.extension.empty() ? "-" : a.extension, human_bytes(a.size));
    }
    return out;
}
