#pragma once

#include "types/AssetReference.hpp"

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace rv::assets {

struct ParseResult {
    std::filesystem::path project_file;
    std::vector<types::AssetReference> assets;   // existing regular files, sorted by path, no backend key yet
    std::vector<std::string> missing_assets;     // sorted
    uintmax_t total_size{};

    [[nodiscard]] bool hasMissing() const { return !missing_assets.empty(); }
};

// Raw candidate strings from an XML document, trimmed and de-duplicated.
// Malformed or empty documents yield an empty set.
std::set<std::string> collectCandidates(const std::string& xml);

// Reads a project file and resolves every referenced asset against its directory.
// Throws std::runtime_error if the file cannot be opened.
ParseResult extractAssets(const std::filesystem::path& projectFile);

}
