#include "assets/Extractor.hpp"
#include "assets/references.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <algorithm>
#include <pugixml.hpp>

using namespace rv::assets;
using namespace rv::logging;
namespace fs = std::filesystem;

namespace {

void addCandidate(std::set<std::string>& out, const std::string_view raw) {
    const auto b = raw.find_first_not_of(" \t\r\n");
    if (b == std::string_view::npos) return;
    const auto e = raw.find_last_not_of(" \t\r\n");
    out.emplace(raw.substr(b, e - b + 1));
}

}

std::set<std::string> rv::assets::collectCandidates(const std::string& xml) {
    std::set<std::string> candidates;

    pugi::xml_document doc;
    const pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size());
    if (!result) {
        LogRegistry::assets()->warn("[Extractor] Failed to parse project XML: {} (offset {})",
                                    result.description(), result.offset);
        return candidates;
    }

    ReferenceWalker walker(
        [&candidates](const pugi::xml_attribute& attr) { addCandidate(candidates, attr.value()); },
        [&candidates](const pugi::xml_text& text) { addCandidate(candidates, text.get()); });
    doc.traverse(walker);

    return candidates;
}

ParseResult rv::assets::extractAssets(const fs::path& projectFile) {
    ParseResult res;
    res.project_file = fs::absolute(projectFile).lexically_normal();

    const auto xml = util::readFileToString(res.project_file);
    const auto projectDir = res.project_file.parent_path();

    std::set<fs::path> seen;
    for (const auto& raw : collectCandidates(xml)) {
        const auto resolved = resolveReference(raw, projectDir);
        if (!resolved || !seen.insert(*resolved).second) continue;

        std::error_code ec;
        if (!fs::is_regular_file(*resolved, ec)) {
            res.missing_assets.push_back(resolved->string());
            continue;
        }

        const auto size = fs::file_size(*resolved, ec);
        if (ec) {
            LogRegistry::assets()->warn("[Extractor] Cannot stat {}: {}", resolved->string(), ec.message());
            res.missing_assets.push_back(resolved->string());
            continue;
        }

        types::AssetReference a;
        a.original_path = *resolved;
        a.relative_path = resolved->lexically_relative(projectDir);
        a.filename = resolved->filename().string();
        a.extension = resolved->extension().string();
        a.size = size;
        res.total_size += size;
        res.assets.push_back(std::move(a));
    }

    std::ranges::sort(res.assets, {}, &types::AssetReference::original_path);
    std::ranges::sort(res.missing_assets);

    LogRegistry::assets()->debug("[Extractor] {}: {} assets ({} bytes), {} missing",
                                 res.project_file.string(), res.assets.size(), res.total_size, res.missing_assets.size());
    return res;
}
