#include "assets/Relinker.hpp"
#include "assets/references.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>
#include <pugixml.hpp>

using namespace rv::logging;
namespace fs = std::filesystem;

std::size_t rv::assets::relinkReferences(const fs::path& projectFile,
                                         const fs::path& baseDir,
                                         const std::map<fs::path, fs::path>& moves) {
    if (moves.empty()) return 0;

    pugi::xml_document doc;
    if (const auto result = doc.load_file(projectFile.c_str(), pugi::parse_full); !result) {
        LogRegistry::assets()->warn("[Relinker] {} is not well-formed XML ({}), leaving references untouched",
                                    projectFile.string(), result.description());
        return 0;
    }

    const auto target = [&](const char* value) -> const fs::path* {
        const auto resolved = resolveReference(value, baseDir);
        if (!resolved) return nullptr;
        const auto it = moves.find(*resolved);
        return it == moves.end() ? nullptr : &it->second;
    };

    std::size_t rewritten = 0;
    ReferenceWalker walker(
        [&](pugi::xml_attribute& attr) {
            if (const auto* to = target(attr.value()); to && attr.set_value(to->c_str())) ++rewritten;
        },
        [&](pugi::xml_text& text) {
            if (const auto* to = target(text.get()); to && text.set(to->c_str())) ++rewritten;
        });
    doc.traverse(walker);

    if (rewritten == 0) return 0;

    if (!doc.save_file(projectFile.c_str(), "", pugi::format_raw | pugi::format_no_declaration))
        throw std::runtime_error("Failed to write relinked project file: " + projectFile.string());

    LogRegistry::assets()->info("[Relinker] Rewrote {} references in {}", rewritten, projectFile.string());
    return rewritten;
}
