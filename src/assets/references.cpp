#include "assets/references.hpp"

#include <algorithm>
#include <array>
#include <cctype>

using namespace rv::assets;

namespace {

constexpr std::array<std::string_view, 4> kPathElements = {"file", "path", "src", "source"};
constexpr std::array<std::string_view, 3> kUriSchemes = {"http://", "https://", "file://"};

std::string toLower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return std::tolower(c); });
    return out;
}

std::string_view trim(std::string_view s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string_view::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

}

std::string_view rv::assets::localName(const std::string_view qualified) {
    const auto colon = qualified.rfind(':');
    return colon == std::string_view::npos ? qualified : qualified.substr(colon + 1);
}

std::optional<std::filesystem::path> rv::assets::resolveReference(const std::string_view raw, const std::filesystem::path& baseDir) {
    const auto cleaned = trim(raw);
    if (cleaned.empty()) return std::nullopt;

    for (const auto scheme : kUriSchemes)
        if (cleaned.starts_with(scheme)) return std::nullopt;

    std::filesystem::path p{std::string(cleaned)};
    if (p.is_relative()) p = baseDir / p;
    p = p.lexically_normal();

    // "dir/" normalizes to "dir/" with an empty filename; treat it like the directory itself
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) p = p.parent_path();
    return p;
}

ReferenceWalker::ReferenceWalker(AttributeVisitor onAttribute, TextVisitor onText)
    : onAttribute_(std::move(onAttribute)), onText_(std::move(onText)) {}

void ReferenceWalker::visitText(const pugi::xml_node& node) const {
    if (auto text = node.text(); !text.empty()) onText_(text);
}

bool ReferenceWalker::for_each(pugi::xml_node& node) {
    if (node.type() != pugi::node_element) return true;

    const auto name = localName(node.name());

    if (name.find("fileReference") != std::string_view::npos) {
        for (auto attr : node.attributes())
            if (localName(attr.name()) == "fullpath") onAttribute_(attr);
    }

    if (name == "fullpath") visitText(node);

    if (std::ranges::find(kPathElements, name) != kPathElements.end()) {
        visitText(node);
        for (auto attr : node.attributes()) {
            const auto attrName = toLower(localName(attr.name()));
            if (attrName.find("path") != std::string::npos || attrName.find("file") != std::string::npos)
                onAttribute_(attr);
        }
    }

    return true;
}
