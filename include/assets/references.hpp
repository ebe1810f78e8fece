#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <pugixml.hpp>

namespace rv::assets {

// Element or attribute name with any "prefix:" namespace qualifier removed.
std::string_view localName(std::string_view qualified);

// Absolute, normalized path for a raw reference string.
// Empty strings and network URIs (http://, https://, file://) yield nullopt.
std::optional<std::filesystem::path> resolveReference(std::string_view raw, const std::filesystem::path& baseDir);

// Visits every attribute and text node that may carry an asset path:
//   <*fileReference* fullpath="...">
//   <fullpath>...</fullpath>
//   <file|path|src|source>...</...> and their *path* / *file* attributes
class ReferenceWalker : public pugi::xml_tree_walker {
public:
    using AttributeVisitor = std::function<void(pugi::xml_attribute&)>;
    using TextVisitor = std::function<void(pugi::xml_text&)>;

    ReferenceWalker(AttributeVisitor onAttribute, TextVisitor onText);

    bool for_each(pugi::xml_node& node) override;

private:
    AttributeVisitor onAttribute_;
    TextVisitor onText_;

    void visitText(const pugi::xml_node& node) const;
};

}
