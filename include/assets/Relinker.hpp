#pragma once

#include <cstddef>
#include <filesystem>
#include <map>

namespace rv::assets {

// Rewrites asset references in a project file in place. A reference is rewritten when it
// resolves (against baseDir) to a key of `moves`; it then points at the mapped absolute path.
// Returns the number of rewritten references.
std::size_t relinkReferences(const std::filesystem::path& projectFile,
                             const std::filesystem::path& baseDir,
                             const std::map<std::filesystem::path, std::filesystem::path>& moves);

}
