#pragma once

#include "types/AssetReference.hpp"
#include "types/AssetTracking.hpp"

#include <ctime>
#include <string>
#include <vector>

namespace rv::tracking {

// Classifies the assets of a commit against the commit before it, by filename.
// Current assets are Present (also in previous) or New; previous-only assets are appended as Removed.
// present_assets counts the entries carried by this commit; missing_assets = total - present.
types::AssetTracking diff(int version,
                          const std::string& message,
                          const std::vector<types::AssetReference>& current,
                          const std::vector<types::AssetReference>& previous,
                          std::time_t timestamp);

}
