#pragma once

#include <cstdlib>
#include <filesystem>
#include <string>

namespace rv::paths {

inline std::filesystem::path homeDir() {
    if (const char* home = std::getenv("HOME"); home && *home) return home;
    return std::filesystem::current_path();
}

// Expands a leading "~" to $HOME; other paths are returned unchanged.
inline std::filesystem::path expandHome(const std::filesystem::path& p) {
    const auto s = p.string();
    if (s == "~") return homeDir();
    if (s.rfind("~/", 0) == 0) return homeDir() / s.substr(2);
    return p;
}

inline std::filesystem::path getConfigPath() {
    if (const char* env = std::getenv("REELVAULT_CONFIG"); env && *env) return env;
    return homeDir() / ".reelvault" / "config.yaml";
}

}
