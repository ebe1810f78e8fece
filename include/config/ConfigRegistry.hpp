#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace rv::config {

class ConfigRegistry {
public:
    // Loads the YAML file at path, or keeps the built-in defaults when it does not exist.
    static void init(const std::filesystem::path& path);
    static void init(const Config& config);
    static const Config& get();

    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace rv::config
