#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace rv::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const std::filesystem::path& logDir);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> reelvault() { return get("reelvault"); }
    static std::shared_ptr<spdlog::logger> assets()    { return get("assets"); }
    static std::shared_ptr<spdlog::logger> storage()   { return get("storage"); }
    static std::shared_ptr<spdlog::logger> tracking()  { return get("tracking"); }
    static std::shared_ptr<spdlog::logger> project()   { return get("project"); }
    static std::shared_ptr<spdlog::logger> shell()     { return get("shell"); }
    static std::shared_ptr<spdlog::logger> http()      { return get("http"); }
    static std::shared_ptr<spdlog::logger> audit()     { return get("audit"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;
};

} // namespace rv::logging
