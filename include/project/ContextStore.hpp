#pragma once

#include "types/ProjectContext.hpp"

#include <filesystem>
#include <optional>

namespace rv::project {

// Remembers the selected project between invocations.
class ContextStore {
public:
    explicit ContextStore(std::filesystem::path file);

    // nullopt when nothing is selected or the record is unreadable
    [[nodiscard]] std::optional<types::ProjectContext> load() const;
    void save(const types::ProjectContext& ctx) const;
    void clear() const;
    [[nodiscard]] bool has() const;

    [[nodiscard]] const std::filesystem::path& path() const { return file_; }

private:
    std::filesystem::path file_;
};

}
