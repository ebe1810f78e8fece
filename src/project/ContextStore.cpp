#include "project/ContextStore.hpp"
#include "logging/LogRegistry.hpp"
#include "util/files.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace rv::project;
using namespace rv::logging;
namespace fs = std::filesystem;

ContextStore::ContextStore(fs::path file) : file_(std::move(file)) {}

std::optional<rv::types::ProjectContext> ContextStore::load() const {
    if (!has()) return std::nullopt;

    try {
        return nlohmann::json::parse(util::readFileToString(file_)).get<types::ProjectContext>();
    } catch (const std::exception& e) {
        LogRegistry::project()->warn("[ContextStore] Ignoring unreadable context {}: {}", file_.string(), e.what());
        return std::nullopt;
    }
}

void ContextStore::save(const types::ProjectContext& ctx) const {
    util::writeFileAtomically(file_, nlohmann::json(ctx).dump(2));
    LogRegistry::project()->info("[ContextStore] Selected project {} ({})", ctx.project_name, ctx.config_path.string());
}

void ContextStore::clear() const {
    std::error_code ec;
    fs::remove(file_, ec);
    if (ec) throw std::runtime_error("Failed to clear project context: " + ec.message());
}

bool ContextStore::has() const {
    std::error_code ec;
    return fs::is_regular_file(file_, ec);
}
