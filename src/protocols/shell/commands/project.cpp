#include "protocols/shell/commands.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/Table.hpp"
#include "protocols/shell/usage/ProjectUsage.hpp"
#include "util/shellArgsHelpers.hpp"
#include "util/cmdLineHelpers.hpp"
#include "util/timestamp.hpp"

#include "runtime/Deps.hpp"
#include "project/ContextStore.hpp"
#include "project/ProjectLocator.hpp"
#include "project/ProjectStore.hpp"
#include "project/VersionEngine.hpp"
#include "storage/StorageBackend.hpp"
#include "tracking/Differ.hpp"
#include "types/Project.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <fmt/core.h>

using namespace rv::shell;
using namespace rv::types;
using namespace rv::project;
using namespace rv::runtime;
namespace fs = std::filesystem;

namespace {

struct OpenProject {
    Project project;
    fs::path store;
};

OpenProject openCurrent(const Deps& deps) {
    const auto store = deps.locator->currentStore(*deps.context);
    return {ProjectStore::load(store), store};
}

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return std::tolower(c); });
    return s;
}

bool hasTrackedExtension(const Deps& deps, const fs::path& file) {
    const auto ext = lower(file.extension().string());
    return std::ranges::any_of(deps.config.project.extensions, [&ext](const std::string& e) { return lower(e) == ext; });
}

std::string extensionList(const Deps& deps) {
    std::string out;
    for (const auto& e : deps.config.project.extensions) out += (out.empty() ? "" : ", ") + e;
    return out;
}

std::optional<int> versionArg(const CommandCall& call, const size_t idx = 0) {
    if (call.positionals.size() <= idx) return std::nullopt;
    return parseInt(call.positionals[idx]);
}

std::string commitsTable(const Project& project) {
    Table t({
        {"Version", Align::Right, 7},
        {"Date", Align::Left, 19},
        {"Message", Align::Left, 10, 60, Clip::Tail},
        {"Assets", Align::Right, 6},
        {"Asset Size", Align::Right, 10},
    }, term_width());

    for (const auto& v : project.versions)
        t.add_row({
            std::to_string(v.number),
            rv::util::displayTimestamp(v.timestamp),
            v.message,
            std::to_string(v.asset_count),
            human_bytes(v.total_size)
        });

    return fmt::format("{} - {} commits\n\n{}", project.name, project.versions.size(), t.render());
}

CommandResult handle_init(const CommandCall& call, const Deps& deps) {
    if (call.positionals.size() != 1) return invalid("init: expected exactly one <file>");

    const fs::path file = call.positionals[0];
    if (!fs::exists(file)) return failed(fmt::format("init: file '{}' does not exist", file.string()));
    if (!hasTrackedExtension(deps, file))
        return failed(fmt::format("init: file must have one of these extensions: {}", extensionList(deps)));

    const auto project = deps.engine->initialize(file, hasFlag(call, "force") || hasFlag(call, "f"));
    const auto store = deps.projectStore->storePathFor(file);
    deps.context->save({project.name, store});

    const auto& v0 = project.versions.front();
    std::string out = fmt::format("Initialized {} (id {})\n", project.name, project.id());
    out += fmt::format("  Version 0: {} assets ({}), {} stored\n", v0.asset_count, human_bytes(v0.total_size), v0.assets.size());
    out += fmt::format("  Storage:   {} ({})\n", to_string(project.backend), project.volume);
    out += fmt::format("  Record:    {}\n", store.string());
    return ok(out);
}

CommandResult handle_commit(const CommandCall& call, const Deps& deps) {
    if (call.positionals.empty() || call.positionals.size() > 2) return invalid("commit: expected <message> [file]");

    auto [project, store] = openCurrent(deps);

    fs::path file = project.project_path;
    if (call.positionals.size() == 2) {
        file = call.positionals[1];
        if (!hasTrackedExtension(deps, file))
            return failed(fmt::format("commit: file must have one of these extensions: {}", extensionList(deps)));
    }

    const auto previous = project.versions.empty() ? std::vector<AssetReference>{} : project.versions.back().assets;
    const auto v = deps.engine->commit(project, store, call.positionals[0], file);
    const auto diff = rv::tracking::diff(v.number, v.message, v.assets, previous, v.timestamp);

    std::string out = fmt::format("Committed version {}: {}\n", v.number, v.message);
    out += fmt::format("  Project file: {} ({})\n", file.filename().string(), human_bytes(v.size));
    out += fmt::format("  Assets:       {} ({}), {} new, {} removed\n",
                       v.asset_count, human_bytes(v.total_size), diff.new_assets, diff.removed_assets);
    return ok(out);
}

CommandResult handle_list(const CommandCall& call, const Deps& deps) {
    if (call.positionals.size() > 1) return invalid("list: expected at most one project number");

    deps.backend->ready();
    const auto entries = deps.locator->catalog(*deps.backend);
    if (entries.empty()) return ok("No projects found in storage.\nUse 'reelvault init <file>' to create one.\n");

    if (!call.positionals.empty()) {
        const auto n = parseInt(call.positionals[0]);
        if (!n) return invalid("list: project number must be an integer");
        if (*n < 1 || *n > static_cast<int>(entries.size()))
            return failed(fmt::format("list: project number {} does not exist (1-{})", *n, entries.size()));

        const auto& e = entries[*n - 1];
        if (!e.store_path) return failed(fmt::format("list: no local record found for project '{}'", e.name));
        return ok(commitsTable(ProjectStore::load(*e.store_path)));
    }

    const auto current = deps.context->load();

    Table t({
        {"", Align::Left, 1},
        {"#", Align::Right, 2},
        {"Project", Align::Left, 8, 40, Clip::Tail},
        {"Commits", Align::Right, 7},
        {"Location", Align::Left, 10, 80, Clip::Middle},
    }, term_width());

    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& e = entries[i];
        const bool selected = current && e.store_path && *e.store_path == current->config_path;
        t.add_row({
            selected ? "*" : "",
            fmt::format("{:02}", i + 1),
            e.name,
            e.store_path ? std::to_string(e.commit_count) : "-",
            e.location
        });
    }

    return ok(t.render() + "\nUse 'reelvault list <n>' to see the commits of a project.\n");
}

CommandResult handle_log(const CommandCall& call, const Deps& deps) {
    if (!call.positionals.empty()) return invalid("log: unexpected arguments");
    return ok(commitsTable(openCurrent(deps).project));
}

CommandResult handle_show(const CommandCall& call, const Deps& deps) {
    if (call.positionals.size() != 1) return invalid("show: expected <version>");
    const auto n = versionArg(call);
    if (!n) return invalid("show: version must be a number");

    const auto [project, store] = openCurrent(deps);
    return ok(to_string(VersionEngine::getVersion(project, *n)));
}

CommandResult handle_tracking(const CommandCall& call, const Deps& deps) {
    if (call.positionals.size() != 1) return invalid("tracking: expected <version>");
    const auto n = versionArg(call);
    if (!n) return invalid("tracking: version must be a number");

    const auto [project, store] = openCurrent(deps);
    const auto t = deps.engine->loadTracking(project, *n);

    Table table({
        {"Asset", Align::Left, 5, 40, Clip::Middle},
        {"Status", Align::Left, 7},
        {"Size", Align::Right, 8},
    }, term_width());

    for (const auto& a : t.assets) table.add_row({a.filename, to_string(a.status), human_bytes(a.size)});

    std::string out = fmt::format("Version {}: {}\n\n", t.version, t.commit_message);
    if (!table.empty()) out += table.render() + "\n";
    out += fmt::format("{} total, {} present, {} new, {} removed\n",
                       t.total_assets, t.present_assets, t.new_assets, t.removed_assets);
    return ok(out);
}

CommandResult handle_remove(const CommandCall& call, const Deps& deps) {
    if (call.positionals.size() != 1) return invalid("remove: expected <version>");
    const auto n = versionArg(call);
    if (!n) return invalid("remove: version must be a number");

    auto [project, store] = openCurrent(deps);
    deps.engine->removeVersion(project, store, *n);
    return ok(fmt::format("Removed version {} ({} remaining)\n", *n, project.versions.size()));
}

CommandResult handle_prune(const CommandCall& call, const Deps& deps) {
    if (!call.positionals.empty()) return invalid("prune: unexpected arguments");

    auto [project, store] = openCurrent(deps);
    const auto removed = deps.engine->pruneMissingBackedVersions(project, store);
    if (removed == 0) return ok("Nothing to prune; every version is present in storage.\n");
    return ok(fmt::format("Pruned {} versions ({} remaining)\n", removed, project.versions.size()));
}

CommandResult handle_pull(const CommandCall& call, const Deps& deps) {
    if (call.positionals.empty() || call.positionals.size() > 2) return invalid("pull: expected <version> [dir]");
    const auto n = versionArg(call);
    if (!n) return invalid("pull: version must be a number");

    const auto outDir = fs::absolute(call.positionals.size() > 1 ? fs::path(call.positionals[1]) : fs::current_path());
    const auto [project, store] = openCurrent(deps);
    const auto restored = deps.engine->restoreVersion(project, *n, outDir);

    std::string out = fmt::format("Pulled version {}\n  Project file: {}\n", *n, restored.string());
    if (const auto assetsDir = outDir / "assets"; fs::is_directory(assetsDir))
        out += fmt::format("  Assets:       {}\n", assetsDir.string());
    return ok(out);
}

CommandResult handle_delete(const CommandCall& call, const Deps& deps) {
    if (call.positionals.size() != 1) return invalid("delete: expected <name>");
    if (!hasFlag(call, "yes") && !hasFlag(call, "y"))
        return invalid("delete: this permanently removes every version and asset; re-run with --yes to confirm");

    const auto& name = call.positionals[0];
    deps.backend->ready();

    if (const auto store = deps.locator->findStore(name)) {
        const auto project = ProjectStore::load(*store);
        deps.engine->deleteProject(project, *store);
        if (const auto ctx = deps.context->load(); ctx && ctx->config_path == *store) deps.context->clear();
        return ok(fmt::format("Deleted project {}: stored versions, assets and {} removed\n",
                              project.name, store->parent_path().string()));
    }

    // No local record left; remove what storage still holds
    const auto entries = deps.locator->catalog(*deps.backend);
    const auto it = std::ranges::find_if(entries, [&](const CatalogEntry& e) {
        return lower(e.id) == lower(name) || lower(e.name) == lower(name);
    });
    if (it == entries.end()) return failed(fmt::format("delete: project '{}' not found", name));

    deps.backend->deleteNamespace(it->id);
    return ok(fmt::format("Deleted stored versions and assets of {}\n", it->name));
}

CommandResult handle_use(const CommandCall& call, const Deps& deps) {
    if (hasFlag(call, "clear")) {
        deps.context->clear();
        return ok("Project selection cleared.\n");
    }
    if (call.positionals.size() != 1) return invalid("use: expected <name|path>");

    const auto store = deps.locator->findStore(call.positionals[0]);
    if (!store) return failed(fmt::format("use: no project record found for '{}'", call.positionals[0]));

    const auto project = ProjectStore::load(*store);
    deps.context->save({project.name, *store});
    return ok(fmt::format("Switched to project: {}\n\n{}", project.name, commitsTable(project)));
}

CommandResult handle_status(const CommandCall& call, const Deps& deps) {
    if (!call.positionals.empty()) return invalid("status: unexpected arguments");

    const auto [project, store] = openCurrent(deps);
    std::string out = fmt::format("Project:  {} (id {})\n", project.name, project.id());
    out += fmt::format("File:     {}\n", project.project_path.string());
    out += fmt::format("Record:   {}\n", store.string());
    out += fmt::format("Storage:  {} ({})\n", to_string(project.backend), project.volume);
    out += fmt::format("Created:  {}\n", rv::util::displayTimestamp(project.created_at));
    out += fmt::format("Versions: {}\n", project.versions.size());
    if (const auto* latest = project.latest())
        out += fmt::format("Latest:   v{} \"{}\" at {}\n", latest->number, latest->message, rv::util::displayTimestamp(latest->timestamp));
    return ok(out);
}

}

void rv::shell::registerProjectCommands(const std::shared_ptr<Router>& r, const std::shared_ptr<Deps>& deps) {
    const auto bind = [deps](CommandResult (*fn)(const CommandCall&, const Deps&)) -> CommandHandler {
        return [deps, fn](const CommandCall& call) { return fn(call, *deps); };
    };

    r->registerCommand(ProjectUsage::init(), bind(handle_init));
    r->registerCommand(ProjectUsage::commit(), bind(handle_commit));
    r->registerCommand(ProjectUsage::list(), bind(handle_list));
    r->registerCommand(ProjectUsage::log(), bind(handle_log));
    r->registerCommand(ProjectUsage::show(), bind(handle_show));
    r->registerCommand(ProjectUsage::tracking(), bind(handle_tracking));
    r->registerCommand(ProjectUsage::remove(), bind(handle_remove));
    r->registerCommand(ProjectUsage::prune(), bind(handle_prune));
    r->registerCommand(ProjectUsage::pull(), bind(handle_pull));
    r->registerCommand(ProjectUsage::del(), bind(handle_delete));
    r->registerCommand(ProjectUsage::use(), bind(handle_use));
    r->registerCommand(ProjectUsage::status(), bind(handle_status));
}
