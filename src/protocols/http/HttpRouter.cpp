#include "protocols/http/HttpRouter.hpp"
#include "runtime/Deps.hpp"
#include "project/ProjectLocator.hpp"
#include "project/ProjectStore.hpp"
#include "project/VersionEngine.hpp"
#include "storage/StorageBackend.hpp"
#include "util/shellArgsHelpers.hpp"
#include "logging/LogRegistry.hpp"

#include <stdexcept>
#include <string_view>
#include <vector>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace rv::logging;
using json = nlohmann::json;

namespace rv::http {

namespace {

std::vector<std::string> splitPath(std::string_view target) {
    if (const auto q = target.find('?'); q != std::string_view::npos) target = target.substr(0, q);

    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= target.size()) {
        const auto slash = target.find('/', start);
        const auto end = slash == std::string_view::npos ? target.size() : slash;
        if (end > start) parts.emplace_back(target.substr(start, end - start));
        if (slash == std::string_view::npos) break;
        start = slash + 1;
    }
    return parts;
}

}

HttpRouter::HttpRouter(std::shared_ptr<runtime::Deps> deps) : deps_(std::move(deps)) {
    if (!deps_) throw std::invalid_argument("HttpRouter requires runtime dependencies");
}

Response HttpRouter::makeJsonResponse(const Request& req, const http::status status, const json& body) {
    Response res{status, req.version()};
    res.set(http::field::content_type, "application/json");
    res.set(http::field::access_control_allow_origin, "*");
    res.keep_alive(req.keep_alive());
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

Response HttpRouter::makeErrorResponse(const Request& req, const http::status status, const std::string& msg) {
    return makeJsonResponse(req, status, {{"success", false}, {"error", msg}});
}

Response HttpRouter::route(const Request& req) const {
    const std::string target(req.target());
    LogRegistry::http()->debug("[HttpRouter] {} {}", std::string(req.method_string()), target);

    const auto parts = splitPath(target);
    const bool known =
        (parts.size() == 1 && parts[0] == "health") ||
        (parts.size() == 2 && parts[0] == "api" && parts[1] == "projects") ||
        (parts.size() == 4 && parts[0] == "api" && parts[1] == "projects" && parts[3] == "commits") ||
        (parts.size() == 5 && parts[0] == "api" && parts[1] == "projects" && parts[3] == "commits");

    if (!known) return makeErrorResponse(req, http::status::not_found, fmt::format("No route for {}", target));
    if (req.method() != http::verb::get) return makeErrorResponse(req, http::status::method_not_allowed, "Method not allowed");

    try {
        if (parts.size() == 1) return handleHealth(req);
        if (parts.size() == 2) return handleListProjects(req);
        if (parts.size() == 4) return handleProjectCommits(req, parts[2]);
        return handleCommit(req, parts[2], parts[4]);
    } catch (const std::exception& e) {
        LogRegistry::http()->error("[HttpRouter] {} failed: {}", target, e.what());
        return makeErrorResponse(req, http::status::internal_server_error, e.what());
    }
}

Response HttpRouter::handleHealth(const Request& req) const {
    return makeJsonResponse(req, http::status::ok, {{"success", true}, {"data", {{"status", "ok"}}}});
}

Response HttpRouter::handleListProjects(const Request& req) const {
    json data = json::array();
    for (const auto& e : deps_->locator->catalog(*deps_->backend)) {
        data.push_back({
            {"id", e.id},
            {"name", e.name},
            {"location", e.location},
            {"commit_count", e.commit_count}
        });
    }
    return makeJsonResponse(req, http::status::ok, {{"success", true}, {"data", data}});
}

Response HttpRouter::handleProjectCommits(const Request& req, const std::string& id) const {
    const auto located = deps_->locator->findById(id);
    if (!located) return makeErrorResponse(req, http::status::not_found, fmt::format("Project with ID '{}' not found", id));

    const auto project = project::ProjectStore::load(located->store_path);

    json commits = json::array();
    for (const auto& v : project.versions) commits.push_back(types::summary(v));

    return makeJsonResponse(req, http::status::ok, {
        {"success", true},
        {"data", {
            {"project_id", id},
            {"project_name", project.name},
            {"commits", commits}
        }}
    });
}

Response HttpRouter::handleCommit(const Request& req, const std::string& id, const std::string& number) const {
    const auto n = shell::parseInt(number);
    if (!n) return makeErrorResponse(req, http::status::bad_request, fmt::format("Invalid version number '{}'", number));

    const auto located = deps_->locator->findById(id);
    if (!located) return makeErrorResponse(req, http::status::not_found, fmt::format("Project with ID '{}' not found", id));

    const auto project = project::ProjectStore::load(located->store_path);
    try {
        const auto& v = project::VersionEngine::getVersion(project, *n);
        return makeJsonResponse(req, http::status::ok, {{"success", true}, {"data", json(v)}});
    } catch (const std::out_of_range& e) {
        return makeErrorResponse(req, http::status::not_found, e.what());
    }
}

}
