#pragma once

#include <boost/beast/http.hpp>
#include <memory>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace rv::runtime { struct Deps; }

namespace rv::http {

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// Read-only JSON API over the project catalog:
//   GET /health
//   GET /api/projects
//   GET /api/projects/{id}/commits
//   GET /api/projects/{id}/commits/{n}
class HttpRouter {
public:
    explicit HttpRouter(std::shared_ptr<runtime::Deps> deps);

    [[nodiscard]] Response route(const Request& req) const;

    static Response makeJsonResponse(const Request& req, http::status status, const nlohmann::json& body);
    static Response makeErrorResponse(const Request& req, http::status status, const std::string& msg);

private:
    std::shared_ptr<runtime::Deps> deps_;

    [[nodiscard]] Response handleHealth(const Request& req) const;
    [[nodiscard]] Response handleListProjects(const Request& req) const;
    [[nodiscard]] Response handleProjectCommits(const Request& req, const std::string& id) const;
    [[nodiscard]] Response handleCommit(const Request& req, const std::string& id, const std::string& number) const;
};

}
