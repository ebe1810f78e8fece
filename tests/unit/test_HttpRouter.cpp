#include <gtest/gtest.h>
#include "TestFixtures.hpp"
#include "protocols/http/HttpRouter.hpp"
#include "project/ProjectStore.hpp"
#include "project/VersionEngine.hpp"
#include "runtime/Deps.hpp"

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace rv::http;
using namespace rv::test;
using json = nlohmann::json;

class HttpRouterTest : public ::testing::Test {
protected:
    TempDir dir{"reelvault-http"};
    std::shared_ptr<rv::runtime::Deps> deps;
    std::unique_ptr<HttpRouter> router;

    void SetUp() override {
        deps = sandboxDeps(dir.path());
        router = std::make_unique<HttpRouter>(deps);

        const auto file = dir / "work" / "reel" / "reel.aepx";
        writeBytes(dir / "work" / "reel" / "a.png", 12);
        writeProject(file, {"a.png"});
        auto p = deps->engine->initialize(file);
        (void)deps->engine->commit(p, deps->projectStore->storePathFor(file), "grade", file);
    }

    [[nodiscard]] Response get(const std::string& target, const http::verb verb = http::verb::get) const {
        Request req{verb, target, 11};
        return router->route(req);
    }
};

TEST_F(HttpRouterTest, Health) {
    const auto res = get("/health");
    EXPECT_EQ(res.result(), http::status::ok);
    const auto body = json::parse(res.body());
    EXPECT_TRUE(body["success"].get<bool>());
    EXPECT_EQ(body["data"]["status"], "ok");
}

TEST_F(HttpRouterTest, ListsProjects) {
    const auto res = get("/api/projects");
    ASSERT_EQ(res.result(), http::status::ok);
    const auto data = json::parse(res.body())["data"];
    ASSERT_EQ(data.size(), 1u);
    EXPECT_EQ(data[0]["id"], "reel");
    EXPECT_EQ(data[0]["commit_count"], 2);
}

TEST_F(HttpRouterTest, ListsCommits) {
    const auto res = get("/api/projects/reel/commits");
    ASSERT_EQ(res.result(), http::status::ok);
    const auto data = json::parse(res.body())["data"];
    EXPECT_EQ(data["project_id"], "reel");
    EXPECT_EQ(data["project_name"], "reel.aepx");
    ASSERT_EQ(data["commits"].size(), 2u);
}

TEST_F(HttpRouterTest, SingleCommit) {
    const auto res = get("/api/projects/reel/commits/1");
    ASSERT_EQ(res.result(), http::status::ok);
    const auto data = json::parse(res.body())["data"];
    EXPECT_EQ(data["message"], "grade");
    EXPECT_EQ(data["number"], 1);
}

TEST_F(HttpRouterTest, ErrorStatuses) {
    EXPECT_EQ(get("/api/projects/nope/commits").result(), http::status::not_found);
    EXPECT_EQ(get("/api/projects/reel/commits/9").result(), http::status::not_found);
    EXPECT_EQ(get("/api/projects/reel/commits/abc").result(), http::status::bad_request);
    EXPECT_EQ(get("/unknown").result(), http::status::not_found);
    EXPECT_EQ(get("/api/projects", http::verb::post).result(), http::status::method_not_allowed);

    const auto body = json::parse(get("/unknown").body());
    EXPECT_FALSE(body["success"].get<bool>());
    EXPECT_TRUE(body.contains("error"));
}
