#include <gtest/gtest.h>
#include <sstream>
#include "TestFixtures.hpp"
#include "protocols/shell/Parser.hpp"
#include "protocols/shell/Router.hpp"
#include "protocols/shell/Table.hpp"
#include "protocols/shell/Token.hpp"
#include "protocols/shell/commands.hpp"
#include "project/ContextStore.hpp"
#include "project/ProjectStore.hpp"
#include "runtime/Deps.hpp"
#include "storage/StorageBackend.hpp"
#include "util/shellArgsHelpers.hpp"

namespace fs = std::filesystem;
using namespace rv::shell;
using namespace rv::test;

TEST(ParserTest, SplitsNameFlagsAndPositionals) {
    const auto call = parseTokens(tokenize(std::vector<std::string>{"pull", "3", "--host", "0.0.0.0", "out"}));
    EXPECT_EQ(call.name, "pull");
    ASSERT_EQ(call.positionals.size(), 2u);
    EXPECT_EQ(call.positionals[0], "3");
    EXPECT_EQ(call.positionals[1], "out");
    EXPECT_EQ(optVal(call, "host"), "0.0.0.0");
}

TEST(ParserTest, SwitchesNeverSwallowValues) {
    const auto call = parseTokens(tokenize(std::vector<std::string>{"init", "--force", "scene.aepx"}));
    EXPECT_TRUE(hasFlag(call, "force"));
    ASSERT_EQ(call.positionals.size(), 1u);
    EXPECT_EQ(call.positionals[0], "scene.aepx");
}

TEST(ParserTest, NegativeNumbersArePositional) {
    const auto call = parseTokens(tokenize(std::vector<std::string>{"show", "-1"}));
    ASSERT_EQ(call.positionals.size(), 1u);
    EXPECT_EQ(call.positionals[0], "-1");
}

TEST(ParserTest, LineTokenizerHonorsQuotes) {
    const auto call = parseTokens(tokenize(std::string("reelvault commit \"color pass two\" 'my file.aepx'")));
    EXPECT_EQ(call.name, "commit");
    ASSERT_EQ(call.positionals.size(), 2u);
    EXPECT_EQ(call.positionals[0], "color pass two");
    EXPECT_EQ(call.positionals[1], "my file.aepx");
}

TEST(ParserTest, DoubleDashEndsFlags) {
    const auto call = parseTokens(tokenize(std::vector<std::string>{"commit", "--", "--not-a-flag"}));
    EXPECT_TRUE(call.options.empty());
    ASSERT_EQ(call.positionals.size(), 1u);
    EXPECT_EQ(call.positionals[0], "--not-a-flag");
}

TEST(ShellArgsTest, ParseInt) {
    EXPECT_EQ(parseInt("42"), 42);
    EXPECT_EQ(parseInt("-3"), -3);
    EXPECT_FALSE(parseInt("").has_value());
    EXPECT_FALSE(parseInt("4x").has_value());
    EXPECT_FALSE(parseInt("99999999999").has_value());
}

class RouterTest : public ::testing::Test {
protected:
    TempDir dir{"reelvault-cli"};
    std::shared_ptr<rv::runtime::Deps> deps;
    std::shared_ptr<Router> router;
    fs::path file;

    void SetUp() override {
        deps = sandboxDeps(dir.path());
        router = std::make_shared<Router>();
        registerAllCommands(router, deps);
        file = dir / "work" / "promo" / "promo.aepx";
        writeBytes(dir / "work" / "promo" / "clip.mov", 64);
        writeProject(file, {"clip.mov"});
    }

    CommandResult run(const std::vector<std::string>& args) const { return router->execute(args); }
};

TEST_F(RouterTest, NoArgumentsPrintsHelp) {
    const auto res = run({});
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_NE(res.stdout_text.find("ReelVault"), std::string::npos);
    EXPECT_NE(res.stdout_text.find("commit"), std::string::npos);
}

TEST_F(RouterTest, UnknownCommandIsUsageError) {
    EXPECT_EQ(run({"frobnicate"}).exit_code, 2);
}

TEST_F(RouterTest, CommandHelpAndAliases) {
    const auto res = run({"save", "--help"});
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_NE(res.stdout_text.find("Usage:"), std::string::npos);
    EXPECT_TRUE(router->hasCommand("rm"));
    EXPECT_TRUE(router->hasCommand("checkout"));
    EXPECT_FALSE(router->hasCommand("nope"));
}

TEST_F(RouterTest, VersionCommand) {
    const auto res = run({"version"});
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_EQ(res.stdout_text.rfind("ReelVault v", 0), 0u);
}

TEST_F(RouterTest, InitSelectsProjectAndCommitsFollow) {
    const auto init = run({"init", file.string()});
    ASSERT_EQ(init.exit_code, 0) << init.stderr_text;
    EXPECT_TRUE(deps->context->has());

    const auto c1 = run({"commit", "first edit"});
    ASSERT_EQ(c1.exit_code, 0) << c1.stderr_text;
    EXPECT_NE(c1.stdout_text.find("Committed version 1"), std::string::npos);

    const auto c2 = run({"c", "second edit"});
    ASSERT_EQ(c2.exit_code, 0) << c2.stderr_text;

    const auto log = run({"log"});
    EXPECT_EQ(log.exit_code, 0);
    EXPECT_NE(log.stdout_text.find("3 commits"), std::string::npos);

    const auto show = run({"show", "1"});
    EXPECT_EQ(show.exit_code, 0);
    EXPECT_NE(show.stdout_text.find("first edit"), std::string::npos);

    EXPECT_EQ(run({"show", "7"}).exit_code, 1);
    EXPECT_EQ(run({"show", "-1"}).exit_code, 1);
    EXPECT_EQ(run({"show", "x"}).exit_code, 2);

    EXPECT_EQ(run({"tracking", "0"}).exit_code, 0);

    const auto rm = run({"rm", "1"});
    EXPECT_EQ(rm.exit_code, 0);
    EXPECT_EQ(rv::project::ProjectStore::load(deps->projectStore->storePathFor(file)).versions.size(), 2u);
}

TEST_F(RouterTest, InitRejectsWrongExtension) {
    const auto other = dir / "work" / "notes.txt";
    writeText(other, "<root/>");
    EXPECT_EQ(run({"init", other.string()}).exit_code, 1);
    EXPECT_EQ(run({"init", (dir / "work" / "absent.aepx").string()}).exit_code, 1);
    EXPECT_EQ(run({"init"}).exit_code, 2);
}

TEST_F(RouterTest, PullRestoresIntoDirectory) {
    ASSERT_EQ(run({"init", file.string()}).exit_code, 0);

    const auto out = dir / "restore";
    const auto res = run({"pull", "0", out.string()});
    ASSERT_EQ(res.exit_code, 0) << res.stderr_text;
    EXPECT_TRUE(fs::exists(out / "promo.aepx"));
}

TEST_F(RouterTest, ListShowsStoredProjects) {
    ASSERT_EQ(run({"init", file.string()}).exit_code, 0);

    const auto res = run({"list"});
    ASSERT_EQ(res.exit_code, 0) << res.stderr_text;
    EXPECT_NE(res.stdout_text.find("promo"), std::string::npos);

    const auto one = run({"list", "1"});
    EXPECT_EQ(one.exit_code, 0);
    EXPECT_NE(one.stdout_text.find("Initial version"), std::string::npos);

    EXPECT_EQ(run({"list", "5"}).exit_code, 1);
}

TEST_F(RouterTest, UseAndClearSelection) {
    ASSERT_EQ(run({"init", file.string()}).exit_code, 0);
    ASSERT_EQ(run({"use", "--clear"}).exit_code, 0);
    EXPECT_FALSE(deps->context->has());

    const auto res = run({"use", "promo"});
    ASSERT_EQ(res.exit_code, 0) << res.stderr_text;
    EXPECT_TRUE(deps->context->has());
    EXPECT_EQ(run({"use", "nonexistent"}).exit_code, 1);
}

TEST_F(RouterTest, DeleteRequiresConfirmation) {
    ASSERT_EQ(run({"init", file.string()}).exit_code, 0);

    EXPECT_EQ(run({"delete", "promo"}).exit_code, 2);
    EXPECT_TRUE(deps->backend->exists("promo"));

    const auto res = run({"delete", "promo", "--yes"});
    ASSERT_EQ(res.exit_code, 0) << res.stderr_text;
    EXPECT_FALSE(deps->backend->exists("promo"));
    EXPECT_FALSE(deps->context->has());
    EXPECT_TRUE(fs::exists(file));
}

TEST(TableTest, AlignsColumnsUnderARule) {
    Table t({{"#", Align::Right, 2}, {"Name", Align::Left, 4}}, 80);
    EXPECT_TRUE(t.empty());
    t.add_row({"7", "scene"});
    EXPECT_FALSE(t.empty());
    EXPECT_EQ(t.render(), "   #  Name\n"
                          "  --  -----\n"
                          "   7  scene\n");
}

TEST(TableTest, MiddleClipKeepsBothEndsOfAPath) {
    Table t({{"Location", Align::Left, 10, 20, Clip::Middle}}, 80);
    t.add_row({"/very/long/path/to/some/project/scene.aepx"});
    const auto out = t.render();
    EXPECT_NE(out.find("  /very/lo...cene.aepx\n"), std::string::npos) << out;
}

TEST(TableTest, ShrinksClippableColumnToTerminalWidth) {
    Table t({{"Message", Align::Left, 10, 60, Clip::Tail}, {"Assets", Align::Right, 6}}, 30);
    t.add_row({std::string(50, 'x'), "3"});
    const auto out = t.render();
    std::istringstream lines(out);
    for (std::string line; std::getline(lines, line);) EXPECT_LE(line.size(), 30u) << line;
    EXPECT_NE(out.find("  " + std::string(17, 'x') + "...       3\n"), std::string::npos) << out;
}
