#include <gtest/gtest.h>
#include "TestFixtures.hpp"
#include "assets/Relinker.hpp"
#include "assets/Extractor.hpp"
#include "util/files.hpp"

namespace fs = std::filesystem;
using namespace rv::assets;
using namespace rv::test;

class RelinkerTest : public ::testing::Test {
protected:
    TempDir dir{"reelvault-relink"};
};

TEST_F(RelinkerTest, RewritesMatchingReferences) {
    const auto project = dir / "scene.aepx";
    writeText(project,
        "<root>"
        "<fileReference fullpath=\"footage/a.mov\"/>"
        "<fullpath>/media/b.wav</fullpath>"
        "<fileReference fullpath=\"footage/c.png\"/>"
        "</root>");

    const std::map<fs::path, fs::path> moves = {
        {dir / "footage" / "a.mov", "/restored/assets/a.mov"},
        {"/media/b.wav", "/restored/assets/b.wav"},
    };

    EXPECT_EQ(relinkReferences(project, dir.path(), moves), 2u);

    const auto c = collectCandidates(rv::util::readFileToString(project));
    EXPECT_TRUE(c.contains("/restored/assets/a.mov"));
    EXPECT_TRUE(c.contains("/restored/assets/b.wav"));
    EXPECT_TRUE(c.contains("footage/c.png"));
}

TEST_F(RelinkerTest, NoMovesLeavesFileUntouched) {
    const auto project = dir / "scene.aepx";
    const std::string original = "<?xml version=\"1.0\"?>\n<root><fileReference fullpath=\"a.mov\"/></root>\n";
    writeText(project, original);

    EXPECT_EQ(relinkReferences(project, dir.path(), {}), 0u);
    EXPECT_EQ(relinkReferences(project, dir.path(), {{"/elsewhere/x.mov", "/y.mov"}}), 0u);
    EXPECT_EQ(rv::util::readFileToString(project), original);
}

TEST_F(RelinkerTest, MalformedDocumentIsSkipped) {
    const auto project = dir / "broken.aepx";
    writeText(project, "<root><fileReference fullpath=\"a.mov\">");
    EXPECT_EQ(relinkReferences(project, dir.path(), {{dir / "a.mov", "/b.mov"}}), 0u);
}
