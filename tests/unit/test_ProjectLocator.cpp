#include <gtest/gtest.h>
#include "TestFixtures.hpp"
#include "project/ContextStore.hpp"
#include "project/ProjectLocator.hpp"
#include "project/ProjectStore.hpp"
#include "project/VersionEngine.hpp"
#include "storage/LocalStorageBackend.hpp"

#include <set>

namespace fs = std::filesystem;
using namespace rv::project;
using namespace rv::storage;
using namespace rv::test;

class ProjectLocatorTest : public ::testing::Test {
protected:
    TempDir dir{"reelvault-locator"};
    std::shared_ptr<LocalStorageBackend> backend;
    std::shared_ptr<ProjectStore> store;
    std::unique_ptr<VersionEngine> engine;
    std::unique_ptr<ProjectLocator> locator;

    void SetUp() override {
        backend = std::make_shared<LocalStorageBackend>(dir / "storage");
        store = std::make_shared<ProjectStore>(".reelvault");
        engine = std::make_unique<VersionEngine>(backend, store);
        locator = std::make_unique<ProjectLocator>(store, std::vector<fs::path>{dir / "work"});
    }

    fs::path initProject(const std::string& sub, const std::string& name) const {
        const auto file = dir / "work" / sub / name;
        writeProject(file, {});
        (void)engine->initialize(file);
        return store->storePathFor(file);
    }
};

TEST_F(ProjectLocatorTest, DiscoversDirectAndNestedProjects) {
    const auto top = initProject("", "top.aepx");
    const auto nested = initProject("nested", "inner.aepx");
    initProject("deep/er", "hidden.aepx");

    const auto found = locator->discover();
    ASSERT_EQ(found.size(), 2u);

    std::set<fs::path> paths;
    for (const auto& p : found) paths.insert(p.store_path);
    EXPECT_TRUE(paths.contains(top));
    EXPECT_TRUE(paths.contains(nested));

    const auto byId = locator->findById("inner");
    ASSERT_TRUE(byId.has_value());
    EXPECT_EQ(byId->name, "inner");
    EXPECT_EQ(byId->version_count, 1u);
}

TEST_F(ProjectLocatorTest, FindStoreAcceptsSeveralForms) {
    const auto s = initProject("proj", "My Scene.aepx");

    EXPECT_EQ(locator->findStore((dir / "work" / "proj").string()), s);
    EXPECT_EQ(locator->findStore(s.string()), s);
    EXPECT_EQ(locator->findStore((dir / "work" / "proj" / "My Scene.aepx").string()), s);
    EXPECT_EQ(locator->findStore("My Scene"), s);
    EXPECT_EQ(locator->findStore("My_Scene"), s);
    EXPECT_EQ(locator->findStore("My Scene.aepx"), s);
    EXPECT_FALSE(locator->findStore("nothing").has_value());
}

TEST_F(ProjectLocatorTest, CatalogJoinsBackendWithLocalRecords) {
    initProject("a", "alpha.aepx");
    backend->makeNamespace("orphan/v000");

    const auto entries = locator->catalog(*backend);
    ASSERT_EQ(entries.size(), 2u);

    EXPECT_EQ(entries[0].id, "alpha");
    ASSERT_TRUE(entries[0].store_path.has_value());
    EXPECT_EQ(entries[0].commit_count, 1u);

    EXPECT_EQ(entries[1].id, "orphan");
    EXPECT_EQ(entries[1].name, "orphan");
    EXPECT_FALSE(entries[1].store_path.has_value());
    EXPECT_EQ(entries[1].commit_count, 0u);
}

TEST_F(ProjectLocatorTest, CurrentStoreUsesContextAndClearsStaleSelection) {
    const auto s = initProject("p", "scene.aepx");
    const ContextStore ctx(dir / "state" / "current.json");

    ctx.save({"scene.aepx", s});
    EXPECT_EQ(locator->currentStore(ctx), s);

    ctx.save({"gone.aepx", dir / "missing" / ".reelvault" / "config.json"});
    if (!ProjectStore::exists(store->storePathInDir(fs::current_path()))) {
        EXPECT_THROW((void)locator->currentStore(ctx), std::invalid_argument);
        EXPECT_FALSE(ctx.has());
    }
}
