#include <gtest/gtest.h>
#include "TestFixtures.hpp"
#include "storage/LocalStorageBackend.hpp"
#include "storage/SharedAssetStore.hpp"
#include "util/files.hpp"

namespace fs = std::filesystem;
using namespace rv::storage;
using namespace rv::types;
using namespace rv::test;

class SharedAssetStoreTest : public ::testing::Test {
protected:
    TempDir dir{"reelvault-shared"};
    std::shared_ptr<LocalStorageBackend> backend;

    void SetUp() override {
        backend = std::make_shared<LocalStorageBackend>(dir / "storage");
        backend->ready();
    }

    AssetReference localAsset(const fs::path& rel, const uintmax_t size, const char fill = 'x') const {
        const auto p = dir / "media" / rel;
        writeBytes(p, size, fill);
        AssetReference a;
        a.original_path = p;
        a.relative_path = rel;
        a.filename = p.filename().string();
        a.extension = p.extension().string();
        a.size = size;
        return a;
    }
};

TEST_F(SharedAssetStoreTest, CopiesNewAssetsIntoPool) {
    SharedAssetStore store(backend, "scene");
    const auto res = store.resolve({localAsset("a.png", 4), localAsset("b.mov", 8)});

    ASSERT_EQ(res.size(), 2u);
    for (const auto& r : res) {
        EXPECT_TRUE(r.copied);
        EXPECT_EQ(r.asset.backend_key, "scene/assets/" + r.asset.filename);
        EXPECT_TRUE(backend->exists(r.asset.backend_key));
    }
    EXPECT_EQ(store.index().size(), 2u);
}

TEST_F(SharedAssetStoreTest, ReusesPooledAssetByFilename) {
    SharedAssetStore first(backend, "scene");
    (void)first.resolve({localAsset("a.png", 4, 'a')});

    // Different content under the same name in another folder is not copied again
    SharedAssetStore second(backend, "scene");
    const auto res = second.resolve({localAsset("other/a.png", 16, 'b')});

    ASSERT_EQ(res.size(), 1u);
    EXPECT_FALSE(res[0].copied);
    EXPECT_EQ(res[0].asset.backend_key, "scene/assets/a.png");
    EXPECT_EQ(fs::file_size(backend->resolve("scene/assets/a.png")), 4u);
}

TEST_F(SharedAssetStoreTest, IndexPrefersRecordedKeys) {
    Version v;
    AssetReference recorded;
    recorded.filename = "a.png";
    recorded.backend_key = "scene/v000/a.png";
    v.assets.push_back(recorded);

    SharedAssetStore store(backend, "scene");
    store.rebuildIndex({v});
    EXPECT_EQ(store.index().at("a.png"), "scene/v000/a.png");

    const auto a = localAsset("a.png", 2);
    backend->copyIn(a.original_path, "scene/assets/a.png");
    const auto res = store.resolve({a});
    ASSERT_EQ(res.size(), 1u);
    EXPECT_EQ(res[0].asset.backend_key, "scene/v000/a.png");
}

TEST_F(SharedAssetStoreTest, UnreadableAssetIsSkipped) {
    auto good = localAsset("good.png", 3);
    AssetReference bad = good;
    bad.filename = "bad.png";
    bad.original_path = dir / "media" / "bad.png";

    SharedAssetStore store(backend, "scene");
    const auto res = store.resolve({bad, good});

    ASSERT_EQ(res.size(), 1u);
    EXPECT_EQ(res[0].asset.filename, "good.png");
}
