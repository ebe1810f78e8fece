#include <gtest/gtest.h>
#include "tracking/Differ.hpp"

using namespace rv::types;
using namespace rv::tracking;

namespace {

AssetReference asset(const std::string& filename, const uintmax_t size = 1) {
    AssetReference a;
    a.filename = filename;
    a.original_path = "/media/" + filename;
    a.extension = std::filesystem::path(filename).extension().string();
    a.size = size;
    a.backend_key = "p/assets/" + filename;
    return a;
}

const AssetStatus* find(const AssetTracking& t, const std::string& filename) {
    for (const auto& s : t.assets)
        if (s.filename == filename) return &s;
    return nullptr;
}

}

TEST(DifferTest, FirstCommitMarksEverythingNew) {
    const auto t = diff(0, "Initial version", {asset("a.png"), asset("b.png")}, {}, 100);

    EXPECT_EQ(t.version, 0);
    EXPECT_EQ(t.commit_message, "Initial version");
    EXPECT_EQ(t.timestamp, 100);
    EXPECT_EQ(t.total_assets, 2u);
    EXPECT_EQ(t.present_assets, 2u);
    EXPECT_EQ(t.new_assets, 2u);
    EXPECT_EQ(t.removed_assets, 0u);
    EXPECT_EQ(t.missing_assets, 0u);
    for (const auto& s : t.assets) {
        EXPECT_EQ(s.status, AssetState::New);
        EXPECT_TRUE(s.present);
        EXPECT_FALSE(s.in_previous);
    }
}

TEST(DifferTest, SwappedAssetIsNewAndRemoved) {
    const auto t = diff(1, "swap", {asset("image2.png")}, {asset("image1.png")}, 0);

    ASSERT_EQ(t.assets.size(), 2u);
    const auto* added = find(t, "image2.png");
    const auto* removed = find(t, "image1.png");
    ASSERT_NE(added, nullptr);
    ASSERT_NE(removed, nullptr);

    EXPECT_EQ(added->status, AssetState::New);
    EXPECT_EQ(removed->status, AssetState::Removed);
    EXPECT_FALSE(removed->present);
    EXPECT_TRUE(removed->in_previous);
    EXPECT_EQ(t.new_assets, 1u);
    EXPECT_EQ(t.removed_assets, 1u);
}

TEST(DifferTest, MixedChangeCounts) {
    const auto t = diff(2, "edit", {asset("a"), asset("b"), asset("c")}, {asset("a"), asset("b"), asset("d")}, 0);

    EXPECT_EQ(find(t, "a")->status, AssetState::Present);
    EXPECT_EQ(find(t, "b")->status, AssetState::Present);
    EXPECT_EQ(find(t, "c")->status, AssetState::New);
    EXPECT_EQ(find(t, "d")->status, AssetState::Removed);

    EXPECT_EQ(t.present_assets, 3u);
    EXPECT_EQ(t.new_assets, 1u);
    EXPECT_EQ(t.removed_assets, 1u);
    EXPECT_EQ(t.total_assets, 4u);
    EXPECT_EQ(t.missing_assets, 1u);
}

TEST(DifferTest, RemovedEntriesComeAfterCurrentOnes) {
    const auto t = diff(1, "m", {asset("z")}, {asset("a")}, 0);
    ASSERT_EQ(t.assets.size(), 2u);
    EXPECT_EQ(t.assets[0].filename, "z");
    EXPECT_EQ(t.assets[1].filename, "a");
}

TEST(DifferTest, IdentityIsFilenameOnly) {
    auto moved = asset("a.png");
    moved.original_path = "/elsewhere/a.png";
    const auto t = diff(1, "m", {moved}, {asset("a.png")}, 0);

    ASSERT_EQ(t.assets.size(), 1u);
    EXPECT_EQ(t.assets[0].status, AssetState::Present);
    EXPECT_TRUE(t.assets[0].in_previous);
}
